#pragma once
#include <QByteArray>
#include <QJsonObject>
#include <QTcpSocket>

class SseWriter {
public:
    static void writeStreamHeader(QTcpSocket* socket);
    static void sendEvent(QTcpSocket* socket, const QString& event, const QJsonObject& payload);
    static void sendTerminator(QTcpSocket* socket);

    static QByteArray formatEvent(const QString& event, const QJsonObject& payload);
    static QByteArray wrapChunked(const QByteArray& data);
};

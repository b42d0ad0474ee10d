#include "sse_writer.h"
#include "core/log_manager.h"
#include <QJsonDocument>

void SseWriter::writeStreamHeader(QTcpSocket* socket)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        LOG_WARNING(QStringLiteral("SseWriter: cannot write stream header, socket not connected"));
        return;
    }

    const QByteArray header =
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/event-stream\r\n"
        "Cache-Control: no-cache\r\n"
        "Connection: keep-alive\r\n"
        "Access-Control-Allow-Origin: *\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n";

    socket->write(header);
    socket->flush();
}

QByteArray SseWriter::formatEvent(const QString& event, const QJsonObject& payload)
{
    QByteArray frame;
    if (!event.isEmpty()) {
        frame.append("event: ");
        frame.append(event.toUtf8());
        frame.append('\n');
    }
    // Compact JSON never contains a raw newline, so one data line suffices.
    frame.append("data: ");
    frame.append(QJsonDocument(payload).toJson(QJsonDocument::Compact));
    frame.append("\n\n");
    return frame;
}

QByteArray SseWriter::wrapChunked(const QByteArray& data)
{
    // HTTP/1.1 chunked transfer encoding:
    //   <hex-length>\r\n
    //   <data>\r\n
    QByteArray chunk;
    chunk.append(QByteArray::number(data.size(), 16));
    chunk.append("\r\n");
    chunk.append(data);
    chunk.append("\r\n");
    return chunk;
}

void SseWriter::sendEvent(QTcpSocket* socket, const QString& event, const QJsonObject& payload)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        LOG_DEBUG(QStringLiteral("SseWriter: dropping '%1', socket not connected").arg(event));
        return;
    }

    socket->write(wrapChunked(formatEvent(event, payload)));
    socket->flush();
}

void SseWriter::sendTerminator(QTcpSocket* socket)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        LOG_DEBUG(QStringLiteral("SseWriter: cannot send terminator, socket not connected"));
        return;
    }

    // The zero-length chunk signals end of chunked transfer
    socket->write("0\r\n\r\n");
    socket->flush();
}

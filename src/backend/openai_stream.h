#pragma once
#include "semantic/ports.h"
#include <QNetworkReply>

// SSE reader for one streaming chat-completions reply. Takes ownership of the
// reply.
class OpenAIStream : public BackendStream {
    Q_OBJECT
public:
    explicit OpenAIStream(QNetworkReply* reply, QObject* parent = nullptr);
    ~OpenAIStream() override;

    void abort() override;

    // Feeds raw bytes through the SSE parser; exposed for tests.
    void feed(const QByteArray& bytes);

private slots:
    void onReadyRead();
    void onReplyFinished();
    void onReplyError(QNetworkReply::NetworkError code);

private:
    bool parseSseEvents();
    void flushPendingEvent();
    void fail(const DomainFailure& failure);

    QNetworkReply* m_reply;
    QByteArray m_sseBuffer;
    QByteArray m_errorBody;
    QList<QByteArray> m_pendingDataLines;
    bool m_finished = false;
};

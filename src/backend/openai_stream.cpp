#include "openai_stream.h"
#include "openai_backend.h"
#include "core/log_manager.h"

OpenAIStream::OpenAIStream(QNetworkReply* reply, QObject* parent)
    : BackendStream(parent)
    , m_reply(reply)
{
    if (!m_reply)
        return;

    // Take ownership of the reply so it is cleaned up with this stream
    m_reply->setParent(this);

    connect(m_reply, &QNetworkReply::readyRead,
            this, &OpenAIStream::onReadyRead);
    connect(m_reply, &QNetworkReply::finished,
            this, &OpenAIStream::onReplyFinished);
    connect(m_reply, &QNetworkReply::errorOccurred,
            this, &OpenAIStream::onReplyError);
}

OpenAIStream::~OpenAIStream()
{
    if (m_reply) {
        m_finished = true;
        m_reply->disconnect(this);
        m_reply->abort();
        m_reply = nullptr;
    }
}

void OpenAIStream::abort()
{
    // No signal may follow an abort
    m_finished = true;
    if (m_reply)
        m_reply->abort();
}

void OpenAIStream::onReadyRead()
{
    if (!m_reply || m_finished) return;

    const int status = m_reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status >= 400) {
        // Error bodies are plain JSON, kept for mapFailure
        m_errorBody.append(m_reply->readAll());
        return;
    }
    feed(m_reply->readAll());
}

void OpenAIStream::feed(const QByteArray& bytes)
{
    m_sseBuffer.append(bytes);
    parseSseEvents();
}

void OpenAIStream::onReplyFinished()
{
    if (m_finished) return;

    // Flush the last event block if the server closed without a blank line
    if (!m_sseBuffer.isEmpty()) {
        m_sseBuffer.append("\n\n");
        parseSseEvents();
    }
    if (m_finished) return;

    m_finished = true;
    emit finished();
}

void OpenAIStream::onReplyError(QNetworkReply::NetworkError code)
{
    if (m_finished) return;

    DomainFailure failure;

    switch (code) {
    case QNetworkReply::NoError:
        return;

    case QNetworkReply::OperationCanceledError:
        failure = DomainFailure::timeout(
            QStringLiteral("Stream operation was cancelled"));
        break;

    case QNetworkReply::TimeoutError:
        failure = DomainFailure::timeout(
            QStringLiteral("Stream connection timed out"));
        break;

    case QNetworkReply::ConnectionRefusedError:
    case QNetworkReply::RemoteHostClosedError:
    case QNetworkReply::HostNotFoundError:
    case QNetworkReply::UnknownNetworkError:
    case QNetworkReply::TemporaryNetworkFailureError:
    case QNetworkReply::NetworkSessionFailedError:
        failure = DomainFailure::unavailable(
            QStringLiteral("Network error: %1").arg(
                m_reply ? m_reply->errorString() : QStringLiteral("unknown")));
        break;

    default: {
        const int httpStatus = m_reply
            ? m_reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt() : 0;
        if (httpStatus >= 400) {
            m_errorBody.append(m_reply->readAll());
            failure = OpenAIBackend::mapFailure(httpStatus, m_errorBody);
        } else {
            failure = DomainFailure::internal(
                QStringLiteral("Stream network error (%1): %2")
                    .arg(static_cast<int>(code))
                    .arg(m_reply ? m_reply->errorString()
                                : QStringLiteral("unknown")));
        }
        break;
    }
    }

    fail(failure);
}

void OpenAIStream::fail(const DomainFailure& failure)
{
    LOG_ERROR(QStringLiteral("OpenAIStream error %1").arg(failure.describe()));

    m_finished = true;
    if (m_reply && m_reply->isRunning())
        m_reply->abort();
    emit error(failure);
}

bool OpenAIStream::parseSseEvents()
{
    bool processed = false;

    while (!m_finished) {
        // SSE events are delimited by double newlines.
        int delimPos = -1;
        int delimLen = 0;

        int crlfPos = m_sseBuffer.indexOf("\r\n\r\n");
        int lfPos = m_sseBuffer.indexOf("\n\n");

        if (crlfPos >= 0 && (lfPos < 0 || crlfPos <= lfPos)) {
            delimPos = crlfPos;
            delimLen = 4;
        } else if (lfPos >= 0) {
            delimPos = lfPos;
            delimLen = 2;
        }

        if (delimPos < 0)
            break;

        QByteArray block = m_sseBuffer.left(delimPos);
        m_sseBuffer.remove(0, delimPos + delimLen);
        m_pendingDataLines.clear();

        const QList<QByteArray> lines = block.split('\n');
        for (const QByteArray& rawLine : lines) {
            QByteArray line = rawLine;
            if (line.endsWith('\r'))
                line.chop(1);

            // Blank lines and ":" heartbeats carry nothing
            if (line.isEmpty() || line.startsWith(':'))
                continue;

            if (line.startsWith("data:"))
                m_pendingDataLines.append(line.mid(5).trimmed());
            // event:, id: and retry: are not used by chat completions
        }

        flushPendingEvent();
        processed = true;
    }

    return processed;
}

void OpenAIStream::flushPendingEvent()
{
    if (m_pendingDataLines.isEmpty())
        return;

    QByteArray data = m_pendingDataLines.join('\n');
    m_pendingDataLines.clear();

    if (data == "[DONE]") {
        if (!m_finished) {
            m_finished = true;
            emit finished();
        }
        return;
    }

    if (data.isEmpty())
        return;

    Result<BackendChunk> result = OpenAIBackend::parseChunk(data);
    if (!result) {
        fail(result.error());
        return;
    }

    if (!result->text.isEmpty() || !result->fragments.isEmpty())
        emit chunkReady(*result);
}

#include "http_server.h"
#include "message_request.h"
#include "agent/agent_session.h"
#include "core/log_manager.h"
#include "relay/event_channel.h"
#include "relay/sse_writer.h"

#include <QFile>
#include <QHostAddress>
#include <QJsonDocument>
#include <QJsonObject>
#include <QPointer>

// ========================================================================
// Construction / destruction
// ========================================================================

HttpServer::HttpServer(const ServiceConfig& config,
                       IChatBackend* backend,
                       ExecutorFactory executorFactory,
                       QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_backend(backend)
    , m_executorFactory(std::move(executorFactory))
    , m_artifacts(config.sandbox.workRoot, config.sandbox.outputSubdir, config.sandbox.artifactExtension)
{
    m_router.registerDefaults();
}

HttpServer::~HttpServer()
{
    stop();
}

// ========================================================================
// start / stop
// ========================================================================

bool HttpServer::start()
{
    if (m_server) {
        stop();
    }

    QHostAddress address;
    if (!address.setAddress(m_config.server.host)) {
        LOG_ERROR(QStringLiteral("HttpServer: invalid listen address: %1").arg(m_config.server.host));
        return false;
    }

    m_server = new QTcpServer(this);
    connect(m_server, &QTcpServer::newConnection,
            this, &HttpServer::onNewConnection);

    const quint16 port = static_cast<quint16>(m_config.server.port);
    if (!m_server->listen(address, port)) {
        LOG_ERROR(QStringLiteral("HttpServer: failed to listen on %1:%2 - %3")
                      .arg(m_config.server.host)
                      .arg(port)
                      .arg(m_server->errorString()));
        delete m_server;
        m_server = nullptr;
        return false;
    }

    LOG_INFO(QStringLiteral("HttpServer: listening on %1:%2")
                 .arg(m_config.server.host)
                 .arg(m_server->serverPort()));
    emit statusChanged(true);
    return true;
}

void HttpServer::stop()
{
    if (!m_server) {
        return;
    }

    // Abort all active agent sessions
    const QList<AgentSession*> sessions = m_activeSessions.values();
    m_activeSessions.clear();
    for (AgentSession* session : sessions) {
        session->abort();
    }

    for (auto it = m_pendingData.begin(); it != m_pendingData.end(); ++it) {
        it.key()->disconnectFromHost();
    }
    m_pendingData.clear();

    m_server->close();
    delete m_server;
    m_server = nullptr;

    LOG_INFO(QStringLiteral("HttpServer: stopped"));
    emit statusChanged(false);
}

bool HttpServer::isRunning() const
{
    return m_server && m_server->isListening();
}

quint16 HttpServer::serverPort() const
{
    return m_server ? m_server->serverPort() : 0;
}

// ========================================================================
// Socket handling
// ========================================================================

void HttpServer::onNewConnection()
{
    while (m_server->hasPendingConnections()) {
        QTcpSocket* socket = m_server->nextPendingConnection();
        if (!socket) {
            continue;
        }

        m_pendingData.insert(socket, QByteArray());
        connect(socket, &QTcpSocket::readyRead,
                this, &HttpServer::onSocketReadyRead);
        connect(socket, &QTcpSocket::disconnected,
                this, &HttpServer::onSocketDisconnected);

        LOG_DEBUG(QStringLiteral("HttpServer: new connection from %1:%2")
                      .arg(socket->peerAddress().toString())
                      .arg(socket->peerPort()));
    }
}

void HttpServer::onSocketReadyRead()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket) {
        return;
    }

    const QByteArray incoming = socket->readAll();

    // An open event stream owns the socket until it ends
    if (m_activeSessions.contains(socket)) {
        LOG_DEBUG(QStringLiteral("HttpServer: ignoring %1 byte(s) sent during an event stream")
                      .arg(incoming.size()));
        return;
    }

    m_pendingData[socket] += incoming;
    processPending(socket);
}

void HttpServer::processPending(QTcpSocket* socket)
{
    if (!m_pendingData.contains(socket)) {
        return;
    }
    QByteArray& buffer = m_pendingData[socket];

    while (true) {
        // A file still going out holds the connection; resumed when it is done
        if (socket->findChild<QFile*>(QString(), Qt::FindDirectChildrenOnly)) {
            return;
        }

        const int headerEnd = buffer.indexOf("\r\n\r\n");
        if (headerEnd < 0) {
            return;
        }

        qint64 contentLength = 0;
        bool hasChunkedTransfer = false;
        const QString headerBlock = QString::fromUtf8(buffer.left(headerEnd));
        const QStringList headerLines = headerBlock.split(QStringLiteral("\r\n"));
        for (const QString& line : headerLines) {
            if (line.startsWith(QStringLiteral("Content-Length:"), Qt::CaseInsensitive)) {
                contentLength = line.mid(15).trimmed().toLongLong();
            }
            if (line.startsWith(QStringLiteral("Transfer-Encoding:"), Qt::CaseInsensitive)
                && line.contains(QStringLiteral("chunked"), Qt::CaseInsensitive)) {
                hasChunkedTransfer = true;
            }
        }

        if (hasChunkedTransfer) {
            sendFailure(socket, DomainFailure::notSupported(
                QStringLiteral("chunked_body"), QStringLiteral("chunked request bodies are not supported")));
            buffer.clear();
            return;
        }

        if (contentLength < 0 || contentLength > kMaxBodyBytes) {
            sendFailure(socket, DomainFailure::invalidInput(
                QStringLiteral("body_too_large"), QStringLiteral("request body too large")));
            buffer.clear();
            socket->disconnectFromHost();
            return;
        }

        const int bodyStart = headerEnd + 4;
        const qint64 totalRequired = bodyStart + contentLength;
        if (buffer.size() < totalRequired) {
            return;
        }

        const QByteArray requestData = buffer.left(totalRequired);
        buffer.remove(0, totalRequired);

        const HttpRequest req = parseHttpRequest(requestData);
        handleRequest(socket, req);

        if (socket->state() != QAbstractSocket::ConnectedState
            || !m_pendingData.contains(socket)) {
            return;
        }
        // An open event stream owns the socket from here on
        if (m_activeSessions.contains(socket)) {
            if (!buffer.isEmpty()) {
                LOG_DEBUG(QStringLiteral("HttpServer: dropping %1 pipelined byte(s) behind an event stream")
                              .arg(buffer.size()));
                buffer.clear();
            }
            return;
        }

        if (buffer.isEmpty()) {
            return;
        }
    }
}

void HttpServer::onSocketDisconnected()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket) {
        return;
    }

    m_pendingData.remove(socket);

    AgentSession* session = m_activeSessions.take(socket);
    if (session) {
        LOG_INFO(QStringLiteral("HttpServer: client went away, aborting session"));
        session->abort();
    }

    socket->deleteLater();
    LOG_DEBUG(QStringLiteral("HttpServer: client disconnected"));
}

// ========================================================================
// parseHttpRequest
// ========================================================================

HttpServer::HttpRequest HttpServer::parseHttpRequest(const QByteArray& data)
{
    HttpRequest req;

    int headerEnd = data.indexOf("\r\n\r\n");
    if (headerEnd < 0) {
        return req;
    }

    QString headerBlock = QString::fromUtf8(data.left(headerEnd));
    QStringList lines = headerBlock.split(QStringLiteral("\r\n"));

    // Parse the request line: "METHOD PATH HTTP/1.1"
    if (!lines.isEmpty()) {
        QStringList parts = lines[0].split(QLatin1Char(' '));
        if (parts.size() >= 3) {
            req.method      = parts[0].trimmed().toUpper();
            req.path        = parts[1];
            req.httpVersion = parts[2];
        }
    }

    // Parse headers
    for (int i = 1; i < lines.size(); ++i) {
        int colon = lines[i].indexOf(QLatin1Char(':'));
        if (colon > 0) {
            QString key   = lines[i].left(colon).trimmed().toLower();
            QString value = lines[i].mid(colon + 1).trimmed();
            req.headers[key] = value;
        }
    }

    req.body = data.mid(headerEnd + 4);
    req.complete = !req.method.isEmpty();

    return req;
}

// ========================================================================
// handleRequest
// ========================================================================

void HttpServer::handleRequest(QTcpSocket* socket, const HttpRequest& request)
{
    LOG_INFO(QStringLiteral("HttpServer: %1 %2").arg(request.method, request.path));

    if (!request.complete) {
        sendFailure(socket, DomainFailure::invalidInput(
            QStringLiteral("malformed_request"), QStringLiteral("malformed HTTP request line")));
        return;
    }

    auto route = m_router.match(request.method, request.path);
    if (!route) {
        QJsonObject errObj;
        errObj[QStringLiteral("error")] = QStringLiteral("route not found");
        errObj[QStringLiteral("path")]  = request.path;
        sendHttpResponse(socket, 404,
                         QJsonDocument(errObj).toJson(QJsonDocument::Compact));
        return;
    }

    switch (route->kind) {
    case RouteKind::Greeting: {
        QJsonObject obj;
        obj[QStringLiteral("message")] = QStringLiteral("Hello from API!");
        sendHttpResponse(socket, 200, QJsonDocument(obj).toJson(QJsonDocument::Compact));
        break;
    }
    case RouteKind::Messages:
        handleMessages(socket, request);
        break;
    case RouteKind::Artifact:
        handleArtifact(socket, route->remainder);
        break;
    }
}

void HttpServer::handleMessages(QTcpSocket* socket, const HttpRequest& request)
{
    auto history = MessageRequest::parse(request.body);
    if (!history) {
        LOG_WARNING(QStringLiteral("HttpServer: rejected message request %1").arg(history.error().describe()));
        sendFailure(socket, history.error());
        return;
    }

    if (!m_backend) {
        sendFailure(socket, DomainFailure::unavailable(QStringLiteral("chat backend not configured")));
        return;
    }

    std::unique_ptr<ICodeExecutor> executor = m_executorFactory ? m_executorFactory() : nullptr;

    auto* channel = new EventChannel(this);
    auto* session = new AgentSession(m_backend, std::move(executor), channel, *history, this);
    channel->setParent(session);
    m_activeSessions.insert(socket, session);

    SseWriter::writeStreamHeader(socket);

    QPointer<QTcpSocket> guarded(socket);
    connect(channel, &EventChannel::eventPublished, this,
            [guarded](const QString& event, const QJsonObject& payload) {
                SseWriter::sendEvent(guarded.data(), event, payload);
            });
    connect(channel, &EventChannel::closed, this, [guarded]() {
        SseWriter::sendTerminator(guarded.data());
    });

    connect(session, &AgentSession::finished, this, [this, guarded, session]() {
        if (guarded && m_activeSessions.value(guarded.data()) == session) {
            m_activeSessions.remove(guarded.data());
        }
        session->deleteLater();
    });

    LOG_INFO(QStringLiteral("HttpServer: opened event stream with %1 history message(s)")
                 .arg(history->size()));
    session->start();
}

void HttpServer::handleArtifact(QTcpSocket* socket, const QString& relativePath)
{
    auto path = m_artifacts.resolve(relativePath);
    if (!path) {
        sendFailure(socket, path.error());
        return;
    }

    auto* file = new QFile(*path, socket);
    if (!file->open(QIODevice::ReadOnly)) {
        LOG_ERROR(QStringLiteral("HttpServer: cannot read %1: %2").arg(*path, file->errorString()));
        delete file;
        sendFailure(socket, DomainFailure::internal(QStringLiteral("Internal server error")));
        return;
    }

    socket->write(responseHead(200, QStringLiteral("video/mp4"), file->size(),
                               {{"Cache-Control", "public, max-age=31536000, immutable"}}));

    // Keeps at most one chunk queued on the socket
    QPointer<QTcpSocket> guarded(socket);
    auto pump = [this, guarded, file]() {
        if (!guarded || file->parent() != guarded.data()) {
            return;
        }
        while (!file->atEnd() && guarded->bytesToWrite() < kArtifactChunkBytes) {
            const QByteArray chunk = file->read(kArtifactChunkBytes);
            if (chunk.isEmpty()) {
                LOG_ERROR(QStringLiteral("HttpServer: read failed mid-transfer of %1: %2")
                              .arg(file->fileName(), file->errorString()));
                file->setParent(nullptr);
                file->deleteLater();
                guarded->abort();
                return;
            }
            guarded->write(chunk);
        }
        if (!file->atEnd()) {
            return;
        }
        LOG_DEBUG(QStringLiteral("HttpServer: sent %1 (%2 bytes)").arg(file->fileName()).arg(file->size()));
        file->setParent(nullptr);
        file->deleteLater();
        // Requests that queued up behind the transfer
        QMetaObject::invokeMethod(this, [this, guarded]() {
            if (guarded) {
                processPending(guarded.data());
            }
        }, Qt::QueuedConnection);
    };
    connect(socket, &QTcpSocket::bytesWritten, file, pump);
    pump();
}

// ========================================================================
// sendHttpResponse
// ========================================================================

void HttpServer::sendFailure(QTcpSocket* socket, const DomainFailure& failure)
{
    sendHttpResponse(socket, failure.httpStatus(),
                     QJsonDocument(failure.toJson()).toJson(QJsonDocument::Compact));
}

void HttpServer::sendHttpResponse(QTcpSocket* socket, int status,
                                  const QByteArray& body,
                                  const QString& contentType,
                                  const HeaderList& extraHeaders)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        return;
    }

    QByteArray response = responseHead(status, contentType, body.size(), extraHeaders);
    response.append(body);

    socket->write(response);
    socket->flush();
}

QByteArray HttpServer::responseHead(int status, const QString& contentType, qint64 contentLength,
                                    const HeaderList& extraHeaders)
{
    static const QMap<int, QString> statusTexts = {
        {200, QStringLiteral("OK")},
        {400, QStringLiteral("Bad Request")},
        {401, QStringLiteral("Unauthorized")},
        {403, QStringLiteral("Forbidden")},
        {404, QStringLiteral("Not Found")},
        {429, QStringLiteral("Too Many Requests")},
        {500, QStringLiteral("Internal Server Error")},
        {501, QStringLiteral("Not Implemented")},
        {503, QStringLiteral("Service Unavailable")},
        {504, QStringLiteral("Gateway Timeout")}
    };

    QString statusText = statusTexts.value(status, QStringLiteral("Unknown"));

    QByteArray response;
    response.append(QStringLiteral("HTTP/1.1 %1 %2\r\n")
                        .arg(status)
                        .arg(statusText)
                        .toUtf8());
    response.append(QStringLiteral("Content-Type: %1\r\n")
                        .arg(contentType)
                        .toUtf8());
    response.append(QStringLiteral("Content-Length: %1\r\n")
                        .arg(contentLength)
                        .toUtf8());
    for (const auto& header : extraHeaders) {
        response.append(header.first).append(": ").append(header.second).append("\r\n");
    }
    response.append("Access-Control-Allow-Origin: *\r\n");
    response.append("Connection: keep-alive\r\n");
    response.append("\r\n");
    return response;
}

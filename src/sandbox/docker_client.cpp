#include "docker_client.h"
#include "core/log_manager.h"
#include <QEventLoop>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLocalSocket>
#include <QMutexLocker>
#include <QTimer>
#include <QUrl>
#include <QtEndian>

DockerEngineClient::DockerEngineClient(const SandboxOptions& options)
    : m_options(options)
{
}

DockerEngineClient::~DockerEngineClient()
{
    close();
}

// ============================================================================
// Wire helpers
// ============================================================================

QByteArray DockerEngineClient::buildRequest(const QByteArray& method, const QString& path,
                                            const QByteArray& body)
{
    QByteArray raw;
    raw.append(method).append(' ').append(path.toUtf8()).append(" HTTP/1.1\r\n");
    raw.append("Host: docker\r\n");
    raw.append("User-Agent: scenecast\r\n");
    raw.append("Connection: close\r\n");
    if (!body.isEmpty())
        raw.append("Content-Type: application/json\r\n");
    raw.append("Content-Length: ").append(QByteArray::number(body.size())).append("\r\n");
    raw.append("\r\n");
    raw.append(body);
    return raw;
}

std::optional<DockerEngineClient::HttpResponse> DockerEngineClient::parseHttpResponse(const QByteArray& raw)
{
    const int headerEnd = raw.indexOf("\r\n\r\n");
    if (headerEnd < 0)
        return std::nullopt;

    const QList<QByteArray> lines = raw.left(headerEnd).split('\n');
    if (lines.isEmpty())
        return std::nullopt;

    // HTTP/1.1 200 OK
    const QList<QByteArray> statusParts = lines.first().trimmed().split(' ');
    if (statusParts.size() < 2 || !statusParts[0].startsWith("HTTP/"))
        return std::nullopt;

    bool ok = false;
    HttpResponse response;
    response.status = statusParts[1].toInt(&ok);
    if (!ok)
        return std::nullopt;

    for (int i = 1; i < lines.size(); ++i) {
        const QByteArray line = lines[i].trimmed();
        const int colon = line.indexOf(':');
        if (colon <= 0)
            continue;
        response.headers.insert(line.left(colon).trimmed().toLower(), line.mid(colon + 1).trimmed());
    }

    QByteArray body = raw.mid(headerEnd + 4);
    if (response.headers.value("transfer-encoding").toLower().contains("chunked")) {
        auto decoded = decodeChunkedBody(body);
        if (!decoded)
            return std::nullopt;
        body = *decoded;
    } else if (response.headers.contains("content-length")) {
        const int length = response.headers.value("content-length").toInt(&ok);
        if (ok && length >= 0 && length < body.size())
            body.truncate(length);
    }
    response.body = body;
    return response;
}

std::optional<QByteArray> DockerEngineClient::decodeChunkedBody(const QByteArray& body)
{
    QByteArray out;
    int pos = 0;

    while (pos < body.size()) {
        const int lineEnd = body.indexOf("\r\n", pos);
        if (lineEnd < 0)
            return std::nullopt;

        QByteArray sizeField = body.mid(pos, lineEnd - pos);
        const int ext = sizeField.indexOf(';');
        if (ext >= 0)
            sizeField.truncate(ext);

        bool ok = false;
        const qint64 size = sizeField.trimmed().toLongLong(&ok, 16);
        if (!ok || size < 0)
            return std::nullopt;

        pos = lineEnd + 2;
        if (size == 0)
            return out;

        if (pos + size > body.size())
            return std::nullopt;
        out.append(body.mid(pos, size));
        pos += size;

        if (body.mid(pos, 2) != "\r\n")
            return std::nullopt;
        pos += 2;
    }

    // Connection closed before the terminating chunk
    return std::nullopt;
}

QByteArray DockerEngineClient::demuxLogStream(const QByteArray& raw)
{
    // Frame: [stream type, 0, 0, 0, size (4 bytes, big endian)] payload
    QByteArray out;
    int pos = 0;

    while (pos < raw.size()) {
        if (raw.size() - pos < 8)
            return raw;

        const auto type = static_cast<quint8>(raw[pos]);
        if (type > 2 || raw[pos + 1] != 0 || raw[pos + 2] != 0 || raw[pos + 3] != 0)
            return raw;

        const quint32 size = qFromBigEndian<quint32>(raw.constData() + pos + 4);
        pos += 8;
        if (size > static_cast<quint32>(raw.size() - pos))
            return raw;

        out.append(raw.constData() + pos, size);
        pos += size;
    }
    return out;
}

QByteArray DockerEngineClient::containerSpecJson(const ContainerSpec& spec)
{
    QJsonObject hostConfig;
    hostConfig["Binds"] = QJsonArray::fromStringList(spec.binds);
    if (!spec.networkMode.isEmpty())
        hostConfig["NetworkMode"] = spec.networkMode;

    QJsonObject body;
    body["Image"] = spec.image;
    body["Cmd"] = QJsonArray::fromStringList(spec.command);
    body["WorkingDir"] = spec.workingDir;
    body["Tty"] = false;
    body["AttachStdout"] = true;
    body["AttachStderr"] = true;
    body["NetworkDisabled"] = spec.networkMode == QLatin1String("none");
    body["HostConfig"] = hostConfig;
    return QJsonDocument(body).toJson(QJsonDocument::Compact);
}

QString DockerEngineClient::apiPath(const QString& path) const
{
    if (m_options.dockerApiVersion.isEmpty())
        return path;
    return QStringLiteral("/%1%2").arg(m_options.dockerApiVersion, path);
}

DomainFailure DockerEngineClient::failureFor(const HttpResponse& response, const QString& action) const
{
    QString detail = QString::fromUtf8(response.body).trimmed();
    const QJsonDocument doc = QJsonDocument::fromJson(response.body);
    if (doc.isObject() && doc.object().value("message").isString())
        detail = doc.object().value("message").toString();

    const QString msg = QStringLiteral("%1 failed (HTTP %2): %3").arg(action).arg(response.status).arg(detail);
    if (response.status == 404)
        return DomainFailure::notFound(QStringLiteral("docker_not_found"), msg);
    if (response.status == 409)
        return DomainFailure::invalidInput(QStringLiteral("docker_conflict"), msg);
    if (response.status >= 500)
        return DomainFailure::unavailable(msg);
    return DomainFailure::internal(msg);
}

// ============================================================================
// Transport
// ============================================================================

Result<DockerEngineClient::HttpResponse> DockerEngineClient::request(
    const QByteArray& method, const QString& path, const QByteArray& body,
    int timeoutMs, bool interruptible)
{
    if (m_closed)
        return std::unexpected(DomainFailure::unavailable(QStringLiteral("docker client closed")));
    if (interruptible && m_interrupted)
        return std::unexpected(DomainFailure::internal(QStringLiteral("interrupted")));

    QLocalSocket socket;
    QByteArray received;
    bool connected = false;
    bool disconnected = false;
    bool timedOut = false;
    QString socketError;

    QEventLoop loop;
    QTimer timeoutTimer;
    timeoutTimer.setSingleShot(true);

    QObject::connect(&socket, &QLocalSocket::connected, &loop, [&]() {
        connected = true;
        socket.write(buildRequest(method, path, body));
    });
    QObject::connect(&socket, &QLocalSocket::readyRead, &loop, [&]() {
        received.append(socket.readAll());
    });
    QObject::connect(&socket, &QLocalSocket::disconnected, &loop, [&]() {
        disconnected = true;
        received.append(socket.readAll());
        loop.quit();
    });
    QObject::connect(&socket, &QLocalSocket::errorOccurred, &loop,
                     [&](QLocalSocket::LocalSocketError err) {
        // The daemon closing its end after the response is the normal finish
        if (err == QLocalSocket::PeerClosedError)
            return;
        socketError = socket.errorString();
        loop.quit();
    });
    QObject::connect(&timeoutTimer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        loop.quit();
    });

    if (interruptible) {
        QMutexLocker lock(&m_loopMutex);
        m_activeLoop = &loop;
    }

    timeoutTimer.start(timeoutMs);
    socket.connectToServer(m_options.dockerSocket);
    // An interrupt that landed before the loop was registered has nothing to quit
    const bool cutShort = interruptible && (m_interrupted || m_closed);
    if (!cutShort && !disconnected && socketError.isEmpty())
        loop.exec();

    if (interruptible) {
        QMutexLocker lock(&m_loopMutex);
        m_activeLoop = nullptr;
    }

    if (!disconnected) {
        received.append(socket.readAll());
        socket.abort();
    }

    if (interruptible && m_interrupted)
        return std::unexpected(DomainFailure::internal(QStringLiteral("interrupted")));
    if (timedOut)
        return std::unexpected(DomainFailure::timeout(
            QStringLiteral("docker %1 %2 timed out after %3 ms")
                .arg(QString::fromLatin1(method), path).arg(timeoutMs)));
    if (!connected)
        return std::unexpected(DomainFailure::unavailable(
            QStringLiteral("cannot reach docker at %1: %2").arg(m_options.dockerSocket, socketError)));

    auto response = parseHttpResponse(received);
    if (!response) {
        if (!socketError.isEmpty())
            return std::unexpected(DomainFailure::unavailable(socketError));
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("malformed docker response to %1 %2").arg(QString::fromLatin1(method), path)));
    }
    return *response;
}

// ============================================================================
// Container lifecycle
// ============================================================================

VoidResult DockerEngineClient::pullImage(const QString& image)
{
    QString repo = image;
    QString tag = QStringLiteral("latest");
    const int colon = image.lastIndexOf(':');
    if (colon > image.lastIndexOf('/')) {
        repo = image.left(colon);
        tag = image.mid(colon + 1);
    }

    LOG_INFO(QStringLiteral("Docker: pulling image %1:%2").arg(repo, tag));
    const QString path = apiPath(QStringLiteral("/images/create?fromImage=%1&tag=%2")
        .arg(QString::fromUtf8(QUrl::toPercentEncoding(repo)),
             QString::fromUtf8(QUrl::toPercentEncoding(tag))));

    auto response = request("POST", path, {}, m_options.waitTimeout);
    if (!response)
        return std::unexpected(response.error());
    if (response->status != 200)
        return std::unexpected(failureFor(*response, QStringLiteral("pull %1").arg(image)));

    // Progress is a stream of JSON lines; a failed pull still answers 200
    for (const QByteArray& line : response->body.split('\n')) {
        const QJsonDocument doc = QJsonDocument::fromJson(line.trimmed());
        if (doc.isObject() && doc.object().contains("error"))
            return std::unexpected(DomainFailure::unavailable(
                QStringLiteral("pull %1 failed: %2").arg(image, doc.object().value("error").toString())));
    }
    return {};
}

Result<QString> DockerEngineClient::createContainer(const ContainerSpec& spec)
{
    QString path = QStringLiteral("/containers/create");
    if (!spec.name.isEmpty())
        path += QStringLiteral("?name=") + QString::fromUtf8(QUrl::toPercentEncoding(spec.name));
    path = apiPath(path);

    const QByteArray body = containerSpecJson(spec);
    auto response = request("POST", path, body, m_options.apiTimeout);
    if (!response)
        return std::unexpected(response.error());

    if (response->status == 404 && m_options.pullMissingImage) {
        auto pulled = pullImage(spec.image);
        if (!pulled)
            return std::unexpected(pulled.error());
        response = request("POST", path, body, m_options.apiTimeout);
        if (!response)
            return std::unexpected(response.error());
    }

    if (response->status != 201)
        return std::unexpected(failureFor(*response, QStringLiteral("create container")));

    const QJsonObject obj = QJsonDocument::fromJson(response->body).object();
    const QString id = obj.value("Id").toString();
    if (id.isEmpty())
        return std::unexpected(DomainFailure::internal(QStringLiteral("create container: no Id in response")));

    for (const auto& warning : obj.value("Warnings").toArray())
        LOG_WARNING(QStringLiteral("Docker: %1").arg(warning.toString()));

    LOG_DEBUG(QStringLiteral("Docker: created container %1 (%2)").arg(id.left(12), spec.name));
    return id;
}

VoidResult DockerEngineClient::startContainer(const QString& containerId)
{
    auto response = request("POST", apiPath(QStringLiteral("/containers/%1/start").arg(containerId)),
                            {}, m_options.apiTimeout);
    if (!response)
        return std::unexpected(response.error());
    if (response->status != 204 && response->status != 304)
        return std::unexpected(failureFor(*response, QStringLiteral("start container")));
    return {};
}

Result<int> DockerEngineClient::waitContainer(const QString& containerId)
{
    auto response = request("POST", apiPath(QStringLiteral("/containers/%1/wait").arg(containerId)),
                            {}, m_options.waitTimeout, true);
    if (!response)
        return std::unexpected(response.error());
    if (response->status != 200)
        return std::unexpected(failureFor(*response, QStringLiteral("wait container")));

    const QJsonObject obj = QJsonDocument::fromJson(response->body).object();
    if (!obj.contains("StatusCode"))
        return std::unexpected(DomainFailure::internal(QStringLiteral("wait container: no StatusCode in response")));

    const QJsonObject error = obj.value("Error").toObject();
    if (!error.value("Message").toString().isEmpty())
        LOG_WARNING(QStringLiteral("Docker: wait reported: %1").arg(error.value("Message").toString()));

    return obj.value("StatusCode").toInt();
}

Result<QByteArray> DockerEngineClient::containerLogs(const QString& containerId)
{
    auto response = request("GET",
                            apiPath(QStringLiteral("/containers/%1/logs?stdout=1&stderr=1").arg(containerId)),
                            {}, m_options.apiTimeout, true);
    if (!response)
        return std::unexpected(response.error());
    if (response->status != 200)
        return std::unexpected(failureFor(*response, QStringLiteral("read logs")));
    return demuxLogStream(response->body);
}

VoidResult DockerEngineClient::stopContainer(const QString& containerId)
{
    auto response = request("POST",
                            apiPath(QStringLiteral("/containers/%1/stop?t=%2").arg(containerId).arg(m_options.stopTimeoutSecs)),
                            {}, m_options.apiTimeout + m_options.stopTimeoutSecs * 1000);
    if (!response)
        return std::unexpected(response.error());
    // 304: already stopped
    if (response->status != 204 && response->status != 304)
        return std::unexpected(failureFor(*response, QStringLiteral("stop container")));
    return {};
}

VoidResult DockerEngineClient::removeContainer(const QString& containerId)
{
    auto response = request("DELETE",
                            apiPath(QStringLiteral("/containers/%1?force=1").arg(containerId)),
                            {}, m_options.apiTimeout);
    if (!response)
        return std::unexpected(response.error());
    if (response->status != 204)
        return std::unexpected(failureFor(*response, QStringLiteral("remove container")));
    return {};
}

void DockerEngineClient::interrupt()
{
    m_interrupted = true;
    QMutexLocker lock(&m_loopMutex);
    if (m_activeLoop)
        QMetaObject::invokeMethod(m_activeLoop, "quit", Qt::QueuedConnection);
}

void DockerEngineClient::close()
{
    if (m_closed.exchange(true))
        return;
    QMutexLocker lock(&m_loopMutex);
    if (m_activeLoop)
        QMetaObject::invokeMethod(m_activeLoop, "quit", Qt::QueuedConnection);
}

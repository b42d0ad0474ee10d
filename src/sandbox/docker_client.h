#pragma once
#include "config/config_types.h"
#include "semantic/ports.h"
#include <QByteArray>
#include <QMap>
#include <QMutex>
#include <atomic>
#include <optional>

class QEventLoop;

// Docker Engine API over the local unix socket. Every call opens its own
// HTTP/1.1 connection with "Connection: close" and blocks on an event loop
// local to the calling thread. Callers run it on a worker thread per
// execution; interrupt() and close() may be called from any thread.
class DockerEngineClient : public IContainerRuntime {
public:
    explicit DockerEngineClient(const SandboxOptions& options);
    ~DockerEngineClient() override;

    Result<QString> createContainer(const ContainerSpec& spec) override;
    VoidResult startContainer(const QString& containerId) override;
    Result<int> waitContainer(const QString& containerId) override;
    Result<QByteArray> containerLogs(const QString& containerId) override;
    VoidResult stopContainer(const QString& containerId) override;
    VoidResult removeContainer(const QString& containerId) override;

    void interrupt() override;
    void close() override;

    struct HttpResponse {
        int status = 0;
        QMap<QByteArray, QByteArray> headers;   // lower-cased names
        QByteArray body;
    };

    static QByteArray buildRequest(const QByteArray& method, const QString& path,
                                   const QByteArray& body);
    static std::optional<HttpResponse> parseHttpResponse(const QByteArray& raw);
    static std::optional<QByteArray> decodeChunkedBody(const QByteArray& body);

    // Strips the 8-byte stream headers Docker puts in front of every log frame
    // of a non-TTY container. Input that is not framed comes back unchanged.
    static QByteArray demuxLogStream(const QByteArray& raw);

    static QByteArray containerSpecJson(const ContainerSpec& spec);

private:
    Result<HttpResponse> request(const QByteArray& method, const QString& path,
                                 const QByteArray& body, int timeoutMs,
                                 bool interruptible = false);
    VoidResult pullImage(const QString& image);
    DomainFailure failureFor(const HttpResponse& response, const QString& action) const;
    QString apiPath(const QString& path) const;

    SandboxOptions m_options;
    QMutex m_loopMutex;
    QEventLoop* m_activeLoop = nullptr;   // guarded by m_loopMutex
    std::atomic<bool> m_interrupted{false};
    std::atomic<bool> m_closed{false};
};

#pragma once
#include "artifact_lookup.h"
#include "request_router.h"
#include "config/config_types.h"
#include "semantic/ports.h"
#include <QMap>
#include <QObject>
#include <QPair>
#include <QTcpServer>
#include <QTcpSocket>
#include <functional>
#include <memory>

class AgentSession;

class HttpServer : public QObject {
    Q_OBJECT
public:
    using ExecutorFactory = std::function<std::unique_ptr<ICodeExecutor>()>;

    HttpServer(const ServiceConfig& config,
               IChatBackend* backend,
               ExecutorFactory executorFactory,
               QObject* parent = nullptr);
    ~HttpServer() override;

    bool start();
    void stop();
    bool isRunning() const;
    quint16 serverPort() const;
    int activeSessions() const { return m_activeSessions.size(); }

    struct HttpRequest {
        QString method, path, httpVersion;
        QMap<QString, QString> headers;
        QByteArray body;
        bool complete = false;
    };
    static HttpRequest parseHttpRequest(const QByteArray& data);

    static constexpr int kMaxBodyBytes = 8 * 1024 * 1024;
    static constexpr qint64 kArtifactChunkBytes = 64 * 1024;

signals:
    void statusChanged(bool running);

private slots:
    void onNewConnection();
    void onSocketReadyRead();
    void onSocketDisconnected();

private:
    using HeaderList = QList<QPair<QByteArray, QByteArray>>;

    void processPending(QTcpSocket* socket);
    void handleRequest(QTcpSocket* socket, const HttpRequest& request);
    void handleMessages(QTcpSocket* socket, const HttpRequest& request);
    void handleArtifact(QTcpSocket* socket, const QString& relativePath);
    static QByteArray responseHead(int status, const QString& contentType, qint64 contentLength,
                                   const HeaderList& extraHeaders);
    void sendHttpResponse(QTcpSocket* socket, int status,
                          const QByteArray& body,
                          const QString& contentType = QStringLiteral("application/json"),
                          const HeaderList& extraHeaders = {});
    void sendFailure(QTcpSocket* socket, const DomainFailure& failure);

    ServiceConfig m_config;
    IChatBackend* m_backend;
    ExecutorFactory m_executorFactory;
    QTcpServer* m_server = nullptr;
    RequestRouter m_router;
    ArtifactLookup m_artifacts;
    QMap<QTcpSocket*, QByteArray> m_pendingData;
    QMap<QTcpSocket*, AgentSession*> m_activeSessions;
};

#pragma once
#include "conversation.h"
#include "execution.h"
#include "failure.h"
#include <expected>
#include <QByteArray>
#include <QList>
#include <QObject>

template<typename T>
using Result = std::expected<T, DomainFailure>;

using VoidResult = std::expected<void, DomainFailure>;

class EventChannel;

// A single in-flight generation. Chunks arrive asynchronously; exactly one of
// finished() or error() ends the stream unless it is aborted first.
class BackendStream : public QObject {
    Q_OBJECT
public:
    explicit BackendStream(QObject* parent = nullptr) : QObject(parent) {}
    ~BackendStream() override = default;

    virtual void abort() = 0;

signals:
    void chunkReady(const BackendChunk& chunk);
    void finished();
    void error(const DomainFailure& failure);
};

class IChatBackend {
public:
    virtual ~IChatBackend() = default;
    virtual Result<BackendStream*> openStream(const QList<ChatMessage>& context) = 0;
};

class IContainerRuntime {
public:
    virtual ~IContainerRuntime() = default;
    virtual Result<QString> createContainer(const ContainerSpec& spec) = 0;
    virtual VoidResult startContainer(const QString& containerId) = 0;
    virtual Result<int> waitContainer(const QString& containerId) = 0;
    virtual Result<QByteArray> containerLogs(const QString& containerId) = 0;
    virtual VoidResult stopContainer(const QString& containerId) = 0;
    virtual VoidResult removeContainer(const QString& containerId) = 0;

    // Breaks a blocking wait from the outside; the interrupted call fails.
    virtual void interrupt() = 0;
    virtual void close() = 0;
};

// execute() blocks and runs on a worker thread; cancel() arrives from the
// session's thread while it runs.
class ICodeExecutor {
public:
    virtual ~ICodeExecutor() = default;
    virtual ExecutionResult execute(const ExecutionRequest& request,
                                    EventChannel* events) = 0;
    virtual void cancel() = 0;
};

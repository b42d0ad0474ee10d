#pragma once
#include "config/config_types.h"
#include "semantic/ports.h"
#include <QMutex>
#include <atomic>
#include <functional>
#include <memory>

// Runs one scene script in a throwaway container and reports the outcome as a
// value. One manager serves one session; executions never overlap.
// execute() blocks and is meant for a worker thread; cancel() may be called
// from any thread while it runs.
class ExecutionManager : public ICodeExecutor {
public:
    using RuntimeFactory = std::function<std::unique_ptr<IContainerRuntime>()>;

    ExecutionManager(const SandboxOptions& options, const QString& publicBaseUrl,
                     RuntimeFactory runtimeFactory);

    ExecutionResult execute(const ExecutionRequest& request, EventChannel* events) override;
    void cancel() override;

    bool isRunning() const { return m_running; }

    static ContainerSpec containerSpec(const SandboxOptions& options, const QString& workPath,
                                       const QString& requestId, const QString& entrySymbol);
    static QString artifactUrl(const QString& publicBaseUrl, const QString& requestId,
                               const QString& fileName);

private:
    void runSteps(const ExecutionRequest& request, EventChannel* events, ExecutionResult& result);

    SandboxOptions m_options;
    QString m_publicBaseUrl;
    RuntimeFactory m_runtimeFactory;

    void setActiveRuntime(IContainerRuntime* runtime);

    QMutex m_runtimeMutex;
    IContainerRuntime* m_activeRuntime = nullptr;   // guarded by m_runtimeMutex
    std::atomic<bool> m_cancelRequested{false};
    std::atomic<bool> m_running{false};
};

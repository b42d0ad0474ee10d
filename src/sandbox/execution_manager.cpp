#include "execution_manager.h"
#include "container_lease.h"
#include "entry_symbol.h"
#include "working_area.h"
#include "core/log_manager.h"
#include "relay/event_channel.h"
#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>
#include <QScopeGuard>
#include <QUuid>
#include <exception>

namespace {

void notify(EventChannel* events, const QString& content, NotificationStatus status)
{
    if (events)
        events->publishNotification(content, status);
}

void fail(ExecutionResult& result, ExecutionFailure kind, const QString& diagnostic)
{
    result.failure = kind;
    result.diagnostic = diagnostic;
}

}

ExecutionManager::ExecutionManager(const SandboxOptions& options, const QString& publicBaseUrl,
                                   RuntimeFactory runtimeFactory)
    : m_options(options)
    , m_publicBaseUrl(publicBaseUrl)
    , m_runtimeFactory(std::move(runtimeFactory))
{
}

ContainerSpec ExecutionManager::containerSpec(const SandboxOptions& options, const QString& workPath,
                                              const QString& requestId, const QString& entrySymbol)
{
    ContainerSpec spec;
    spec.name = QStringLiteral("scenecast-%1").arg(requestId);
    spec.image = options.image;
    spec.command << options.renderCommand << options.renderFlags
                 << options.sourceFileName << entrySymbol;
    spec.workingDir = options.containerWorkDir;
    spec.binds << QStringLiteral("%1:%2").arg(QDir(workPath).absolutePath(), options.containerWorkDir);
    spec.networkMode = options.networkMode;
    return spec;
}

QString ExecutionManager::artifactUrl(const QString& publicBaseUrl, const QString& requestId,
                                      const QString& fileName)
{
    QString base = publicBaseUrl;
    while (base.endsWith('/'))
        base.chop(1);
    return QStringLiteral("%1/api/videos/%2/%3").arg(base, requestId, fileName);
}

ExecutionResult ExecutionManager::execute(const ExecutionRequest& request, EventChannel* events)
{
    ExecutionResult result;
    result.requestId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    result.toolCallId = request.toolCallId;

    m_cancelRequested = false;
    m_running = true;

    LOG_INFO(QStringLiteral("ExecutionManager: execution %1 for call %2")
        .arg(result.requestId, request.toolCallId));
    notify(events, QStringLiteral("Starting scene execution"), NotificationStatus::Started);

    try {
        runSteps(request, events, result);
    } catch (const std::exception& e) {
        fail(result, ExecutionFailure::Internal,
             QStringLiteral("internal error: %1").arg(QString::fromUtf8(e.what())));
    }

    m_running = false;

    if (result.succeeded()) {
        LOG_INFO(QStringLiteral("ExecutionManager: %1 produced %2").arg(result.requestId, *result.artifactPath));
        if (events) {
            QJsonObject payload;
            payload["url"] = result.artifactUrl;
            payload["toolCallId"] = result.toolCallId;
            events->publish(RelayEvent::ArtifactUrl, payload);
        }
        notify(events, QStringLiteral("Scene execution completed"), NotificationStatus::Completed);
    } else {
        LOG_WARNING(QStringLiteral("ExecutionManager: %1 failed (%2): %3")
            .arg(result.requestId, QString::fromLatin1(ExecutionResult::failureName(result.failure)),
                 result.diagnostic.left(500)));
        notify(events, QStringLiteral("Scene execution failed"), NotificationStatus::Failed);
    }
    return result;
}

void ExecutionManager::runSteps(const ExecutionRequest& request, EventChannel* events, ExecutionResult& result)
{
    WorkingArea area(m_options.workRoot, result.requestId);
    if (auto created = area.create(); !created) {
        fail(result, ExecutionFailure::WorkingArea, created.error().message);
        return;
    }
    if (auto written = area.writeSource(m_options.sourceFileName, request.sourceText); !written) {
        fail(result, ExecutionFailure::WorkingArea, written.error().message);
        return;
    }

    const QString entrySymbol = EntrySymbol::detect(request.sourceText, m_options.defaultEntrySymbol);

    std::unique_ptr<IContainerRuntime> runtime = m_runtimeFactory ? m_runtimeFactory() : nullptr;
    if (!runtime) {
        fail(result, ExecutionFailure::Provisioning, QStringLiteral("no container runtime available"));
        return;
    }

    ContainerLease lease(std::move(runtime));
    // Cleared before the lease tears the runtime down
    setActiveRuntime(lease.runtime());
    auto clearActive = qScopeGuard([this]() { setActiveRuntime(nullptr); });

    auto containerId = lease.runtime()->createContainer(
        containerSpec(m_options, area.path(), result.requestId, entrySymbol));
    if (!containerId) {
        fail(result, ExecutionFailure::Provisioning,
             QStringLiteral("could not create container: %1").arg(containerId.error().message));
        return;
    }
    lease.setContainer(*containerId);

    if (m_cancelRequested) {
        fail(result, ExecutionFailure::Cancelled, QStringLiteral("execution cancelled before start"));
        return;
    }

    if (auto started = lease.runtime()->startContainer(*containerId); !started) {
        fail(result, ExecutionFailure::Provisioning,
             QStringLiteral("could not start container: %1").arg(started.error().message));
        return;
    }
    lease.markStarted();

    notify(events, QStringLiteral("Rendering %1 in sandbox").arg(entrySymbol), NotificationStatus::Running);

    auto exitStatus = lease.runtime()->waitContainer(*containerId);
    if (!exitStatus) {
        if (m_cancelRequested)
            fail(result, ExecutionFailure::Cancelled, QStringLiteral("execution cancelled while running"));
        else
            fail(result, ExecutionFailure::Internal,
                 QStringLiteral("waiting for container failed: %1").arg(exitStatus.error().message));
        return;
    }
    result.exitStatus = *exitStatus;

    if (auto logs = lease.runtime()->containerLogs(*containerId))
        result.combinedLog = QString::fromUtf8(*logs);
    else
        LOG_WARNING(QStringLiteral("ExecutionManager: no logs for %1: %2")
            .arg(result.requestId, logs.error().message));

    if (result.exitStatus != 0) {
        fail(result, ExecutionFailure::NonZeroExit,
             QStringLiteral("render exited with code %1. Logs: %2").arg(result.exitStatus).arg(result.combinedLog));
        return;
    }

    const auto artifact = area.findArtifact(m_options.outputSubdir, m_options.artifactExtension);
    if (!artifact) {
        fail(result, ExecutionFailure::ArtifactMissing,
             QStringLiteral("no %1 file found after execution. Logs: %2")
                 .arg(m_options.artifactExtension, result.combinedLog));
        return;
    }

    result.artifactPath = *artifact;
    result.artifactUrl = artifactUrl(m_publicBaseUrl, result.requestId, QFileInfo(*artifact).fileName());
}

void ExecutionManager::setActiveRuntime(IContainerRuntime* runtime)
{
    QMutexLocker lock(&m_runtimeMutex);
    m_activeRuntime = runtime;
}

void ExecutionManager::cancel()
{
    if (!m_running)
        return;
    m_cancelRequested = true;
    QMutexLocker lock(&m_runtimeMutex);
    if (m_activeRuntime)
        m_activeRuntime->interrupt();
}

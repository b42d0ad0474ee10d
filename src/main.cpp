#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QStandardPaths>

#include "agent/system_prompt.h"
#include "backend/openai_backend.h"
#include "config/config_store.h"
#include "core/log_manager.h"
#include "sandbox/docker_client.h"
#include "sandbox/execution_manager.h"
#include "server/http_server.h"

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("scenecast"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));

    // --- 1. Command line ---
    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Streams a code-generating agent and renders its scenes in disposable containers."));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption(QStringList{QStringLiteral("c"), QStringLiteral("config")},
                                    QStringLiteral("Configuration file."), QStringLiteral("path"));
    QCommandLineOption portOption(QStringList{QStringLiteral("p"), QStringLiteral("port")},
                                  QStringLiteral("Listen port, overrides the configuration."), QStringLiteral("port"));
    parser.addOption(configOption);
    parser.addOption(portOption);
    parser.process(app);

    // --- 2. Data directory ---
    QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir().mkpath(dataDir);
    const QString configPath = parser.isSet(configOption)
        ? parser.value(configOption)
        : dataDir + QStringLiteral("/config.json");

    // --- 3. Config + Log ---
    ConfigStore configStore;
    const bool loaded = configStore.load(configPath);
    configStore.applyDataDir(dataDir);
    if (!loaded) {
        configStore.save();
    }

    ServiceConfig& config = configStore.config();
    if (parser.isSet(portOption)) {
        bool ok = false;
        const int port = parser.value(portOption).toInt(&ok);
        if (!ok || port < 0 || port > 65535) {
            qCritical("invalid --port value: %s", qPrintable(parser.value(portOption)));
            return 2;
        }
        config.server.port = port;
    }

    QDir().mkpath(config.log.dir);
    LogManager::instance().initialize(config.log.dir,
                                      LogManager::levelFromString(config.log.level),
                                      config.log.console);
    LOG_INFO(QStringLiteral("scenecast v%1 starting, config %2")
                 .arg(app.applicationVersion(), configStore.filePath()));

    if (!config.isValid()) {
        LOG_ERROR(QStringLiteral("configuration is incomplete (backend url, model, image and work root are required)"));
        return 1;
    }
    if (config.backend.apiKey.isEmpty()) {
        LOG_WARNING(QStringLiteral("no backend API key configured; set api_key or OPENAI_API_KEY"));
    }
    if (!QDir().mkpath(config.sandbox.workRoot)) {
        LOG_ERROR(QStringLiteral("cannot create work root %1").arg(config.sandbox.workRoot));
        return 1;
    }

    // --- 4. Backend ---
    OpenAIBackend backend(config.backend, QString::fromUtf8(kSystemPrompt));

    // --- 5. Sandbox ---
    const SandboxOptions sandbox = config.sandbox;
    const QString publicBaseUrl = config.server.publicBaseUrl;
    auto executorFactory = [sandbox, publicBaseUrl]() -> std::unique_ptr<ICodeExecutor> {
        return std::make_unique<ExecutionManager>(sandbox, publicBaseUrl, [sandbox]() {
            return std::unique_ptr<IContainerRuntime>(new DockerEngineClient(sandbox));
        });
    };

    // --- 6. HTTP server ---
    HttpServer server(config, &backend, executorFactory);
    if (!server.start()) {
        return 1;
    }

    const int rc = app.exec();
    server.stop();
    LOG_INFO(QStringLiteral("scenecast stopped"));
    return rc;
}

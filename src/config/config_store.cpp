#include "config_store.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QtGlobal>

namespace {

QJsonValue jsonValueEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey)
{
    const QString snake = QString::fromUtf8(snakeKey);
    if (obj.contains(snake))
        return obj.value(snake);
    return obj.value(QString::fromUtf8(camelKey));
}

QString jsonStringEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey,
                         const QString& fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isString() ? value.toString() : fallback;
}

int jsonIntEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, int fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toInt(fallback);
}

bool jsonBoolEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, bool fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toBool(fallback);
}

QStringList jsonStringListEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey,
                                 const QStringList& fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    if (!value.isArray())
        return fallback;
    QStringList list;
    for (const auto& item : value.toArray())
        list.append(item.toString());
    return list;
}

int clampInt(int value, int minValue, int maxValue)
{
    return qBound(minValue, value, maxValue);
}

QString stripTrailingSlash(QString url)
{
    while (url.endsWith(QLatin1Char('/')))
        url.chop(1);
    return url;
}

}

bool ConfigStore::load(const QString& path) {
    m_filePath = path;

    bool loaded = false;
    QFile file(m_filePath);
    if (!m_filePath.isEmpty() && file.open(QIODevice::ReadOnly)) {
        QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
        if (doc.isObject()) {
            fromJson(doc.object());
            loaded = true;
        }
    }

    if (m_config.backend.apiKey.isEmpty())
        m_config.backend.apiKey = qEnvironmentVariable("OPENAI_API_KEY");

    return loaded;
}

bool ConfigStore::save() {
    if (m_filePath.isEmpty())
        return false;

    QFileInfo info(m_filePath);
    QDir().mkpath(info.absolutePath());

    QFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return false;
    file.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented));
    return true;
}

void ConfigStore::applyDataDir(const QString& dataDir) {
    if (m_config.sandbox.workRoot.isEmpty())
        m_config.sandbox.workRoot = dataDir + QStringLiteral("/executions");
    if (m_config.log.dir.isEmpty())
        m_config.log.dir = dataDir + QStringLiteral("/logs");
}

void ConfigStore::fromJson(const QJsonObject& root) {
    // server
    QJsonObject srv = root["server"].toObject();
    ServerOptions& server = m_config.server;
    server.host = jsonStringEither(srv, "host", "host", server.host);
    server.port = clampInt(jsonIntEither(srv, "port", "port", server.port), 1, 65535);
    server.publicBaseUrl = stripTrailingSlash(
        jsonStringEither(srv, "public_base_url", "publicBaseUrl", server.publicBaseUrl));

    // backend
    QJsonObject be = root["backend"].toObject();
    BackendOptions& backend = m_config.backend;
    backend.baseUrl = stripTrailingSlash(jsonStringEither(be, "base_url", "baseUrl", backend.baseUrl));
    backend.middleRoute = jsonStringEither(be, "middle_route", "middleRoute", backend.middleRoute);
    backend.apiKey = jsonStringEither(be, "api_key", "apiKey", backend.apiKey);
    backend.modelId = jsonStringEither(be, "model_id", "modelId", backend.modelId);
    backend.reasoningEffort = jsonStringEither(be, "reasoning_effort", "reasoningEffort", backend.reasoningEffort);
    backend.requestTimeout = clampInt(jsonIntEither(be, "request_timeout", "requestTimeout", backend.requestTimeout),
                                      1000, 600000);

    // sandbox
    QJsonObject sb = root["sandbox"].toObject();
    SandboxOptions& sandbox = m_config.sandbox;
    sandbox.dockerSocket = jsonStringEither(sb, "docker_socket", "dockerSocket", sandbox.dockerSocket);
    sandbox.dockerApiVersion = jsonStringEither(sb, "docker_api_version", "dockerApiVersion", sandbox.dockerApiVersion);
    sandbox.image = jsonStringEither(sb, "image", "image", sandbox.image);
    sandbox.workRoot = jsonStringEither(sb, "work_root", "workRoot", sandbox.workRoot);
    sandbox.containerWorkDir = jsonStringEither(sb, "container_work_dir", "containerWorkDir", sandbox.containerWorkDir);
    sandbox.sourceFileName = jsonStringEither(sb, "source_file_name", "sourceFileName", sandbox.sourceFileName);
    sandbox.defaultEntrySymbol = jsonStringEither(sb, "default_entry_symbol", "defaultEntrySymbol", sandbox.defaultEntrySymbol);
    sandbox.renderCommand = jsonStringEither(sb, "render_command", "renderCommand", sandbox.renderCommand);
    sandbox.renderFlags = jsonStringListEither(sb, "render_flags", "renderFlags", sandbox.renderFlags);
    sandbox.outputSubdir = jsonStringEither(sb, "output_subdir", "outputSubdir", sandbox.outputSubdir);
    sandbox.artifactExtension = jsonStringEither(sb, "artifact_extension", "artifactExtension", sandbox.artifactExtension);
    sandbox.networkMode = jsonStringEither(sb, "network_mode", "networkMode", sandbox.networkMode);
    sandbox.pullMissingImage = jsonBoolEither(sb, "pull_missing_image", "pullMissingImage", sandbox.pullMissingImage);
    sandbox.waitTimeout = clampInt(jsonIntEither(sb, "wait_timeout", "waitTimeout", sandbox.waitTimeout),
                                   1000, 3600000);
    sandbox.apiTimeout = clampInt(jsonIntEither(sb, "api_timeout", "apiTimeout", sandbox.apiTimeout),
                                  500, 600000);
    sandbox.stopTimeoutSecs = clampInt(jsonIntEither(sb, "stop_timeout_secs", "stopTimeoutSecs", sandbox.stopTimeoutSecs),
                                       0, 300);

    if (!sandbox.artifactExtension.isEmpty() && !sandbox.artifactExtension.startsWith(QLatin1Char('.')))
        sandbox.artifactExtension.prepend(QLatin1Char('.'));

    // log
    QJsonObject lg = root["log"].toObject();
    LogOptions& log = m_config.log;
    log.dir = jsonStringEither(lg, "dir", "dir", log.dir);
    log.level = jsonStringEither(lg, "level", "level", log.level);
    log.console = jsonBoolEither(lg, "console", "console", log.console);
}

QJsonObject ConfigStore::toJson() const {
    QJsonObject root;
    root["version"] = 1;

    const ServerOptions& server = m_config.server;
    QJsonObject srv;
    srv["host"] = server.host;
    srv["port"] = server.port;
    srv["public_base_url"] = server.publicBaseUrl;
    root["server"] = srv;

    const BackendOptions& backend = m_config.backend;
    QJsonObject be;
    be["base_url"] = backend.baseUrl;
    be["middle_route"] = backend.middleRoute;
    // A key taken from the environment is not written back to disk.
    be["api_key"] = backend.apiKey == qEnvironmentVariable("OPENAI_API_KEY")
                        ? QString() : backend.apiKey;
    be["model_id"] = backend.modelId;
    be["reasoning_effort"] = backend.reasoningEffort;
    be["request_timeout"] = backend.requestTimeout;
    root["backend"] = be;

    const SandboxOptions& sandbox = m_config.sandbox;
    QJsonObject sb;
    sb["docker_socket"] = sandbox.dockerSocket;
    sb["docker_api_version"] = sandbox.dockerApiVersion;
    sb["image"] = sandbox.image;
    sb["work_root"] = sandbox.workRoot;
    sb["container_work_dir"] = sandbox.containerWorkDir;
    sb["source_file_name"] = sandbox.sourceFileName;
    sb["default_entry_symbol"] = sandbox.defaultEntrySymbol;
    sb["render_command"] = sandbox.renderCommand;
    sb["render_flags"] = QJsonArray::fromStringList(sandbox.renderFlags);
    sb["output_subdir"] = sandbox.outputSubdir;
    sb["artifact_extension"] = sandbox.artifactExtension;
    sb["network_mode"] = sandbox.networkMode;
    sb["pull_missing_image"] = sandbox.pullMissingImage;
    sb["wait_timeout"] = sandbox.waitTimeout;
    sb["api_timeout"] = sandbox.apiTimeout;
    sb["stop_timeout_secs"] = sandbox.stopTimeoutSecs;
    root["sandbox"] = sb;

    const LogOptions& log = m_config.log;
    QJsonObject lg;
    lg["dir"] = log.dir;
    lg["level"] = log.level;
    lg["console"] = log.console;
    root["log"] = lg;

    return root;
}

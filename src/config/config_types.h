#pragma once
#include <QString>
#include <QStringList>

struct ServerOptions {
    QString host = QStringLiteral("0.0.0.0");
    int port = 8787;
    QString publicBaseUrl = QStringLiteral("http://localhost:8787");
};

struct BackendOptions {
    QString baseUrl = QStringLiteral("https://api.openai.com");
    QString middleRoute = QStringLiteral("/v1");
    QString apiKey;
    QString modelId = QStringLiteral("gpt-4.1");
    QString reasoningEffort;
    int requestTimeout = 120000;
};

struct SandboxOptions {
    QString dockerSocket = QStringLiteral("/var/run/docker.sock");
    QString dockerApiVersion = QStringLiteral("v1.43");
    QString image = QStringLiteral("manimcommunity/manim:v0.18.1");
    QString workRoot;
    QString containerWorkDir = QStringLiteral("/manim");
    QString sourceFileName = QStringLiteral("scene.py");
    QString defaultEntrySymbol = QStringLiteral("Scene");
    QString renderCommand = QStringLiteral("manim");
    QStringList renderFlags = {QStringLiteral("-ql"), QStringLiteral("--disable_caching")};
    QString outputSubdir = QStringLiteral("media/videos");
    QString artifactExtension = QStringLiteral(".mp4");
    QString networkMode = QStringLiteral("none");
    bool pullMissingImage = true;
    int waitTimeout = 300000;
    int apiTimeout = 30000;
    int stopTimeoutSecs = 5;
};

struct LogOptions {
    QString dir;
    QString level = QStringLiteral("info");
    bool console = true;
};

struct ServiceConfig {
    ServerOptions server;
    BackendOptions backend;
    SandboxOptions sandbox;
    LogOptions log;

    bool isValid() const {
        return !backend.baseUrl.isEmpty() && !backend.modelId.isEmpty()
            && !sandbox.image.isEmpty() && !sandbox.workRoot.isEmpty();
    }
};

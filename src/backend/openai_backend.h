#pragma once
#include "config/config_types.h"
#include "semantic/ports.h"
#include <QJsonArray>
#include <QJsonObject>
#include <QMap>
#include <QNetworkAccessManager>

// Name and argument field of the single tool the agent can call.
namespace ExecuteCodeTool {
    inline constexpr char Name[] = "execute_code";
    inline constexpr char Field[] = "code";
}

struct ChatRequest {
    QString url;
    QMap<QString, QString> headers;
    QByteArray body;
};

// OpenAI-compatible chat-completions backend, always streaming with the
// execute_code tool bound.
class OpenAIBackend : public IChatBackend {
public:
    OpenAIBackend(const BackendOptions& options, const QString& systemPrompt);
    ~OpenAIBackend() override = default;

    Result<BackendStream*> openStream(const QList<ChatMessage>& context) override;

    ChatRequest buildRequest(const QList<ChatMessage>& context) const;

    static QJsonArray buildMessages(const QString& systemPrompt, const QList<ChatMessage>& context);
    static QJsonArray buildToolDefs();
    static Result<BackendChunk> parseChunk(const QByteArray& data);
    static DomainFailure mapFailure(int httpStatus, const QByteArray& body);

private:
    static ErrorKind mapHttpStatusToKind(int httpStatus);

    BackendOptions m_options;
    QString m_systemPrompt;
    QNetworkAccessManager m_nam;
};

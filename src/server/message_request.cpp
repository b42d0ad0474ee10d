#include "message_request.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace MessageRequest {

namespace {

DomainFailure invalidBody(const QString& detail)
{
    return DomainFailure::invalidInput(QStringLiteral("invalid_request_body"),
                                       QStringLiteral("Invalid request body: %1").arg(detail));
}

bool isKnownRole(const QString& role)
{
    return role == QLatin1String("user")
        || role == QLatin1String("assistant")
        || role == QLatin1String("tool");
}

}

Result<QList<ChatMessage>> parse(const QByteArray& body)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject())
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("invalid_json"), QStringLiteral("Invalid JSON body")));

    const QJsonObject root = doc.object();
    QList<ChatMessage> history;

    const QJsonValue messages = root.value(QStringLiteral("messages"));
    if (messages.isUndefined() || messages.isNull())
        return history;
    if (!messages.isArray())
        return std::unexpected(invalidBody(QStringLiteral("messages must be an array")));

    const QJsonArray items = messages.toArray();
    for (int i = 0; i < items.size(); ++i) {
        if (!items[i].isObject())
            return std::unexpected(invalidBody(QStringLiteral("messages[%1] must be an object").arg(i)));

        const QJsonObject item = items[i].toObject();
        const QJsonValue role = item.value(QStringLiteral("role"));
        if (!role.isString() || !isKnownRole(role.toString()))
            return std::unexpected(invalidBody(
                QStringLiteral("messages[%1].role must be one of user, assistant, tool").arg(i)));

        const QJsonValue content = item.value(QStringLiteral("content"));
        if (!content.isString())
            return std::unexpected(invalidBody(QStringLiteral("messages[%1].content must be a string").arg(i)));

        const QJsonValue callId = item.value(QStringLiteral("tool_call_id"));
        if (!callId.isUndefined() && !callId.isString())
            return std::unexpected(invalidBody(QStringLiteral("messages[%1].tool_call_id must be a string").arg(i)));

        ChatMessage message;
        message.role = role.toString();
        message.content = content.toString();
        if (message.role == QLatin1String("tool"))
            message.toolCallId = callId.toString();
        history.append(message);
    }

    return history;
}

}

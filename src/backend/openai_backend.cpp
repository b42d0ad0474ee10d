#include "openai_backend.h"
#include "openai_stream.h"
#include "core/log_manager.h"
#include <QJsonDocument>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrl>

OpenAIBackend::OpenAIBackend(const BackendOptions& options, const QString& systemPrompt)
    : m_options(options)
    , m_systemPrompt(systemPrompt)
{
}

ChatRequest OpenAIBackend::buildRequest(const QList<ChatMessage>& context) const
{
    ChatRequest req;

    QString baseUrl = m_options.baseUrl;
    while (baseUrl.endsWith('/'))
        baseUrl.chop(1);
    QString middleRoute = m_options.middleRoute;
    // Guard against double-append: if baseUrl already ends with middleRoute, skip
    if (!middleRoute.isEmpty() && baseUrl.endsWith(middleRoute))
        middleRoute.clear();
    req.url = baseUrl + middleRoute + QStringLiteral("/chat/completions");

    if (!m_options.apiKey.isEmpty())
        req.headers[QStringLiteral("Authorization")] = QStringLiteral("Bearer ") + m_options.apiKey;
    req.headers[QStringLiteral("Content-Type")] = QStringLiteral("application/json");
    req.headers[QStringLiteral("Accept")] = QStringLiteral("text/event-stream");

    QJsonObject body;
    body[QStringLiteral("model")] = m_options.modelId;
    body[QStringLiteral("messages")] = buildMessages(m_systemPrompt, context);
    body[QStringLiteral("tools")] = buildToolDefs();
    body[QStringLiteral("stream")] = true;
    if (!m_options.reasoningEffort.isEmpty())
        body[QStringLiteral("reasoning_effort")] = m_options.reasoningEffort;

    req.body = QJsonDocument(body).toJson(QJsonDocument::Compact);
    return req;
}

Result<BackendStream*> OpenAIBackend::openStream(const QList<ChatMessage>& context)
{
    const ChatRequest chat = buildRequest(context);

    const QUrl url(chat.url);
    if (!url.isValid() || url.scheme().isEmpty())
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("backend_url"), QStringLiteral("invalid backend url: %1").arg(chat.url)));

    QNetworkRequest req{url};
    for (auto it = chat.headers.constBegin(); it != chat.headers.constEnd(); ++it)
        req.setRawHeader(it.key().toUtf8(), it.value().toUtf8());
    req.setTransferTimeout(m_options.requestTimeout);

    LOG_DEBUG(QStringLiteral("OpenAIBackend: POST %1 (%2 messages)").arg(chat.url).arg(context.size()));

    QNetworkReply* reply = m_nam.post(req, chat.body);
    return new OpenAIStream(reply);
}

QJsonArray OpenAIBackend::buildMessages(const QString& systemPrompt, const QList<ChatMessage>& context)
{
    QJsonArray messages;

    if (!systemPrompt.isEmpty()) {
        QJsonObject sys;
        sys[QStringLiteral("role")] = QStringLiteral("system");
        sys[QStringLiteral("content")] = systemPrompt;
        messages.append(sys);
    }

    for (const auto& item : context) {
        QJsonObject msg;
        msg[QStringLiteral("role")] = item.role;

        if (item.role == QStringLiteral("tool")) {
            msg[QStringLiteral("tool_call_id")] = item.toolCallId;
            msg[QStringLiteral("content")] = item.content;
        } else if (item.role == QStringLiteral("assistant") && !item.toolCalls.isEmpty()) {
            // Assistant turns that only call a tool carry null content
            if (item.content.isEmpty())
                msg[QStringLiteral("content")] = QJsonValue::Null;
            else
                msg[QStringLiteral("content")] = item.content;

            QJsonArray tcArr;
            for (const auto& tc : item.toolCalls) {
                QJsonObject tcObj;
                tcObj[QStringLiteral("id")] = tc.callId;
                tcObj[QStringLiteral("type")] = QStringLiteral("function");
                QJsonObject fn;
                fn[QStringLiteral("name")] = tc.name;
                fn[QStringLiteral("arguments")] = tc.args;
                tcObj[QStringLiteral("function")] = fn;
                tcArr.append(tcObj);
            }
            msg[QStringLiteral("tool_calls")] = tcArr;
        } else {
            msg[QStringLiteral("content")] = item.content;
        }

        messages.append(msg);
    }
    return messages;
}

QJsonArray OpenAIBackend::buildToolDefs()
{
    QJsonObject codeProp;
    codeProp[QStringLiteral("type")] = QStringLiteral("string");
    codeProp[QStringLiteral("description")] = QStringLiteral("The Manim Python code to execute");

    QJsonObject properties;
    properties[QString::fromLatin1(ExecuteCodeTool::Field)] = codeProp;

    QJsonObject parameters;
    parameters[QStringLiteral("type")] = QStringLiteral("object");
    parameters[QStringLiteral("properties")] = properties;
    parameters[QStringLiteral("required")] = QJsonArray{QString::fromLatin1(ExecuteCodeTool::Field)};
    parameters[QStringLiteral("additionalProperties")] = false;

    QJsonObject fn;
    fn[QStringLiteral("name")] = QString::fromLatin1(ExecuteCodeTool::Name);
    fn[QStringLiteral("description")] =
        QStringLiteral("Render a Manim scene in an isolated sandbox and return the URL of the produced video.");
    fn[QStringLiteral("parameters")] = parameters;

    QJsonObject toolObj;
    toolObj[QStringLiteral("type")] = QStringLiteral("function");
    toolObj[QStringLiteral("function")] = fn;

    return QJsonArray{toolObj};
}

Result<BackendChunk> OpenAIBackend::parseChunk(const QByteArray& data)
{
    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(data, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("Failed to parse OpenAI chunk JSON: ") + err.errorString()));
    }

    const QJsonObject root = doc.object();

    // Some compatible servers report mid-stream failures as a data event
    const QJsonObject errorObj = root.value(QStringLiteral("error")).toObject();
    if (!errorObj.isEmpty()) {
        DomainFailure failure = DomainFailure::unavailable(
            errorObj.value(QStringLiteral("message")).toString(QStringLiteral("backend stream error")));
        failure.code = QStringLiteral("openai.stream_error");
        return std::unexpected(failure);
    }

    BackendChunk chunk;
    const QJsonArray choices = root.value(QStringLiteral("choices")).toArray();
    if (choices.isEmpty())
        return chunk;

    const QJsonObject delta = choices.first().toObject().value(QStringLiteral("delta")).toObject();
    chunk.text = delta.value(QStringLiteral("content")).toString();

    const QJsonArray toolCalls = delta.value(QStringLiteral("tool_calls")).toArray();
    for (const QJsonValue& tcv : toolCalls) {
        const QJsonObject tcObj = tcv.toObject();
        const QJsonObject fn = tcObj.value(QStringLiteral("function")).toObject();

        ToolCallFragment fragment;
        fragment.index = tcObj.value(QStringLiteral("index")).toInt();
        fragment.callId = tcObj.value(QStringLiteral("id")).toString();
        fragment.name = fn.value(QStringLiteral("name")).toString();
        fragment.argsFragment = fn.value(QStringLiteral("arguments")).toString();
        chunk.fragments.append(fragment);
    }

    return chunk;
}

DomainFailure OpenAIBackend::mapFailure(int httpStatus, const QByteArray& body)
{
    QString message;

    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error == QJsonParseError::NoError) {
        QJsonObject root = doc.object();
        QJsonObject errorObj = root.value(QStringLiteral("error")).toObject();
        message = errorObj.value(QStringLiteral("message")).toString();
    }

    if (message.isEmpty()) {
        message = QStringLiteral("OpenAI API error (HTTP %1)").arg(httpStatus);
    }

    ErrorKind kind = mapHttpStatusToKind(httpStatus);
    DomainFailure failure;
    failure.kind = kind;
    failure.code = QStringLiteral("openai.http_%1").arg(httpStatus);
    failure.message = message;
    failure.retryable = (kind == ErrorKind::RateLimited ||
                         kind == ErrorKind::Unavailable ||
                         kind == ErrorKind::Timeout);
    failure.temporary = failure.retryable;
    return failure;
}

ErrorKind OpenAIBackend::mapHttpStatusToKind(int httpStatus)
{
    switch (httpStatus) {
    case 400: return ErrorKind::InvalidInput;
    case 401: return ErrorKind::Unauthorized;
    case 403: return ErrorKind::Forbidden;
    case 404: return ErrorKind::InvalidInput;
    case 429: return ErrorKind::RateLimited;
    case 500: return ErrorKind::Internal;
    case 501: return ErrorKind::NotSupported;
    case 502: return ErrorKind::Unavailable;
    case 503: return ErrorKind::Unavailable;
    case 504: return ErrorKind::Timeout;
    default:
        if (httpStatus >= 500) return ErrorKind::Internal;
        if (httpStatus >= 400) return ErrorKind::InvalidInput;
        return ErrorKind::Internal;
    }
}

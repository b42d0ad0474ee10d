#include "agent_session.h"
#include "backend/openai_backend.h"
#include "core/log_manager.h"
#include "decoder/args_decoder.h"
#include "relay/event_channel.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QThread>
#include <QTimer>

AgentSession::AgentSession(IChatBackend* backend,
                           std::unique_ptr<ICodeExecutor> executor,
                           EventChannel* events,
                           const QList<ChatMessage>& history,
                           QObject* parent)
    : QObject(parent)
    , m_backend(backend)
    , m_executor(std::move(executor))
    , m_events(events)
    , m_context(history)
    , m_accumulator(QString::fromLatin1(ExecuteCodeTool::Field))
{
}

AgentSession::~AgentSession()
{
    releaseStream();
    if (m_worker) {
        m_worker->disconnect(this);
        if (m_executor)
            m_executor->cancel();
        m_worker->wait();
        delete m_worker;
    }
}

void AgentSession::start()
{
    if (m_state != State::Idle)
        return;
    QTimer::singleShot(0, this, &AgentSession::generate);
}

void AgentSession::abort()
{
    if (m_state == State::Completed || m_state == State::Failed || m_state == State::Aborted)
        return;

    LOG_INFO(QStringLiteral("AgentSession: aborted in turn %1").arg(m_turns));
    m_state = State::Aborted;
    m_pendingCalls.clear();
    releaseStream();
    if (m_events)
        m_events->detach();

    if (m_worker) {
        // onExecutionFinished() emits finished() once the worker returns
        if (m_executor)
            m_executor->cancel();
        return;
    }
    emit finished();
}

// ============================================================================
// Generate
// ============================================================================

void AgentSession::generate()
{
    if (m_state == State::Aborted)
        return;

    m_state = State::Generating;
    ++m_turns;
    m_accumulator.reset();
    m_aggregator.reset();

    if (!m_backend) {
        onStreamError(DomainFailure::internal(QStringLiteral("no chat backend configured")));
        return;
    }

    auto stream = m_backend->openStream(m_context);
    if (!stream) {
        onStreamError(stream.error());
        return;
    }

    m_stream = *stream;
    m_stream->setParent(this);
    connect(m_stream, &BackendStream::chunkReady, this, &AgentSession::onChunk);
    connect(m_stream, &BackendStream::finished, this, &AgentSession::onStreamFinished);
    connect(m_stream, &BackendStream::error, this, &AgentSession::onStreamError);

    LOG_DEBUG(QStringLiteral("AgentSession: turn %1 generating with %2 messages")
        .arg(m_turns).arg(m_context.size()));
}

void AgentSession::onChunk(const BackendChunk& chunk)
{
    if (m_state != State::Generating)
        return;

    if (!chunk.text.isEmpty()) {
        m_aggregator.addText(chunk.text);

        QJsonObject payload;
        payload["type"] = QString::fromLatin1(RelayEvent::TextDelta);
        payload["content"] = chunk.text;
        publish(RelayEvent::TextDelta, payload);
    }

    for (const auto& fragment : chunk.fragments) {
        const auto identity = m_accumulator.resolve(fragment);
        m_aggregator.addToolFragment(identity.callId, identity.name, fragment.argsFragment);

        if (identity.name != QLatin1String(ExecuteCodeTool::Name) || fragment.argsFragment.isEmpty())
            continue;

        QJsonObject delta;
        delta["type"] = QString::fromLatin1(RelayEvent::ArgDelta);
        delta["toolCallId"] = identity.callId;
        delta["toolName"] = identity.name;
        delta["argName"] = QString::fromLatin1(ExecuteCodeTool::Field);
        delta["value"] = fragment.argsFragment;
        publish(RelayEvent::ArgDelta, delta);

        if (auto code = m_accumulator.accept(identity.callId, fragment.argsFragment)) {
            QJsonObject payload;
            payload["code"] = *code;
            payload["toolCallId"] = identity.callId;
            publish(RelayEvent::Code, payload);
        }
    }
}

void AgentSession::onStreamFinished()
{
    if (m_state != State::Generating)
        return;
    releaseStream();

    const ChatMessage assistant = m_aggregator.finalize();
    m_context.append(assistant);

    QJsonArray toolCalls;
    for (const auto& call : assistant.toolCalls) {
        QJsonObject obj;
        obj["id"] = call.callId;
        obj["name"] = call.name;
        // Arguments that parse go out as an object, anything else as raw text
        const QJsonDocument parsed = QJsonDocument::fromJson(call.args.toUtf8());
        if (parsed.isObject())
            obj["args"] = parsed.object();
        else
            obj["args"] = call.args;
        toolCalls.append(obj);
    }

    QJsonObject payload;
    payload["type"] = QString::fromLatin1(RelayEvent::Message);
    payload["role"] = assistant.role;
    payload["content"] = assistant.content;
    payload["toolCalls"] = toolCalls;
    publish(RelayEvent::Message, payload);

    if (assistant.toolCalls.isEmpty()) {
        complete();
        return;
    }

    m_state = State::Dispatching;
    m_pendingCalls = assistant.toolCalls;
    QTimer::singleShot(0, this, &AgentSession::runNextToolCall);
}

void AgentSession::onStreamError(const DomainFailure& failure)
{
    if (m_state == State::Aborted || m_state == State::Failed || m_state == State::Completed)
        return;
    releaseStream();

    LOG_ERROR(QStringLiteral("AgentSession: generation failed %1").arg(failure.describe()));

    QJsonObject payload;
    payload["type"] = QString::fromLatin1(RelayEvent::Error);
    payload["error"] = failure.message;
    publish(RelayEvent::Error, payload);
    finishWith(State::Failed);
}

// ============================================================================
// Dispatch
// ============================================================================

void AgentSession::runNextToolCall()
{
    if (m_state != State::Dispatching)
        return;

    while (!m_pendingCalls.isEmpty()) {
        const ToolCall call = m_pendingCalls.takeFirst();
        auto request = prepareExecution(call);
        if (!request) {
            appendToolMessage(ChatMessage::tool(call.callId, request.error().message));
            continue;
        }
        startExecution(call, *request);
        return;
    }

    QTimer::singleShot(0, this, &AgentSession::generate);
}

Result<ExecutionRequest> AgentSession::prepareExecution(const ToolCall& call) const
{
    if (call.name != QLatin1String(ExecuteCodeTool::Name)) {
        LOG_WARNING(QStringLiteral("AgentSession: unknown tool '%1'").arg(call.name));
        return std::unexpected(DomainFailure::notSupported(QStringLiteral("unknown_tool"),
            QStringLiteral("Error: unknown tool '%1'. Only %2 is available.")
                .arg(call.name, QString::fromLatin1(ExecuteCodeTool::Name))));
    }

    const auto code = ArgsDecoder::decodeField(call.args, QString::fromLatin1(ExecuteCodeTool::Field));
    if (!code || !code->complete) {
        return std::unexpected(DomainFailure::invalidInput(QStringLiteral("bad_arguments"),
            QStringLiteral("Error: %1 arguments must be a JSON object with a string field \"%2\".")
                .arg(QString::fromLatin1(ExecuteCodeTool::Name), QString::fromLatin1(ExecuteCodeTool::Field))));
    }

    if (!m_executor) {
        return std::unexpected(DomainFailure::unavailable(QStringLiteral("Error: code execution is not available.")));
    }

    ExecutionRequest request;
    request.sourceText = code->value;
    request.toolCallId = call.callId;
    return request;
}

void AgentSession::startExecution(const ToolCall& call, const ExecutionRequest& request)
{
    auto result = std::make_shared<ExecutionResult>();
    ICodeExecutor* executor = m_executor.get();
    EventChannel* events = m_events.data();

    m_worker = QThread::create([executor, events, request, result]() {
        *result = executor->execute(request, events);
    });
    // Queued behind everything the worker published
    connect(m_worker, &QThread::finished, this, [this, call, result]() {
        onExecutionFinished(call, *result);
    });

    LOG_DEBUG(QStringLiteral("AgentSession: executing call %1 on a worker thread").arg(call.callId));
    m_worker->start();
}

void AgentSession::onExecutionFinished(const ToolCall& call, const ExecutionResult& result)
{
    QThread* worker = m_worker;
    m_worker = nullptr;
    worker->wait();
    worker->deleteLater();

    if (m_state == State::Aborted) {
        emit finished();
        return;
    }

    appendToolMessage(ChatMessage::tool(call.callId, result.toolOutput()));
    runNextToolCall();
}

void AgentSession::appendToolMessage(const ChatMessage& toolMessage)
{
    m_context.append(toolMessage);

    QJsonObject payload;
    payload["type"] = QString::fromLatin1(RelayEvent::Message);
    payload["role"] = toolMessage.role;
    payload["content"] = toolMessage.content;
    payload["toolCallId"] = toolMessage.toolCallId;
    publish(RelayEvent::Message, payload);
}

// ============================================================================
// Termination
// ============================================================================

void AgentSession::complete()
{
    QJsonObject payload;
    payload["type"] = QString::fromLatin1(RelayEvent::Done);
    payload["message"] = QStringLiteral("Stream completed");
    publish(RelayEvent::Done, payload);

    LOG_INFO(QStringLiteral("AgentSession: completed after %1 turn(s)").arg(m_turns));
    finishWith(State::Completed);
}

void AgentSession::finishWith(State state)
{
    m_state = state;
    emit finished();
}

void AgentSession::publish(const QString& event, const QJsonObject& payload)
{
    if (m_events)
        m_events->publish(event, payload);
}

void AgentSession::releaseStream()
{
    if (!m_stream)
        return;
    BackendStream* stream = m_stream;
    m_stream = nullptr;
    stream->disconnect(this);
    stream->abort();
    stream->deleteLater();
}

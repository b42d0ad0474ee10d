#pragma once
#include "turn_aggregator.h"
#include "decoder/tool_call_accumulator.h"
#include "semantic/ports.h"
#include <QJsonObject>
#include <QObject>
#include <QPointer>
#include <memory>

class EventChannel;
class QThread;

// Generate/dispatch loop for one inbound request. Generate streams a reply
// from the backend; Dispatch runs every tool call of that reply and feeds the
// results back. The loop halts once a reply requests no execution.
// Executions run one at a time on a worker thread, so a render never holds
// up the event loop other sessions share.
class AgentSession : public QObject {
    Q_OBJECT
public:
    enum class State { Idle, Generating, Dispatching, Completed, Failed, Aborted };

    AgentSession(IChatBackend* backend,
                 std::unique_ptr<ICodeExecutor> executor,
                 EventChannel* events,
                 const QList<ChatMessage>& history,
                 QObject* parent = nullptr);
    ~AgentSession() override;

    // Schedules the first Generate on the event loop.
    void start();

    // Stops the in-flight generation or execution; no further events.
    // finished() follows once a running execution has returned.
    void abort();

    State state() const { return m_state; }
    QList<ChatMessage> context() const { return m_context; }
    int turns() const { return m_turns; }

signals:
    void finished();

private:
    void generate();
    void onChunk(const BackendChunk& chunk);
    void onStreamFinished();
    void onStreamError(const DomainFailure& failure);

    void runNextToolCall();
    Result<ExecutionRequest> prepareExecution(const ToolCall& call) const;
    void startExecution(const ToolCall& call, const ExecutionRequest& request);
    void onExecutionFinished(const ToolCall& call, const ExecutionResult& result);
    void appendToolMessage(const ChatMessage& toolMessage);

    void publish(const QString& event, const QJsonObject& payload);
    void releaseStream();
    void complete();
    void finishWith(State state);

    IChatBackend* m_backend;
    std::unique_ptr<ICodeExecutor> m_executor;
    QPointer<EventChannel> m_events;
    QList<ChatMessage> m_context;

    QPointer<BackendStream> m_stream;
    ToolCallAccumulator m_accumulator;
    TurnAggregator m_aggregator;

    QList<ToolCall> m_pendingCalls;
    QThread* m_worker = nullptr;

    State m_state = State::Idle;
    int m_turns = 0;
};

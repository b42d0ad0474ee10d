#include "turn_aggregator.h"

void TurnAggregator::addText(const QString& text)
{
    m_text += text;
}

void TurnAggregator::addToolFragment(const QString& callId, const QString& name, const QString& argsFragment)
{
    auto it = m_callIndex.constFind(callId);
    if (it == m_callIndex.constEnd()) {
        ToolCall call;
        call.callId = callId;
        call.name = name;
        m_toolCalls.append(call);
        it = m_callIndex.insert(callId, m_toolCalls.size() - 1);
    }

    ToolCall& call = m_toolCalls[it.value()];
    if (call.name.isEmpty() && !name.isEmpty())
        call.name = name;
    call.args += argsFragment;
}

ChatMessage TurnAggregator::finalize() const
{
    ChatMessage message;
    message.role = QStringLiteral("assistant");
    message.content = m_text;
    message.toolCalls = m_toolCalls;
    return message;
}

void TurnAggregator::reset()
{
    m_text.clear();
    m_toolCalls.clear();
    m_callIndex.clear();
}

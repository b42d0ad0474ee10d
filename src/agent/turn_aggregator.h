#pragma once
#include "semantic/conversation.h"
#include <QList>
#include <QMap>

// Folds the chunks of one generation into the finished assistant message.
class TurnAggregator {
public:
    void addText(const QString& text);
    void addToolFragment(const QString& callId, const QString& name, const QString& argsFragment);

    ChatMessage finalize() const;
    bool hasToolCalls() const { return !m_toolCalls.isEmpty(); }
    void reset();

private:
    QString m_text;
    QList<ToolCall> m_toolCalls;
    QMap<QString, int> m_callIndex;     // callId -> index in m_toolCalls
};

#pragma once
#include <QString>
#include <QList>

struct ToolCall {
    QString callId;
    QString name;
    QString args;
};

// One piece of a streamed tool call. The backend only fills callId and name
// on the first fragment of a call; continuations carry the position index.
struct ToolCallFragment {
    QString callId;
    QString name;
    QString argsFragment;
    int index = 0;
};

struct BackendChunk {
    QString text;
    QList<ToolCallFragment> fragments;
};

struct ChatMessage {
    QString role;
    QString content;
    QList<ToolCall> toolCalls;
    QString toolCallId;

    static ChatMessage user(const QString& text) {
        return ChatMessage{QStringLiteral("user"), text, {}, {}};
    }
    static ChatMessage tool(const QString& callId, const QString& output) {
        return ChatMessage{QStringLiteral("tool"), output, {}, callId};
    }
};

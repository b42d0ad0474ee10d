#pragma once
#include "args_decoder.h"
#include "semantic/conversation.h"
#include <QMap>
#include <QString>
#include <optional>

// Collects streamed tool-call arguments per call identity and reports the
// decoded field value whenever it moves forward.
class ToolCallAccumulator {
public:
    explicit ToolCallAccumulator(const QString& field = QStringLiteral("code"));

    struct Identity {
        QString callId;
        QString name;
    };

    // Explicit id on the fragment, else the id last seen at the same position
    // index, else a synthetic "index:<n>" key.
    Identity resolve(const ToolCallFragment& fragment);

    std::optional<QString> accept(const QString& callId, const QString& fragment);

    QString buffer(const QString& callId) const;
    std::optional<QString> lastValue(const QString& callId) const;

    void reset();

private:
    struct Entry {
        QString buffer;
        std::optional<QString> lastValue;
    };

    QString m_field;
    QMap<QString, Entry> m_entries;
    QMap<int, QString> m_idByIndex;
    QMap<int, QString> m_nameByIndex;
};

#include "tool_call_accumulator.h"

ToolCallAccumulator::ToolCallAccumulator(const QString& field)
    : m_field(field)
{
}

ToolCallAccumulator::Identity ToolCallAccumulator::resolve(const ToolCallFragment& fragment)
{
    if (!fragment.name.isEmpty())
        m_nameByIndex[fragment.index] = fragment.name;
    if (!fragment.callId.isEmpty())
        m_idByIndex[fragment.index] = fragment.callId;

    Identity id;
    id.name = m_nameByIndex.value(fragment.index);
    id.callId = m_idByIndex.value(fragment.index);
    if (id.callId.isEmpty())
        id.callId = QStringLiteral("index:%1").arg(fragment.index);
    return id;
}

std::optional<QString> ToolCallAccumulator::accept(const QString& callId, const QString& fragment)
{
    Entry& entry = m_entries[callId];
    entry.buffer.append(fragment);

    std::optional<DecodedArgument> decoded = ArgsDecoder::decodeField(entry.buffer, m_field);
    if (!decoded || decoded->value.isEmpty())
        return std::nullopt;

    if (entry.lastValue) {
        const QString& last = *entry.lastValue;
        if (decoded->value == last)
            return std::nullopt;
        // A partial decode never walks back over text already emitted.
        if (!decoded->complete && last.startsWith(decoded->value))
            return std::nullopt;
    }

    entry.lastValue = decoded->value;
    return decoded->value;
}

QString ToolCallAccumulator::buffer(const QString& callId) const
{
    return m_entries.value(callId).buffer;
}

std::optional<QString> ToolCallAccumulator::lastValue(const QString& callId) const
{
    auto it = m_entries.constFind(callId);
    if (it == m_entries.constEnd())
        return std::nullopt;
    return it->lastValue;
}

void ToolCallAccumulator::reset()
{
    m_entries.clear();
    m_idByIndex.clear();
    m_nameByIndex.clear();
}

#pragma once
#include <QString>
#include <optional>

struct DecodedArgument {
    QString value;
    // True once the closing quote of the value has been seen, either through a
    // full JSON parse or by the tolerant scanner.
    bool complete = false;
};

// Recovers a single string field from a possibly truncated JSON object such
// as {"code": "print(1)\npri
namespace ArgsDecoder {
    std::optional<DecodedArgument> decodeField(const QString& buffer,
                                               const QString& field = QStringLiteral("code"));

    std::optional<QString> strictField(const QString& buffer, const QString& field);
    std::optional<DecodedArgument> tolerantField(const QString& buffer, const QString& field);
}

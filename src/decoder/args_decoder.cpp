#include "args_decoder.h"
#include <QJsonDocument>
#include <QJsonObject>
#include <QRegularExpression>

namespace {

int hexValue(QChar c)
{
    const ushort u = c.unicode();
    if (u >= '0' && u <= '9') return u - '0';
    if (u >= 'a' && u <= 'f') return u - 'a' + 10;
    if (u >= 'A' && u <= 'F') return u - 'A' + 10;
    return -1;
}

// Parses the four hex digits following "\u" at pos. Returns -1 if they are
// not all present or not all hex.
int parseUnicodeEscape(const QString& buffer, int pos)
{
    if (pos + 4 > buffer.size())
        return -1;
    int code = 0;
    for (int k = 0; k < 4; ++k) {
        const int h = hexValue(buffer.at(pos + k));
        if (h < 0)
            return -1;
        code = (code << 4) | h;
    }
    return code;
}

}

namespace ArgsDecoder {

std::optional<QString> strictField(const QString& buffer, const QString& field)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(buffer.toUtf8(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject())
        return std::nullopt;

    const QJsonValue value = doc.object().value(field);
    if (!value.isString())
        return std::nullopt;
    return value.toString();
}

std::optional<DecodedArgument> tolerantField(const QString& buffer, const QString& field)
{
    const QRegularExpression keyPattern(
        QStringLiteral("\"%1\"\\s*:\\s*\"").arg(QRegularExpression::escape(field)));
    const QRegularExpressionMatch match = keyPattern.match(buffer);
    if (!match.hasMatch())
        return std::nullopt;

    DecodedArgument decoded;
    QString& out = decoded.value;
    const int n = buffer.size();
    int i = match.capturedEnd();

    while (i < n) {
        const QChar c = buffer.at(i);
        if (c == QLatin1Char('"')) {
            decoded.complete = true;
            return decoded;
        }
        if (c != QLatin1Char('\\')) {
            out.append(c);
            ++i;
            continue;
        }

        // A backslash at the very end is half of an escape; wait for the rest.
        if (i + 1 >= n)
            break;

        const QChar e = buffer.at(i + 1);
        switch (e.unicode()) {
        case 'n':  out.append(QLatin1Char('\n')); break;
        case 't':  out.append(QLatin1Char('\t')); break;
        case 'r':  out.append(QLatin1Char('\r')); break;
        case 'b':  out.append(QLatin1Char('\b')); break;
        case 'f':  out.append(QLatin1Char('\f')); break;
        case '"':  out.append(QLatin1Char('"'));  break;
        case '\\': out.append(QLatin1Char('\\')); break;
        case '/':  out.append(QLatin1Char('/'));  break;
        case 'u': {
            const int code = parseUnicodeEscape(buffer, i + 2);
            if (code < 0) {
                if (i + 6 > n)
                    return decoded;  // truncated, wait for more digits
                out.append(e);
                break;
            }
            const QChar unit(static_cast<char16_t>(code));
            if (unit.isHighSurrogate()) {
                // Hold a high surrogate back until its low half is readable.
                if (i + 12 > n)
                    return decoded;
                if (buffer.at(i + 6) == QLatin1Char('\\') && buffer.at(i + 7) == QLatin1Char('u')) {
                    const int low = parseUnicodeEscape(buffer, i + 8);
                    if (low >= 0 && QChar(static_cast<char16_t>(low)).isLowSurrogate()) {
                        out.append(unit);
                        out.append(QChar(static_cast<char16_t>(low)));
                        i += 12;
                        continue;
                    }
                }
                out.append(QChar::ReplacementCharacter);
            } else if (unit.isLowSurrogate()) {
                out.append(QChar::ReplacementCharacter);
            } else {
                out.append(unit);
            }
            i += 6;
            continue;
        }
        default:
            out.append(e);
            break;
        }
        i += 2;
    }

    return decoded;
}

std::optional<DecodedArgument> decodeField(const QString& buffer, const QString& field)
{
    if (buffer.isEmpty())
        return std::nullopt;

    if (auto strict = strictField(buffer, field))
        return DecodedArgument{*strict, true};

    return tolerantField(buffer, field);
}

}

#include "entry_symbol.h"
#include <QRegularExpression>

namespace EntrySymbol {

QString detect(const QString& source, const QString& fallback)
{
    static const QRegularExpression re(QStringLiteral("class\\s+(\\w+)\\s*\\("));
    const auto match = re.match(source);
    if (!match.hasMatch())
        return fallback;
    return match.captured(1);
}

}

#pragma once
#include <QString>

namespace EntrySymbol {

// Name of the first `class <Name>(` declaration in the source, or the
// fallback when there is none.
QString detect(const QString& source, const QString& fallback);

}

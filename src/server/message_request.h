#pragma once
#include "semantic/ports.h"
#include <QByteArray>
#include <QList>

namespace MessageRequest {

// Validates a POST /api/v1/messages body and converts it to conversation
// history. "messages" may be omitted and defaults to an empty list.
Result<QList<ChatMessage>> parse(const QByteArray& body);

}

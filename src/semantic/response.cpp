#include "response.h"

QString stopReasonName(StopReason reason)
{
    switch (reason) {
    case StopReason::EndTurn:      return QStringLiteral("end_turn");
    case StopReason::MaxTokens:    return QStringLiteral("max_tokens");
    case StopReason::StopSequence: return QStringLiteral("stop_sequence");
    case StopReason::ToolUse:      return QStringLiteral("tool_use");
    }
    return QStringLiteral("end_turn");
}

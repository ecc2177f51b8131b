#pragma once
#include "content.h"
#include "types.h"
#include <QList>
#include <QString>
#include <variant>

struct Usage {
    int inputTokens = 0;
    int outputTokens = 0;
    int cacheReadInputTokens = 0;
};

using ResponseBlock = std::variant<TextBlock, ToolUseBlock>;

struct CanonicalResponse {
    QString id;
    QString model;
    QList<ResponseBlock> content;
    StopReason stopReason = StopReason::EndTurn;
    QString stopSequence;
    Usage usage;
};

QString stopReasonName(StopReason reason);

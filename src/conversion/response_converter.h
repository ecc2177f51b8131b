#pragma once
#include "semantic/backend.h"
#include "semantic/response.h"
#include <QJsonValue>

namespace ResponseConverter {
    // `clientModel` is the model id the client asked for, echoed back unchanged.
    CanonicalResponse convert(const BackendResponse& response, const QString& clientModel);

    StopReason mapFinishReason(const QString& finishReason, const QString& matchedStop);
    QJsonValue parseArguments(const QString& arguments);
    QString generateMessageId();
    QString generateToolUseId();
}

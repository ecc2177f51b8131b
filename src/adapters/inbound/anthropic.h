#pragma once
#include "semantic/failure.h"
#include "semantic/ports.h"
#include "semantic/request.h"
#include "semantic/response.h"
#include "semantic/stream_event.h"
#include <QJsonArray>

// Claude Messages API wire format, client side.
class AnthropicCodec {
public:
    static Result<CanonicalRequest> decodeRequest(const QByteArray& body);
    static QByteArray encodeResponse(const CanonicalResponse& response);
    static QByteArray encodeStreamEvent(const StreamEvent& event) { return event.toSse(); }
    static QByteArray encodeFailure(const ErrorEnvelope& failure);

    static QJsonObject responseToJson(const CanonicalResponse& response);

private:
    static Result<Message> parseMessage(const QJsonValue& value, int index);
    static Result<QList<ContentBlock>> parseContent(const QJsonValue& content, int index);
    static Result<SystemPrompt> parseSystem(const QJsonValue& value);
    static Result<ToolChoice> parseToolChoice(const QJsonValue& value);
    static Result<GenerationParams> parseParams(const QJsonObject& root);
    static QJsonArray serializeContent(const QList<ResponseBlock>& blocks);
};

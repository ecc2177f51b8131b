#pragma once
#include "config/config_types.h"
#include "semantic/backend.h"
#include "semantic/ports.h"
#include <QJsonArray>

// OpenAI Chat Completions wire format, including the Azure endpoint layout.
class OpenAICodec {
public:
    static QJsonObject encodeRequest(const BackendRequest& request);
    static BackendHttpRequest buildHttpRequest(const BackendRequest& request,
                                               const BackendConfig& config);
    static QString endpointUrl(const QString& model, const BackendConfig& config);
    static QString apiType(const BackendConfig& config);

    static Result<BackendResponse> parseResponse(const QByteArray& body);
    static Result<BackendStreamFragment> parseChunk(const QByteArray& data);
    static bool isDoneMarker(const QByteArray& data) { return data.trimmed() == "[DONE]"; }

private:
    static QJsonArray buildMessages(const QList<BackendMessage>& messages);
    static QJsonArray buildToolDefs(const QList<BackendToolDefinition>& tools);
    static BackendToolCall parseToolCall(const QJsonObject& tc);
    static std::optional<BackendUsage> parseUsage(const QJsonValue& value);
    static QString contentText(const QJsonValue& content);
    static QString roleName(BackendRole role);
};

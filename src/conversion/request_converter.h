#pragma once
#include "config/config_types.h"
#include "semantic/backend.h"
#include "semantic/ports.h"
#include "semantic/request.h"
#include <QSet>

class RequestConverter {
public:
    explicit RequestConverter(const ConversionOptions& options);

    // Fails with a validation error before anything is sent when the
    // conversation is structurally unsound (e.g. a dangling tool_result).
    Result<BackendRequest> convert(const CanonicalRequest& request,
                                   const QString& backendModel) const;

    int resolveMaxTokens(std::optional<int> requested) const;

    static QString systemText(const SystemPrompt& system);
    static QString toolResultText(const ToolResultBlock& block);
    static QString imageUrl(const ImageBlock& image);
    static QString argumentsJson(const QJsonValue& input);
    static std::optional<QJsonValue> toolChoiceValue(const CanonicalRequest& request);

private:
    ConversionOptions m_options;

    static VoidResult appendUserMessage(const Message& msg, int index,
                                        const QSet<QString>& knownCallIds,
                                        QList<BackendMessage>& out);
    static VoidResult appendAssistantMessage(const Message& msg, int index,
                                             QSet<QString>& knownCallIds,
                                             QList<BackendMessage>& out);
};

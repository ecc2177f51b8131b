#include "request_converter.h"
#include "semantic/validate.h"
#include "core/log_manager.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QStringList>

RequestConverter::RequestConverter(const ConversionOptions& options)
    : m_options(options)
{
}

Result<BackendRequest> RequestConverter::convert(const CanonicalRequest& request,
                                                 const QString& backendModel) const
{
    VoidResult valid = Validate::request(request);
    if (!valid)
        return std::unexpected(valid.error());

    BackendRequest out;
    out.model = backendModel;

    if (request.system) {
        const QString text = systemText(*request.system);
        if (!text.isEmpty()) {
            BackendMessage sys;
            sys.role = BackendRole::System;
            sys.text = text;
            out.messages.append(sys);
        }
    }

    QSet<QString> knownCallIds;
    for (int i = 0; i < request.messages.size(); ++i) {
        const Message& msg = request.messages.at(i);
        VoidResult appended = msg.role == Role::User
            ? appendUserMessage(msg, i, knownCallIds, out.messages)
            : appendAssistantMessage(msg, i, knownCallIds, out.messages);
        if (!appended)
            return std::unexpected(appended.error());
    }

    for (const ToolDefinition& tool : request.tools) {
        BackendToolDefinition def;
        def.name = tool.name;
        def.description = tool.description;
        def.parameters = tool.inputSchema;
        out.tools.append(def);
    }
    out.toolChoice = toolChoiceValue(request);

    out.temperature = request.params.temperature;
    out.topP = request.params.topP;
    out.maxTokens = resolveMaxTokens(request.params.maxTokens);
    out.stop = request.params.stopSequences;
    if (request.params.topK)
        LOG_DEBUG(QStringLiteral("RequestConverter: top_k=%1 has no backend equivalent, dropped")
                      .arg(*request.params.topK));

    out.stream = request.stream;
    out.includeUsage = request.stream && m_options.requestStreamUsage;
    return out;
}

int RequestConverter::resolveMaxTokens(std::optional<int> requested) const
{
    const int value = requested.value_or(m_options.defaultMaxTokens);
    if (m_options.minTokensLimit > m_options.maxTokensLimit)
        return value;
    return qBound(m_options.minTokensLimit, value, m_options.maxTokensLimit);
}

QString RequestConverter::systemText(const SystemPrompt& system)
{
    return std::visit(Overloaded{
        [](const QString& text) { return text; },
        [](const QList<TextBlock>& blocks) {
            QStringList parts;
            for (const TextBlock& block : blocks)
                parts.append(block.text);
            return parts.join(QStringLiteral("\n\n"));
        },
    }, system);
}

QString RequestConverter::toolResultText(const ToolResultBlock& block)
{
    const QJsonValue& content = block.content;
    if (content.isString())
        return content.toString();
    if (content.isNull() || content.isUndefined())
        return {};
    if (content.isArray()) {
        QStringList parts;
        for (const QJsonValue& item : content.toArray()) {
            const QJsonObject obj = item.toObject();
            if (obj.value(QStringLiteral("type")).toString() == QStringLiteral("text")) {
                parts.append(obj.value(QStringLiteral("text")).toString());
            } else if (item.isString()) {
                parts.append(item.toString());
            } else {
                LOG_WARNING(QStringLiteral("RequestConverter: dropped non-text block in tool_result %1")
                                .arg(block.toolUseId));
            }
        }
        return parts.join(QLatin1Char('\n'));
    }
    if (content.isObject())
        return QString::fromUtf8(QJsonDocument(content.toObject()).toJson(QJsonDocument::Compact));
    return content.toVariant().toString();
}

QString RequestConverter::imageUrl(const ImageBlock& image)
{
    if (image.sourceType == QStringLiteral("url"))
        return image.url;
    return QStringLiteral("data:") + image.mediaType + QStringLiteral(";base64,") + image.data;
}

QString RequestConverter::argumentsJson(const QJsonValue& input)
{
    if (input.isObject())
        return QString::fromUtf8(QJsonDocument(input.toObject()).toJson(QJsonDocument::Compact));
    if (input.isArray())
        return QString::fromUtf8(QJsonDocument(input.toArray()).toJson(QJsonDocument::Compact));
    if (input.isString())
        return input.toString();
    return QStringLiteral("{}");
}

std::optional<QJsonValue> RequestConverter::toolChoiceValue(const CanonicalRequest& request)
{
    if (request.tools.isEmpty())
        return std::nullopt;
    if (!request.toolChoice)
        return QJsonValue(QStringLiteral("auto"));

    switch (request.toolChoice->mode) {
    case ToolChoiceMode::Auto:
        return QJsonValue(QStringLiteral("auto"));
    case ToolChoiceMode::Any:
        return QJsonValue(QStringLiteral("required"));
    case ToolChoiceMode::None:
        return QJsonValue(QStringLiteral("none"));
    case ToolChoiceMode::Tool: {
        QJsonObject fn;
        fn[QStringLiteral("name")] = request.toolChoice->toolName;
        QJsonObject choice;
        choice[QStringLiteral("type")] = QStringLiteral("function");
        choice[QStringLiteral("function")] = fn;
        return QJsonValue(choice);
    }
    }
    return QJsonValue(QStringLiteral("auto"));
}

VoidResult RequestConverter::appendUserMessage(const Message& msg, int index,
                                               const QSet<QString>& knownCallIds,
                                               QList<BackendMessage>& out)
{
    QList<BackendMessage> toolMessages;
    QList<BackendContentPart> parts;
    QStringList pendingText;
    bool hasImage = false;

    auto flushText = [&]() {
        if (pendingText.isEmpty())
            return;
        BackendContentPart part;
        part.kind = BackendContentPart::Kind::Text;
        part.text = pendingText.join(QLatin1Char('\n'));
        parts.append(part);
        pendingText.clear();
    };

    for (const ContentBlock& block : msg.content) {
        VoidResult handled = std::visit(Overloaded{
            [&](const TextBlock& text) -> VoidResult {
                pendingText.append(text.text);
                return {};
            },
            [&](const ImageBlock& image) -> VoidResult {
                flushText();
                BackendContentPart part;
                part.kind = BackendContentPart::Kind::ImageUrl;
                part.url = imageUrl(image);
                parts.append(part);
                hasImage = true;
                return {};
            },
            [&](const ToolResultBlock& result) -> VoidResult {
                if (!knownCallIds.contains(result.toolUseId)) {
                    return std::unexpected(ErrorEnvelope::validation(
                        QStringLiteral("messages.%1: tool_result references unknown tool_use id \"%2\"")
                            .arg(index).arg(result.toolUseId)));
                }
                BackendMessage tool;
                tool.role = BackendRole::Tool;
                tool.toolCallId = result.toolUseId;
                tool.text = toolResultText(result);
                toolMessages.append(tool);
                return {};
            },
            [&](const ToolUseBlock& use) -> VoidResult {
                return std::unexpected(ErrorEnvelope::validation(
                    QStringLiteral("messages.%1: tool_use %2 in a user message").arg(index).arg(use.id)));
            },
        }, block);
        if (!handled)
            return handled;
    }
    flushText();

    // Tool responses must directly follow the assistant turn that issued the calls.
    out.append(toolMessages);

    if (parts.isEmpty() && !toolMessages.isEmpty())
        return {};

    BackendMessage user;
    user.role = BackendRole::User;
    if (hasImage) {
        user.parts = parts;
    } else {
        QStringList texts;
        for (const BackendContentPart& part : parts)
            texts.append(part.text);
        user.text = texts.join(QLatin1Char('\n'));
    }
    out.append(user);
    return {};
}

VoidResult RequestConverter::appendAssistantMessage(const Message& msg, int index,
                                                    QSet<QString>& knownCallIds,
                                                    QList<BackendMessage>& out)
{
    BackendMessage assistant;
    assistant.role = BackendRole::Assistant;
    QStringList texts;

    for (const ContentBlock& block : msg.content) {
        VoidResult handled = std::visit(Overloaded{
            [&](const TextBlock& text) -> VoidResult {
                texts.append(text.text);
                return {};
            },
            [&](const ImageBlock&) -> VoidResult {
                LOG_WARNING(QStringLiteral("RequestConverter: image in assistant message %1 dropped")
                                .arg(index));
                return {};
            },
            [&](const ToolUseBlock& use) -> VoidResult {
                BackendToolCall call;
                call.id = use.id;
                call.name = use.name;
                call.arguments = argumentsJson(use.input);
                assistant.toolCalls.append(call);
                knownCallIds.insert(use.id);
                return {};
            },
            [&](const ToolResultBlock& result) -> VoidResult {
                return std::unexpected(ErrorEnvelope::validation(
                    QStringLiteral("messages.%1: tool_result %2 in an assistant message")
                        .arg(index).arg(result.toolUseId)));
            },
        }, block);
        if (!handled)
            return handled;
    }

    if (!texts.isEmpty())
        assistant.text = texts.join(QLatin1Char('\n'));
    else if (assistant.toolCalls.isEmpty())
        assistant.text = QString();

    out.append(assistant);
    return {};
}

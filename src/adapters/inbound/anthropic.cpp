#include "adapters/inbound/anthropic.h"
#include "core/log_manager.h"
#include <QJsonDocument>
#include <QUuid>
#include <cmath>
#include <limits>

namespace {
ErrorEnvelope invalid(const QString& msg)
{
    return ErrorEnvelope::validation(msg);
}
}

Result<CanonicalRequest> AnthropicCodec::decodeRequest(const QByteArray& body)
{
    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseErr);
    if (parseErr.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(invalid(
            QStringLiteral("Request body is not valid JSON: %1").arg(parseErr.errorString())));
    }

    const QJsonObject root = doc.object();
    CanonicalRequest req;
    req.requestId = QUuid::createUuid().toString(QUuid::WithoutBraces);

    const QJsonValue modelVal = root[QStringLiteral("model")];
    if (!modelVal.isString())
        return std::unexpected(invalid(QStringLiteral("model: expected a string")));
    req.model = modelVal.toString();

    const QJsonValue msgsVal = root[QStringLiteral("messages")];
    if (!msgsVal.isArray())
        return std::unexpected(invalid(QStringLiteral("messages: expected an array")));
    const QJsonArray msgs = msgsVal.toArray();
    for (int i = 0; i < msgs.size(); ++i) {
        Result<Message> msg = parseMessage(msgs.at(i), i);
        if (!msg)
            return std::unexpected(msg.error());
        req.messages.append(std::move(*msg));
    }

    // System prompt is top-level in the Claude format
    if (root.contains(QStringLiteral("system")) && !root[QStringLiteral("system")].isNull()) {
        Result<SystemPrompt> system = parseSystem(root[QStringLiteral("system")]);
        if (!system)
            return std::unexpected(system.error());
        req.system = std::move(*system);
    }

    const QJsonValue toolsVal = root[QStringLiteral("tools")];
    if (!toolsVal.isUndefined() && !toolsVal.isNull() && !toolsVal.isArray())
        return std::unexpected(invalid(QStringLiteral("tools: expected an array")));
    for (const QJsonValue& tv : toolsVal.toArray()) {
        const QJsonObject t = tv.toObject();
        ToolDefinition tool;
        tool.name = t[QStringLiteral("name")].toString();
        tool.description = t[QStringLiteral("description")].toString();
        tool.inputSchema = t[QStringLiteral("input_schema")].toObject();
        req.tools.append(tool);
    }

    const QJsonValue choiceVal = root[QStringLiteral("tool_choice")];
    if (!choiceVal.isUndefined() && !choiceVal.isNull()) {
        Result<ToolChoice> choice = parseToolChoice(choiceVal);
        if (!choice)
            return std::unexpected(choice.error());
        req.toolChoice = *choice;
    }

    Result<GenerationParams> params = parseParams(root);
    if (!params)
        return std::unexpected(params.error());
    req.params = std::move(*params);

    req.stream = root[QStringLiteral("stream")].toBool();
    return req;
}

Result<Message> AnthropicCodec::parseMessage(const QJsonValue& value, int index)
{
    if (!value.isObject())
        return std::unexpected(invalid(QStringLiteral("messages.%1: expected an object").arg(index)));

    const QJsonObject m = value.toObject();
    Message msg;
    const QString role = m[QStringLiteral("role")].toString();
    if (role == QStringLiteral("user")) {
        msg.role = Role::User;
    } else if (role == QStringLiteral("assistant")) {
        msg.role = Role::Assistant;
    } else {
        return std::unexpected(invalid(
            QStringLiteral("messages.%1.role: unsupported role \"%2\"").arg(index).arg(role)));
    }

    Result<QList<ContentBlock>> content = parseContent(m[QStringLiteral("content")], index);
    if (!content)
        return std::unexpected(content.error());
    msg.content = std::move(*content);
    return msg;
}

Result<QList<ContentBlock>> AnthropicCodec::parseContent(const QJsonValue& content, int index)
{
    QList<ContentBlock> blocks;
    if (content.isString()) {
        blocks.append(TextBlock{content.toString()});
        return blocks;
    }
    if (!content.isArray()) {
        return std::unexpected(invalid(
            QStringLiteral("messages.%1.content: expected a string or an array").arg(index)));
    }

    for (const QJsonValue& bv : content.toArray()) {
        const QJsonObject block = bv.toObject();
        const QString type = block[QStringLiteral("type")].toString();
        if (type == QStringLiteral("text")) {
            blocks.append(TextBlock{block[QStringLiteral("text")].toString()});
        } else if (type == QStringLiteral("image")) {
            const QJsonObject source = block[QStringLiteral("source")].toObject();
            ImageBlock image;
            image.sourceType = source[QStringLiteral("type")].toString();
            image.mediaType = source[QStringLiteral("media_type")].toString();
            if (image.sourceType == QStringLiteral("base64")) {
                image.data = source[QStringLiteral("data")].toString();
                if (image.data.isEmpty() || image.mediaType.isEmpty()) {
                    return std::unexpected(invalid(
                        QStringLiteral("messages.%1: base64 image needs media_type and data").arg(index)));
                }
            } else if (image.sourceType == QStringLiteral("url")) {
                image.url = source[QStringLiteral("url")].toString();
            } else {
                return std::unexpected(invalid(
                    QStringLiteral("messages.%1: unsupported image source \"%2\"")
                        .arg(index).arg(image.sourceType)));
            }
            blocks.append(image);
        } else if (type == QStringLiteral("tool_use")) {
            ToolUseBlock use;
            use.id = block[QStringLiteral("id")].toString();
            use.name = block[QStringLiteral("name")].toString();
            use.input = block.contains(QStringLiteral("input"))
                ? block[QStringLiteral("input")] : QJsonValue(QJsonObject());
            blocks.append(use);
        } else if (type == QStringLiteral("tool_result")) {
            ToolResultBlock result;
            result.toolUseId = block[QStringLiteral("tool_use_id")].toString();
            result.content = block[QStringLiteral("content")];
            result.isError = block[QStringLiteral("is_error")].toBool();
            blocks.append(result);
        } else {
            LOG_WARNING(QStringLiteral("AnthropicCodec: messages.%1: content block \"%2\" dropped")
                            .arg(index).arg(type));
        }
    }
    return blocks;
}

Result<SystemPrompt> AnthropicCodec::parseSystem(const QJsonValue& value)
{
    if (value.isString())
        return SystemPrompt(value.toString());
    if (!value.isArray())
        return std::unexpected(invalid(QStringLiteral("system: expected a string or an array")));

    QList<TextBlock> blocks;
    for (const QJsonValue& bv : value.toArray()) {
        const QJsonObject block = bv.toObject();
        if (block[QStringLiteral("type")].toString() != QStringLiteral("text")) {
            return std::unexpected(invalid(QStringLiteral("system: only text blocks are supported")));
        }
        blocks.append(TextBlock{block[QStringLiteral("text")].toString()});
    }
    return SystemPrompt(blocks);
}

Result<ToolChoice> AnthropicCodec::parseToolChoice(const QJsonValue& value)
{
    const QJsonObject obj = value.toObject();
    const QString type = value.isString() ? value.toString() : obj[QStringLiteral("type")].toString();

    ToolChoice choice;
    if (type == QStringLiteral("auto")) {
        choice.mode = ToolChoiceMode::Auto;
    } else if (type == QStringLiteral("any")) {
        choice.mode = ToolChoiceMode::Any;
    } else if (type == QStringLiteral("none")) {
        choice.mode = ToolChoiceMode::None;
    } else if (type == QStringLiteral("tool")) {
        choice.mode = ToolChoiceMode::Tool;
        choice.toolName = obj[QStringLiteral("name")].toString();
    } else {
        return std::unexpected(invalid(QStringLiteral("tool_choice: unsupported type \"%1\"").arg(type)));
    }
    return choice;
}

Result<GenerationParams> AnthropicCodec::parseParams(const QJsonObject& root)
{
    GenerationParams params;

    auto numberField = [&](const char* key, auto assign) -> VoidResult {
        const QJsonValue v = root[QLatin1String(key)];
        if (v.isUndefined() || v.isNull())
            return {};
        if (!v.isDouble())
            return std::unexpected(invalid(QStringLiteral("%1: expected a number").arg(QLatin1String(key))));
        assign(v.toDouble());
        return {};
    };

    auto integerField = [&](const char* key, std::optional<int>& out) -> VoidResult {
        std::optional<double> value;
        VoidResult read = numberField(key, [&](double d) { value = d; });
        if (!read || !value)
            return read;
        if (std::trunc(*value) != *value
            || *value < static_cast<double>(std::numeric_limits<int>::min())
            || *value > static_cast<double>(std::numeric_limits<int>::max()))
            return std::unexpected(invalid(QStringLiteral("%1: expected an integer").arg(QLatin1String(key))));
        out = static_cast<int>(*value);
        return {};
    };

    VoidResult ok = integerField("max_tokens", params.maxTokens);
    if (ok)
        ok = numberField("temperature", [&](double d) { params.temperature = d; });
    if (ok)
        ok = numberField("top_p", [&](double d) { params.topP = d; });
    if (ok)
        ok = integerField("top_k", params.topK);
    if (!ok)
        return std::unexpected(ok.error());

    const QJsonValue stopVal = root[QStringLiteral("stop_sequences")];
    if (stopVal.isArray()) {
        for (const QJsonValue& sv : stopVal.toArray())
            params.stopSequences.append(sv.toString());
    } else if (!stopVal.isUndefined() && !stopVal.isNull()) {
        return std::unexpected(invalid(QStringLiteral("stop_sequences: expected an array")));
    }
    return params;
}

QJsonArray AnthropicCodec::serializeContent(const QList<ResponseBlock>& blocks)
{
    QJsonArray out;
    for (const ResponseBlock& block : blocks) {
        out.append(std::visit(Overloaded{
            [](const TextBlock& text) {
                QJsonObject obj;
                obj[QStringLiteral("type")] = QStringLiteral("text");
                obj[QStringLiteral("text")] = text.text;
                return obj;
            },
            [](const ToolUseBlock& use) {
                QJsonObject obj;
                obj[QStringLiteral("type")] = QStringLiteral("tool_use");
                obj[QStringLiteral("id")] = use.id;
                obj[QStringLiteral("name")] = use.name;
                obj[QStringLiteral("input")] = use.input;
                return obj;
            },
        }, block));
    }
    return out;
}

QJsonObject AnthropicCodec::responseToJson(const CanonicalResponse& response)
{
    QJsonObject root;
    root[QStringLiteral("id")] = response.id;
    root[QStringLiteral("type")] = QStringLiteral("message");
    root[QStringLiteral("role")] = QStringLiteral("assistant");
    root[QStringLiteral("model")] = response.model;
    root[QStringLiteral("content")] = serializeContent(response.content);
    root[QStringLiteral("stop_reason")] = stopReasonName(response.stopReason);
    root[QStringLiteral("stop_sequence")] = response.stopSequence.isEmpty()
        ? QJsonValue(QJsonValue::Null) : QJsonValue(response.stopSequence);

    QJsonObject usage;
    usage[QStringLiteral("input_tokens")] = response.usage.inputTokens;
    usage[QStringLiteral("output_tokens")] = response.usage.outputTokens;
    if (response.usage.cacheReadInputTokens > 0)
        usage[QStringLiteral("cache_read_input_tokens")] = response.usage.cacheReadInputTokens;
    root[QStringLiteral("usage")] = usage;
    return root;
}

QByteArray AnthropicCodec::encodeResponse(const CanonicalResponse& response)
{
    return QJsonDocument(responseToJson(response)).toJson(QJsonDocument::Compact);
}

QByteArray AnthropicCodec::encodeFailure(const ErrorEnvelope& failure)
{
    return QJsonDocument(failure.toJson()).toJson(QJsonDocument::Compact);
}

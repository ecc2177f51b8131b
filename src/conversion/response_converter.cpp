#include "response_converter.h"
#include "core/log_manager.h"
#include <QJsonDocument>
#include <QUuid>

namespace ResponseConverter {

CanonicalResponse convert(const BackendResponse& response, const QString& clientModel)
{
    CanonicalResponse out;
    out.id = response.id.isEmpty() ? generateMessageId() : response.id;
    out.model = clientModel;

    if (response.content && !response.content->isEmpty())
        out.content.append(TextBlock{*response.content});

    for (const BackendToolCall& call : response.toolCalls) {
        ToolUseBlock block;
        block.id = call.id.isEmpty() ? generateToolUseId() : call.id;
        block.name = call.name;
        block.input = parseArguments(call.arguments);
        out.content.append(block);
    }

    if (out.content.isEmpty())
        out.content.append(TextBlock{});

    out.stopReason = mapFinishReason(response.finishReason, response.matchedStop);
    if (out.stopReason == StopReason::StopSequence)
        out.stopSequence = response.matchedStop;

    if (response.usage) {
        out.usage.inputTokens = response.usage->promptTokens;
        out.usage.outputTokens = response.usage->completionTokens;
        out.usage.cacheReadInputTokens = response.usage->cachedTokens;
    }
    return out;
}

StopReason mapFinishReason(const QString& finishReason, const QString& matchedStop)
{
    if (finishReason == QStringLiteral("tool_calls") || finishReason == QStringLiteral("function_call"))
        return StopReason::ToolUse;
    if (finishReason == QStringLiteral("length"))
        return StopReason::MaxTokens;
    if (!matchedStop.isEmpty())
        return StopReason::StopSequence;
    if (finishReason == QStringLiteral("stop") || finishReason.isEmpty())
        return StopReason::EndTurn;

    LOG_INFO(QStringLiteral("ResponseConverter: finish_reason \"%1\" mapped to end_turn").arg(finishReason));
    return StopReason::EndTurn;
}

QJsonValue parseArguments(const QString& arguments)
{
    if (arguments.trimmed().isEmpty())
        return QJsonObject();

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(arguments.toUtf8(), &err);
    if (err.error == QJsonParseError::NoError) {
        if (doc.isObject())
            return doc.object();
        if (doc.isArray())
            return doc.array();
    }

    LOG_WARNING(QStringLiteral("ResponseConverter: tool arguments are not valid JSON, kept raw: %1")
                    .arg(arguments.left(200)));
    return QJsonValue(arguments);
}

QString generateMessageId()
{
    return QStringLiteral("msg_") + QUuid::createUuid().toString(QUuid::Id128);
}

QString generateToolUseId()
{
    return QStringLiteral("toolu_") + QUuid::createUuid().toString(QUuid::Id128);
}

}

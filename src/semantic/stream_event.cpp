#include "stream_event.h"
#include <QJsonArray>
#include <QJsonDocument>

namespace {
StreamEvent makeEvent(StreamEventType type, int index, QJsonObject data)
{
    StreamEvent ev;
    ev.type = type;
    ev.index = index;
    ev.data = std::move(data);
    return ev;
}
}

QString StreamEvent::name() const {
    switch (type) {
    case StreamEventType::MessageStart:      return QStringLiteral("message_start");
    case StreamEventType::ContentBlockStart: return QStringLiteral("content_block_start");
    case StreamEventType::ContentBlockDelta: return QStringLiteral("content_block_delta");
    case StreamEventType::ContentBlockStop:  return QStringLiteral("content_block_stop");
    case StreamEventType::MessageDelta:      return QStringLiteral("message_delta");
    case StreamEventType::MessageStop:       return QStringLiteral("message_stop");
    case StreamEventType::Error:             return QStringLiteral("error");
    }
    return QStringLiteral("error");
}

QByteArray StreamEvent::toSse() const {
    QByteArray out;
    out += "event: ";
    out += name().toUtf8();
    out += "\ndata: ";
    out += QJsonDocument(data).toJson(QJsonDocument::Compact);
    out += "\n\n";
    return out;
}

StreamEvent StreamEvent::messageStart(const QString& id, const QString& model, int inputTokens) {
    QJsonObject usage;
    usage["input_tokens"] = inputTokens;
    usage["output_tokens"] = 0;

    QJsonObject message;
    message["id"] = id;
    message["type"] = QStringLiteral("message");
    message["role"] = QStringLiteral("assistant");
    message["model"] = model;
    message["content"] = QJsonArray();
    message["stop_reason"] = QJsonValue::Null;
    message["stop_sequence"] = QJsonValue::Null;
    message["usage"] = usage;

    QJsonObject data;
    data["type"] = QStringLiteral("message_start");
    data["message"] = message;
    return makeEvent(StreamEventType::MessageStart, -1, data);
}

StreamEvent StreamEvent::textBlockStart(int index) {
    QJsonObject block;
    block["type"] = QStringLiteral("text");
    block["text"] = QString();

    QJsonObject data;
    data["type"] = QStringLiteral("content_block_start");
    data["index"] = index;
    data["content_block"] = block;
    return makeEvent(StreamEventType::ContentBlockStart, index, data);
}

StreamEvent StreamEvent::toolUseBlockStart(int index, const QString& id, const QString& name) {
    QJsonObject block;
    block["type"] = QStringLiteral("tool_use");
    block["id"] = id;
    block["name"] = name;
    block["input"] = QJsonObject();

    QJsonObject data;
    data["type"] = QStringLiteral("content_block_start");
    data["index"] = index;
    data["content_block"] = block;
    return makeEvent(StreamEventType::ContentBlockStart, index, data);
}

StreamEvent StreamEvent::textDelta(int index, const QString& text) {
    QJsonObject delta;
    delta["type"] = QStringLiteral("text_delta");
    delta["text"] = text;

    QJsonObject data;
    data["type"] = QStringLiteral("content_block_delta");
    data["index"] = index;
    data["delta"] = delta;
    return makeEvent(StreamEventType::ContentBlockDelta, index, data);
}

StreamEvent StreamEvent::inputJsonDelta(int index, const QString& partialJson) {
    QJsonObject delta;
    delta["type"] = QStringLiteral("input_json_delta");
    delta["partial_json"] = partialJson;

    QJsonObject data;
    data["type"] = QStringLiteral("content_block_delta");
    data["index"] = index;
    data["delta"] = delta;
    return makeEvent(StreamEventType::ContentBlockDelta, index, data);
}

StreamEvent StreamEvent::blockStop(int index) {
    QJsonObject data;
    data["type"] = QStringLiteral("content_block_stop");
    data["index"] = index;
    return makeEvent(StreamEventType::ContentBlockStop, index, data);
}

StreamEvent StreamEvent::messageDelta(StopReason reason, const QString& stopSequence,
                                      const Usage& usage) {
    QJsonObject delta;
    delta["stop_reason"] = stopReasonName(reason);
    delta["stop_sequence"] = stopSequence.isEmpty() ? QJsonValue(QJsonValue::Null)
                                                    : QJsonValue(stopSequence);

    QJsonObject u;
    u["input_tokens"] = usage.inputTokens;
    u["output_tokens"] = usage.outputTokens;
    if (usage.cacheReadInputTokens > 0)
        u["cache_read_input_tokens"] = usage.cacheReadInputTokens;

    QJsonObject data;
    data["type"] = QStringLiteral("message_delta");
    data["delta"] = delta;
    data["usage"] = u;
    return makeEvent(StreamEventType::MessageDelta, -1, data);
}

StreamEvent StreamEvent::messageStop() {
    QJsonObject data;
    data["type"] = QStringLiteral("message_stop");
    return makeEvent(StreamEventType::MessageStop, -1, data);
}

StreamEvent StreamEvent::error(const ErrorEnvelope& failure) {
    return makeEvent(StreamEventType::Error, -1, failure.toJson());
}

#pragma once
#include "failure.h"
#include "response.h"
#include <QByteArray>
#include <QJsonObject>
#include <QString>

enum class StreamEventType : quint8 {
    MessageStart,
    ContentBlockStart,
    ContentBlockDelta,
    ContentBlockStop,
    MessageDelta,
    MessageStop,
    Error,
};

// One Claude streaming event. `data` is the full JSON payload, including its "type".
struct StreamEvent {
    StreamEventType type = StreamEventType::MessageStart;
    int index = -1;
    QJsonObject data;

    QString name() const;
    QByteArray toSse() const;

    static StreamEvent messageStart(const QString& id, const QString& model, int inputTokens);
    static StreamEvent textBlockStart(int index);
    static StreamEvent toolUseBlockStart(int index, const QString& id, const QString& name);
    static StreamEvent textDelta(int index, const QString& text);
    static StreamEvent inputJsonDelta(int index, const QString& partialJson);
    static StreamEvent blockStop(int index);
    static StreamEvent messageDelta(StopReason reason, const QString& stopSequence, const Usage& usage);
    static StreamEvent messageStop();
    static StreamEvent error(const ErrorEnvelope& failure);
};

#pragma once
#include "types.h"
#include <QJsonObject>
#include <QJsonValue>
#include <QList>
#include <QString>
#include <QStringList>
#include <optional>

// OpenAI Chat Completions shapes, as sent to and received from the backend.

struct BackendContentPart {
    enum class Kind : quint8 { Text, ImageUrl };
    Kind kind = Kind::Text;
    QString text;
    QString url;
};

struct BackendToolCall {
    QString id;
    QString name;
    QString arguments;
};

struct BackendMessage {
    BackendRole role = BackendRole::User;
    std::optional<QString> text;
    QList<BackendContentPart> parts;   // multimodal content; takes precedence over text
    QList<BackendToolCall> toolCalls;
    QString toolCallId;
};

struct BackendToolDefinition {
    QString name;
    QString description;
    QJsonObject parameters;
};

struct BackendRequest {
    QString model;
    QList<BackendMessage> messages;
    QList<BackendToolDefinition> tools;
    std::optional<QJsonValue> toolChoice;
    std::optional<double> temperature;
    std::optional<double> topP;
    int maxTokens = 0;
    QStringList stop;
    bool stream = false;
    bool includeUsage = false;
};

struct BackendUsage {
    int promptTokens = 0;
    int completionTokens = 0;
    int cachedTokens = 0;
};

struct BackendResponse {
    QString id;
    QString model;
    std::optional<QString> content;
    QList<BackendToolCall> toolCalls;
    QString finishReason;
    QString matchedStop;
    std::optional<BackendUsage> usage;
};

struct BackendToolCallDelta {
    int index = 0;
    QString id;
    QString name;
    QString argumentsDelta;
    bool hasIndex = true;               // false when the backend omitted "index"
};

struct BackendStreamFragment {
    QString id;
    QString model;
    QString contentDelta;
    QList<BackendToolCallDelta> toolCalls;
    QString finishReason;
    QString matchedStop;
    std::optional<BackendUsage> usage;

    bool hasContent() const { return !contentDelta.isEmpty() || !toolCalls.isEmpty(); }
};

#pragma once
#include "content.h"
#include "types.h"
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>
#include <optional>
#include <variant>

struct Message {
    Role role = Role::User;
    QList<ContentBlock> content;
};

using SystemPrompt = std::variant<QString, QList<TextBlock>>;

struct ToolDefinition {
    QString name;
    QString description;
    QJsonObject inputSchema;
};

struct ToolChoice {
    ToolChoiceMode mode = ToolChoiceMode::Auto;
    QString toolName;
};

struct GenerationParams {
    std::optional<double> temperature;
    std::optional<double> topP;
    std::optional<int> topK;
    std::optional<int> maxTokens;
    QStringList stopSequences;
};

struct CanonicalRequest {
    QString requestId;
    QString model;
    QList<Message> messages;
    std::optional<SystemPrompt> system;
    QList<ToolDefinition> tools;
    std::optional<ToolChoice> toolChoice;
    GenerationParams params;
    bool stream = false;
};

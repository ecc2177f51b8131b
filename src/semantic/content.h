#pragma once
#include <QString>
#include <QJsonValue>
#include <variant>

struct TextBlock {
    QString text;
};

struct ImageBlock {
    QString sourceType;   // "base64" or "url"
    QString mediaType;
    QString data;         // base64 payload, kept exactly as received
    QString url;
};

struct ToolUseBlock {
    QString id;
    QString name;
    QJsonValue input;     // parsed arguments, or the raw string when they did not parse
};

struct ToolResultBlock {
    QString toolUseId;
    QJsonValue content;
    bool isError = false;
};

using ContentBlock = std::variant<TextBlock, ImageBlock, ToolUseBlock, ToolResultBlock>;

template<class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

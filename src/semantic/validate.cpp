#include "validate.h"
#include <QSet>

namespace Validate {

VoidResult request(const CanonicalRequest& req) {
    if (req.messages.isEmpty())
        return std::unexpected(ErrorEnvelope::validation(
            QStringLiteral("messages: at least one message is required")));
    if (req.model.trimmed().isEmpty())
        return std::unexpected(ErrorEnvelope::validation(
            QStringLiteral("model: field required")));

    QSet<QString> toolUseIds;
    for (int i = 0; i < req.messages.size(); ++i) {
        const Message& msg = req.messages.at(i);
        for (const ContentBlock& block : msg.content) {
            if (const auto* use = std::get_if<ToolUseBlock>(&block)) {
                if (msg.role != Role::Assistant)
                    return std::unexpected(ErrorEnvelope::validation(
                        QStringLiteral("messages.%1: tool_use blocks are only allowed in assistant messages").arg(i)));
                if (use->id.isEmpty())
                    return std::unexpected(ErrorEnvelope::validation(
                        QStringLiteral("messages.%1: tool_use block without id").arg(i)));
                if (toolUseIds.contains(use->id))
                    return std::unexpected(ErrorEnvelope::validation(
                        QStringLiteral("messages.%1: duplicate tool_use id %2").arg(i).arg(use->id)));
                toolUseIds.insert(use->id);
            } else if (std::holds_alternative<ToolResultBlock>(block)) {
                if (msg.role != Role::User)
                    return std::unexpected(ErrorEnvelope::validation(
                        QStringLiteral("messages.%1: tool_result blocks are only allowed in user messages").arg(i)));
            }
        }
    }
    for (const ToolDefinition& tool : req.tools) {
        if (tool.name.isEmpty())
            return std::unexpected(ErrorEnvelope::validation(
                QStringLiteral("tools: every tool needs a name")));
    }
    if (req.toolChoice && req.toolChoice->mode == ToolChoiceMode::Tool
        && req.toolChoice->toolName.isEmpty())
        return std::unexpected(ErrorEnvelope::validation(
            QStringLiteral("tool_choice: type \"tool\" requires a name")));
    return {};
}

}

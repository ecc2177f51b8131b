#include "stream_converter.h"
#include "response_converter.h"
#include "core/log_manager.h"

StreamConverter::StreamConverter(const QString& clientModel)
    : StreamConverter(clientModel, Options{})
{
}

StreamConverter::StreamConverter(const QString& clientModel, Options options)
    : m_clientModel(clientModel)
    , m_options(options)
{
}

QList<StreamEvent> StreamConverter::consume(const BackendStreamFragment& fragment)
{
    QList<StreamEvent> out;

    if (m_state.phase == StreamPhase::Finalized) {
        if (fragment.hasContent() || !fragment.finishReason.isEmpty() || fragment.usage)
            LOG_WARNING(QStringLiteral("StreamConverter: fragment after message_stop dropped"));
        return out;
    }

    if (fragment.usage)
        m_state.usage = fragment.usage;

    if (m_state.phase == StreamPhase::Finishing) {
        if (fragment.hasContent())
            LOG_WARNING(QStringLiteral("StreamConverter: content after finish_reason dropped"));
        if (fragment.usage)
            finalize(out);
        return out;
    }

    if (!fragment.hasContent() && fragment.finishReason.isEmpty())
        return out;

    ensureStarted(fragment.id, out);

    if (!fragment.contentDelta.isEmpty())
        appendText(fragment.contentDelta, out);

    for (const BackendToolCallDelta& delta : fragment.toolCalls)
        appendToolDelta(delta, out);

    if (!fragment.finishReason.isEmpty()) {
        closeOpenBlock(out);
        m_state.stopReason = ResponseConverter::mapFinishReason(fragment.finishReason,
                                                                fragment.matchedStop);
        if (m_state.stopReason == StopReason::StopSequence)
            m_state.stopSequence = fragment.matchedStop;

        if (m_options.awaitTrailingUsage && !fragment.usage)
            m_state.phase = StreamPhase::Finishing;
        else
            finalize(out);
    }
    return out;
}

QList<StreamEvent> StreamConverter::finish()
{
    QList<StreamEvent> out;
    if (m_state.phase == StreamPhase::Finalized)
        return out;

    if (m_state.phase != StreamPhase::Finishing)
        LOG_DEBUG(QStringLiteral("StreamConverter: backend stream ended without finish_reason"));

    ensureStarted(QString(), out);
    closeOpenBlock(out);
    finalize(out);
    return out;
}

QList<StreamEvent> StreamConverter::fail(const ErrorEnvelope& failure)
{
    QList<StreamEvent> out;
    if (m_state.phase == StreamPhase::Finalized) {
        LOG_WARNING(QStringLiteral("StreamConverter: failure after message_stop ignored: %1")
                        .arg(failure.message));
        return out;
    }

    ensureStarted(QString(), out);
    closeOpenBlock(out);

    if (failure.kind == ErrorKind::Cancelled) {
        finalize(out);
        return out;
    }

    out.append(StreamEvent::error(failure));
    m_state.phase = StreamPhase::Finalized;
    return out;
}

Usage StreamConverter::usage() const
{
    Usage u;
    if (m_state.usage) {
        u.inputTokens = m_state.usage->promptTokens;
        u.outputTokens = m_state.usage->completionTokens;
        u.cacheReadInputTokens = m_state.usage->cachedTokens;
    } else {
        u.outputTokens = estimateTokens(m_state.streamedChars);
    }
    return u;
}

void StreamConverter::ensureStarted(const QString& backendId, QList<StreamEvent>& out)
{
    if (m_state.phase != StreamPhase::Idle)
        return;
    m_state.messageId = backendId.isEmpty() ? ResponseConverter::generateMessageId() : backendId;
    out.append(StreamEvent::messageStart(m_state.messageId, m_clientModel, 0));
    m_state.phase = StreamPhase::Started;
}

void StreamConverter::closeOpenBlock(QList<StreamEvent>& out)
{
    if (m_state.openBlockIndex < 0)
        return;
    out.append(StreamEvent::blockStop(m_state.openBlockIndex));
    if (m_state.openToolIndex >= 0)
        m_state.closedToolIndices.insert(m_state.openToolIndex);
    m_state.openBlockIndex = -1;
    m_state.openToolIndex = -1;
    m_state.phase = StreamPhase::Started;
}

void StreamConverter::appendText(const QString& text, QList<StreamEvent>& out)
{
    if (m_state.phase != StreamPhase::TextOpen) {
        closeOpenBlock(out);
        m_state.openBlockIndex = m_state.nextBlockIndex++;
        out.append(StreamEvent::textBlockStart(m_state.openBlockIndex));
        m_state.phase = StreamPhase::TextOpen;
    }
    m_state.streamedChars += text.size();
    out.append(StreamEvent::textDelta(m_state.openBlockIndex, text));
}

// Without an explicit index the position in the chunk is only a guess: a new
// id starts a new call, an id-less delta continues the open one.
int StreamConverter::resolveToolIndex(const BackendToolCallDelta& delta) const
{
    if (delta.hasIndex)
        return delta.index;

    if (delta.id.isEmpty())
        return m_state.phase == StreamPhase::ToolOpen ? m_state.openToolIndex : delta.index;

    for (auto it = m_state.toolIds.constBegin(); it != m_state.toolIds.constEnd(); ++it) {
        if (it.value() == delta.id)
            return it.key();
    }
    if (!m_state.toolIds.contains(delta.index))
        return delta.index;

    const int next = m_state.toolIds.lastKey() + 1;
    LOG_WARNING(QStringLiteral("StreamConverter: tool call %1 has no index, assigned %2")
                    .arg(delta.id).arg(next));
    return next;
}

void StreamConverter::appendToolDelta(const BackendToolCallDelta& delta, QList<StreamEvent>& out)
{
    const int index = resolveToolIndex(delta);
    if (m_state.closedToolIndices.contains(index)) {
        LOG_WARNING(QStringLiteral("StreamConverter: fragment for closed tool call index %1 dropped")
                        .arg(index));
        return;
    }

    if (m_state.phase != StreamPhase::ToolOpen || m_state.openToolIndex != index) {
        closeOpenBlock(out);
        const QString id = delta.id.isEmpty() ? ResponseConverter::generateToolUseId() : delta.id;
        m_state.openBlockIndex = m_state.nextBlockIndex++;
        m_state.openToolIndex = index;
        m_state.toolIds[index] = id;
        out.append(StreamEvent::toolUseBlockStart(m_state.openBlockIndex, id, delta.name));
        m_state.phase = StreamPhase::ToolOpen;
    }

    if (delta.argumentsDelta.isEmpty())
        return;
    m_state.toolArguments[index] += delta.argumentsDelta;
    m_state.streamedChars += delta.argumentsDelta.size();
    out.append(StreamEvent::inputJsonDelta(m_state.openBlockIndex, delta.argumentsDelta));
}

void StreamConverter::finalize(QList<StreamEvent>& out)
{
    out.append(StreamEvent::messageDelta(m_state.stopReason, m_state.stopSequence, usage()));
    out.append(StreamEvent::messageStop());
    m_state.phase = StreamPhase::Finalized;
}

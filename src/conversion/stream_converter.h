#pragma once
#include "semantic/backend.h"
#include "semantic/failure.h"
#include "semantic/stream_event.h"
#include <QList>
#include <QMap>
#include <QSet>
#include <optional>

enum class StreamPhase : quint8 {
    Idle,
    Started,
    TextOpen,
    ToolOpen,
    Finishing,
    Finalized,
};

struct StreamState {
    StreamPhase phase = StreamPhase::Idle;
    QString messageId;
    int nextBlockIndex = 0;
    int openBlockIndex = -1;
    int openToolIndex = -1;             // backend tool-call index of the open tool block
    QSet<int> closedToolIndices;
    QMap<int, QString> toolIds;         // tool_use id per backend index
    QMap<int, QString> toolArguments;   // accumulated partial arguments per backend index
    StopReason stopReason = StopReason::EndTurn;
    QString stopSequence;
    std::optional<BackendUsage> usage;
    qint64 streamedChars = 0;
};

// Turns backend stream fragments into Claude stream events.
//
// Per block index the output is always start, deltas, stop; indices increase
// monotonically and nothing is emitted once the converter is Finalized.
class StreamConverter {
public:
    struct Options {
        bool awaitTrailingUsage = false;   // backend sends usage in a fragment after finish_reason
    };

    explicit StreamConverter(const QString& clientModel);
    StreamConverter(const QString& clientModel, Options options);

    QList<StreamEvent> consume(const BackendStreamFragment& fragment);
    QList<StreamEvent> finish();
    QList<StreamEvent> fail(const ErrorEnvelope& failure);

    bool isFinalized() const { return m_state.phase == StreamPhase::Finalized; }
    StreamPhase phase() const { return m_state.phase; }
    const StreamState& state() const { return m_state; }
    Usage usage() const;

    static int estimateTokens(qint64 chars) { return static_cast<int>((chars + 3) / 4); }

private:
    QString m_clientModel;
    Options m_options;
    StreamState m_state;

    void ensureStarted(const QString& backendId, QList<StreamEvent>& out);
    void closeOpenBlock(QList<StreamEvent>& out);
    void appendText(const QString& text, QList<StreamEvent>& out);
    void appendToolDelta(const BackendToolCallDelta& delta, QList<StreamEvent>& out);
    int resolveToolIndex(const BackendToolCallDelta& delta) const;
    void finalize(QList<StreamEvent>& out);
};

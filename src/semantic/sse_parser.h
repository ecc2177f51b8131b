#pragma once
#include <QByteArray>
#include <QList>
#include <QString>

struct SseEvent {
    QString type;
    QByteArray data;
};

// Incremental server-sent-event parser. Bytes may arrive split anywhere;
// complete events are returned as soon as their terminating blank line is seen.
class SseParser {
public:
    QList<SseEvent> feed(const QByteArray& bytes);
    QList<SseEvent> flush();
    void reset();
    bool hasBufferedData() const { return !m_buffer.isEmpty(); }

private:
    QByteArray m_buffer;

    QList<SseEvent> drainBlocks();
    static bool parseBlock(const QByteArray& block, SseEvent& event);
};

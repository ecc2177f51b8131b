#include "sse_parser.h"

QList<SseEvent> SseParser::feed(const QByteArray& bytes)
{
    m_buffer.append(bytes);
    return drainBlocks();
}

QList<SseEvent> SseParser::flush()
{
    // An unterminated trailing block still counts once the transport is done.
    if (m_buffer.trimmed().isEmpty()) {
        m_buffer.clear();
        return {};
    }
    m_buffer.append("\n\n");
    QList<SseEvent> events = drainBlocks();
    m_buffer.clear();
    return events;
}

void SseParser::reset()
{
    m_buffer.clear();
}

QList<SseEvent> SseParser::drainBlocks()
{
    QList<SseEvent> events;

    while (true) {
        // Check "\r\n\r\n" first so a CRLF stream is not split on a partial match.
        int delimPos = -1;
        int delimLen = 0;

        const int crlfPos = m_buffer.indexOf("\r\n\r\n");
        const int lfPos = m_buffer.indexOf("\n\n");

        if (crlfPos >= 0 && (lfPos < 0 || crlfPos <= lfPos)) {
            delimPos = crlfPos;
            delimLen = 4;
        } else if (lfPos >= 0) {
            delimPos = lfPos;
            delimLen = 2;
        }

        if (delimPos < 0)
            break;

        const QByteArray block = m_buffer.left(delimPos);
        m_buffer.remove(0, delimPos + delimLen);

        SseEvent event;
        if (parseBlock(block, event))
            events.append(event);
    }

    return events;
}

bool SseParser::parseBlock(const QByteArray& block, SseEvent& event)
{
    QList<QByteArray> dataLines;

    const QList<QByteArray> lines = block.split('\n');
    for (const QByteArray& rawLine : lines) {
        QByteArray line = rawLine;
        if (line.endsWith('\r'))
            line.chop(1);

        if (line.isEmpty() || line.startsWith(':'))
            continue;

        if (line.startsWith("event:")) {
            event.type = QString::fromUtf8(line.mid(6).trimmed());
        } else if (line.startsWith("data:")) {
            QByteArray value = line.mid(5);
            if (value.startsWith(' '))
                value.remove(0, 1);
            dataLines.append(value);
        }
        // id:, retry: and unknown fields are ignored.
    }

    // Event-only blocks carry nothing we can use.
    if (dataLines.isEmpty())
        return false;

    event.data = dataLines.join('\n');
    return true;
}

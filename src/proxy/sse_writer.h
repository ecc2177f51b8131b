#pragma once
#include "semantic/stream_event.h"
#include <QTcpSocket>
#include <QByteArray>

class SseWriter {
public:
    static void writeStreamHeader(QTcpSocket* socket);
    static void sendEvent(QTcpSocket* socket, const StreamEvent& event);
    static void sendChunk(QTcpSocket* socket, const QByteArray& sseData);
    static void sendTerminator(QTcpSocket* socket);

    static QByteArray wrapChunked(const QByteArray& data);
};

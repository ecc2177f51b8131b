#include "sse_writer.h"
#include "core/log_manager.h"

namespace {
bool writable(QTcpSocket* socket, const char* what)
{
    if (socket && socket->state() == QAbstractSocket::ConnectedState)
        return true;
    LOG_DEBUG(QStringLiteral("SseWriter: cannot send %1, socket not connected").arg(QLatin1String(what)));
    return false;
}
}

void SseWriter::writeStreamHeader(QTcpSocket* socket)
{
    if (!writable(socket, "stream header"))
        return;

    const QByteArray header =
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/event-stream\r\n"
        "Cache-Control: no-cache\r\n"
        "Connection: keep-alive\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n";

    socket->write(header);
    socket->flush();
}

QByteArray SseWriter::wrapChunked(const QByteArray& data)
{
    // <hex-length>\r\n<data>\r\n
    QByteArray chunk;
    chunk.append(QByteArray::number(data.size(), 16));
    chunk.append("\r\n");
    chunk.append(data);
    chunk.append("\r\n");
    return chunk;
}

void SseWriter::sendEvent(QTcpSocket* socket, const StreamEvent& event)
{
    sendChunk(socket, event.toSse());
}

void SseWriter::sendChunk(QTcpSocket* socket, const QByteArray& sseData)
{
    if (sseData.isEmpty() || !writable(socket, "chunk"))
        return;
    socket->write(wrapChunked(sseData));
    socket->flush();
}

void SseWriter::sendTerminator(QTcpSocket* socket)
{
    if (!writable(socket, "terminator"))
        return;

    // The zero-length chunk signals end of chunked transfer
    socket->write("0\r\n\r\n");
    socket->flush();
}

#include "proxy_server.h"
#include "sse_writer.h"
#include "adapters/inbound/anthropic.h"
#include "adapters/outbound/openai.h"
#include "core/log_manager.h"
#include "pipeline/pipeline.h"
#include "semantic/cancellation.h"

#include <QDateTime>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTimer>

ProxyServer::ProxyServer(const BridgeConfig& config,
                         IBackendClient* client,
                         UsageRecorder* usage,
                         QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_client(client)
    , m_usage(usage)
{
}

ProxyServer::~ProxyServer()
{
    stop();
}

bool ProxyServer::start()
{
    QHostAddress address;
    if (m_config.server.host.isEmpty() || m_config.server.host == QStringLiteral("0.0.0.0"))
        address = QHostAddress::Any;
    else if (m_config.server.host == QStringLiteral("localhost"))
        address = QHostAddress::LocalHost;
    else if (!address.setAddress(m_config.server.host)) {
        LOG_ERROR(QStringLiteral("ProxyServer: invalid listen address %1").arg(m_config.server.host));
        return false;
    }
    return listen(address, static_cast<quint16>(m_config.server.port));
}

bool ProxyServer::listen(const QHostAddress& address, quint16 port)
{
    if (m_server)
        stop();

    m_server = new QTcpServer(this);
    connect(m_server, &QTcpServer::newConnection,
            this, &ProxyServer::onNewConnection);

    if (!m_server->listen(address, port)) {
        LOG_ERROR(QStringLiteral("ProxyServer: failed to listen on %1:%2 - %3")
                      .arg(address.toString())
                      .arg(port)
                      .arg(m_server->errorString()));
        delete m_server;
        m_server = nullptr;
        return false;
    }

    LOG_INFO(QStringLiteral("ProxyServer: listening on %1:%2 (backend %3, %4)")
                 .arg(address.toString())
                 .arg(m_server->serverPort())
                 .arg(m_config.backend.baseUrl, OpenAICodec::apiType(m_config.backend)));
    emit statusChanged(true);
    return true;
}

void ProxyServer::stop()
{
    if (!m_server)
        return;

    // Cancel in-flight work; stream sessions close themselves through finished()
    const QList<QTcpSocket*> sockets = m_connections.keys();
    for (QTcpSocket* socket : sockets) {
        auto it = m_connections.find(socket);
        if (it == m_connections.end())
            continue;
        if (it->token)
            it->token->cancel(CancelReason::Requested);
    }
    for (QTcpSocket* socket : sockets)
        socket->disconnectFromHost();

    m_server->close();
    m_server->deleteLater();
    m_server = nullptr;

    LOG_INFO(QStringLiteral("ProxyServer: stopped"));
    emit statusChanged(false);
}

bool ProxyServer::isRunning() const
{
    return m_server && m_server->isListening();
}

quint16 ProxyServer::serverPort() const
{
    return m_server ? m_server->serverPort() : 0;
}

int ProxyServer::activeStreamCount() const
{
    int count = 0;
    for (const Connection& conn : m_connections)
        count += conn.session ? 1 : 0;
    return count;
}

void ProxyServer::onNewConnection()
{
    while (m_server && m_server->hasPendingConnections()) {
        QTcpSocket* socket = m_server->nextPendingConnection();
        if (!socket)
            continue;

        m_connections.insert(socket, Connection{});
        connect(socket, &QTcpSocket::readyRead,
                this, &ProxyServer::onSocketReadyRead);
        connect(socket, &QTcpSocket::disconnected,
                this, &ProxyServer::onSocketDisconnected);

        LOG_DEBUG(QStringLiteral("ProxyServer: new connection from %1:%2")
                      .arg(socket->peerAddress().toString())
                      .arg(socket->peerPort()));
    }
}

void ProxyServer::onSocketReadyRead()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket)
        return;

    auto it = m_connections.find(socket);
    if (it == m_connections.end())
        return;
    if (it->closed) {
        socket->readAll();
        return;
    }
    it->buffer += socket->readAll();

    // A request on this connection is still running; pick this up afterwards
    if (it->busy || it->session)
        return;
    processBuffer(socket);
}

void ProxyServer::processBuffer(QTcpSocket* socket)
{
    while (true) {
        auto it = m_connections.find(socket);
        if (it == m_connections.end() || it->busy || it->session || it->closed)
            return;
        QByteArray& buffer = it->buffer;

        const qsizetype headerEnd = buffer.indexOf("\r\n\r\n");
        if (headerEnd < 0) {
            if (buffer.size() > kMaxHeaderBytes) {
                rejectAndClose(socket, ErrorEnvelope::clientError(
                    413, QStringLiteral("request header exceeds %1 bytes").arg(kMaxHeaderBytes)));
            }
            return;
        }

        qint64 contentLength = 0;
        bool hasChunkedTransfer = false;
        const QString headerBlock = QString::fromUtf8(buffer.left(headerEnd));
        const QStringList headerLines = headerBlock.split(QStringLiteral("\r\n"));
        for (const QString& line : headerLines) {
            if (line.startsWith(QStringLiteral("Content-Length:"), Qt::CaseInsensitive)) {
                bool ok = false;
                contentLength = line.mid(15).trimmed().toLongLong(&ok);
                if (!ok || contentLength < 0) {
                    rejectAndClose(socket, ErrorEnvelope::validation(
                        QStringLiteral("invalid Content-Length \"%1\"").arg(line.mid(15).trimmed())));
                    return;
                }
            }
            if (line.startsWith(QStringLiteral("Transfer-Encoding:"), Qt::CaseInsensitive)
                && line.contains(QStringLiteral("chunked"), Qt::CaseInsensitive))
                hasChunkedTransfer = true;
        }

        if (hasChunkedTransfer) {
            rejectAndClose(socket, ErrorEnvelope::validation(
                QStringLiteral("chunked request bodies are not supported")));
            return;
        }

        if (contentLength > m_config.server.maxRequestBytes) {
            rejectAndClose(socket, ErrorEnvelope::clientError(
                413, QStringLiteral("request body of %1 bytes exceeds the limit of %2")
                         .arg(contentLength).arg(m_config.server.maxRequestBytes)));
            return;
        }

        const qint64 totalRequired = headerEnd + 4 + contentLength;
        if (buffer.size() < totalRequired)
            return;

        const QByteArray requestData = buffer.left(totalRequired);
        buffer.remove(0, totalRequired);

        handleRequest(socket, parseHttpRequest(requestData));
        if (socket->state() != QAbstractSocket::ConnectedState)
            return;
    }
}

void ProxyServer::rejectAndClose(QTcpSocket* socket, const ErrorEnvelope& failure)
{
    LOG_WARNING(QStringLiteral("ProxyServer: rejecting request: %1").arg(failure.message));
    auto it = m_connections.find(socket);
    if (it != m_connections.end()) {
        it->buffer.clear();
        it->closed = true;
    }
    sendFailure(socket, failure);
    socket->disconnectFromHost();
}

void ProxyServer::onSocketDisconnected()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket)
        return;

    auto it = m_connections.find(socket);
    if (it == m_connections.end())
        return;

    it->closed = true;
    if (it->token)
        it->token->cancel(CancelReason::ClientDisconnected);

    // The token may have finished the stream synchronously and released the socket
    releaseIfClosed(socket);
    LOG_DEBUG(QStringLiteral("ProxyServer: client disconnected"));
}

bool ProxyServer::releaseIfClosed(QTcpSocket* socket)
{
    auto it = m_connections.find(socket);
    if (it == m_connections.end())
        return true;
    if (!it->closed)
        return false;
    if (it->busy || it->session)
        return true;
    m_connections.erase(it);
    socket->deleteLater();
    return true;
}

ProxyServer::HttpRequest ProxyServer::parseHttpRequest(const QByteArray& data)
{
    HttpRequest req;

    const int headerEnd = data.indexOf("\r\n\r\n");
    if (headerEnd < 0)
        return req;

    const QString headerBlock = QString::fromUtf8(data.left(headerEnd));
    const QStringList lines = headerBlock.split(QStringLiteral("\r\n"));

    // Request line: "METHOD PATH HTTP/1.1"
    if (!lines.isEmpty()) {
        const QStringList parts = lines[0].split(QLatin1Char(' '));
        if (parts.size() >= 3) {
            req.method      = parts[0].trimmed().toUpper();
            req.path        = parts[1];
            req.httpVersion = parts[2];
        }
    }

    for (int i = 1; i < lines.size(); ++i) {
        const int colon = lines[i].indexOf(QLatin1Char(':'));
        if (colon > 0) {
            const QString key   = lines[i].left(colon).trimmed().toLower();
            const QString value = lines[i].mid(colon + 1).trimmed();
            req.headers[key] = value;
        }
    }

    req.body = data.mid(headerEnd + 4);
    return req;
}

void ProxyServer::handleRequest(QTcpSocket* socket, const HttpRequest& request)
{
    LOG_INFO(QStringLiteral("ProxyServer: %1 %2").arg(request.method, request.path));

    QString path = request.path;
    const int query = path.indexOf(QLatin1Char('?'));
    if (query >= 0)
        path.truncate(query);

    if (request.method == QStringLiteral("POST") && path == QStringLiteral("/v1/messages")) {
        handleMessages(socket, request);
        return;
    }
    if (request.method == QStringLiteral("GET") && path == QStringLiteral("/health")) {
        handleHealth(socket);
        return;
    }

    ErrorEnvelope notFound = ErrorEnvelope::clientError(
        404, QStringLiteral("No route for %1 %2").arg(request.method, path));
    sendFailure(socket, notFound);
}

void ProxyServer::handleHealth(QTcpSocket* socket)
{
    QJsonObject body;
    body[QStringLiteral("status")] = QStringLiteral("healthy");
    body[QStringLiteral("timestamp")] = QDateTime::currentDateTimeUtc().toString(Qt::ISODate);
    body[QStringLiteral("api_type")] = OpenAICodec::apiType(m_config.backend);
    body[QStringLiteral("backend_configured")] = m_config.isValid();
    sendHttpResponse(socket, 200, QJsonDocument(body).toJson(QJsonDocument::Compact));
}

void ProxyServer::handleMessages(QTcpSocket* socket, const HttpRequest& request)
{
    auto decoded = AnthropicCodec::decodeRequest(request.body);
    if (!decoded) {
        LOG_WARNING(QStringLiteral("ProxyServer: rejected request body: %1").arg(decoded.error().message));
        sendFailure(socket, decoded.error());
        return;
    }
    const CanonicalRequest canonical = *decoded;

    auto* token = new CancellationToken(this);
    auto* timer = new QTimer(token);
    timer->setSingleShot(true);
    connect(timer, &QTimer::timeout, token, [token]() {
        token->cancel(CancelReason::Timeout);
    });
    timer->start(m_config.server.requestTimeout);

    auto it = m_connections.find(socket);
    it->token = token;
    it->busy = true;

    auto endCall = [this, socket, token]() {
        auto conn = m_connections.find(socket);
        if (conn != m_connections.end()) {
            conn->busy = false;
            if (conn->token == token)
                conn->token = nullptr;
        }
    };

    // The backend call runs a local event loop; the socket can disconnect meanwhile
    Pipeline pipeline(m_config, m_client, m_usage);
    if (!canonical.stream) {
        auto result = pipeline.process(canonical, token);
        endCall();
        token->deleteLater();
        if (releaseIfClosed(socket))
            return;
        if (!result) {
            sendFailure(socket, result.error());
            return;
        }
        sendHttpResponse(socket, 200, AnthropicCodec::encodeResponse(*result));
        return;
    }

    auto result = pipeline.processStream(canonical, token, this);
    endCall();
    if (!result) {
        token->deleteLater();
        if (!releaseIfClosed(socket))
            sendFailure(socket, result.error());
        return;
    }
    sendStreamResponse(socket, *result, token, timer);
}

void ProxyServer::sendStreamResponse(QTcpSocket* socket,
                                     PipelineStreamSession* session,
                                     CancellationToken* token,
                                     QTimer* timer)
{
    auto it = m_connections.find(socket);
    it->session = session;
    it->token = token;

    SseWriter::writeStreamHeader(socket);

    // While events flow the request timeout acts as an idle timeout
    connect(session, &PipelineStreamSession::eventReady,
            this, [socket, timer](const StreamEvent& event) {
                timer->start();
                SseWriter::sendEvent(socket, event);
            });

    connect(session, &PipelineStreamSession::finished,
            this, [this, socket, session, token]() {
                SseWriter::sendTerminator(socket);
                auto conn = m_connections.find(socket);
                if (conn != m_connections.end() && conn->session == session) {
                    conn->session = nullptr;
                    conn->token = nullptr;
                }
                session->deleteLater();
                token->deleteLater();
                if (!releaseIfClosed(socket))
                    QMetaObject::invokeMethod(this, [this, socket]() { processBuffer(socket); },
                                              Qt::QueuedConnection);
            });

    if (it->closed)
        session->abort(CancelReason::ClientDisconnected);
}

void ProxyServer::sendFailure(QTcpSocket* socket, const ErrorEnvelope& failure)
{
    sendHttpResponse(socket, failure.httpStatus(), QJsonDocument(failure.toJson()).toJson(QJsonDocument::Compact));
}

void ProxyServer::sendHttpResponse(QTcpSocket* socket, int status,
                                   const QByteArray& body,
                                   const QString& contentType)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState)
        return;

    static const QMap<int, QString> statusTexts = {
        {200, QStringLiteral("OK")},
        {400, QStringLiteral("Bad Request")},
        {401, QStringLiteral("Unauthorized")},
        {403, QStringLiteral("Forbidden")},
        {404, QStringLiteral("Not Found")},
        {413, QStringLiteral("Payload Too Large")},
        {429, QStringLiteral("Too Many Requests")},
        {499, QStringLiteral("Client Closed Request")},
        {500, QStringLiteral("Internal Server Error")},
        {502, QStringLiteral("Bad Gateway")},
        {503, QStringLiteral("Service Unavailable")},
        {504, QStringLiteral("Gateway Timeout")},
        {529, QStringLiteral("Overloaded")},
    };

    const QString statusText = statusTexts.value(status, QStringLiteral("Unknown"));

    QByteArray response;
    response.append(QStringLiteral("HTTP/1.1 %1 %2\r\n").arg(status).arg(statusText).toUtf8());
    response.append(QStringLiteral("Content-Type: %1\r\n").arg(contentType).toUtf8());
    response.append(QStringLiteral("Content-Length: %1\r\n").arg(body.size()).toUtf8());
    response.append("Connection: keep-alive\r\n");
    response.append("\r\n");
    response.append(body);

    socket->write(response);
    socket->flush();
}

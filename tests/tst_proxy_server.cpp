#include <QTest>
#include <QElapsedTimer>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTcpSocket>
#include <QTimer>
#include "proxy/proxy_server.h"
#include "proxy/sse_writer.h"
#include "semantic/backend_stream.h"
#include "semantic/ports.h"

namespace {

class ScriptedStream : public BackendStream {
public:
    using BackendStream::BackendStream;

    void abort(CancelReason) override {
        emit failed(ErrorEnvelope::cancelled(QStringLiteral("aborted")));
    }

    void play(const QStringList& deltas) {
        for (const QString& text : deltas) {
            BackendStreamFragment f;
            f.id = QStringLiteral("chatcmpl-stream");
            f.contentDelta = text;
            emit fragmentReady(f);
        }
        BackendStreamFragment stop;
        stop.finishReason = QStringLiteral("stop");
        stop.usage = BackendUsage{4, 2, 0};
        emit fragmentReady(stop);
        emit finished();
    }
};

class ScriptedClient : public IBackendClient {
public:
    Result<BackendHttpResponse> execute(const BackendHttpRequest& request,
                                        CancellationToken*) override {
        lastRequest = request;
        BackendHttpResponse resp;
        resp.statusCode = 200;
        resp.body = R"({"id":"chatcmpl-1","choices":[{"finish_reason":"stop",
            "message":{"role":"assistant","content":"pong"}}],
            "usage":{"prompt_tokens":3,"completion_tokens":1}})";
        return resp;
    }

    Result<BackendStream*> openStream(const BackendHttpRequest& request,
                                      CancellationToken*) override {
        lastRequest = request;
        auto* stream = new ScriptedStream;
        QTimer::singleShot(0, stream, [stream]() {
            stream->play({QStringLiteral("po"), QStringLiteral("ng")});
        });
        return stream;
    }

    BackendHttpRequest lastRequest;
};

QByteArray httpRequest(const QByteArray& method, const QByteArray& path, const QByteArray& body = {}) {
    QByteArray out = method + ' ' + path + " HTTP/1.1\r\nHost: localhost\r\n";
    if (!body.isEmpty()) {
        out += "Content-Type: application/json\r\n";
        out += "Content-Length: " + QByteArray::number(body.size()) + "\r\n";
    }
    out += "\r\n";
    out += body;
    return out;
}

QByteArray bodyOf(const QByteArray& response) {
    const int split = response.indexOf("\r\n\r\n");
    return split < 0 ? QByteArray() : response.mid(split + 4);
}

}

class TestProxyServer : public QObject {
    Q_OBJECT

private:
    BridgeConfig config() const {
        BridgeConfig c;
        c.backend.apiKey = QStringLiteral("sk-test");
        c.backend.baseUrl = QStringLiteral("https://backend.test/v1");
        c.models.bigModel = QStringLiteral("big-backend");
        c.models.middleModel = QStringLiteral("middle-backend");
        c.models.smallModel = QStringLiteral("small-backend");
        return c;
    }

    // A reply is complete once its Content-Length is satisfied, or for a
    // chunked reply once the terminating zero-length chunk arrived.
    static bool replyComplete(const QByteArray& reply) {
        const int split = reply.indexOf("\r\n\r\n");
        if (split < 0)
            return false;
        const QByteArray head = reply.left(split).toLower();
        if (head.contains("transfer-encoding: chunked"))
            return reply.endsWith("0\r\n\r\n");
        const int pos = head.indexOf("content-length:");
        if (pos < 0)
            return true;
        const int end = head.indexOf("\r\n", pos);
        const int length = head.mid(pos + 15, end < 0 ? -1 : end - pos - 15).trimmed().toInt();
        return reply.size() - split - 4 >= length;
    }

    static QByteArray roundTrip(quint16 port, const QByteArray& request) {
        QTcpSocket socket;
        socket.connectToHost(QHostAddress::LocalHost, port);
        if (!socket.waitForConnected(3000))
            return {};
        socket.write(request);

        QByteArray received;
        QElapsedTimer timer;
        timer.start();
        while (!replyComplete(received) && timer.elapsed() < 5000) {
            QTest::qWait(10);
            received += socket.readAll();
        }
        return received;
    }

    // Reads until the server drops the connection.
    static QByteArray readUntilClosed(quint16 port, const QByteArray& request) {
        QTcpSocket socket;
        socket.connectToHost(QHostAddress::LocalHost, port);
        if (!socket.waitForConnected(3000))
            return {};
        socket.write(request);

        QByteArray received;
        QElapsedTimer timer;
        timer.start();
        while (socket.state() == QAbstractSocket::ConnectedState && timer.elapsed() < 5000) {
            QTest::qWait(10);
            received += socket.readAll();
        }
        received += socket.readAll();
        if (socket.state() == QAbstractSocket::ConnectedState)
            return {};
        return received;
    }

private slots:
    void testHealth() {
        ScriptedClient client;
        ProxyServer server(config(), &client);
        QVERIFY(server.listen(QHostAddress::LocalHost, 0));
        QVERIFY(server.isRunning());

        const QByteArray reply = roundTrip(server.serverPort(), httpRequest("GET", "/health"));
        QVERIFY(reply.startsWith("HTTP/1.1 200 OK"));
        const QJsonObject json = QJsonDocument::fromJson(bodyOf(reply)).object();
        QCOMPARE(json.value(QStringLiteral("status")).toString(), QStringLiteral("healthy"));
        QCOMPARE(json.value(QStringLiteral("api_type")).toString(), QStringLiteral("openai"));
        QVERIFY(json.value(QStringLiteral("backend_configured")).toBool());
    }

    void testUnknownRoute() {
        ScriptedClient client;
        ProxyServer server(config(), &client);
        QVERIFY(server.listen(QHostAddress::LocalHost, 0));

        const QByteArray reply = roundTrip(server.serverPort(), httpRequest("GET", "/v1/models"));
        QVERIFY(reply.startsWith("HTTP/1.1 404 Not Found"));
        QCOMPARE(QJsonDocument::fromJson(bodyOf(reply)).object().value(QStringLiteral("error")).toObject()
                     .value(QStringLiteral("type")).toString(), QStringLiteral("not_found_error"));
    }

    void testInvalidBody() {
        ScriptedClient client;
        ProxyServer server(config(), &client);
        QVERIFY(server.listen(QHostAddress::LocalHost, 0));

        const QByteArray reply = roundTrip(server.serverPort(),
                                           httpRequest("POST", "/v1/messages", "{\"model\":1}"));
        QVERIFY(reply.startsWith("HTTP/1.1 400 Bad Request"));
        QCOMPARE(QJsonDocument::fromJson(bodyOf(reply)).object().value(QStringLiteral("error")).toObject()
                     .value(QStringLiteral("type")).toString(), QStringLiteral("invalid_request_error"));
    }

    void testNegativeContentLength() {
        ScriptedClient client;
        ProxyServer server(config(), &client);
        QVERIFY(server.listen(QHostAddress::LocalHost, 0));

        const QByteArray reply = readUntilClosed(server.serverPort(),
            "GET /health HTTP/1.1\r\nHost: localhost\r\nContent-Length: -1000\r\n\r\n");
        QVERIFY(reply.startsWith("HTTP/1.1 400 Bad Request"));
        QCOMPARE(reply.count("HTTP/1.1 "), 1);
        QCOMPARE(QJsonDocument::fromJson(bodyOf(reply)).object().value(QStringLiteral("error")).toObject()
                     .value(QStringLiteral("type")).toString(), QStringLiteral("invalid_request_error"));
    }

    void testNonNumericContentLength() {
        ScriptedClient client;
        ProxyServer server(config(), &client);
        QVERIFY(server.listen(QHostAddress::LocalHost, 0));

        const QByteArray reply = readUntilClosed(server.serverPort(),
            "POST /v1/messages HTTP/1.1\r\nHost: localhost\r\nContent-Length: lots\r\n\r\n{}");
        QVERIFY(reply.startsWith("HTTP/1.1 400 Bad Request"));
        QCOMPARE(reply.count("HTTP/1.1 "), 1);
    }

    void testOversizedBody() {
        ScriptedClient client;
        BridgeConfig c = config();
        c.server.maxRequestBytes = 1024;
        ProxyServer server(c, &client);
        QVERIFY(server.listen(QHostAddress::LocalHost, 0));

        const QByteArray reply = readUntilClosed(server.serverPort(),
            "POST /v1/messages HTTP/1.1\r\nHost: localhost\r\nContent-Length: 4096\r\n\r\n{");
        QVERIFY(reply.startsWith("HTTP/1.1 413"));
        QCOMPARE(QJsonDocument::fromJson(bodyOf(reply)).object().value(QStringLiteral("error")).toObject()
                     .value(QStringLiteral("type")).toString(), QStringLiteral("request_too_large"));
    }

    void testBodyWithinLimit() {
        ScriptedClient client;
        BridgeConfig c = config();
        c.server.maxRequestBytes = 1024;
        ProxyServer server(c, &client);
        QVERIFY(server.listen(QHostAddress::LocalHost, 0));

        const QByteArray body = R"({"model":"claude-3-opus","max_tokens":64,"messages":[{"role":"user","content":"ping"}]})";
        const QByteArray reply = roundTrip(server.serverPort(), httpRequest("POST", "/v1/messages", body));
        QVERIFY(reply.startsWith("HTTP/1.1 200 OK"));
    }

    void testMessages() {
        ScriptedClient client;
        ProxyServer server(config(), &client);
        QVERIFY(server.listen(QHostAddress::LocalHost, 0));

        const QByteArray body = R"({"model":"claude-3-opus","max_tokens":64,"messages":[{"role":"user","content":"ping"}]})";
        const QByteArray reply = roundTrip(server.serverPort(), httpRequest("POST", "/v1/messages", body));
        QVERIFY(reply.startsWith("HTTP/1.1 200 OK"));

        const QJsonObject json = QJsonDocument::fromJson(bodyOf(reply)).object();
        QCOMPARE(json.value(QStringLiteral("model")).toString(), QStringLiteral("claude-3-opus"));
        QCOMPARE(json.value(QStringLiteral("content")).toArray()[0].toObject()
                     .value(QStringLiteral("text")).toString(), QStringLiteral("pong"));
        QCOMPARE(QJsonDocument::fromJson(client.lastRequest.body).object()
                     .value(QStringLiteral("model")).toString(), QStringLiteral("big-backend"));
    }

    void testStreamingMessages() {
        ScriptedClient client;
        ProxyServer server(config(), &client);
        QVERIFY(server.listen(QHostAddress::LocalHost, 0));

        const QByteArray body = R"({"model":"claude-3-5-sonnet","stream":true,"messages":[{"role":"user","content":"ping"}]})";
        const QByteArray reply = roundTrip(server.serverPort(), httpRequest("POST", "/v1/messages", body));
        QVERIFY(reply.startsWith("HTTP/1.1 200 OK"));
        QVERIFY(reply.contains("Content-Type: text/event-stream"));
        QVERIFY(reply.contains("Transfer-Encoding: chunked"));
        QVERIFY(reply.contains("event: message_start"));
        QVERIFY(reply.contains("\"text\":\"po\""));
        QVERIFY(reply.contains("\"stop_reason\":\"end_turn\""));
        QVERIFY(reply.contains("event: message_stop"));
        QVERIFY(reply.endsWith("0\r\n\r\n"));
        QCOMPARE(reply.count("event: message_start"), 1);

        QTRY_COMPARE(server.activeStreamCount(), 0);
    }

    void testStop() {
        ScriptedClient client;
        ProxyServer server(config(), &client);
        QVERIFY(server.listen(QHostAddress::LocalHost, 0));
        server.stop();
        QVERIFY(!server.isRunning());
        QCOMPARE(server.serverPort(), quint16(0));
    }

    void testChunkFraming() {
        QCOMPARE(SseWriter::wrapChunked("hello"), QByteArray("5\r\nhello\r\n"));
        QCOMPARE(SseWriter::wrapChunked(QByteArray(26, 'x')).left(4), QByteArray("1a\r\n"));
    }
};

QTEST_MAIN(TestProxyServer)
#include "tst_proxy_server.moc"

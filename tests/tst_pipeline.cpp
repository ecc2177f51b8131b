#include <QTest>
#include <QFile>
#include <QJsonDocument>
#include <QPointer>
#include <QSignalSpy>
#include <QTemporaryDir>
#include "pipeline/pipeline.h"
#include "conversion/error_translator.h"
#include "core/usage_recorder.h"
#include "semantic/backend_stream.h"
#include "semantic/cancellation.h"

namespace {

class FakeStream : public BackendStream {
public:
    using BackendStream::BackendStream;

    void abort(CancelReason reason) override {
        aborted = true;
        emit failed(ErrorTranslator::fromCancellation(reason));
    }

    void push(const BackendStreamFragment& fragment) { emit fragmentReady(fragment); }
    void end() { emit finished(); }
    void fail(const ErrorEnvelope& failure) { emit failed(failure); }

    bool aborted = false;
};

class FakeClient : public IBackendClient {
public:
    Result<BackendHttpResponse> execute(const BackendHttpRequest& request,
                                        CancellationToken*) override {
        lastRequest = request;
        ++calls;
        if (failure)
            return std::unexpected(*failure);
        BackendHttpResponse resp;
        resp.statusCode = 200;
        resp.body = body;
        return resp;
    }

    Result<BackendStream*> openStream(const BackendHttpRequest& request,
                                      CancellationToken*) override {
        lastRequest = request;
        ++calls;
        if (failure)
            return std::unexpected(*failure);
        stream = new FakeStream;
        return stream.data();
    }

    BackendHttpRequest lastRequest;
    QByteArray body;
    std::optional<ErrorEnvelope> failure;
    QPointer<FakeStream> stream;
    int calls = 0;
};

BridgeConfig testConfig() {
    BridgeConfig config;
    config.backend.baseUrl = QStringLiteral("https://backend.test/v1");
    config.backend.apiKey = QStringLiteral("sk-test");
    config.models.smallModel = QStringLiteral("small-backend");
    config.models.middleModel = QStringLiteral("middle-backend");
    config.models.bigModel = QStringLiteral("big-backend");
    return config;
}

CanonicalRequest userRequest(const QString& model, const QString& text, bool stream = false) {
    CanonicalRequest req;
    req.requestId = QStringLiteral("req-1");
    req.model = model;
    req.stream = stream;
    req.messages.append(Message{Role::User, {TextBlock{text}}});
    return req;
}

BackendStreamFragment textFragment(const QString& text) {
    BackendStreamFragment f;
    f.id = QStringLiteral("chatcmpl-42");
    f.contentDelta = text;
    return f;
}

QStringList readLines(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
        return {};
    return QString::fromUtf8(file.readAll()).split(QLatin1Char('\n'), Qt::SkipEmptyParts);
}

}

class TestPipeline : public QObject {
    Q_OBJECT

private slots:
    void testNonStreamingRoundTrip() {
        FakeClient client;
        client.body = R"({"id":"chatcmpl-9","model":"small-backend","choices":[{"finish_reason":"stop",
            "message":{"role":"assistant","content":"Hello there"}}],
            "usage":{"prompt_tokens":8,"completion_tokens":2}})";

        Pipeline pipeline(testConfig(), &client);
        auto result = pipeline.process(userRequest(QStringLiteral("claude-3-haiku-20240307"), QStringLiteral("Hi")));
        QVERIFY(result.has_value());
        QCOMPARE(result->model, QStringLiteral("claude-3-haiku-20240307"));
        QCOMPARE(result->id, QStringLiteral("chatcmpl-9"));
        QCOMPARE(std::get<TextBlock>(result->content[0]).text, QStringLiteral("Hello there"));
        QCOMPARE(result->stopReason, StopReason::EndTurn);
        QCOMPARE(result->usage.inputTokens, 8);

        QCOMPARE(client.lastRequest.url, QStringLiteral("https://backend.test/v1/chat/completions"));
        const QJsonObject sent = QJsonDocument::fromJson(client.lastRequest.body).object();
        QCOMPARE(sent.value(QStringLiteral("model")).toString(), QStringLiteral("small-backend"));
        QVERIFY(!sent.contains(QStringLiteral("stream")));
    }

    void testValidationNeverReachesBackend() {
        FakeClient client;
        Pipeline pipeline(testConfig(), &client);
        CanonicalRequest req = userRequest(QStringLiteral("claude"), QStringLiteral("x"));
        req.messages.clear();
        auto result = pipeline.process(req);
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::Validation);
        QCOMPARE(client.calls, 0);
    }

    void testBackendFailurePropagates() {
        FakeClient client;
        client.failure = ErrorTranslator::fromHttpStatus(429, R"({"error":{"message":"Too many requests"}})");
        Pipeline pipeline(testConfig(), &client);
        auto result = pipeline.process(userRequest(QStringLiteral("claude-opus"), QStringLiteral("x")));
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().httpStatus(), 429);
        QCOMPARE(result.error().message, QStringLiteral("Too many requests"));
    }

    void testMalformedBackendBody() {
        FakeClient client;
        client.body = "not json";
        Pipeline pipeline(testConfig(), &client);
        auto result = pipeline.process(userRequest(QStringLiteral("claude-opus"), QStringLiteral("x")));
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::Decode);
    }

    void testStreamingSession() {
        FakeClient client;
        Pipeline pipeline(testConfig(), &client);
        auto session = pipeline.processStream(
            userRequest(QStringLiteral("claude-3-5-sonnet"), QStringLiteral("Hi"), true));
        QVERIFY(session.has_value());
        QVERIFY(client.stream);

        const QJsonObject sent = QJsonDocument::fromJson(client.lastRequest.body).object();
        QCOMPARE(sent.value(QStringLiteral("model")).toString(), QStringLiteral("middle-backend"));
        QVERIFY(sent.value(QStringLiteral("stream")).toBool());
        QVERIFY(client.lastRequest.stream);

        QStringList names;
        connect(*session, &PipelineStreamSession::eventReady, this,
                [&](const StreamEvent& ev) { names.append(ev.name()); });
        QSignalSpy finishedSpy(*session, &PipelineStreamSession::finished);

        client.stream->push(textFragment(QStringLiteral("Hel")));
        client.stream->push(textFragment(QStringLiteral("lo")));
        BackendStreamFragment stop;
        stop.finishReason = QStringLiteral("stop");
        client.stream->push(stop);
        BackendStreamFragment usage;
        usage.usage = BackendUsage{5, 2, 0};
        client.stream->push(usage);
        client.stream->end();

        QCOMPARE(names.first(), QStringLiteral("message_start"));
        QCOMPARE(names.last(), QStringLiteral("message_stop"));
        QCOMPARE(names.count(QStringLiteral("message_stop")), 1);
        QCOMPARE(finishedSpy.count(), 1);
        QVERIFY((*session)->isFinished());
        QCOMPARE((*session)->converter().usage().inputTokens, 5);
        delete *session;
    }

    void testStreamCancellation() {
        FakeClient client;
        Pipeline pipeline(testConfig(), &client);
        CancellationToken token;
        auto session = pipeline.processStream(
            userRequest(QStringLiteral("claude-3-5-sonnet"), QStringLiteral("Hi"), true), &token);
        QVERIFY(session.has_value());

        QList<StreamEvent> events;
        connect(*session, &PipelineStreamSession::eventReady, this,
                [&](const StreamEvent& ev) { events.append(ev); });

        client.stream->push(textFragment(QStringLiteral("partial")));
        token.cancel(CancelReason::ClientDisconnected);

        QVERIFY(client.stream->aborted);
        QVERIFY((*session)->isFinished());
        QCOMPARE(events.last().type, StreamEventType::MessageStop);
        for (const StreamEvent& ev : events)
            QVERIFY(ev.type != StreamEventType::Error);
        delete *session;
    }

    void testStreamUpstreamError() {
        FakeClient client;
        Pipeline pipeline(testConfig(), &client);
        auto session = pipeline.processStream(
            userRequest(QStringLiteral("claude"), QStringLiteral("Hi"), true));
        QVERIFY(session.has_value());

        QList<StreamEvent> events;
        connect(*session, &PipelineStreamSession::eventReady, this,
                [&](const StreamEvent& ev) { events.append(ev); });

        client.stream->push(textFragment(QStringLiteral("a")));
        client.stream->fail(ErrorEnvelope::upstream(QStringLiteral("connection reset")));
        client.stream->push(textFragment(QStringLiteral("ignored")));

        QCOMPARE(events.last().type, StreamEventType::Error);
        QCOMPARE(events.last().data.value(QStringLiteral("error")).toObject()
                     .value(QStringLiteral("message")).toString(), QStringLiteral("connection reset"));
        delete *session;
    }

    void testStreamOpenFailure() {
        FakeClient client;
        client.failure = ErrorTranslator::fromHttpStatus(401, R"({"error":{"message":"bad key"}})");
        Pipeline pipeline(testConfig(), &client);
        auto session = pipeline.processStream(
            userRequest(QStringLiteral("claude"), QStringLiteral("Hi"), true));
        QVERIFY(!session.has_value());
        QCOMPARE(session.error().claudeErrorType(), QStringLiteral("authentication_error"));
    }

    void testUsageRowsRecorded() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath(QStringLiteral("usage.tsv"));
        UsageRecorder recorder(path);

        FakeClient client;
        client.body = R"({"id":"c","choices":[{"finish_reason":"stop","message":{"content":"ok"}}],
            "usage":{"prompt_tokens":3,"completion_tokens":1}})";
        Pipeline pipeline(testConfig(), &client, &recorder);
        QVERIFY(pipeline.process(userRequest(QStringLiteral("claude-haiku"), QStringLiteral("x"))).has_value());

        client.failure = ErrorEnvelope::upstream(QStringLiteral("boom"), 500);
        QVERIFY(!pipeline.process(userRequest(QStringLiteral("claude-haiku"), QStringLiteral("x"))).has_value());

        const QStringList lines = readLines(path);
        QCOMPARE(lines.size(), 3);
        QCOMPARE(lines[0], UsageRecorder::columns().join(QLatin1Char('\t')));

        const QStringList ok = lines[1].split(QLatin1Char('\t'));
        QCOMPARE(ok.size(), 13);
        QCOMPARE(ok[1], QStringLiteral("req-1"));
        QCOMPARE(ok[2], QStringLiteral("false"));
        QCOMPARE(ok[3], QStringLiteral("small-backend"));
        QCOMPARE(ok[5], QStringLiteral("openai"));
        QCOMPARE(ok[9], QStringLiteral("4"));
        QCOMPARE(ok[11], QStringLiteral("success"));

        const QStringList failed = lines[2].split(QLatin1Char('\t'));
        QCOMPARE(failed[11], QStringLiteral("error"));
        QCOMPARE(failed[12], QStringLiteral("boom"));
    }
};

QTEST_MAIN(TestPipeline)
#include "tst_pipeline.moc"

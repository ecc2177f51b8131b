#include <QTest>
#include <QJsonArray>
#include <QJsonObject>
#include "conversion/request_converter.h"

class TestRequestConverter : public QObject {
    Q_OBJECT

private:
    static ConversionOptions options() {
        ConversionOptions opts;
        opts.defaultMaxTokens = 1024;
        opts.minTokensLimit = 100;
        opts.maxTokensLimit = 4096;
        opts.requestStreamUsage = true;
        return opts;
    }

    static Message userText(const QString& text) {
        Message msg;
        msg.role = Role::User;
        msg.content.append(TextBlock{text});
        return msg;
    }

    static CanonicalRequest request(const QList<Message>& messages) {
        CanonicalRequest req;
        req.requestId = QStringLiteral("req-test");
        req.model = QStringLiteral("claude-3-5-sonnet");
        req.messages = messages;
        return req;
    }

    static Message toolCallTurn(const QString& id) {
        Message assistant;
        assistant.role = Role::Assistant;
        QJsonObject input;
        input[QStringLiteral("city")] = QStringLiteral("Paris");
        assistant.content.append(ToolUseBlock{id, QStringLiteral("get_weather"), input});
        return assistant;
    }

private slots:
    void testPlainConversation() {
        RequestConverter conv(options());
        Message assistant;
        assistant.role = Role::Assistant;
        assistant.content.append(TextBlock{QStringLiteral("Hi there")});

        auto result = conv.convert(request({userText(QStringLiteral("Hello")), assistant,
                                            userText(QStringLiteral("How are you?"))}),
                                   QStringLiteral("gpt-4o"));
        QVERIFY(result.has_value());
        QCOMPARE(result->model, QStringLiteral("gpt-4o"));
        QCOMPARE(result->messages.size(), 3);
        QCOMPARE(result->messages[0].role, BackendRole::User);
        QCOMPARE(*result->messages[0].text, QStringLiteral("Hello"));
        QCOMPARE(result->messages[1].role, BackendRole::Assistant);
        QCOMPARE(*result->messages[1].text, QStringLiteral("Hi there"));
        QCOMPARE(result->messages[2].role, BackendRole::User);
        QVERIFY(!result->stream);
        QVERIFY(!result->includeUsage);
    }

    void testSystemBlocksJoined() {
        RequestConverter conv(options());
        CanonicalRequest req = request({userText(QStringLiteral("Hi"))});
        req.system = SystemPrompt(QList<TextBlock>{TextBlock{QStringLiteral("Be brief.")},
                                                   TextBlock{QStringLiteral("Be kind.")}});

        auto result = conv.convert(req, QStringLiteral("gpt-4o"));
        QVERIFY(result.has_value());
        QCOMPARE(result->messages.size(), 2);
        QCOMPARE(result->messages[0].role, BackendRole::System);
        QCOMPARE(*result->messages[0].text, QStringLiteral("Be brief.\n\nBe kind."));
    }

    void testEmptySystemSkipped() {
        RequestConverter conv(options());
        CanonicalRequest req = request({userText(QStringLiteral("Hi"))});
        req.system = SystemPrompt(QString());

        auto result = conv.convert(req, QStringLiteral("gpt-4o"));
        QVERIFY(result.has_value());
        QCOMPARE(result->messages.size(), 1);
        QCOMPARE(result->messages[0].role, BackendRole::User);
    }

    void testConsecutiveTextBlocksJoined() {
        RequestConverter conv(options());
        Message msg = userText(QStringLiteral("line one"));
        msg.content.append(TextBlock{QStringLiteral("line two")});

        auto result = conv.convert(request({msg}), QStringLiteral("gpt-4o"));
        QVERIFY(result.has_value());
        QCOMPARE(*result->messages[0].text, QStringLiteral("line one\nline two"));
        QVERIFY(result->messages[0].parts.isEmpty());
    }

    void testImageKeepsBase64Verbatim() {
        RequestConverter conv(options());
        Message msg = userText(QStringLiteral("What is this?"));
        ImageBlock image;
        image.sourceType = QStringLiteral("base64");
        image.mediaType = QStringLiteral("image/png");
        image.data = QStringLiteral("iVBORw0KGgoAAAANSUhEUg==");
        msg.content.append(image);

        auto result = conv.convert(request({msg}), QStringLiteral("gpt-4o"));
        QVERIFY(result.has_value());
        const BackendMessage& out = result->messages[0];
        QCOMPARE(out.parts.size(), 2);
        QCOMPARE(out.parts[0].kind, BackendContentPart::Kind::Text);
        QCOMPARE(out.parts[0].text, QStringLiteral("What is this?"));
        QCOMPARE(out.parts[1].kind, BackendContentPart::Kind::ImageUrl);
        QCOMPARE(out.parts[1].url, QStringLiteral("data:image/png;base64,iVBORw0KGgoAAAANSUhEUg=="));
    }

    void testUrlImagePassesThrough() {
        RequestConverter conv(options());
        Message msg;
        msg.role = Role::User;
        ImageBlock image;
        image.sourceType = QStringLiteral("url");
        image.url = QStringLiteral("https://example.com/cat.jpg");
        msg.content.append(image);

        auto result = conv.convert(request({msg}), QStringLiteral("gpt-4o"));
        QVERIFY(result.has_value());
        QCOMPARE(result->messages[0].parts.size(), 1);
        QCOMPARE(result->messages[0].parts[0].url, QStringLiteral("https://example.com/cat.jpg"));
    }

    void testToolRoundTripOrdering() {
        RequestConverter conv(options());
        Message results;
        results.role = Role::User;
        results.content.append(TextBlock{QStringLiteral("Here you go")});
        results.content.append(ToolResultBlock{QStringLiteral("call_1"), QJsonValue(QStringLiteral("18C")), false});

        auto result = conv.convert(request({userText(QStringLiteral("Weather?")),
                                            toolCallTurn(QStringLiteral("call_1")), results}),
                                   QStringLiteral("gpt-4o"));
        QVERIFY(result.has_value());
        QCOMPARE(result->messages.size(), 4);

        const BackendMessage& assistant = result->messages[1];
        QCOMPARE(assistant.role, BackendRole::Assistant);
        QVERIFY(!assistant.text.has_value());
        QCOMPARE(assistant.toolCalls.size(), 1);
        QCOMPARE(assistant.toolCalls[0].id, QStringLiteral("call_1"));
        QCOMPARE(assistant.toolCalls[0].name, QStringLiteral("get_weather"));
        QCOMPARE(assistant.toolCalls[0].arguments, QStringLiteral("{\"city\":\"Paris\"}"));

        // Tool response comes straight after the call, before the remaining user text
        QCOMPARE(result->messages[2].role, BackendRole::Tool);
        QCOMPARE(result->messages[2].toolCallId, QStringLiteral("call_1"));
        QCOMPARE(*result->messages[2].text, QStringLiteral("18C"));
        QCOMPARE(result->messages[3].role, BackendRole::User);
        QCOMPARE(*result->messages[3].text, QStringLiteral("Here you go"));
    }

    void testToolResultBlockListContent() {
        RequestConverter conv(options());
        QJsonArray blocks;
        QJsonObject t1;
        t1[QStringLiteral("type")] = QStringLiteral("text");
        t1[QStringLiteral("text")] = QStringLiteral("first");
        QJsonObject img;
        img[QStringLiteral("type")] = QStringLiteral("image");
        QJsonObject t2;
        t2[QStringLiteral("type")] = QStringLiteral("text");
        t2[QStringLiteral("text")] = QStringLiteral("second");
        blocks.append(t1);
        blocks.append(img);
        blocks.append(t2);

        Message results;
        results.role = Role::User;
        results.content.append(ToolResultBlock{QStringLiteral("call_1"), blocks, false});

        auto result = conv.convert(request({userText(QStringLiteral("go")),
                                            toolCallTurn(QStringLiteral("call_1")), results}),
                                   QStringLiteral("gpt-4o"));
        QVERIFY(result.has_value());
        QCOMPARE(result->messages.size(), 3);
        QCOMPARE(*result->messages[2].text, QStringLiteral("first\nsecond"));
    }

    void testToolResultObjectSerialized() {
        QJsonObject obj;
        obj[QStringLiteral("temp")] = 18;
        ToolResultBlock block{QStringLiteral("call_1"), obj, false};
        QCOMPARE(RequestConverter::toolResultText(block), QStringLiteral("{\"temp\":18}"));
    }

    void testDanglingToolResultFails() {
        RequestConverter conv(options());
        Message results;
        results.role = Role::User;
        results.content.append(ToolResultBlock{QStringLiteral("call_missing"), QJsonValue(QStringLiteral("x")), false});

        auto result = conv.convert(request({results}), QStringLiteral("gpt-4o"));
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::Validation);
        QVERIFY(result.error().message.contains(QStringLiteral("call_missing")));
    }

    void testToolUseInUserMessageFails() {
        RequestConverter conv(options());
        Message msg = userText(QStringLiteral("hi"));
        msg.content.append(ToolUseBlock{QStringLiteral("call_1"), QStringLiteral("f"), QJsonObject()});

        auto result = conv.convert(request({msg}), QStringLiteral("gpt-4o"));
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::Validation);
    }

    void testToolDefinitionsAndDefaultChoice() {
        RequestConverter conv(options());
        CanonicalRequest req = request({userText(QStringLiteral("hi"))});
        QJsonObject schema;
        schema[QStringLiteral("type")] = QStringLiteral("object");
        req.tools.append(ToolDefinition{QStringLiteral("get_weather"), QStringLiteral("Weather lookup"), schema});

        auto result = conv.convert(req, QStringLiteral("gpt-4o"));
        QVERIFY(result.has_value());
        QCOMPARE(result->tools.size(), 1);
        QCOMPARE(result->tools[0].name, QStringLiteral("get_weather"));
        QCOMPARE(result->tools[0].description, QStringLiteral("Weather lookup"));
        QCOMPARE(result->tools[0].parameters, schema);
        QVERIFY(result->toolChoice.has_value());
        QCOMPARE(result->toolChoice->toString(), QStringLiteral("auto"));
    }

    void testToolChoiceMapping() {
        CanonicalRequest req = request({userText(QStringLiteral("hi"))});
        req.tools.append(ToolDefinition{QStringLiteral("get_weather"), QString(), QJsonObject()});

        req.toolChoice = ToolChoice{ToolChoiceMode::Any, QString()};
        QCOMPARE(RequestConverter::toolChoiceValue(req)->toString(), QStringLiteral("required"));

        req.toolChoice = ToolChoice{ToolChoiceMode::None, QString()};
        QCOMPARE(RequestConverter::toolChoiceValue(req)->toString(), QStringLiteral("none"));

        req.toolChoice = ToolChoice{ToolChoiceMode::Tool, QStringLiteral("get_weather")};
        const QJsonObject named = RequestConverter::toolChoiceValue(req)->toObject();
        QCOMPARE(named.value(QStringLiteral("type")).toString(), QStringLiteral("function"));
        QCOMPARE(named.value(QStringLiteral("function")).toObject().value(QStringLiteral("name")).toString(),
                 QStringLiteral("get_weather"));
    }

    void testNoToolsNoChoice() {
        CanonicalRequest req = request({userText(QStringLiteral("hi"))});
        req.toolChoice = ToolChoice{ToolChoiceMode::Any, QString()};
        QVERIFY(!RequestConverter::toolChoiceValue(req).has_value());
    }

    void testMaxTokensDefaultAndClamp() {
        RequestConverter conv(options());
        QCOMPARE(conv.resolveMaxTokens(std::nullopt), 1024);
        QCOMPARE(conv.resolveMaxTokens(10), 100);
        QCOMPARE(conv.resolveMaxTokens(100000), 4096);
        QCOMPARE(conv.resolveMaxTokens(2000), 2000);
    }

    void testParamsAndStreaming() {
        RequestConverter conv(options());
        CanonicalRequest req = request({userText(QStringLiteral("hi"))});
        req.params.temperature = 0.5;
        req.params.topP = 0.9;
        req.params.topK = 40;
        req.params.stopSequences = {QStringLiteral("END")};
        req.stream = true;

        auto result = conv.convert(req, QStringLiteral("gpt-4o"));
        QVERIFY(result.has_value());
        QCOMPARE(*result->temperature, 0.5);
        QCOMPARE(*result->topP, 0.9);
        QCOMPARE(result->stop, QStringList{QStringLiteral("END")});
        QVERIFY(result->stream);
        QVERIFY(result->includeUsage);
    }

    void testStreamUsageCanBeDisabled() {
        ConversionOptions opts = options();
        opts.requestStreamUsage = false;
        RequestConverter conv(opts);
        CanonicalRequest req = request({userText(QStringLiteral("hi"))});
        req.stream = true;

        auto result = conv.convert(req, QStringLiteral("gpt-4o"));
        QVERIFY(result.has_value());
        QVERIFY(result->stream);
        QVERIFY(!result->includeUsage);
    }
};

QTEST_MAIN(TestRequestConverter)
#include "tst_request_converter.moc"

#include <QTest>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include "backend/openai_backend.h"
#include "backend/openai_stream.h"

class TestOpenAIBackend : public QObject {
    Q_OBJECT

private:
    static BackendOptions options() {
        BackendOptions opts;
        opts.baseUrl = QStringLiteral("https://llm.example.com/");
        opts.middleRoute = QStringLiteral("/v1");
        opts.apiKey = QStringLiteral("sk-test");
        opts.modelId = QStringLiteral("gpt-test");
        return opts;
    }

private slots:
    void testBuildRequest() {
        OpenAIBackend backend(options(), QStringLiteral("You animate."));
        const ChatRequest req = backend.buildRequest({ChatMessage::user(QStringLiteral("Draw a square"))});

        QCOMPARE(req.url, QStringLiteral("https://llm.example.com/v1/chat/completions"));
        QCOMPARE(req.headers.value(QStringLiteral("Authorization")), QStringLiteral("Bearer sk-test"));
        QCOMPARE(req.headers.value(QStringLiteral("Accept")), QStringLiteral("text/event-stream"));

        const QJsonObject body = QJsonDocument::fromJson(req.body).object();
        QCOMPARE(body.value(QStringLiteral("model")).toString(), QStringLiteral("gpt-test"));
        QCOMPARE(body.value(QStringLiteral("stream")).toBool(), true);
        QVERIFY(!body.contains(QStringLiteral("reasoning_effort")));

        const QJsonArray messages = body.value(QStringLiteral("messages")).toArray();
        QCOMPARE(messages.size(), 2);
        QCOMPARE(messages[0].toObject().value(QStringLiteral("role")).toString(), QStringLiteral("system"));
        QCOMPARE(messages[1].toObject().value(QStringLiteral("content")).toString(), QStringLiteral("Draw a square"));
    }

    void testMiddleRouteNotAppendedTwice() {
        BackendOptions opts = options();
        opts.baseUrl = QStringLiteral("https://llm.example.com/v1");
        opts.apiKey.clear();
        opts.reasoningEffort = QStringLiteral("high");

        OpenAIBackend backend(opts, QString());
        const ChatRequest req = backend.buildRequest({});
        QCOMPARE(req.url, QStringLiteral("https://llm.example.com/v1/chat/completions"));
        QVERIFY(!req.headers.contains(QStringLiteral("Authorization")));

        const QJsonObject body = QJsonDocument::fromJson(req.body).object();
        QCOMPARE(body.value(QStringLiteral("reasoning_effort")).toString(), QStringLiteral("high"));
        QVERIFY(body.value(QStringLiteral("messages")).toArray().isEmpty());
    }

    void testBuildMessagesWithToolTurn() {
        ChatMessage assistant;
        assistant.role = QStringLiteral("assistant");
        assistant.toolCalls.append(ToolCall{QStringLiteral("call_1"), QStringLiteral("execute_code"),
                                            QStringLiteral("{\"code\":\"x\"}")});

        const QJsonArray messages = OpenAIBackend::buildMessages(
            QStringLiteral("sys"),
            {ChatMessage::user(QStringLiteral("hi")), assistant,
             ChatMessage::tool(QStringLiteral("call_1"), QStringLiteral("Video URL: u"))});

        QCOMPARE(messages.size(), 4);

        const QJsonObject call = messages[2].toObject();
        QVERIFY(call.value(QStringLiteral("content")).isNull());
        const QJsonObject tc = call.value(QStringLiteral("tool_calls")).toArray().first().toObject();
        QCOMPARE(tc.value(QStringLiteral("id")).toString(), QStringLiteral("call_1"));
        QCOMPARE(tc.value(QStringLiteral("type")).toString(), QStringLiteral("function"));
        QCOMPARE(tc.value(QStringLiteral("function")).toObject().value(QStringLiteral("arguments")).toString(),
                 QStringLiteral("{\"code\":\"x\"}"));

        const QJsonObject tool = messages[3].toObject();
        QCOMPARE(tool.value(QStringLiteral("role")).toString(), QStringLiteral("tool"));
        QCOMPARE(tool.value(QStringLiteral("tool_call_id")).toString(), QStringLiteral("call_1"));
    }

    void testToolDefinition() {
        const QJsonArray tools = OpenAIBackend::buildToolDefs();
        QCOMPARE(tools.size(), 1);

        const QJsonObject fn = tools[0].toObject().value(QStringLiteral("function")).toObject();
        QCOMPARE(fn.value(QStringLiteral("name")).toString(), QStringLiteral("execute_code"));
        const QJsonObject params = fn.value(QStringLiteral("parameters")).toObject();
        QCOMPARE(params.value(QStringLiteral("required")).toArray(), QJsonArray{QStringLiteral("code")});
        QCOMPARE(params.value(QStringLiteral("additionalProperties")).toBool(true), false);
    }

    void testParseTextChunk() {
        auto chunk = OpenAIBackend::parseChunk(R"({"choices":[{"index":0,"delta":{"content":"Hel"}}]})");
        QVERIFY(chunk.has_value());
        QCOMPARE(chunk->text, QStringLiteral("Hel"));
        QVERIFY(chunk->fragments.isEmpty());
    }

    void testParseToolCallChunks() {
        auto first = OpenAIBackend::parseChunk(
            R"({"choices":[{"delta":{"tool_calls":[{"index":0,"id":"call_9","type":"function","function":{"name":"execute_code","arguments":""}}]}}]})");
        QVERIFY(first.has_value());
        QCOMPARE(first->fragments.size(), 1);
        QCOMPARE(first->fragments[0].callId, QStringLiteral("call_9"));
        QCOMPARE(first->fragments[0].name, QStringLiteral("execute_code"));

        auto next = OpenAIBackend::parseChunk(
            R"({"choices":[{"delta":{"tool_calls":[{"index":1,"function":{"arguments":"{\"co"}}]}}]})");
        QVERIFY(next.has_value());
        QCOMPARE(next->fragments[0].index, 1);
        QVERIFY(next->fragments[0].callId.isEmpty());
        QCOMPARE(next->fragments[0].argsFragment, QStringLiteral("{\"co"));
    }

    void testParseChunkFailures() {
        auto broken = OpenAIBackend::parseChunk("{not json");
        QVERIFY(!broken.has_value());
        QCOMPARE(broken.error().kind, ErrorKind::Internal);

        auto streamError = OpenAIBackend::parseChunk(R"({"error":{"message":"overloaded"}})");
        QVERIFY(!streamError.has_value());
        QCOMPARE(streamError.error().code, QStringLiteral("openai.stream_error"));
        QCOMPARE(streamError.error().message, QStringLiteral("overloaded"));

        auto usageOnly = OpenAIBackend::parseChunk(R"({"choices":[],"usage":{"total_tokens":3}})");
        QVERIFY(usageOnly.has_value());
        QVERIFY(usageOnly->text.isEmpty());
    }

    void testMapFailure() {
        DomainFailure auth = OpenAIBackend::mapFailure(401, R"({"error":{"message":"bad key"}})");
        QCOMPARE(auth.kind, ErrorKind::Unauthorized);
        QCOMPARE(auth.message, QStringLiteral("bad key"));
        QVERIFY(!auth.retryable);

        DomainFailure limited = OpenAIBackend::mapFailure(429, "not json");
        QCOMPARE(limited.kind, ErrorKind::RateLimited);
        QCOMPARE(limited.message, QStringLiteral("OpenAI API error (HTTP 429)"));
        QVERIFY(limited.retryable);
    }

    void testStreamEmitsChunksUntilDone() {
        OpenAIStream stream(nullptr);
        QStringList texts;
        int finishedCount = 0;
        int errorCount = 0;
        connect(&stream, &BackendStream::chunkReady, this,
                [&](const BackendChunk& chunk) { texts << chunk.text; });
        connect(&stream, &BackendStream::finished, this, [&]() { ++finishedCount; });
        connect(&stream, &BackendStream::error, this, [&](const DomainFailure&) { ++errorCount; });

        stream.feed(": keep-alive\n\n");
        stream.feed("data: {\"choices\":[{\"delta\":{\"content\":\"A\"}}]}\n");
        stream.feed("\ndata: {\"choices\":[{\"delta\":{\"con");
        stream.feed("tent\":\"B\"}}]}\r\n\r\n");
        stream.feed("data: {\"choices\":[{\"delta\":{}}]}\n\n");
        stream.feed("data: [DONE]\n\n");
        stream.feed("data: {\"choices\":[{\"delta\":{\"content\":\"late\"}}]}\n\n");

        QCOMPARE(texts, (QStringList{QStringLiteral("A"), QStringLiteral("B")}));
        QCOMPARE(finishedCount, 1);
        QCOMPARE(errorCount, 0);
    }

    void testStreamFailsOnBadChunk() {
        OpenAIStream stream(nullptr);
        int chunks = 0;
        QList<DomainFailure> errors;
        connect(&stream, &BackendStream::chunkReady, this, [&](const BackendChunk&) { ++chunks; });
        connect(&stream, &BackendStream::error, this,
                [&](const DomainFailure& failure) { errors.append(failure); });

        stream.feed("data: {\"error\":{\"message\":\"quota\"}}\n\n");
        stream.feed("data: {\"choices\":[{\"delta\":{\"content\":\"x\"}}]}\n\n");

        QCOMPARE(errors.size(), 1);
        QCOMPARE(errors[0].message, QStringLiteral("quota"));
        QCOMPARE(chunks, 0);
    }

    void testAbortSilencesStream() {
        OpenAIStream stream(nullptr);
        int events = 0;
        connect(&stream, &BackendStream::chunkReady, this, [&](const BackendChunk&) { ++events; });
        connect(&stream, &BackendStream::finished, this, [&]() { ++events; });

        stream.abort();
        stream.feed("data: {\"choices\":[{\"delta\":{\"content\":\"x\"}}]}\n\ndata: [DONE]\n\n");
        QCOMPARE(events, 0);
    }
};

QTEST_MAIN(TestOpenAIBackend)
#include "tst_openai_backend.moc"

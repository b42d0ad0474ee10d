#include <QTest>
#include <QJsonDocument>
#include <QJsonObject>
#include "decoder/args_decoder.h"
#include "decoder/tool_call_accumulator.h"

class TestArgsDecoder : public QObject {
    Q_OBJECT

private:
    static QString encodeCode(const QString& code) {
        QJsonObject obj;
        obj[QStringLiteral("code")] = code;
        return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact));
    }

private slots:
    void testEmptyBufferYieldsNothing() {
        QVERIFY(!ArgsDecoder::decodeField(QString()).has_value());
    }

    void testStrictDecodeIsComplete() {
        auto decoded = ArgsDecoder::decodeField(QStringLiteral("{\"code\": \"x = 1\"}"));
        QVERIFY(decoded.has_value());
        QCOMPARE(decoded->value, QStringLiteral("x = 1"));
        QVERIFY(decoded->complete);
    }

    void testStrictDecodeRejectsNonStringField() {
        QVERIFY(!ArgsDecoder::strictField(QStringLiteral("{\"code\": 42}"), QStringLiteral("code")).has_value());
        QVERIFY(!ArgsDecoder::strictField(QStringLiteral("[\"code\"]"), QStringLiteral("code")).has_value());
    }

    void testTolerantDecodeOfTruncatedValue() {
        auto decoded = ArgsDecoder::decodeField(QStringLiteral("{\"code\": \"from manim import *\\nclass A"));
        QVERIFY(decoded.has_value());
        QCOMPARE(decoded->value, QStringLiteral("from manim import *\nclass A"));
        QVERIFY(!decoded->complete);
    }

    void testTolerantDecodeBeforeValueStarts() {
        QVERIFY(!ArgsDecoder::decodeField(QStringLiteral("{\"co")).has_value());
        QVERIFY(!ArgsDecoder::decodeField(QStringLiteral("{\"code\": ")).has_value());
    }

    void testEscapesAreReversed() {
        auto decoded = ArgsDecoder::decodeField(
            QStringLiteral("{\"code\": \"a\\tb\\r\\n\\\"q\\\" \\\\ \\/ \\u00e9"));
        QVERIFY(decoded.has_value());
        QCOMPARE(decoded->value, QStringLiteral("a\tb\r\n\"q\" \\ / ") + QChar(0x00e9));
    }

    void testTruncatedEscapeIsHeldBack() {
        auto lone = ArgsDecoder::decodeField(QStringLiteral("{\"code\": \"abc\\"));
        QVERIFY(lone.has_value());
        QCOMPARE(lone->value, QStringLiteral("abc"));

        auto unicode = ArgsDecoder::decodeField(QStringLiteral("{\"code\": \"abc\\u00"));
        QVERIFY(unicode.has_value());
        QCOMPARE(unicode->value, QStringLiteral("abc"));
    }

    void testSurrogatePair() {
        auto decoded = ArgsDecoder::decodeField(QStringLiteral("{\"code\": \"\\ud83d\\ude00\"}"));
        QVERIFY(decoded.has_value());
        QCOMPARE(decoded->value, QString::fromUtf8("\xF0\x9F\x98\x80"));
    }

    void testRoundTripOfSpecialCharacters() {
        const QString code = QStringLiteral("class Demo(Scene):\n    def construct(self):\n"
                                            "        t = Text(\"say \\\"hi\\\"\")\n"
                                            "        path = 'C:\\\\tmp'\n\tself.play(Write(t))\n");
        auto decoded = ArgsDecoder::decodeField(encodeCode(code));
        QVERIFY(decoded.has_value());
        QVERIFY(decoded->complete);
        QCOMPARE(decoded->value, code);
    }

    void testFieldNameWithWhitespace() {
        auto decoded = ArgsDecoder::decodeField(QStringLiteral("{ \"code\"  :\n \"y = 2"));
        QVERIFY(decoded.has_value());
        QCOMPARE(decoded->value, QStringLiteral("y = 2"));
    }

    void testEveryPartitionConvergesOnTheSameValue() {
        const QString code = QStringLiteral("x = \"a\\b\"\nprint(x)\t# done \u00e9");
        const QString encoded = encodeCode(code);

        // All two-cut partitions of the encoded payload
        for (int i = 1; i < encoded.size(); ++i) {
            for (int j = i; j < encoded.size(); ++j) {
                ToolCallAccumulator acc;
                acc.accept(QStringLiteral("c"), encoded.left(i));
                acc.accept(QStringLiteral("c"), encoded.mid(i, j - i));
                acc.accept(QStringLiteral("c"), encoded.mid(j));
                auto last = acc.lastValue(QStringLiteral("c"));
                QVERIFY2(last.has_value(), qPrintable(QStringLiteral("split %1/%2").arg(i).arg(j)));
                QCOMPARE(*last, code);
            }
        }
    }

    void testSingleCharacterFragmentsNeverShrink() {
        const QString code = QStringLiteral("a\\nb\u00e9\"c\"");
        const QString encoded = encodeCode(code);

        ToolCallAccumulator acc;
        QString previous;
        for (const QChar ch : encoded) {
            auto emitted = acc.accept(QStringLiteral("c"), QString(ch));
            if (emitted) {
                QVERIFY(emitted->startsWith(previous));
                previous = *emitted;
            }
        }
        QCOMPARE(previous, code);
    }

    void testSplitFragmentsWithIdentityOnFirst() {
        ToolCallAccumulator acc;

        ToolCallFragment first;
        first.callId = QStringLiteral("call_1");
        first.name = QStringLiteral("execute_code");
        first.index = 0;
        first.argsFragment = QStringLiteral("{\"co");

        auto id = acc.resolve(first);
        QCOMPARE(id.callId, QStringLiteral("call_1"));
        QVERIFY(!acc.accept(id.callId, first.argsFragment).has_value());

        ToolCallFragment second;
        second.index = 0;
        second.argsFragment = QStringLiteral("de\": \"x = 1\\n");
        id = acc.resolve(second);
        QCOMPARE(id.callId, QStringLiteral("call_1"));
        QCOMPARE(id.name, QStringLiteral("execute_code"));
        acc.accept(id.callId, second.argsFragment);

        ToolCallFragment third;
        third.index = 0;
        third.argsFragment = QStringLiteral("print(x)\"}");
        id = acc.resolve(third);
        auto emitted = acc.accept(id.callId, third.argsFragment);
        QVERIFY(emitted.has_value());
        QCOMPARE(*emitted, QStringLiteral("x = 1\nprint(x)"));
        QCOMPARE(*acc.lastValue(QStringLiteral("call_1")), QStringLiteral("x = 1\nprint(x)"));
    }
};

QTEST_MAIN(TestArgsDecoder)
#include "tst_args_decoder.moc"

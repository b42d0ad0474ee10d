#include <QTest>
#include <QJsonDocument>
#include <QJsonObject>
#include <QThread>
#include <memory>
#include "relay/event_channel.h"
#include "relay/sse_writer.h"

class TestEventRelay : public QObject {
    Q_OBJECT

private slots:
    void testDeliversInPublishOrder() {
        EventChannel channel;
        QStringList seen;
        connect(&channel, &EventChannel::eventPublished, this,
                [&](const QString& event, const QJsonObject&) { seen << event; });

        QVERIFY(channel.publish(RelayEvent::TextDelta, {{"content", "a"}}));
        QVERIFY(channel.publish(RelayEvent::Code, {{"code", "x"}}));
        QVERIFY(channel.publish(RelayEvent::TextDelta, {{"content", "b"}}));

        QCOMPARE(seen, (QStringList{QStringLiteral("text-delta"), QStringLiteral("code"),
                                    QStringLiteral("text-delta")}));
        QCOMPARE(channel.publishedCount(), 3);
        QVERIFY(!channel.isClosed());
    }

    void testDoneClosesChannel() {
        EventChannel channel;
        int closedCount = 0;
        QStringList seen;
        connect(&channel, &EventChannel::closed, this, [&]() { ++closedCount; });
        connect(&channel, &EventChannel::eventPublished, this,
                [&](const QString& event, const QJsonObject&) { seen << event; });

        QVERIFY(channel.publish(RelayEvent::Done, {{"type", "done"}}));
        QVERIFY(channel.isClosed());
        QCOMPARE(closedCount, 1);

        QVERIFY(!channel.publish(RelayEvent::TextDelta, {{"content", "late"}}));
        QVERIFY(!channel.publish(RelayEvent::Error, {{"error", "late"}}));
        QCOMPARE(seen, QStringList{QStringLiteral("done")});
        QCOMPARE(closedCount, 1);
    }

    void testErrorIsTerminal() {
        EventChannel channel;
        QVERIFY(channel.publish(RelayEvent::Error, {{"error", "boom"}}));
        QVERIFY(channel.isClosed());
        QVERIFY(EventChannel::isTerminal(QStringLiteral("error")));
        QVERIFY(EventChannel::isTerminal(QStringLiteral("done")));
        QVERIFY(!EventChannel::isTerminal(QStringLiteral("notification")));
    }

    void testDetachDropsWithoutClosedSignal() {
        EventChannel channel;
        int closedCount = 0;
        QStringList seen;
        connect(&channel, &EventChannel::closed, this, [&]() { ++closedCount; });
        connect(&channel, &EventChannel::eventPublished, this,
                [&](const QString& event, const QJsonObject&) { seen << event; });

        QVERIFY(channel.publish(RelayEvent::TextDelta, {{"content", "a"}}));
        channel.detach();
        QVERIFY(channel.isDetached());
        QVERIFY(channel.isClosed());

        QVERIFY(!channel.publishNotification(QStringLiteral("Scene execution failed"), NotificationStatus::Failed));
        QVERIFY(!channel.publish(RelayEvent::Done, {{"type", "done"}}));
        QCOMPARE(seen, QStringList{QStringLiteral("text-delta")});
        QCOMPARE(closedCount, 0);
        QCOMPARE(channel.publishedCount(), 1);
    }

    void testPublishFromWorkerThreadKeepsOrder() {
        EventChannel channel;
        QStringList seen;
        QList<Qt::HANDLE> deliveredOn;
        connect(&channel, &EventChannel::eventPublished, this,
                [&](const QString&, const QJsonObject& payload) {
            seen << payload.value(QStringLiteral("content")).toString();
            deliveredOn << QThread::currentThreadId();
        });

        std::unique_ptr<QThread> worker(QThread::create([&channel]() {
            for (int i = 0; i < 50; ++i)
                channel.publish(RelayEvent::TextDelta, {{"content", QString::number(i)}});
        }));
        worker->start();
        QVERIFY(worker->wait(5000));

        QTRY_COMPARE(seen.size(), 50);
        for (int i = 0; i < 50; ++i)
            QCOMPARE(seen[i], QString::number(i));
        for (Qt::HANDLE id : deliveredOn)
            QCOMPARE(id, QThread::currentThreadId());
    }

    void testNotificationPayload() {
        EventChannel channel;
        QJsonObject payload;
        connect(&channel, &EventChannel::eventPublished, this,
                [&](const QString&, const QJsonObject& p) { payload = p; });

        QVERIFY(channel.publishNotification(QStringLiteral("Rendering"), NotificationStatus::Running));
        QCOMPARE(payload.value(QStringLiteral("content")).toString(), QStringLiteral("Rendering"));
        QCOMPARE(payload.value(QStringLiteral("status")).toString(), QStringLiteral("running"));
        QVERIFY(!payload.value(QStringLiteral("id")).toString().isEmpty());
    }

    void testFormatEvent() {
        QJsonObject payload;
        payload[QStringLiteral("type")] = QStringLiteral("done");
        payload[QStringLiteral("message")] = QStringLiteral("Stream completed");

        QCOMPARE(SseWriter::formatEvent(QStringLiteral("done"), payload),
                 QByteArray("event: done\ndata: {\"message\":\"Stream completed\",\"type\":\"done\"}\n\n"));
    }

    void testFormatEventEscapesNewlines() {
        QJsonObject payload;
        payload[QStringLiteral("code")] = QStringLiteral("a\nb");
        const QByteArray frame = SseWriter::formatEvent(QStringLiteral("code"), payload);
        QCOMPARE(frame.count('\n'), 3);
        QVERIFY(frame.contains("a\\nb"));
    }

    void testWrapChunked() {
        QCOMPARE(SseWriter::wrapChunked("hello"), QByteArray("5\r\nhello\r\n"));
        QCOMPARE(SseWriter::wrapChunked(QByteArray(26, 'x')).left(4), QByteArray("1a\r\n"));
    }
};

QTEST_MAIN(TestEventRelay)
#include "tst_event_relay.moc"

#include <QTest>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include "server/artifact_lookup.h"

class TestArtifactLookup : public QObject {
    Q_OBJECT

private:
    QTemporaryDir m_root;

    QString workRoot() const { return QDir(m_root.path()).filePath(QStringLiteral("executions")); }

    static void touch(const QString& path) {
        QDir().mkpath(QFileInfo(path).absolutePath());
        QFile f(path);
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write("video");
    }

    ArtifactLookup lookup() const {
        return ArtifactLookup(workRoot(), QStringLiteral("media/videos"), QStringLiteral(".mp4"));
    }

private slots:
    void initTestCase() {
        QVERIFY(m_root.isValid());
        touch(QDir(workRoot()).filePath(QStringLiteral("run_1/media/videos/scene/480p15/Demo.mp4")));
        touch(QDir(m_root.path()).filePath(QStringLiteral("secret.mp4")));
        touch(QDir(m_root.path()).filePath(QStringLiteral("outside/Leak.mp4")));
        QDir().mkpath(QDir(workRoot()).filePath(QStringLiteral("run_2/media/videos")));
        QVERIFY(QFile::link(QDir(m_root.path()).filePath(QStringLiteral("outside/Leak.mp4")),
                            QDir(workRoot()).filePath(QStringLiteral("run_2/media/videos/Leak.mp4"))));
    }

    void testResolvesNestedArtifact() {
        auto path = lookup().resolve(QStringLiteral("run_1/Demo.mp4"));
        QVERIFY(path.has_value());
        QVERIFY(path->endsWith(QStringLiteral("/scene/480p15/Demo.mp4")));
    }

    void testTraversalRejectedBeforeFilesystem() {
        auto result = lookup().resolve(QStringLiteral("run_1/../secret.mp4"));
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().httpStatus(), 400);

        auto encoded = lookup().resolve(QStringLiteral("run_1/%2e%2e%2fsecret.mp4"));
        QVERIFY(!encoded.has_value());
        QCOMPARE(encoded.error().httpStatus(), 400);

        // Validation fails identically when the work root does not even exist
        ArtifactLookup nowhere(QStringLiteral("/nonexistent/scenecast"), QStringLiteral("media/videos"),
                               QStringLiteral(".mp4"));
        auto rejected = nowhere.resolve(QStringLiteral("../etc/passwd.mp4"));
        QVERIFY(!rejected.has_value());
        QCOMPARE(rejected.error().httpStatus(), 400);
    }

    void testInvalidParameters_data() {
        QTest::addColumn<QString>("path");
        QTest::newRow("wrong extension") << QStringLiteral("run_1/Demo.mov");
        QTest::newRow("bad id char") << QStringLiteral("run.1/Demo.mp4");
        QTest::newRow("bad name char") << QStringLiteral("run_1/De mo.mp4");
        QTest::newRow("missing file") << QStringLiteral("run_1");
        QTest::newRow("extra segment") << QStringLiteral("run_1/scene/Demo.mp4");
        QTest::newRow("empty id") << QStringLiteral("/Demo.mp4");
        QTest::newRow("bare extension") << QStringLiteral("run_1/.mp4");
    }

    void testInvalidParameters() {
        QFETCH(QString, path);
        auto result = lookup().resolve(path);
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().httpStatus(), 400);
    }

    void testUnknownExecutionIsNotFound() {
        auto result = lookup().resolve(QStringLiteral("run_9/Demo.mp4"));
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().httpStatus(), 404);
    }

    void testUnknownFileIsNotFound() {
        auto result = lookup().resolve(QStringLiteral("run_1/Other.mp4"));
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().httpStatus(), 404);
    }

    void testSymlinkEscapeIsForbidden() {
        auto result = lookup().resolve(QStringLiteral("run_2/Leak.mp4"));
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().httpStatus(), 403);
    }
};

QTEST_MAIN(TestArtifactLookup)
#include "tst_artifact_lookup.moc"

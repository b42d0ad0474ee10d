#include <QTest>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include "sandbox/entry_symbol.h"
#include "sandbox/working_area.h"

class TestWorkingArea : public QObject {
    Q_OBJECT

private:
    static void touch(const QString& path) {
        QDir().mkpath(QFileInfo(path).absolutePath());
        QFile f(path);
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write("x");
    }

private slots:
    void testEntrySymbolFirstClass() {
        const QString src = QStringLiteral("from manim import *\n"
                                           "class Helper (VGroup):\n    pass\n"
                                           "class Main(Scene):\n    pass\n");
        QCOMPARE(EntrySymbol::detect(src, QStringLiteral("Scene")), QStringLiteral("Helper"));
    }

    void testEntrySymbolFallback() {
        QCOMPARE(EntrySymbol::detect(QStringLiteral("x = 1\n"), QStringLiteral("Scene")), QStringLiteral("Scene"));
        // A class without a base list is not a scene declaration
        QCOMPARE(EntrySymbol::detect(QStringLiteral("class Plain:\n    pass\n"), QStringLiteral("Fallback")),
                 QStringLiteral("Fallback"));
    }

    void testCreateAndWriteSource() {
        QTemporaryDir root;
        QVERIFY(root.isValid());

        WorkingArea area(root.path(), QStringLiteral("run-1"));
        QVERIFY(area.create().has_value());
        QVERIFY(area.writeSource(QStringLiteral("scene.py"), QStringLiteral("print('hé')\n")).has_value());

        QFile f(QDir(area.path()).filePath(QStringLiteral("scene.py")));
        QVERIFY(f.open(QIODevice::ReadOnly));
        QCOMPARE(QString::fromUtf8(f.readAll()), QStringLiteral("print('hé')\n"));
    }

    void testCreateRefusesExistingArea() {
        QTemporaryDir root;
        WorkingArea area(root.path(), QStringLiteral("run-1"));
        QVERIFY(area.create().has_value());
        WorkingArea again(root.path(), QStringLiteral("run-1"));
        QVERIFY(!again.create().has_value());
    }

    void testFindArtifactAtDepth() {
        QTemporaryDir root;
        WorkingArea area(root.path(), QStringLiteral("run-2"));
        QVERIFY(area.create().has_value());
        touch(QDir(area.path()).filePath(QStringLiteral("media/videos/scene/480p15/partial_movie_files/x.txt")));
        touch(QDir(area.path()).filePath(QStringLiteral("media/videos/scene/480p15/Demo.mp4")));

        auto found = area.findArtifact(QStringLiteral("media/videos"), QStringLiteral(".mp4"));
        QVERIFY(found.has_value());
        QVERIFY(found->endsWith(QStringLiteral("/480p15/Demo.mp4")));
    }

    void testFindArtifactMissingOutputDir() {
        QTemporaryDir root;
        WorkingArea area(root.path(), QStringLiteral("run-3"));
        QVERIFY(area.create().has_value());
        QVERIFY(!area.findArtifact(QStringLiteral("media/videos"), QStringLiteral(".mp4")).has_value());
    }

    void testArtifactOutsideOutputDirIsIgnored() {
        QTemporaryDir root;
        WorkingArea area(root.path(), QStringLiteral("run-4"));
        QVERIFY(area.create().has_value());
        touch(QDir(area.path()).filePath(QStringLiteral("media/images/Demo.mp4")));
        QVERIFY(!area.findArtifact(QStringLiteral("media/videos"), QStringLiteral(".mp4")).has_value());
    }
};

QTEST_MAIN(TestWorkingArea)
#include "tst_working_area.moc"

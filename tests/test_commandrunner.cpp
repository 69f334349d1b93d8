#include <QtTest>
#include <QBuffer>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "commandrunner.h"
#include "models/transferqueue.h"
#include "utils/transfersettings.h"

class TestCommandRunner : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir *root;
    QTemporaryDir *local;
    CommandRunner *runner;
    QBuffer *out;
    QBuffer *err;

    void writeFile(const QString &path, const QByteArray &data)
    {
        QDir().mkpath(QFileInfo(path).absolutePath());
        QFile file(path);
        if (file.open(QIODevice::WriteOnly)) {
            file.write(data);
            file.close();
        }
    }

    // Runs one command and returns its exit code, or -1 on timeout
    int runCommand(const QString &command, const QStringList &arguments,
                   const CommandRunner::Options &options = CommandRunner::Options())
    {
        QSignalSpy finishedSpy(runner, &CommandRunner::finished);
        runner->run(command, arguments, options);
        if (!finishedSpy.wait(5000)) {
            return -1;
        }
        return finishedSpy.first().first().toInt();
    }

    QString output() const { return QString::fromUtf8(out->data()); }
    QString errors() const { return QString::fromUtf8(err->data()); }

private slots:
    void init()
    {
        root = new QTemporaryDir();
        local = new QTemporaryDir();
        QVERIFY(root->isValid());
        QVERIFY(local->isValid());
        QVERIFY(QDir(root->path()).mkdir("photos"));

        out = new QBuffer(this);
        err = new QBuffer(this);
        out->open(QIODevice::WriteOnly);
        err->open(QIODevice::WriteOnly);

        runner = new CommandRunner(root->path(), TransferSettings(), this);
        runner->setOutputDevices(out, err);
    }

    void cleanup()
    {
        delete runner;
        runner = nullptr;
        delete out;
        out = nullptr;
        delete err;
        err = nullptr;
        delete local;
        local = nullptr;
        delete root;
        root = nullptr;
    }

    void testUnknownCommandIsUsageError()
    {
        QCOMPARE(runCommand("frobnicate", {}), int(CommandRunner::ExitUsage));
        QVERIFY(errors().contains("Unknown command 'frobnicate'"));
        QVERIFY(errors().contains("Commands:"));
    }

    void testMissingArgumentsIsUsageError()
    {
        QCOMPARE(runCommand("mv", {"photos", "a.png"}), int(CommandRunner::ExitUsage));
        QVERIFY(errors().contains("mv expects BUCKET OLD NEW"));
    }

    void testListShowsPrefixesAndObjects()
    {
        writeFile(root->filePath("photos/a.png"), QByteArray(2048, 'a'));
        writeFile(root->filePath("photos/2024/b.png"), "b");

        QCOMPARE(runCommand("ls", {"photos"}), int(CommandRunner::ExitSuccess));

        const QStringList lines = output().split('\n', Qt::SkipEmptyParts);
        QCOMPARE(lines.size(), 2);
        QVERIFY(lines.at(0).endsWith("PRE 2024/"));
        QVERIFY(lines.at(1).endsWith("       2048 a.png"));
    }

    void testListAllPages()
    {
        for (int i = 0; i < 5; ++i) {
            writeFile(root->filePath(QString("photos/file%1.txt").arg(i)), "x");
        }

        CommandRunner::Options options;
        options.pageSize = 2;
        options.listAll = true;
        QCOMPARE(runCommand("ls", {"photos"}, options), int(CommandRunner::ExitSuccess));

        QCOMPARE(output().split('\n', Qt::SkipEmptyParts).size(), 5);
        QVERIFY(!errors().contains("More entries available"));
    }

    void testListFirstPageOnly()
    {
        for (int i = 0; i < 5; ++i) {
            writeFile(root->filePath(QString("photos/file%1.txt").arg(i)), "x");
        }

        CommandRunner::Options options;
        options.pageSize = 2;
        QCOMPARE(runCommand("ls", {"photos"}, options), int(CommandRunner::ExitSuccess));

        QCOMPARE(output().split('\n', Qt::SkipEmptyParts).size(), 2);
        QVERIFY(errors().contains("More entries available"));
    }

    void testListMissingBucketFails()
    {
        QCOMPARE(runCommand("ls", {"nope"}), int(CommandRunner::ExitFailure));
        QVERIFY(errors().contains("NoSuchBucket: nope"));
    }

    void testPutUploadsFiles()
    {
        const QString a = local->filePath("a.png");
        const QString b = local->filePath("b.png");
        writeFile(a, "aaa");
        writeFile(b, "bbbb");

        QCOMPARE(runCommand("put", {"photos", "2024/", a, b}), int(CommandRunner::ExitSuccess));

        QVERIFY(QFile::exists(root->filePath("photos/2024/a.png")));
        QVERIFY(QFile::exists(root->filePath("photos/2024/b.png")));
        QVERIFY(output().contains("Successfully uploaded 2 file(s)"));
        QCOMPARE(runner->queue()->completedRecords().size(), 2);
    }

    void testPutMissingFileFails()
    {
        const QString a = local->filePath("a.png");
        writeFile(a, "aaa");

        QCOMPARE(runCommand("put", {"photos", "", a, local->filePath("missing.png")}),
                 int(CommandRunner::ExitFailure));

        QVERIFY(QFile::exists(root->filePath("photos/a.png")));
        QVERIFY(errors().contains("upload failed: missing.png"));
        QVERIFY(output().contains("Successfully uploaded 1 file(s), 1 failed"));
    }

    void testGetDownloadsObjects()
    {
        writeFile(root->filePath("photos/2024/a.png"), "image");

        QCOMPARE(runCommand("get", {"photos", local->path(), "2024/a.png"}),
                 int(CommandRunner::ExitSuccess));

        QFile downloaded(local->filePath("a.png"));
        QVERIFY(downloaded.open(QIODevice::ReadOnly));
        QCOMPARE(downloaded.readAll(), QByteArray("image"));
    }

    void testRemove()
    {
        writeFile(root->filePath("photos/a.png"), "a");

        QCOMPARE(runCommand("rm", {"photos", "a.png"}), int(CommandRunner::ExitSuccess));

        QVERIFY(!QFile::exists(root->filePath("photos/a.png")));
        QVERIFY(output().contains("delete: photos/a.png"));
    }

    void testMove()
    {
        writeFile(root->filePath("photos/a.png"), "a");

        QCOMPARE(runCommand("mv", {"photos", "a.png", "2024/a.png"}), int(CommandRunner::ExitSuccess));

        QVERIFY(!QFile::exists(root->filePath("photos/a.png")));
        QVERIFY(QFile::exists(root->filePath("photos/2024/a.png")));
        QVERIFY(output().contains("move: a.png -> 2024/a.png"));
    }

    void testMoveMissingSourceFails()
    {
        QCOMPARE(runCommand("mv", {"photos", "nope.png", "b.png"}), int(CommandRunner::ExitFailure));
        QVERIFY(errors().contains("NoSuchKey: nope.png"));
    }

    void testMakeFolder()
    {
        QCOMPARE(runCommand("mkdir", {"photos", "2024/holiday"}), int(CommandRunner::ExitSuccess));
        QVERIFY(QFileInfo(root->filePath("photos/2024/holiday")).isDir());
        QVERIFY(output().contains("created: photos/2024/holiday/"));
    }

    void testPresign()
    {
        writeFile(root->filePath("photos/a.png"), "a");

        QCOMPARE(runCommand("presign", {"photos", "a.png", "120"}), int(CommandRunner::ExitSuccess));
        QVERIFY(output().startsWith("file://"));
        QVERIFY(output().contains("X-Signature="));
    }

    void testPresignNonNumericTtl()
    {
        QCOMPARE(runCommand("presign", {"photos", "a.png", "soon"}), int(CommandRunner::ExitUsage));
        QVERIFY(errors().contains("TTL must be a number of seconds"));
    }

    void testPresignTtlOutOfRange()
    {
        writeFile(root->filePath("photos/a.png"), "a");

        QCOMPARE(runCommand("presign", {"photos", "a.png", "0"}), int(CommandRunner::ExitFailure));
        QVERIFY(errors().contains("InvalidArgument"));
    }

    void testStat()
    {
        writeFile(root->filePath("photos/notes.txt"), "hello");

        QCOMPARE(runCommand("stat", {"photos", "notes.txt"}), int(CommandRunner::ExitSuccess));
        QVERIFY(output().contains("Size:          5"));
        QVERIFY(output().contains("5d41402abc4b2a76b9719d911017c592"));
        QVERIFY(output().contains("Storage class: STANDARD"));
    }
};

QTEST_MAIN(TestCommandRunner)
#include "test_commandrunner.moc"

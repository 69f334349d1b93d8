#include <QtTest>
#include <QSignalSpy>

#include "services/gatewayerror.h"
#include "services/gatewayreply.h"

class TestGatewayReply : public QObject
{
    Q_OBJECT

private slots:
    // =========================================================
    // GatewayError classification
    // =========================================================

    void testFromMessageClassifies_data()
    {
        QTest::addColumn<QString>("message");
        QTest::addColumn<int>("kind");

        QTest::newRow("missing key") << "NoSuchKey: The specified key does not exist."
                                     << static_cast<int>(GatewayErrorKind::NotFound);
        QTest::newRow("missing bucket") << "NoSuchBucket: photos"
                                        << static_cast<int>(GatewayErrorKind::NotFound);
        QTest::newRow("access denied") << "AccessDenied"
                                       << static_cast<int>(GatewayErrorKind::PermissionDenied);
        QTest::newRow("bad signature") << "SignatureDoesNotMatch: check your secret"
                                       << static_cast<int>(GatewayErrorKind::Authentication);
        QTest::newRow("expired token") << "ExpiredToken"
                                       << static_cast<int>(GatewayErrorKind::Authentication);
        QTest::newRow("bad argument") << "InvalidArgument: expiry too long"
                                      << static_cast<int>(GatewayErrorKind::InvalidRequest);
        QTest::newRow("timeout") << "Connection timed out"
                                 << static_cast<int>(GatewayErrorKind::Network);
        QTest::newRow("refused") << "Connection refused"
                                 << static_cast<int>(GatewayErrorKind::Network);
        QTest::newRow("other") << "InternalError: We encountered an internal error"
                               << static_cast<int>(GatewayErrorKind::Unknown);
    }

    void testFromMessageClassifies()
    {
        QFETCH(QString, message);
        QFETCH(int, kind);

        GatewayError error = GatewayError::fromMessage(message);
        QCOMPARE(static_cast<int>(error.kind), kind);
        QCOMPARE(error.message, message);
        QVERIFY(error.isError());
    }

    void testProviderCodeWinsOverKeyText()
    {
        // The key mentions "timeout" but the provider said NoSuchKey
        GatewayError error = GatewayError::fromMessage("NoSuchKey: logs/timeout.txt");
        QCOMPARE(error.kind, GatewayErrorKind::NotFound);
    }

    void testAffectsConnectionHealth()
    {
        QVERIFY(GatewayError::fromMessage("Connection reset by peer").affectsConnectionHealth());
        QVERIFY(GatewayError::fromMessage("InvalidAccessKeyId").affectsConnectionHealth());
        QVERIFY(!GatewayError::fromMessage("AccessDenied").affectsConnectionHealth());
        QVERIFY(!GatewayError::fromMessage("NoSuchKey: a").affectsConnectionHealth());
        QVERIFY(!GatewayError::cancelled().affectsConnectionHealth());
    }

    void testDefaultIsNoError()
    {
        GatewayError error;
        QVERIFY(!error.isError());
        QCOMPARE(QString(gatewayErrorKindToString(error.kind)), QString("None"));
    }

    // =========================================================
    // GatewayReply lifecycle
    // =========================================================

    void testFinishSuccessOnce()
    {
        GatewayReply reply(GatewayReply::Operation::Put);
        QSignalSpy finishedSpy(&reply, &GatewayReply::finished);

        QVERIFY(!reply.isFinished());
        reply.finishSuccess();
        reply.finishSuccess();

        QVERIFY(reply.isFinished());
        QVERIFY(!reply.hasError());
        QCOMPARE(finishedSpy.count(), 1);
        QCOMPARE(reply.operation(), GatewayReply::Operation::Put);
    }

    void testFirstFinishWins()
    {
        GatewayReply reply(GatewayReply::Operation::List);
        QSignalSpy finishedSpy(&reply, &GatewayReply::finished);

        ListingPage page;
        page.prefixes = QStringList{"logs/"};
        reply.finishWithListing(page);
        reply.fail(GatewayError::fromMessage("AccessDenied"));

        QCOMPARE(finishedSpy.count(), 1);
        QVERIFY(!reply.hasError());
        QCOMPARE(reply.listingPage().prefixes, QStringList({"logs/"}));
    }

    void testFailKeepsMessage()
    {
        GatewayReply reply(GatewayReply::Operation::Get);
        reply.fail(GatewayError::fromMessage("NoSuchKey: a.png"));

        QVERIFY(reply.hasError());
        QCOMPARE(reply.error().kind, GatewayErrorKind::NotFound);
        QCOMPARE(reply.errorString(), QString("NoSuchKey: a.png"));
    }

    void testFailWithoutKindIsStillError()
    {
        GatewayReply reply(GatewayReply::Operation::Head);
        GatewayError error;
        error.message = "something broke";
        reply.fail(error);

        QVERIFY(reply.hasError());
        QCOMPARE(reply.error().kind, GatewayErrorKind::Unknown);
    }

    void testAbort()
    {
        GatewayReply reply(GatewayReply::Operation::Get);
        QSignalSpy abortSpy(&reply, &GatewayReply::abortRequested);
        QSignalSpy finishedSpy(&reply, &GatewayReply::finished);

        reply.abort();

        QCOMPARE(abortSpy.count(), 1);
        QCOMPARE(finishedSpy.count(), 1);
        QCOMPARE(reply.error().kind, GatewayErrorKind::Cancelled);

        // A late completion from the gateway is ignored
        reply.finishSuccess();
        reply.abort();
        QCOMPARE(abortSpy.count(), 1);
        QCOMPARE(finishedSpy.count(), 1);
        QCOMPARE(reply.error().kind, GatewayErrorKind::Cancelled);
    }

    void testAbortAfterFinishIsNoOp()
    {
        GatewayReply reply(GatewayReply::Operation::Presign);
        reply.finishWithUrl("https://example.com/a?sig=1");
        QSignalSpy abortSpy(&reply, &GatewayReply::abortRequested);

        reply.abort();

        QCOMPARE(abortSpy.count(), 0);
        QVERIFY(!reply.hasError());
        QCOMPARE(reply.url(), QString("https://example.com/a?sig=1"));
    }

    void testProgressStopsAfterFinish()
    {
        GatewayReply reply(GatewayReply::Operation::Put);
        QSignalSpy progressSpy(&reply, &GatewayReply::progress);

        reply.reportProgress(10, 100);
        QCOMPARE(reply.bytesDone(), qint64(10));
        QCOMPARE(reply.bytesTotal(), qint64(100));

        reply.finishSuccess();
        reply.reportProgress(100, 100);

        QCOMPARE(progressSpy.count(), 1);
        QCOMPARE(reply.bytesDone(), qint64(10));
    }

    void testMetadataResult()
    {
        GatewayReply reply(GatewayReply::Operation::Head);
        ObjectMetadata metadata;
        metadata.key = "a.png";
        metadata.size = 2048;
        metadata.customMetadata.insert("owner", "ops");
        reply.finishWithMetadata(metadata);

        QCOMPARE(reply.metadata().size, qint64(2048));
        QCOMPARE(reply.metadata().customMetadata.value("owner"), QString("ops"));
    }
};

QTEST_MAIN(TestGatewayReply)
#include "test_gatewayreply.moc"

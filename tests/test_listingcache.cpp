#include <QtTest>
#include <QSignalSpy>

#include "mocks/mockstoragegateway.h"
#include "models/listingcache.h"

class TestListingCache : public QObject
{
    Q_OBJECT

private:
    MockStorageGateway *mockGateway;
    ListingCache *cache;

    const ListingScope photosRoot{"conn-1", "photos", ""};

    ListingPage makePage(const QStringList &keys, const QStringList &prefixes,
                         const QString &nextToken = QString())
    {
        ListingPage page;
        for (const QString &key : keys) {
            ObjectEntry entry;
            entry.key = key;
            entry.size = 100;
            entry.lastModified = QDateTime(QDate(2024, 3, 1), QTime(12, 0));
            page.objects.append(entry);
        }
        page.prefixes = prefixes;
        page.isTruncated = !nextToken.isEmpty();
        page.continuationToken = nextToken;
        return page;
    }

    void setupThreePages()
    {
        mockGateway->mockSetListingPages("photos", "", {
            makePage({"a.png", "b.png"}, {"logs/"}, "t1"),
            makePage({"c.png", "d.png"}, {"logs/", "raw/"}, "t2"),
            makePage({"e.png"}, {})
        });
    }

private slots:
    void init()
    {
        mockGateway = new MockStorageGateway(this);
        cache = new ListingCache(mockGateway, this);
    }

    void cleanup()
    {
        delete cache;
        cache = nullptr;
        delete mockGateway;
        mockGateway = nullptr;
    }

    void testInitialState()
    {
        QCOMPARE(cache->pageCount(photosRoot), 0);
        QVERIFY(!cache->hasMore(photosRoot));
        QVERIFY(!cache->isFetching(photosRoot));
        QCOMPARE(cache->generation(photosRoot), quint64(0));
        QVERIFY(!cache->page(photosRoot, 0).has_value());
        QCOMPARE(cache->flatten(photosRoot).objects.size(), 0);
    }

    void testFirstPageFetch()
    {
        setupThreePages();
        QSignalSpy readySpy(cache, &ListingCache::pageReady);

        cache->fetchPage(photosRoot, 0, 2);
        QVERIFY(cache->isFetching(photosRoot));
        QCOMPARE(mockGateway->mockGetListRequests().size(), 1);
        QCOMPARE(mockGateway->mockGetListRequests().first().maxKeys, 2);
        QVERIFY(mockGateway->mockGetListRequests().first().continuationToken.isEmpty());

        mockGateway->mockProcessAllOperations();

        QCOMPARE(readySpy.count(), 1);
        QCOMPARE(readySpy.first().at(1).toInt(), 0);
        QCOMPARE(cache->pageCount(photosRoot), 1);
        QVERIFY(cache->hasMore(photosRoot));
        QVERIFY(!cache->isFetching(photosRoot));
    }

    void testPagesFetchedInSequenceWithTokens()
    {
        setupThreePages();
        QSignalSpy readySpy(cache, &ListingCache::pageReady);

        // Asking for page 2 first pulls pages 0 and 1 in order
        cache->fetchPage(photosRoot, 2);

        // Only one request may be outstanding per scope
        QCOMPARE(mockGateway->mockPendingOperationCount(), 1);
        mockGateway->mockProcessAllOperations();

        const auto requests = mockGateway->mockGetListRequests();
        QCOMPARE(requests.size(), 3);
        QCOMPARE(requests.at(0).continuationToken, QString());
        QCOMPARE(requests.at(1).continuationToken, QString("t1"));
        QCOMPARE(requests.at(2).continuationToken, QString("t2"));

        QCOMPARE(cache->pageCount(photosRoot), 3);
        QCOMPARE(readySpy.last().at(1).toInt(), 2);
        QVERIFY(!cache->hasMore(photosRoot));
    }

    void testHasMoreTurnsFalseOnLastPage()
    {
        mockGateway->mockSetListingPages("photos", "", {
            makePage({"a.png"}, {}, "t1"),
            makePage({"b.png"}, {})
        });

        cache->fetchPage(photosRoot, 0);
        mockGateway->mockProcessAllOperations();
        QVERIFY(cache->hasMore(photosRoot));

        cache->fetchPage(photosRoot, 1);
        mockGateway->mockProcessAllOperations();
        QVERIFY(!cache->hasMore(photosRoot));
    }

    void testFlattenConcatenatesAndDeduplicatesPrefixes()
    {
        setupThreePages();
        cache->fetchPage(photosRoot, 2);
        mockGateway->mockProcessAllOperations();

        ListingSnapshot snapshot = cache->flatten(photosRoot);
        QCOMPARE(snapshot.pageCount, 3);
        QCOMPARE(snapshot.objects.size(), 5);
        QCOMPARE(snapshot.objects.at(0).key, QString("a.png"));
        QCOMPARE(snapshot.objects.at(4).key, QString("e.png"));
        QCOMPARE(snapshot.prefixes, QStringList({"logs/", "raw/"}));
        QVERIFY(!snapshot.isTruncated);
    }

    void testCachedPageResolvesWithoutRequest()
    {
        setupThreePages();
        cache->fetchPage(photosRoot, 0);
        mockGateway->mockProcessAllOperations();
        QCOMPARE(mockGateway->mockGetListRequests().size(), 1);

        QSignalSpy readySpy(cache, &ListingCache::pageReady);
        cache->fetchPage(photosRoot, 0);

        // Delivered immediately from the cache
        QCOMPARE(readySpy.count(), 1);
        QCOMPARE(mockGateway->mockGetListRequests().size(), 1);
        QCOMPARE(readySpy.first().at(2).value<ListingPage>().objects.size(), 2);
    }

    void testRequestPastEndFails()
    {
        mockGateway->mockSetListingPages("photos", "", {makePage({"a.png"}, {})});
        cache->fetchPage(photosRoot, 0);
        mockGateway->mockProcessAllOperations();

        QSignalSpy failedSpy(cache, &ListingCache::fetchFailed);
        cache->fetchPage(photosRoot, 1);

        QCOMPARE(failedSpy.count(), 1);
        QCOMPARE(failedSpy.first().at(1).toInt(), 1);
        QCOMPARE(failedSpy.first().at(2).toString(), QString("No more pages"));
        QCOMPARE(mockGateway->mockGetListRequests().size(), 1);
    }

    void testNegativePageIndexFails()
    {
        QSignalSpy failedSpy(cache, &ListingCache::fetchFailed);
        cache->fetchPage(photosRoot, -1);
        QCOMPARE(failedSpy.count(), 1);
        QCOMPARE(mockGateway->mockGetListRequests().size(), 0);
    }

    void testFailureLeavesCacheUnchanged()
    {
        setupThreePages();
        cache->fetchPage(photosRoot, 0);
        mockGateway->mockProcessAllOperations();

        QSignalSpy failedSpy(cache, &ListingCache::fetchFailed);
        QSignalSpy readySpy(cache, &ListingCache::pageReady);
        mockGateway->mockSetNextOperationFails("SlowDown: Please reduce your request rate");

        QVERIFY(cache->fetchNextPage(photosRoot));
        mockGateway->mockProcessAllOperations();

        QCOMPARE(failedSpy.count(), 1);
        QCOMPARE(failedSpy.first().at(1).toInt(), 1);
        QCOMPARE(failedSpy.first().at(2).toString(),
                 QString("SlowDown: Please reduce your request rate"));
        QCOMPARE(readySpy.count(), 0);
        QCOMPARE(cache->pageCount(photosRoot), 1);
        QVERIFY(cache->hasMore(photosRoot));
        QVERIFY(!cache->isFetching(photosRoot));

        // Retrying after a failure continues from the same token
        QVERIFY(cache->fetchNextPage(photosRoot));
        mockGateway->mockProcessAllOperations();
        QCOMPARE(cache->pageCount(photosRoot), 2);
        QCOMPARE(mockGateway->mockGetListRequests().last().continuationToken, QString("t1"));
    }

    void testFailureOnFirstPageFailsQueuedRequests()
    {
        setupThreePages();
        QSignalSpy failedSpy(cache, &ListingCache::fetchFailed);
        mockGateway->mockSetNextOperationFails("AccessDenied");

        cache->fetchPage(photosRoot, 0);
        cache->fetchPage(photosRoot, 1);
        mockGateway->mockProcessAllOperations();

        QCOMPARE(failedSpy.count(), 2);
        QCOMPARE(mockGateway->mockGetListRequests().size(), 1);
        QCOMPARE(cache->pageCount(photosRoot), 0);
    }

    void testFetchNextPage()
    {
        setupThreePages();

        // Nothing cached yet: starts at page 0
        QVERIFY(cache->fetchNextPage(photosRoot));
        QVERIFY(!cache->fetchNextPage(photosRoot));  // Already fetching
        mockGateway->mockProcessAllOperations();

        QVERIFY(cache->fetchNextPage(photosRoot));
        mockGateway->mockProcessAllOperations();
        QVERIFY(cache->fetchNextPage(photosRoot));
        mockGateway->mockProcessAllOperations();

        QCOMPARE(cache->pageCount(photosRoot), 3);
        QVERIFY(!cache->fetchNextPage(photosRoot));  // Listing complete
        QCOMPARE(mockGateway->mockGetListRequests().size(), 3);
    }

    void testPageSizeClamped()
    {
        cache->fetchPage(photosRoot, 0, 5000);
        QCOMPARE(mockGateway->mockGetListRequests().first().maxKeys, ListingCache::MaxPageSize);

        ListingScope other{"conn-1", "photos", "2024/"};
        cache->fetchPage(other, 0, 0);
        QCOMPARE(mockGateway->mockGetListRequests().last().maxKeys, 1);
    }

    void testScopesFetchIndependently()
    {
        ListingScope logs{"conn-1", "photos", "logs/"};
        mockGateway->mockSetListingPages("photos", "", {makePage({"a.png"}, {"logs/"})});
        mockGateway->mockSetListingPages("photos", "logs/", {makePage({"logs/1.txt"}, {})});

        cache->fetchPage(photosRoot, 0);
        cache->fetchPage(logs, 0);

        // Both scopes have a request outstanding at the same time
        QCOMPARE(mockGateway->mockPendingOperationCount(), 2);
        mockGateway->mockProcessAllOperations();

        QCOMPARE(cache->flatten(photosRoot).objects.first().key, QString("a.png"));
        QCOMPARE(cache->flatten(logs).objects.first().key, QString("logs/1.txt"));
    }

    void testInvalidateClearsMatchingScopesOnly()
    {
        ListingScope nested{"conn-1", "photos", "2024/"};
        ListingScope otherBucket{"conn-1", "backups", ""};
        ListingScope otherConnection{"conn-2", "photos", ""};
        mockGateway->mockSetListingPages("photos", "", {makePage({"a.png"}, {})});
        mockGateway->mockSetListingPages("photos", "2024/", {makePage({"2024/b.png"}, {})});
        mockGateway->mockSetListingPages("backups", "", {makePage({"dump.sql"}, {})});

        cache->fetchPage(photosRoot, 0);
        cache->fetchPage(nested, 0);
        cache->fetchPage(otherBucket, 0);
        cache->fetchPage(otherConnection, 0);
        mockGateway->mockProcessAllOperations();

        QSignalSpy invalidatedSpy(cache, &ListingCache::scopeInvalidated);
        cache->invalidate("conn-1", "photos");

        QCOMPARE(invalidatedSpy.count(), 1);
        QCOMPARE(cache->pageCount(photosRoot), 0);
        QCOMPARE(cache->pageCount(nested), 0);
        QCOMPARE(cache->pageCount(otherBucket), 1);
        QCOMPARE(cache->pageCount(otherConnection), 1);

        // Emptied scopes with nothing outstanding are released
        QCOMPARE(cache->scopeCount(), 2);
        QCOMPARE(cache->generation(otherBucket), quint64(0));
    }

    void testInvalidateDuringFetchDiscardsResult()
    {
        setupThreePages();
        QSignalSpy readySpy(cache, &ListingCache::pageReady);
        QSignalSpy staleSpy(cache, &ListingCache::stalePageDiscarded);

        cache->fetchPage(photosRoot, 0);
        QCOMPARE(cache->generation(photosRoot), quint64(0));

        // A mutation lands while the listing request is outstanding
        cache->invalidate("conn-1", "photos");
        QCOMPARE(cache->generation(photosRoot), quint64(1));
        QVERIFY(!cache->isFetching(photosRoot));

        mockGateway->mockProcessAllOperations();

        QCOMPARE(readySpy.count(), 0);
        QCOMPARE(staleSpy.count(), 1);
        QCOMPARE(staleSpy.first().at(1).toInt(), 0);
        QCOMPARE(cache->pageCount(photosRoot), 0);
    }

    void testInvalidateWhileLaterPageOutstanding()
    {
        setupThreePages();
        cache->fetchPage(photosRoot, 0);
        mockGateway->mockProcessAllOperations();
        QCOMPARE(cache->pageCount(photosRoot), 1);

        QSignalSpy readySpy(cache, &ListingCache::pageReady);
        QSignalSpy staleSpy(cache, &ListingCache::stalePageDiscarded);

        cache->fetchPage(photosRoot, 1);
        QCOMPARE(mockGateway->mockGetListRequests().last().continuationToken, QString("t1"));

        cache->invalidate("conn-1", "photos");
        QCOMPARE(cache->pageCount(photosRoot), 0);

        // Page 1 arrives after the invalidation and must not be appended
        mockGateway->mockProcessAllOperations();
        QCOMPARE(readySpy.count(), 0);
        QCOMPARE(staleSpy.count(), 1);
        QCOMPARE(staleSpy.first().at(1).toInt(), 1);
        QCOMPARE(cache->pageCount(photosRoot), 0);

        // The next read starts a fresh sequence from the first page
        cache->fetchPage(photosRoot, 0);
        QCOMPARE(mockGateway->mockGetListRequests().size(), 3);
        QVERIFY(mockGateway->mockGetListRequests().last().continuationToken.isEmpty());

        mockGateway->mockProcessAllOperations();
        QCOMPARE(readySpy.count(), 1);
        QCOMPARE(readySpy.first().at(1).toInt(), 0);
        QCOMPARE(cache->flatten(photosRoot).objects.first().key, QString("a.png"));
    }

    void testInvalidatedScopeReleasedOnceIdle()
    {
        ListingScope nested{"conn-1", "photos", "2024/"};
        mockGateway->mockSetListingPages("photos", "", {makePage({"a.png"}, {})});
        cache->fetchPage(photosRoot, 0);
        mockGateway->mockProcessAllOperations();
        cache->fetchPage(nested, 0);
        QCOMPARE(cache->scopeCount(), 2);

        cache->invalidate("conn-1", "photos");

        // The nested scope waits for its outstanding reply before it goes
        QCOMPARE(cache->scopeCount(), 1);
        QCOMPARE(cache->generation(nested), quint64(1));

        mockGateway->mockProcessAllOperations();
        QCOMPARE(cache->scopeCount(), 0);
        QCOMPARE(cache->pageCount(nested), 0);

        // Browsing many prefixes does not accumulate state
        for (int i = 0; i < 10; ++i) {
            cache->fetchPage(ListingScope{"conn-1", "photos", QString("dir%1/").arg(i)}, 0);
        }
        mockGateway->mockProcessAllOperations();
        QCOMPARE(cache->scopeCount(), 10);
        cache->invalidate("conn-1", "photos");
        QCOMPARE(cache->scopeCount(), 0);
    }

    void testRefetchAfterInvalidationIgnoresOldReply()
    {
        setupThreePages();
        QSignalSpy readySpy(cache, &ListingCache::pageReady);
        QSignalSpy staleSpy(cache, &ListingCache::stalePageDiscarded);

        cache->fetchPage(photosRoot, 0);
        cache->invalidate("conn-1", "photos");
        cache->fetchPage(photosRoot, 0);

        QCOMPARE(mockGateway->mockPendingOperationCount(), 2);

        // Old reply arrives first and must not populate the new sequence
        mockGateway->mockProcessNextOperation();
        QCOMPARE(staleSpy.count(), 1);
        QCOMPARE(cache->pageCount(photosRoot), 0);
        QVERIFY(cache->isFetching(photosRoot));

        mockGateway->mockProcessNextOperation();
        QCOMPARE(readySpy.count(), 1);
        QCOMPARE(cache->pageCount(photosRoot), 1);
    }

    void testInvalidateDropsQueuedRequests()
    {
        setupThreePages();
        QSignalSpy staleSpy(cache, &ListingCache::stalePageDiscarded);
        QSignalSpy readySpy(cache, &ListingCache::pageReady);

        cache->fetchPage(photosRoot, 2);
        cache->invalidate("conn-1", "photos");
        mockGateway->mockProcessAllOperations();

        // The queued page-2 request and the in-flight page-0 reply
        QCOMPARE(staleSpy.count(), 2);
        QCOMPARE(readySpy.count(), 0);
        QCOMPARE(mockGateway->mockGetListRequests().size(), 1);
    }

    void testInvalidateAll()
    {
        ListingScope otherBucket{"conn-1", "backups", ""};
        mockGateway->mockSetListingPages("photos", "", {makePage({"a.png"}, {})});
        mockGateway->mockSetListingPages("backups", "", {makePage({"dump.sql"}, {})});
        cache->fetchPage(photosRoot, 0);
        cache->fetchPage(otherBucket, 0);
        mockGateway->mockProcessAllOperations();

        cache->invalidateAll();

        QCOMPARE(cache->pageCount(photosRoot), 0);
        QCOMPARE(cache->pageCount(otherBucket), 0);
    }

    void testLoadingSignals()
    {
        setupThreePages();
        QSignalSpy startedSpy(cache, &ListingCache::loadingStarted);
        QSignalSpy finishedSpy(cache, &ListingCache::loadingFinished);

        cache->fetchPage(photosRoot, 1);
        mockGateway->mockProcessAllOperations();

        QCOMPARE(startedSpy.count(), 2);
        QCOMPARE(finishedSpy.count(), 2);
    }

    void testStaleScopeRestartsFromFirstPage()
    {
        setupThreePages();
        cache->setCacheTtl(1);
        cache->fetchPage(photosRoot, 1);
        mockGateway->mockProcessAllOperations();
        QCOMPARE(cache->pageCount(photosRoot), 2);
        QVERIFY(!cache->isStale(photosRoot));

        QTest::qWait(1100);
        QVERIFY(cache->isStale(photosRoot));

        cache->fetchPage(photosRoot, 0);
        QCOMPARE(cache->generation(photosRoot), quint64(1));
        QCOMPARE(cache->pageCount(photosRoot), 0);
        QVERIFY(mockGateway->mockGetListRequests().last().continuationToken.isEmpty());

        mockGateway->mockProcessAllOperations();
        QCOMPARE(cache->pageCount(photosRoot), 1);
        QVERIFY(!cache->isStale(photosRoot));
    }

    void testZeroTtlNeverExpires()
    {
        QCOMPARE(cache->cacheTtl(), 30);
        cache->setCacheTtl(0);
        mockGateway->mockSetListingPages("photos", "", {makePage({"a.png"}, {})});
        cache->fetchPage(photosRoot, 0);
        mockGateway->mockProcessAllOperations();

        QVERIFY(!cache->isStale(photosRoot));
    }

    void testFetchWithoutGatewayFails()
    {
        ListingCache detached(nullptr);
        QSignalSpy failedSpy(&detached, &ListingCache::fetchFailed);

        detached.fetchPage(photosRoot, 0);

        QCOMPARE(failedSpy.count(), 1);
    }
};

QTEST_MAIN(TestListingCache)
#include "test_listingcache.moc"

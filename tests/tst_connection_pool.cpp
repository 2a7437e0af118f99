#include <QTest>
#include <QPointer>
#include "proxy/connection_pool.h"

class TestConnectionPool : public QObject {
    Q_OBJECT

private slots:
    void testReleasedManagerIsReused() {
        ConnectionPool pool(2);
        QNetworkAccessManager* first = pool.acquire();
        QCOMPARE(pool.activeCount(), 1);

        pool.release(first);
        QCOMPARE(pool.activeCount(), 0);
        QCOMPARE(pool.idleCount(), 1);
        QCOMPARE(pool.acquire(), first);
    }

    void testManagersDoNotFollowRedirects() {
        ConnectionPool pool;
        QNetworkAccessManager* nam = pool.acquire();
        QCOMPARE(nam->redirectPolicy(), QNetworkRequest::ManualRedirectPolicy);
        pool.release(nam);
    }

    void testOverflowManagerIsDroppedOnRelease() {
        ConnectionPool pool(1);
        QNetworkAccessManager* a = pool.acquire();
        QPointer<QNetworkAccessManager> b = pool.acquire();
        QVERIFY(a != b.data());
        QCOMPARE(pool.activeCount(), 2);

        pool.release(b);
        pool.release(a);
        QCOMPARE(pool.idleCount(), 1);
        QTRY_VERIFY(b.isNull());
    }

    void testDisabledPoolNeverKeepsManagers() {
        ConnectionPool pool(4);
        pool.setEnabled(false);
        QPointer<QNetworkAccessManager> nam = pool.acquire();
        pool.release(nam);
        QCOMPARE(pool.idleCount(), 0);
        QTRY_VERIFY(nam.isNull());
    }

    void testResizeAndClearDropWarmManagers() {
        ConnectionPool pool(3);
        QList<QNetworkAccessManager*> held;
        for (int i = 0; i < 3; ++i)
            held << pool.acquire();
        for (QNetworkAccessManager* nam : held)
            pool.release(nam);
        QCOMPARE(pool.idleCount(), 3);

        pool.resize(1);
        QCOMPARE(pool.capacity(), 1);
        QCOMPARE(pool.idleCount(), 1);

        QNetworkAccessManager* busy = pool.acquire();
        pool.clear();
        QCOMPARE(pool.idleCount(), 0);
        QCOMPARE(pool.activeCount(), 1);
        pool.release(busy);
        QCOMPARE(pool.idleCount(), 1);
    }

    void testForeignManagerIsRetired() {
        ConnectionPool pool;
        QPointer<QNetworkAccessManager> stranger = new QNetworkAccessManager;
        pool.release(stranger);
        QCOMPARE(pool.idleCount(), 0);
        QTRY_VERIFY(stranger.isNull());
    }
};

QTEST_MAIN(TestConnectionPool)
#include "tst_connection_pool.moc"

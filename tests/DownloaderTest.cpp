#include <QtTest>

#include <QCryptographicHash>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "support/httpstub.hpp"

#ifndef Q_MOC_RUN
import theboys.backend.downloader;
import theboys.backend.updateerror;
#endif

namespace {
QString sha256Of(const QByteArray& data)
{
    return QString::fromLatin1(QCryptographicHash::hash(data, QCryptographicHash::Sha256).toHex());
}

QByteArray readAll(const QString& path)
{
    QFile file(path);
    return file.open(QIODevice::ReadOnly) ? file.readAll() : QByteArray();
}

QStringList leftovers(const QString& dirPath)
{
    return QDir(dirPath).entryList(QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot);
}
}

class DownloaderTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void fetch_retriesUntilServerRecovers()
    {
        const QByteArray payload = QByteArray(200000, 'x') + QByteArrayLiteral("tail");
        HttpStub server;
        server.enqueue(QStringLiteral("/launcher"), 500, QByteArrayLiteral("boom"));
        server.enqueue(QStringLiteral("/launcher"), 502, QByteArrayLiteral("boom"));
        server.enqueue(QStringLiteral("/launcher"), 200, payload);

        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString dest = dir.filePath(QStringLiteral("launcher.bin"));

        Downloader downloader;
        downloader.setBaseDelay(10);
        UpdateError error;
        QVERIFY2(downloader.fetch(server.url(QStringLiteral("/launcher")), sha256Of(payload), dest, 3, &error),
                 qPrintable(error.message));
        QCOMPARE(downloader.lastAttemptCount(), 3);
        QCOMPARE(server.hits(QStringLiteral("/launcher")), 3);
        QCOMPARE(Downloader::fileSha256Hex(dest), sha256Of(payload));
        QCOMPARE(downloader.lastSha256(), sha256Of(payload));
        QCOMPARE(leftovers(dir.path()), QStringList{QStringLiteral("launcher.bin")});
    }

    void fetch_treatsHashMismatchAsRetryableFailure()
    {
        const QByteArray good = QByteArrayLiteral("the real build");
        HttpStub server;
        server.enqueue(QStringLiteral("/launcher"), 200, QByteArrayLiteral("truncated"));
        server.enqueue(QStringLiteral("/launcher"), 200, good);

        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString dest = dir.filePath(QStringLiteral("launcher.bin"));

        Downloader downloader;
        downloader.setBaseDelay(0);
        QVERIFY(downloader.fetch(server.url(QStringLiteral("/launcher")), sha256Of(good), dest));
        QCOMPARE(downloader.lastAttemptCount(), 2);
        QCOMPARE(readAll(dest), good);
    }

    void fetch_failsAfterBudgetAndLeavesNothingBehind()
    {
        HttpStub server;
        server.enqueue(QStringLiteral("/launcher"), 200, QByteArrayLiteral("always wrong"));

        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString dest = dir.filePath(QStringLiteral("launcher.bin"));

        Downloader downloader;
        downloader.setBaseDelay(0);
        UpdateError error;
        QVERIFY(!downloader.fetch(server.url(QStringLiteral("/launcher")), sha256Of(QByteArrayLiteral("expected")), dest, 3, &error));
        QCOMPARE(error.kind, ErrorKind::DownloadFailed);
        QVERIFY(error.message.contains(QStringLiteral("Hash mismatch")));
        QCOMPARE(server.hits(QStringLiteral("/launcher")), 3);
        QVERIFY(leftovers(dir.path()).isEmpty());
    }

    void fetch_keepsExistingDestinationOnFailure()
    {
        HttpStub server;
        server.enqueue(QStringLiteral("/launcher"), 404, QByteArrayLiteral("gone"));

        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString dest = dir.filePath(QStringLiteral("launcher.bin"));
        {
            QFile existing(dest);
            QVERIFY(existing.open(QIODevice::WriteOnly));
            existing.write("previous");
        }

        Downloader downloader;
        downloader.setBaseDelay(0);
        QVERIFY(!downloader.fetch(server.url(QStringLiteral("/launcher")), QString(), dest, 2));
        QCOMPARE(readAll(dest), QByteArrayLiteral("previous"));
        QCOMPARE(leftovers(dir.path()), QStringList{QStringLiteral("launcher.bin")});
    }

    void fetch_timesOutAndRetries()
    {
        const QByteArray payload = QByteArrayLiteral("late but fine");
        HttpStub server;
        server.enqueueHang(QStringLiteral("/launcher"));
        server.enqueue(QStringLiteral("/launcher"), 200, payload);

        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString dest = dir.filePath(QStringLiteral("launcher.bin"));

        Downloader downloader;
        downloader.setTimeout(300);
        downloader.setBaseDelay(0);
        QVERIFY(downloader.fetch(server.url(QStringLiteral("/launcher")), QString(), dest, 2));
        QCOMPARE(downloader.lastAttemptCount(), 2);
        QCOMPARE(readAll(dest), payload);
    }

    void fetch_rejectsInvalidUrl()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        UpdateError error;
        QVERIFY(!Downloader().fetch(QUrl(), QString(), dir.filePath(QStringLiteral("x")), 3, &error));
        QCOMPARE(error.kind, ErrorKind::DownloadFailed);
    }
};

QTEST_GUILESS_MAIN(DownloaderTest)
#include "DownloaderTest.moc"

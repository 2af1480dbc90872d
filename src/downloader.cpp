module;
#include <QByteArray>
#include <QByteArrayView>
#include <QCryptographicHash>
#include <QDir>
#include <QEventLoop>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QObject>
#include <QSaveFile>
#include <QScopedPointer>
#include <QString>
#include <QTimer>
#include <QUrl>

#include <algorithm>

module theboys.backend.downloader;

import theboys.backend.httpsupport;
import theboys.backend.logging;
import theboys.backend.updateerror;

void Downloader::setTimeout(int timeoutMs)
{
    m_timeoutMs = std::max(1, timeoutMs);
}

void Downloader::setBaseDelay(int baseDelayMs)
{
    m_baseDelayMs = std::max(0, baseDelayMs);
}

bool Downloader::fetch(const QUrl& url,
                       const QString& expectedSha256,
                       const QString& destPath,
                       int attempts,
                       UpdateError *error)
{
    m_lastSha256.clear();
    m_lastAttemptCount = 0;

    if (!url.isValid() || url.isEmpty()) {
        setError(error, ErrorKind::DownloadFailed, QStringLiteral("Download URL is invalid."));
        return false;
    }
    if (!QDir().mkpath(QFileInfo(destPath).absolutePath())) {
        setError(error, ErrorKind::DownloadFailed,
                 QStringLiteral("Could not create download directory for %1.").arg(destPath));
        return false;
    }

    const int budget = std::max(1, attempts);
    const QString expected = expectedSha256.trimmed().toLower();
    QString lastError;
    int delayMs = m_baseDelayMs;

    for (int i = 1; i <= budget; ++i) {
        m_lastAttemptCount = i;
        qCInfo(lcDownload).noquote()
            << QStringLiteral("[Downloader] Downloading %1 (attempt %2/%3)").arg(url.toString()).arg(i).arg(budget);

        if (attempt(url, expected, destPath, &lastError)) {
            qCInfo(lcDownload).noquote()
                << QStringLiteral("[Downloader] Saved %1 (sha256 %2)").arg(destPath, m_lastSha256);
            return true;
        }

        qCWarning(lcDownload).noquote()
            << QStringLiteral("[Downloader] Attempt %1 failed: %2").arg(i).arg(lastError);
        if (i < budget) {
            backOff(delayMs);
            delayMs *= 2;
        }
    }

    setError(error, ErrorKind::DownloadFailed,
             QStringLiteral("Download failed after %1 attempt(s): %2").arg(budget).arg(lastError));
    return false;
}

QString Downloader::lastSha256() const
{
    return m_lastSha256;
}

int Downloader::lastAttemptCount() const
{
    return m_lastAttemptCount;
}

QString Downloader::fileSha256Hex(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }

    QCryptographicHash hash(QCryptographicHash::Sha256);
    QByteArray buffer;
    buffer.resize(1024 * 1024);
    while (!file.atEnd()) {
        const qint64 readBytes = file.read(buffer.data(), buffer.size());
        if (readBytes < 0) {
            return {};
        }
        if (readBytes > 0) {
            hash.addData(QByteArrayView(buffer.constData(), static_cast<qsizetype>(readBytes)));
        }
    }
    return QString::fromLatin1(hash.result().toHex());
}

bool Downloader::attempt(const QUrl& url, const QString& expectedSha256, const QString& destPath, QString *errorMessage)
{
    QSaveFile file(destPath);
    if (!file.open(QIODevice::WriteOnly)) {
        *errorMessage = QStringLiteral("Failed to create temporary file for %1.").arg(destPath);
        return false;
    }

    QCryptographicHash hash(QCryptographicHash::Sha256);
    bool writeFailed = false;

    QScopedPointer<QNetworkReply, QScopedPointerDeleteLater> reply(
        m_networkManager.get(makeRequest(url, QStringLiteral("Downloader"), m_timeoutMs)));
    QNetworkReply *rawReply = reply.data();

    const auto drain = [&]() {
        if (writeFailed || !rawReply->isOpen()) {
            return;
        }
        const QByteArray chunk = rawReply->readAll();
        if (chunk.isEmpty()) {
            return;
        }
        hash.addData(chunk);
        if (file.write(chunk) != chunk.size()) {
            writeFailed = true;
            rawReply->abort();
        }
    };
    QObject::connect(rawReply, &QNetworkReply::readyRead, rawReply, drain);

    const bool timedOut = waitForReply(rawReply, m_timeoutMs);
    drain();

    const int statusCode = httpStatus(rawReply);
    if (timedOut) {
        file.cancelWriting();
        *errorMessage = QStringLiteral("Timed out after %1 ms.").arg(m_timeoutMs);
        return false;
    }
    if (writeFailed) {
        file.cancelWriting();
        *errorMessage = QStringLiteral("Failed to write downloaded data.");
        return false;
    }
    if (rawReply->error() != QNetworkReply::NoError) {
        file.cancelWriting();
        *errorMessage = statusCode != 0
            ? QStringLiteral("HTTP %1").arg(statusCode)
            : rawReply->errorString().trimmed();
        return false;
    }
    if (statusCode != 0 && (statusCode < 200 || statusCode >= 300)) {
        file.cancelWriting();
        *errorMessage = QStringLiteral("HTTP %1").arg(statusCode);
        return false;
    }

    const QString actual = QString::fromLatin1(hash.result().toHex());
    if (!expectedSha256.isEmpty() && actual != expectedSha256) {
        file.cancelWriting();
        *errorMessage = QStringLiteral("Hash mismatch (expected %1, got %2).").arg(expectedSha256, actual);
        return false;
    }

    if (!file.commit()) {
        *errorMessage = QStringLiteral("Failed to move download into place: %1").arg(file.errorString());
        return false;
    }

    m_lastSha256 = actual;
    return true;
}

void Downloader::backOff(int delayMs)
{
    if (delayMs <= 0) {
        return;
    }
    QEventLoop loop;
    QTimer::singleShot(delayMs, &loop, &QEventLoop::quit);
    loop.exec();
}

/*!
 * @file        downloader.cppm
 * @brief       Retrying artifact downloader with integrity check.
 *
 * @details
 * Each attempt streams the response body into a `QSaveFile` beside the
 * destination while hashing it with SHA-256. The destination only appears
 * once an attempt completes and its hash matches; failed attempts discard
 * their temporary file. Attempts are separated by an exponential back-off.
 *
 * @copyright   Copyright (c) 2026 TheBoys.
 * @license     See LICENSE in repository root.
 */

module;
#include <QNetworkAccessManager>
#include <QString>
#include <QUrl>

#ifndef Q_MOC_RUN
export module theboys.backend.downloader;
import theboys.backend.updateerror;
#endif

/**
 * @class Downloader
 * @brief Fetches binary artifacts over HTTP(S).
 */
export class Downloader
{
public:
    static constexpr int kDefaultAttempts = 3;
    static constexpr int kDefaultTimeoutMs = 120000;
    static constexpr int kDefaultBaseDelayMs = 1000;

    Downloader() = default;

    /**
     * @brief Set the overall deadline of one attempt.
     * @param timeoutMs Milliseconds.
     */
    void setTimeout(int timeoutMs);

    /**
     * @brief Set the back-off delay before the second attempt.
     * @param baseDelayMs Milliseconds, doubled for every further attempt.
     */
    void setBaseDelay(int baseDelayMs);

    /**
     * @brief Download `url` to `destPath`.
     *
     * @details
     * A hash mismatch counts as a failed attempt and is retried. After the
     * last failed attempt `error` receives `DownloadFailed` and
     * `destPath` is left untouched.
     *
     * @param url Source URL.
     * @param expectedSha256 Hex digest to verify, empty to skip.
     * @param destPath Final file path.
     * @param attempts Attempt budget, at least one.
     * @param error Optional output on failure.
     * @return True when `destPath` holds a verified copy.
     */
    bool fetch(const QUrl& url,
               const QString& expectedSha256,
               const QString& destPath,
               int attempts = kDefaultAttempts,
               UpdateError *error = nullptr);

    /**
     * @brief SHA-256 of the last successful download.
     * @return Lower-case hex digest.
     */
    QString lastSha256() const;

    /**
     * @brief Number of attempts used by the last `fetch`.
     * @return Attempt count.
     */
    int lastAttemptCount() const;

    /**
     * @brief Compute SHA-256 of a file.
     * @param path File path.
     * @return Lower-case hex digest, empty on read failure.
     */
    static QString fileSha256Hex(const QString& path);

private:
    /**
     * @brief Run one download attempt into a save file.
     * @param url Source URL.
     * @param expectedSha256 Digest to verify, empty to skip.
     * @param destPath Final file path.
     * @param errorMessage Output failure cause.
     * @return True when the file was committed.
     */
    bool attempt(const QUrl& url, const QString& expectedSha256, const QString& destPath, QString *errorMessage);

    /**
     * @brief Wait without blocking queued network events.
     * @param delayMs Milliseconds.
     */
    static void backOff(int delayMs);

    int m_timeoutMs = kDefaultTimeoutMs;
    int m_baseDelayMs = kDefaultBaseDelayMs;
    int m_lastAttemptCount = 0;
    QString m_lastSha256;
    QNetworkAccessManager m_networkManager;
};

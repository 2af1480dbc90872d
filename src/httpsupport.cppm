/*!
 * @file        httpsupport.cppm
 * @brief       Blocking request helpers shared by the network components.
 *
 * @details
 * The update flow runs as one foreground sequence, so metadata checks and
 * downloads wait for their reply in a local event loop bounded by an
 * overall deadline. On expiry the reply is aborted and the caller receives
 * a retryable failure instead of hanging.
 *
 * @copyright   Copyright (c) 2026 TheBoys.
 * @license     See LICENSE in repository root.
 */

module;
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QString>
#include <QUrl>

export module theboys.backend.httpsupport;

/**
 * @brief User agent sent with every launcher request.
 * @param component Component name (`Updater`, `Downloader`, ...).
 * @return Header value such as `TheBoys-Updater/1.3.0`.
 */
export QByteArray userAgent(const QString& component);

/**
 * @brief Build a GET request with redirect policy, user agent and timeout.
 * @param url Target URL.
 * @param component Component name for the user agent.
 * @param timeoutMs Transfer timeout in milliseconds.
 * @return Configured request.
 */
export QNetworkRequest makeRequest(const QUrl& url, const QString& component, int timeoutMs);

/**
 * @brief Wait for `reply` to finish or the deadline to pass.
 * @param reply Reply in flight; aborted when the deadline passes.
 * @param timeoutMs Overall deadline in milliseconds.
 * @return True when the deadline expired.
 */
export bool waitForReply(QNetworkReply *reply, int timeoutMs);

/**
 * @brief HTTP status of a finished reply.
 * @param reply Finished reply.
 * @return Status code, 0 for non-HTTP schemes.
 */
export int httpStatus(const QNetworkReply *reply);

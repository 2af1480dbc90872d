/*!
 * @file        logging.cppm
 * @brief       Logging categories and log file sink for TheBoysLauncher.
 *
 * @details
 * Declares one Qt logging category per backend component and exposes the
 * helpers used by the application to mirror log output into
 * `logs/latest.log` under the data directory.
 *
 * @copyright   Copyright (c) 2026 TheBoys.
 * @license     See LICENSE in repository root.
 */

module;
#include <QLoggingCategory>
#include <QString>

export module theboys.backend.logging;

export const QLoggingCategory& lcVersion();
export const QLoggingCategory& lcInstall();
export const QLoggingCategory& lcSettings();
export const QLoggingCategory& lcRelease();
export const QLoggingCategory& lcDownload();
export const QLoggingCategory& lcUpdate();
export const QLoggingCategory& lcMigration();
export const QLoggingCategory& lcPlatform();

/**
 * @brief Enable or disable debug output for all launcher categories.
 * @param debugEnabled Persisted `debugEnabled` setting.
 */
export void applyLogFilter(bool debugEnabled);

/**
 * @brief Start mirroring Qt messages into `<logDirectory>/latest.log`.
 *
 * @details
 * An existing `latest.log` is rotated to `previous.log` first. The console
 * handler stays active.
 *
 * @param logDirectory Directory that receives the log files.
 * @param errorMessage Optional output message on failure.
 * @return True when the log file is open.
 */
export bool installFileLogSink(const QString& logDirectory, QString *errorMessage = nullptr);

/**
 * @brief Stop mirroring and close the log file.
 */
export void removeFileLogSink();

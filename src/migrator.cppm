/*!
 * @file        migrator.cppm
 * @brief       One-time migration of a legacy portable layout.
 *
 * @details
 * Older launcher builds kept their data (instances, configuration, the
 * Prism runtime, utilities and logs) beside the executable. The migrator
 * copies that tree into the canonical data directory exactly once:
 *
 * 1. detect the legacy entries and the absence of the completion marker;
 * 2. back up the whole legacy tree before anything else happens;
 * 3. copy the entries, never overwriting existing destination files
 *    (linked directories are copied through their targets);
 * 4. verify each top-level entry arrived;
 * 5. write the completion marker atomically.
 *
 * The legacy tree is only ever read. Files that already exist in the data
 * directory with different content are kept and reported as conflicts.
 *
 * @copyright   Copyright (c) 2026 TheBoys.
 * @license     See LICENSE in repository root.
 */

module;
#include <QDateTime>
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module theboys.backend.migrator;
import theboys.backend.updateerror;
#endif

/**
 * @enum MigrationStatus
 * @brief Where an installation stands with respect to migration.
 */
export enum class MigrationStatus
{
    NotNeeded,
    Pending,
    InProgress,
    Completed,
    Failed
};

/**
 * @struct MigrationState
 * @brief Transient migration state; only the marker file is durable.
 */
export struct MigrationState
{
    MigrationStatus status = MigrationStatus::NotNeeded;
    QString backupPath;
    QDateTime completedAt;

    QString statusName() const;
};

/**
 * @struct LegacyInstallInfo
 * @brief What a legacy portable installation contains.
 */
export struct LegacyInstallInfo
{
    QString rootPath;
    QStringList entries;     //!< Legacy top-level entries present.
    QStringList instances;   //!< Instance directory names.
    QStringList configFiles; //!< Files directly under `config/`.
    qint64 totalSize = 0;
    QDateTime lastModified;
    QString legacyVersion;   //!< "unknown" when not recorded.
    bool migrationRequired = false;
};

/**
 * @struct MigrationResult
 * @brief Outcome of one migration run.
 */
export struct MigrationResult
{
    MigrationState state;
    QStringList migratedEntries;
    int copiedFiles = 0;
    int identicalFiles = 0;  //!< Already present with the same content.
    QStringList conflicts;   //!< Relative paths kept at the destination.
};

/**
 * @class Migrator
 * @brief Moves a legacy portable installation into the data directory.
 */
export class Migrator
{
public:
    /**
     * @brief Construct a migrator.
     * @param legacyRoot Directory holding the legacy layout (the executable's folder).
     * @param dataDirectory Canonical data directory.
     */
    Migrator(const QString& legacyRoot, const QString& dataDirectory);

    /**
     * @brief Directory under which the backup folder is created.
     * @param path Backup root; defaults to the system temporary directory.
     */
    void setBackupRoot(const QString& path);
    QString backupRoot() const;

    QString markerPath() const;

    /**
     * @brief Current state without changing anything on disk.
     * @return NotNeeded, Pending or Completed.
     */
    MigrationState detect() const;

    /**
     * @brief Describe the legacy installation.
     * @return Entry, size and version details.
     */
    LegacyInstallInfo inspect() const;

    /**
     * @brief Migrate when pending; otherwise report the current state.
     * @param error Receives `MigrationFailed` on failure.
     * @return Result of the run.
     */
    MigrationResult run(UpdateError *error = nullptr);

    //! Top-level names that belong to a legacy layout.
    static QStringList legacyEntries();

    //! Entries whose presence marks a legacy layout.
    static QStringList legacyIndicators();

    static QString markerFileName();

private:
    bool isSameLocation() const;
    bool backUp(QString *backupPath, QString *errorMessage) const;
    bool copyEntries(const QStringList& entries, MigrationResult *result, QString *errorMessage) const;
    bool verify(const QStringList& entries, QString *errorMessage) const;
    bool writeMarker(const MigrationResult& result, const QString& legacyVersion, QString *errorMessage) const;
    QString detectLegacyVersion() const;

    QString m_legacyRoot;
    QString m_dataDirectory;
    QString m_backupRoot;
};

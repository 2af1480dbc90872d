/*!
 * @file        updateapplier.cppm
 * @brief       Installs a downloaded launcher build over the running one.
 *
 * @details
 * The applier never exposes a half-written executable. A new build is first
 * staged beside the target (`<target>.staged`), verified, and given the
 * original file's permissions. Only then is it promoted:
 *
 * - where the platform allows replacing a running executable the staged
 *   file is renamed over the target, with a backup kept until the promoted
 *   file verifies;
 * - elsewhere a job file is written and `TheBoysUpdater` performs the
 *   replace-and-relaunch once this process has exited.
 *
 * @copyright   Copyright (c) 2026 TheBoys.
 * @license     See LICENSE in repository root.
 */

module;
#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QUrl>

#include <optional>

#ifndef Q_MOC_RUN
export module theboys.backend.updateapplier;
import theboys.backend.downloader;
import theboys.backend.installationprobe;
import theboys.backend.platform;
import theboys.backend.updateerror;
#endif

/**
 * @enum ApplyState
 * @brief Progress of one update installation.
 */
export enum class ApplyState
{
    Idle,
    Downloading,
    Verifying,
    Staged,
    Applying,
    Applied,
    RolledBack  //!< Promotion failed; the original executable is intact.
};

/**
 * @enum ApplyOutcome
 * @brief How a successful installation completed.
 */
export enum class ApplyOutcome
{
    AppliedInPlace,          //!< The target now holds the new build.
    StagedForExternalRestart //!< The helper finishes after this process exits.
};

/**
 * @struct HelperStatus
 * @brief Result left behind by the updater helper.
 */
export struct HelperStatus
{
    bool ok = false;
    QString message;
    QDateTime finishedAt;
};

/**
 * @brief Human-readable name of an apply state.
 * @param state State.
 * @return Name such as "Staged".
 */
export QString applyStateName(ApplyState state);

/**
 * @class UpdateApplier
 * @brief Stages, verifies and promotes a new launcher executable.
 */
export class UpdateApplier
{
public:
    /**
     * @brief Construct an applier.
     * @param platform Platform capabilities; must outlive the applier.
     * @param mode Installation mode of the running launcher.
     * @param dataDirectory Canonical data directory (downloads and jobs).
     */
    UpdateApplier(PlatformBackend& platform, InstallMode mode, const QString& dataDirectory);

    /**
     * @brief Override the executable to replace.
     * @param path Target path; defaults to the platform's executable path.
     */
    void setTargetPath(const QString& path);
    QString targetPath() const;

    /**
     * @brief Override the helper executable used for external restarts.
     * @param path Helper path; defaults to `TheBoysUpdater` beside the target.
     */
    void setHelperPath(const QString& path);
    QString helperPath() const;

    /**
     * @brief Arguments passed to the relaunched launcher.
     * @param arguments Argument list.
     */
    void setRelaunchArguments(const QStringList& arguments);

    /**
     * @brief Download and install a build.
     * @param url Artifact URL.
     * @param expectedSha256 Published digest, empty when unknown.
     * @param downloader Downloader to use.
     * @param error Optional output on failure.
     * @return Outcome on success.
     */
    std::optional<ApplyOutcome> install(const QUrl& url,
                                        const QString& expectedSha256,
                                        Downloader& downloader,
                                        UpdateError *error = nullptr);

    /**
     * @brief Install an artifact already present on disk.
     * @param artifactPath Downloaded build.
     * @param expectedSha256 Digest the build must match, empty to trust the file.
     * @param error Optional output on failure.
     * @return Outcome on success.
     */
    std::optional<ApplyOutcome> apply(const QString& artifactPath,
                                      const QString& expectedSha256,
                                      UpdateError *error = nullptr);

    ApplyState state() const;

    /**
     * @brief Job file written by the last external-restart hand-off.
     * @return Path, empty when none was written.
     */
    QString lastJobPath() const;

    /**
     * @brief Check whether the target directory accepts new files.
     * @param error Receives `ElevationRequired` (installed) or `ApplyFailed`.
     * @return True when writable.
     */
    bool checkTargetWritable(UpdateError *error = nullptr) const;

    /**
     * @brief Read and delete the helper's status files.
     * @param dataDirectory Canonical data directory.
     * @param error Receives `ParseError` when the newest status is unreadable.
     * @return Newest status, or nullopt when none could be read.
     */
    static std::optional<HelperStatus> consumePendingStatus(const QString& dataDirectory,
                                                            UpdateError *error = nullptr);

    static QString updatesDirectory(const QString& dataDirectory);
    static QString stagedPathFor(const QString& targetPath);
    static QString backupPathFor(const QString& targetPath);

private:
    bool stage(const QString& artifactPath, const QString& expectedSha256, UpdateError *error);
    std::optional<ApplyOutcome> promoteInPlace(const QString& sha256, UpdateError *error);
    std::optional<ApplyOutcome> handOffToHelper(const QString& sha256, UpdateError *error);
    void fail(ApplyState state, UpdateError *error, ErrorKind kind, const QString& message);

    PlatformBackend& m_platform;
    InstallMode m_mode;
    QString m_dataDirectory;
    QString m_targetPath;
    QString m_helperPath;
    QStringList m_relaunchArguments;
    QString m_lastJobPath;
    ApplyState m_state = ApplyState::Idle;
};

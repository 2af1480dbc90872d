/*!
 * @file        platform.cppm
 * @brief       Per-OS capability interface for TheBoysLauncher.
 *
 * @details
 * Every operating-system difference the update and migration backend
 * depends on lives behind `PlatformBackend`: registration lookup, data
 * directory layout, physical memory, replacing a running executable,
 * atomic file replacement and executable attributes. One implementation
 * per OS is selected at startup by `createPlatformBackend()`; the other
 * components never branch on the OS themselves.
 *
 * @copyright   Copyright (c) 2026 TheBoys.
 * @license     See LICENSE in repository root.
 */

module;
#include <QFileDevice>
#include <QString>
#include <QStringList>
#include <QtTypes>

#include <memory>

export module theboys.backend.platform;

//! Application name used for directories, registry keys and assets.
export inline const QString kApplicationName = QStringLiteral("TheBoysLauncher");

/**
 * @enum FileOpStatus
 * @brief Outcome of a file-system mutation.
 */
export enum class FileOpStatus
{
    Ok,               //!< Operation succeeded.
    PermissionDenied, //!< OS refused for lack of write permission.
    Failed            //!< Any other I/O failure.
};

/**
 * @class PlatformBackend
 * @brief Capability interface implemented once per operating system.
 */
export class PlatformBackend
{
public:
    virtual ~PlatformBackend() = default;

    /**
     * @brief Short OS identifier (`windows`, `macos`, `linux`).
     * @return OS name.
     */
    virtual QString osName() const = 0;

    /**
     * @brief Absolute path of the running executable.
     * @return Executable path.
     */
    virtual QString executablePath() const;

    /**
     * @brief Whether the executable directory is a registered installation.
     *
     * @details
     * Windows consults the per-user registration entry; macOS and Linux
     * check for a known system application location.
     *
     * @param executableDir Directory containing the executable.
     * @return True for installed mode.
     */
    virtual bool isRegisteredInstall(const QString& executableDir) const = 0;

    /**
     * @brief Fixed per-user data directory.
     * @return Absolute directory path.
     */
    virtual QString userDataDirectory() const = 0;

    /**
     * @brief Whether portable mode keeps data beside the executable.
     * @return True on Windows.
     */
    virtual bool portableDataBesideExecutable() const = 0;

    /**
     * @brief Total physical memory.
     * @return Megabytes, 8192 when detection fails.
     */
    virtual qint64 totalMemoryMB() const = 0;

    /**
     * @brief Whether a running executable may be renamed over in place.
     * @return False when the OS locks in-use binaries.
     */
    virtual bool canReplaceRunningExecutable() const = 0;

    /**
     * @brief Atomically move `sourcePath` onto `targetPath`.
     * @param sourcePath Existing file, same volume as target.
     * @param targetPath Destination, replaced when present.
     * @param errorMessage Optional output message on failure.
     * @return Operation status.
     */
    virtual FileOpStatus replaceFile(const QString& sourcePath, const QString& targetPath, QString *errorMessage);

    /**
     * @brief Apply executable permissions and platform attributes.
     * @param path File to update.
     * @param permissions Mode bits copied from the original executable.
     * @param errorMessage Optional output message on failure.
     * @return True on success.
     */
    virtual bool applyExecutableAttributes(const QString& path, QFileDevice::Permissions permissions, QString *errorMessage);

    /**
     * @brief Release asset name published for this platform.
     * @return Asset file name.
     */
    virtual QString updateAssetName() const = 0;

    /**
     * @brief Whether `path` equals or lies below one of `roots`.
     * @param path Absolute path.
     * @param roots Candidate root directories.
     * @return True when contained.
     */
    static bool isPathWithin(const QString& path, const QStringList& roots);

protected:
    /**
     * @brief Utility to set output error text.
     * @param errorMessage Optional output pointer.
     * @param message Error message.
     */
    static void setError(QString *errorMessage, const QString& message);
};

/**
 * @brief Create the backend for the operating system being run on.
 * @return Owned backend instance.
 */
export std::unique_ptr<PlatformBackend> createPlatformBackend();

/*!
 * @file        installationprobe.cppm
 * @brief       Installation mode detection for TheBoysLauncher.
 *
 * @details
 * Decides on every start whether the launcher runs installed or portable
 * and which directory holds its data. The result is never persisted: an
 * installer or the user may change the install state between runs.
 *
 * `THEBOYS_DATA_DIR`, when set, forces the data directory ahead of any
 * detection.
 *
 * @copyright   Copyright (c) 2026 TheBoys.
 * @license     See LICENSE in repository root.
 */

module;
#include <QString>

#ifndef Q_MOC_RUN
export module theboys.backend.installationprobe;
import theboys.backend.platform;
#endif

//! Environment variable overriding the canonical data directory.
export inline constexpr char kDataDirOverrideEnv[] = "THEBOYS_DATA_DIR";

/**
 * @enum InstallMode
 * @brief How the running binary is deployed.
 */
export enum class InstallMode
{
    Portable,  //!< Unregistered, data beside the executable or per-user.
    Installed  //!< Registered or placed in a system application location.
};

/**
 * @struct InstallationRecord
 * @brief Result of one installation probe.
 */
export struct InstallationRecord {
    InstallMode mode = InstallMode::Portable; //!< Detected mode.
    QString rootPath;                         //!< Directory containing the executable.
    QString dataPath;                         //!< Canonical data directory.
    bool dataPathOverridden = false;          //!< True when the environment override applied.

    /**
     * @brief Mode label for logs.
     * @return `installed` or `portable`.
     */
    QString modeName() const;
};

/**
 * @class InstallationProbe
 * @brief Side-effect free installation detection.
 */
export class InstallationProbe
{
public:
    /**
     * @brief Construct a probe over a platform backend.
     * @param platform Backend answering the OS-specific questions.
     */
    explicit InstallationProbe(const PlatformBackend& platform);

    /**
     * @brief Detect mode and data directory.
     * @return Fresh installation record.
     */
    InstallationRecord probe() const;

    /**
     * @brief Resolve only the canonical data directory.
     * @return Data directory path.
     */
    QString dataDirectory() const;

private:
    const PlatformBackend& m_platform;
};

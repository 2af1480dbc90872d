/*!
 * @file        selfupdater.cppm
 * @brief       Update check, installation and channel switching.
 *
 * @details
 * Ties the release feed, the downloader and the applier together. The
 * channel consulted follows the persisted dev-builds preference. A launcher
 * built without a numeric version ("dev") never updates itself except
 * through an explicit channel switch.
 *
 * @copyright   Copyright (c) 2026 TheBoys.
 * @license     See LICENSE in repository root.
 */

module;
#include <QString>

#include <optional>

#ifndef Q_MOC_RUN
export module theboys.backend.selfupdater;
import theboys.backend.downloader;
import theboys.backend.releaseclient;
import theboys.backend.settingsstore;
import theboys.backend.updateapplier;
import theboys.backend.updateerror;
import theboys.backend.versionmodel;
#endif

/**
 * @struct UpdateCheck
 * @brief Result of comparing the running build with its channel.
 */
export struct UpdateCheck {
    ReleaseChannel channel = ReleaseChannel::Stable;
    Version current;
    std::optional<ReleaseInfo> latest;
    bool updateAvailable = false;
    bool skipped = false;  //!< Unversioned build; no check performed.
};

/**
 * @struct ChannelSwitch
 * @brief Result of a successful channel switch.
 */
export struct ChannelSwitch {
    Settings settings;        //!< Persisted settings after the switch.
    ReleaseInfo installed;    //!< Release that was installed.
    ApplyOutcome outcome = ApplyOutcome::AppliedInPlace;
    bool fellBackToStable = false;
};

/**
 * @class SelfUpdater
 * @brief Keeps the launcher executable current.
 */
export class SelfUpdater
{
public:
    static constexpr int kDefaultCheckTimeoutMs = 12000;

    /**
     * @brief Construct the updater; all collaborators must outlive it.
     */
    SelfUpdater(ReleaseClient& releaseClient,
                Downloader& downloader,
                UpdateApplier& applier,
                const SettingsStore& settingsStore,
                const QString& dataDirectory);

    void setCheckTimeout(int timeoutMs);

    /**
     * @brief Channel selected by the settings.
     * @param settings Current settings.
     * @return Dev when dev builds are enabled.
     */
    static ReleaseChannel channelFor(const Settings& settings);

    /**
     * @brief Look for a newer release on the settings' channel.
     * @param current Running version.
     * @param settings Current settings.
     * @param error Optional output, `UpdateCheckFailed` on failure.
     * @return Check result, empty on failure.
     */
    std::optional<UpdateCheck> checkForUpdate(const Version& current,
                                              const Settings& settings,
                                              UpdateError *error = nullptr);

    /**
     * @brief Install a release regardless of its version.
     * @param release Release to install.
     * @param error Optional output on failure.
     * @return Outcome on success.
     */
    std::optional<ApplyOutcome> installRelease(const ReleaseInfo& release, UpdateError *error = nullptr);

    /**
     * @brief Change the dev-builds preference and install that channel's build.
     *
     * @details
     * The target channel must be reachable before the preference changes.
     * The channel's newest build is installed even when it is older than the
     * running one. When installing a dev build fails the switch falls back to
     * stable; when that fails too the previous preference is restored.
     *
     * @param settings Current settings.
     * @param enableDevBuilds Target preference.
     * @param error Optional output on failure.
     * @return Switch result, empty on failure.
     */
    std::optional<ChannelSwitch> switchChannel(const Settings& settings,
                                               bool enableDevBuilds,
                                               UpdateError *error = nullptr);

private:
    std::optional<ReleaseInfo> fetchChannel(ReleaseChannel channel, UpdateError *error);
    bool persist(const Settings& settings, UpdateError *error) const;

    ReleaseClient& m_releaseClient;
    Downloader& m_downloader;
    UpdateApplier& m_applier;
    const SettingsStore& m_settingsStore;
    QString m_dataDirectory;
    int m_checkTimeoutMs = kDefaultCheckTimeoutMs;
};

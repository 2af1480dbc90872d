module;
#include <QLoggingCategory>
#include <QString>
#include <QUrl>

#include <algorithm>
#include <optional>

module theboys.backend.selfupdater;

import theboys.backend.downloader;
import theboys.backend.logging;
import theboys.backend.releaseclient;
import theboys.backend.settingsstore;
import theboys.backend.updateapplier;
import theboys.backend.updateerror;
import theboys.backend.versionmodel;

SelfUpdater::SelfUpdater(ReleaseClient& releaseClient,
                         Downloader& downloader,
                         UpdateApplier& applier,
                         const SettingsStore& settingsStore,
                         const QString& dataDirectory)
    : m_releaseClient(releaseClient)
    , m_downloader(downloader)
    , m_applier(applier)
    , m_settingsStore(settingsStore)
    , m_dataDirectory(dataDirectory)
{
}

void SelfUpdater::setCheckTimeout(int timeoutMs)
{
    m_checkTimeoutMs = std::max(1, timeoutMs);
}

ReleaseChannel SelfUpdater::channelFor(const Settings& settings)
{
    return settings.devBuildsEnabled ? ReleaseChannel::Dev : ReleaseChannel::Stable;
}

std::optional<UpdateCheck> SelfUpdater::checkForUpdate(const Version& current,
                                                       const Settings& settings,
                                                       UpdateError *error)
{
    UpdateCheck check;
    check.channel = channelFor(settings);
    check.current = current;

    if (!current.numeric) {
        check.skipped = true;
        qCInfo(lcUpdate).noquote()
            << QStringLiteral("[Updater] Development build %1, skipping update check").arg(current.toString());
        return check;
    }

    UpdateError fetchError;
    check.latest = m_releaseClient.fetchLatest(check.channel, m_checkTimeoutMs, &fetchError);
    if (fetchError.isError()) {
        if (error != nullptr) {
            *error = fetchError;
        }
        return std::nullopt;
    }

    if (!check.latest.has_value()) {
        qCInfo(lcUpdate).noquote()
            << QStringLiteral("[Updater] No %1 release published for this platform")
                   .arg(releaseChannelName(check.channel));
        return check;
    }

    check.updateAvailable = VersionModel::isNewer(current, check.latest->version);
    qCInfo(lcUpdate).noquote()
        << (check.updateAvailable
                ? QStringLiteral("[Updater] Update available: %1 -> %2")
                      .arg(current.toString(), check.latest->version.toString())
                : QStringLiteral("[Updater] Up to date (%1, latest %2)")
                      .arg(current.toString(), check.latest->version.toString()));
    return check;
}

std::optional<ApplyOutcome> SelfUpdater::installRelease(const ReleaseInfo& release, UpdateError *error)
{
    if (release.assetUrl.isEmpty()) {
        setError(error, ErrorKind::DownloadFailed,
                 QStringLiteral("Release %1 has no downloadable asset.").arg(release.tag));
        return std::nullopt;
    }

    qCInfo(lcUpdate).noquote()
        << QStringLiteral("[Updater] Installing %1 (%2)").arg(release.version.toString(), release.assetName);
    return m_applier.install(QUrl(release.assetUrl), release.sha256, m_downloader, error);
}

std::optional<ChannelSwitch> SelfUpdater::switchChannel(const Settings& settings,
                                                        bool enableDevBuilds,
                                                        UpdateError *error)
{
    const ReleaseChannel target = enableDevBuilds ? ReleaseChannel::Dev : ReleaseChannel::Stable;
    qCInfo(lcUpdate).noquote()
        << QStringLiteral("[Updater] Switching to the %1 channel").arg(releaseChannelName(target));

    const std::optional<ReleaseInfo> release = fetchChannel(target, error);
    if (!release.has_value()) {
        return std::nullopt;
    }

    ChannelSwitch result;
    result.settings = settings;
    result.settings.devBuildsEnabled = enableDevBuilds;
    if (!persist(result.settings, error)) {
        return std::nullopt;
    }

    UpdateError installError;
    std::optional<ApplyOutcome> outcome = installRelease(*release, &installError);
    if (outcome.has_value()) {
        result.installed = *release;
        result.outcome = *outcome;
        return result;
    }

    if (enableDevBuilds) {
        qCWarning(lcUpdate).noquote()
            << QStringLiteral("[Updater] Dev build install failed (%1), falling back to stable")
                   .arg(installError.message);
        UpdateError stableError;
        const std::optional<ReleaseInfo> stable = fetchChannel(ReleaseChannel::Stable, &stableError);
        if (stable.has_value()) {
            result.settings.devBuildsEnabled = false;
            if (persist(result.settings, &stableError)) {
                outcome = installRelease(*stable, &stableError);
                if (outcome.has_value()) {
                    result.installed = *stable;
                    result.outcome = *outcome;
                    result.fellBackToStable = true;
                    return result;
                }
            }
        }
        installError = stableError;
    }

    qCWarning(lcUpdate).noquote()
        << QStringLiteral("[Updater] Channel switch failed, restoring previous preference");
    UpdateError revertError;
    if (!persist(settings, &revertError)) {
        qCCritical(lcUpdate).noquote()
            << QStringLiteral("[Updater] Could not restore channel preference: %1").arg(revertError.message);
    }
    if (error != nullptr) {
        *error = installError;
    }
    return std::nullopt;
}

std::optional<ReleaseInfo> SelfUpdater::fetchChannel(ReleaseChannel channel, UpdateError *error)
{
    UpdateError fetchError;
    std::optional<ReleaseInfo> release = m_releaseClient.fetchLatest(channel, m_checkTimeoutMs, &fetchError);
    if (fetchError.isError()) {
        if (error != nullptr) {
            *error = fetchError;
        }
        return std::nullopt;
    }
    if (!release.has_value()) {
        setError(error, ErrorKind::UpdateCheckFailed,
                 QStringLiteral("No %1 release is available for this platform.").arg(releaseChannelName(channel)));
    }
    return release;
}

bool SelfUpdater::persist(const Settings& settings, UpdateError *error) const
{
    return m_settingsStore.save(m_dataDirectory, settings, error);
}

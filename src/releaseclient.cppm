/*!
 * @file        releaseclient.cppm
 * @brief       Release feed client for launcher self-updates.
 *
 * @details
 * Reads the GitHub Releases list of the launcher repository and returns
 * the newest release of the requested channel together with the asset
 * built for this platform:
 * - stable channel: published, non-prerelease, non-dev tags only
 * - dev channel: published dev tags only
 *
 * A single bounded request is made per call. Network failures, non-success
 * status codes and malformed bodies are all reported as
 * `UpdateCheckFailed`; retrying the check is left to the caller.
 *
 * @copyright   Copyright (c) 2026 TheBoys.
 * @license     See LICENSE in repository root.
 */

module;
#include <QByteArray>
#include <QJsonArray>
#include <QNetworkAccessManager>
#include <QString>
#include <QUrl>

#include <optional>

#ifndef Q_MOC_RUN
export module theboys.backend.releaseclient;
import theboys.backend.updateerror;
import theboys.backend.versionmodel;
#endif

/**
 * @enum ReleaseChannel
 * @brief Update feed subset to consult.
 */
export enum class ReleaseChannel
{
    Stable,
    Dev
};

/**
 * @brief Channel label for logs and command-line values.
 * @param channel Channel.
 * @return `stable` or `dev`.
 */
export QString releaseChannelName(ReleaseChannel channel);

/**
 * @struct AssetCriteria
 * @brief Platform facts used to pick a release asset.
 */
export struct AssetCriteria {
    QString preferredName; //!< Exact asset name published for this platform.
    QString osName;        //!< `windows`, `macos` or `linux`.
    QString cpuArch;       //!< CPU architecture, e.g. `x86_64` or `arm64`.
};

/**
 * @struct ReleaseInfo
 * @brief Newest release of a channel plus its platform asset.
 */
export struct ReleaseInfo {
    Version version;        //!< Parsed release version.
    QString tag;            //!< Raw tag name.
    QString assetUrl;       //!< Download URL of the selected asset.
    QString assetName;      //!< File name of the selected asset.
    QString sha256;         //!< Published SHA-256 digest, empty when unknown.
    QString releasePageUrl; //!< Human-facing release page.
};

/**
 * @class ReleaseClient
 * @brief Fetches and interprets release metadata.
 */
export class ReleaseClient
{
public:
    /**
     * @brief Construct a client for a platform.
     * @param criteria Asset selection facts.
     * @param feedUrl Releases list endpoint.
     */
    explicit ReleaseClient(AssetCriteria criteria, QUrl feedUrl = defaultFeedUrl());

    /**
     * @brief Override the releases endpoint.
     * @param feedUrl Releases list endpoint.
     */
    void setFeedUrl(const QUrl& feedUrl);

    /**
     * @brief Current releases endpoint.
     * @return Endpoint URL.
     */
    QUrl feedUrl() const;

    /**
     * @brief Fetch the newest release of a channel.
     *
     * @details
     * An empty result with no error means the channel has no published
     * release carrying an asset for this platform.
     *
     * @param channel Channel to consult.
     * @param timeoutMs Overall deadline for the request.
     * @param error Optional output, `UpdateCheckFailed` on failure.
     * @return Release info or empty optional.
     */
    std::optional<ReleaseInfo> fetchLatest(ReleaseChannel channel, int timeoutMs, UpdateError *error = nullptr);

    /**
     * @brief Interpret a releases payload.
     * @param payload JSON array of releases, or one release object.
     * @param channel Channel to consult.
     * @param criteria Asset selection facts.
     * @param error Optional output, `UpdateCheckFailed` on malformed input.
     * @return Release info or empty optional.
     */
    static std::optional<ReleaseInfo> parseReleaseFeed(const QByteArray& payload,
                                                       ReleaseChannel channel,
                                                       const AssetCriteria& criteria,
                                                       UpdateError *error = nullptr);

    /**
     * @brief Default releases endpoint of the launcher repository.
     * @return GitHub API URL.
     */
    static QUrl defaultFeedUrl();

    /**
     * @brief Whether a tag belongs to a channel.
     * @param channel Channel.
     * @param tag Release tag.
     * @param prerelease GitHub prerelease flag.
     * @return True when the release is eligible.
     */
    static bool matchesChannel(ReleaseChannel channel, const QString& tag, bool prerelease);

private:
    /**
     * @brief Choose the asset for the current platform.
     * @param assets Release assets array.
     * @param criteria Asset selection facts.
     * @param release Output receiving URL, name and digest.
     * @return True if an asset was selected.
     */
    static bool selectReleaseAsset(const QJsonArray& assets, const AssetCriteria& criteria, ReleaseInfo *release);

    AssetCriteria m_criteria;
    QUrl m_feedUrl;
    QNetworkAccessManager m_networkManager;
};

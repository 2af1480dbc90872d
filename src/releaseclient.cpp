module;
#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QLoggingCategory>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QScopedPointer>
#include <QString>
#include <QStringList>
#include <QUrl>

#include <limits>
#include <optional>
#include <utility>

module theboys.backend.releaseclient;

import theboys.backend.httpsupport;
import theboys.backend.logging;
import theboys.backend.updateerror;
import theboys.backend.versionmodel;

namespace {
const QUrl kReleaseFeedUrl(QStringLiteral("https://api.github.com/repos/dilllxd/theboyslauncher/releases?per_page=30"));

bool mentionsOs(const QString& lowerName, const QString& osName)
{
    if (osName == QStringLiteral("macos")) {
        return lowerName.contains(QStringLiteral("mac"))
            || lowerName.contains(QStringLiteral("darwin"))
            || lowerName.contains(QStringLiteral("osx"));
    }
    if (osName == QStringLiteral("windows")) {
        return lowerName.contains(QStringLiteral("windows"))
            || lowerName.contains(QStringLiteral("win64"))
            || lowerName.contains(QStringLiteral("win32"))
            || lowerName.endsWith(QStringLiteral(".exe"));
    }
    return lowerName.contains(QStringLiteral("linux"))
        || lowerName.contains(QStringLiteral("appimage"));
}

QString digestToSha256(const QString& digest)
{
    const QString trimmed = digest.trimmed();
    if (trimmed.startsWith(QStringLiteral("sha256:"), Qt::CaseInsensitive)) {
        return trimmed.mid(7).toLower();
    }
    return {};
}
}

QString releaseChannelName(ReleaseChannel channel)
{
    return channel == ReleaseChannel::Dev ? QStringLiteral("dev") : QStringLiteral("stable");
}

ReleaseClient::ReleaseClient(AssetCriteria criteria, QUrl feedUrl)
    : m_criteria(std::move(criteria))
    , m_feedUrl(std::move(feedUrl))
{
}

void ReleaseClient::setFeedUrl(const QUrl& feedUrl)
{
    m_feedUrl = feedUrl;
}

QUrl ReleaseClient::feedUrl() const
{
    return m_feedUrl;
}

std::optional<ReleaseInfo> ReleaseClient::fetchLatest(ReleaseChannel channel, int timeoutMs, UpdateError *error)
{
    qCInfo(lcRelease).noquote()
        << QStringLiteral("[Updater] Checking %1 channel at %2")
               .arg(releaseChannelName(channel), m_feedUrl.toString());

    QNetworkRequest request = makeRequest(m_feedUrl, QStringLiteral("Updater"), timeoutMs);
    request.setRawHeader("Accept", "application/vnd.github+json");

    QScopedPointer<QNetworkReply, QScopedPointerDeleteLater> reply(m_networkManager.get(request));
    const bool timedOut = waitForReply(reply.data(), timeoutMs);

    const int statusCode = httpStatus(reply.data());
    const bool hadError = reply->error() != QNetworkReply::NoError;
    const QByteArray payload = reply->isOpen() ? reply->readAll() : QByteArray();
    const QString networkError = reply->errorString().trimmed();

    if (timedOut) {
        const QString message = QStringLiteral("Update check timed out after %1 ms.").arg(timeoutMs);
        qCWarning(lcRelease).noquote() << QStringLiteral("[Updater] %1").arg(message);
        setError(error, ErrorKind::UpdateCheckFailed, message);
        return std::nullopt;
    }

    if (hadError || (statusCode != 0 && (statusCode < 200 || statusCode >= 300))) {
        const QString message = statusCode != 0
            ? QStringLiteral("Release feed returned HTTP %1.").arg(statusCode)
            : (networkError.isEmpty() ? QStringLiteral("Failed to check updates.") : networkError);
        qCWarning(lcRelease).noquote() << QStringLiteral("[Updater] %1").arg(message);
        setError(error, ErrorKind::UpdateCheckFailed, message);
        return std::nullopt;
    }

    return parseReleaseFeed(payload, channel, m_criteria, error);
}

std::optional<ReleaseInfo> ReleaseClient::parseReleaseFeed(const QByteArray& payload,
                                                           ReleaseChannel channel,
                                                           const AssetCriteria& criteria,
                                                           UpdateError *error)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &parseError);
    if (parseError.error != QJsonParseError::NoError || (!doc.isArray() && !doc.isObject())) {
        qCWarning(lcRelease).noquote() << "[Updater] Release metadata parse failed.";
        setError(error, ErrorKind::UpdateCheckFailed, QStringLiteral("Release metadata parse failed."));
        return std::nullopt;
    }

    QJsonArray releases;
    if (doc.isArray()) {
        releases = doc.array();
    } else {
        releases.append(doc.object());
    }

    std::optional<ReleaseInfo> best;
    for (const QJsonValue& entry : std::as_const(releases)) {
        if (!entry.isObject()) {
            setError(error, ErrorKind::UpdateCheckFailed, QStringLiteral("Release metadata has an invalid entry."));
            return std::nullopt;
        }
        const QJsonObject release = entry.toObject();
        const QString tag = release.value(QStringLiteral("tag_name")).toString().trimmed();
        if (tag.isEmpty()) {
            continue;
        }
        if (release.value(QStringLiteral("draft")).toBool(false)) {
            continue;
        }
        const bool prerelease = release.value(QStringLiteral("prerelease")).toBool(false);
        if (!matchesChannel(channel, tag, prerelease)) {
            continue;
        }

        ReleaseInfo candidate;
        candidate.tag = tag;
        candidate.version = VersionModel::parse(tag);
        candidate.releasePageUrl = release.value(QStringLiteral("html_url")).toString().trimmed();
        if (!selectReleaseAsset(release.value(QStringLiteral("assets")).toArray(), criteria, &candidate)) {
            qCDebug(lcRelease).noquote()
                << QStringLiteral("[Updater] Release %1 has no asset for %2, skipping.").arg(tag, criteria.osName);
            continue;
        }

        if (!best.has_value() || VersionModel::compare(candidate.version, best->version) == VersionOrder::Greater) {
            best = candidate;
        }
    }

    if (best.has_value()) {
        qCInfo(lcRelease).noquote()
            << QStringLiteral("[Updater] Latest %1 release: %2 (%3)")
                   .arg(releaseChannelName(channel), best->tag, best->assetName);
    } else {
        qCInfo(lcRelease).noquote()
            << QStringLiteral("[Updater] No %1 release with a %2 asset.")
                   .arg(releaseChannelName(channel), criteria.osName);
    }
    return best;
}

QUrl ReleaseClient::defaultFeedUrl()
{
    return kReleaseFeedUrl;
}

bool ReleaseClient::matchesChannel(ReleaseChannel channel, const QString& tag, bool prerelease)
{
    const bool dev = VersionModel::isDevBuild(tag);
    if (channel == ReleaseChannel::Dev) {
        return dev;
    }
    return !dev && !prerelease;
}

bool ReleaseClient::selectReleaseAsset(const QJsonArray& assets, const AssetCriteria& criteria, ReleaseInfo *release)
{
    if (release == nullptr || assets.isEmpty()) {
        return false;
    }

    const QString arch = criteria.cpuArch.toLower();
    const bool hostArm = arch.contains(QStringLiteral("arm")) || arch.contains(QStringLiteral("aarch64"));
    const QString preferred = criteria.preferredName.trimmed().toLower();

    int bestScore = std::numeric_limits<int>::min();
    QJsonObject bestAsset;

    for (const QJsonValue& entry : assets) {
        if (!entry.isObject()) {
            continue;
        }
        const QJsonObject obj = entry.toObject();
        const QString name = obj.value(QStringLiteral("name")).toString().trimmed();
        const QString url = obj.value(QStringLiteral("browser_download_url")).toString().trimmed();
        if (name.isEmpty() || url.isEmpty()) {
            continue;
        }

        const QString lower = name.toLower();
        if (!preferred.isEmpty() && lower == preferred) {
            bestAsset = obj;
            break;
        }

        // Hard filter when asset explicitly targets a different platform.
        const QStringList otherOses = {QStringLiteral("windows"), QStringLiteral("macos"), QStringLiteral("linux")};
        bool foreign = false;
        for (const QString& other : otherOses) {
            if (other != criteria.osName && mentionsOs(lower, other) && !mentionsOs(lower, criteria.osName)) {
                foreign = true;
                break;
            }
        }
        if (foreign || !mentionsOs(lower, criteria.osName)) {
            continue;
        }

        const bool assetArm = lower.contains(QStringLiteral("arm64")) || lower.contains(QStringLiteral("aarch64"));
        const bool assetX86 = lower.contains(QStringLiteral("x64"))
            || lower.contains(QStringLiteral("x86_64"))
            || lower.contains(QStringLiteral("amd64"));
        if (hostArm && assetX86 && !assetArm) {
            continue;
        }
        if (!hostArm && assetArm && !assetX86) {
            continue;
        }

        if (lower.endsWith(QStringLiteral(".zip")) || lower.endsWith(QStringLiteral(".dmg"))
            || lower.endsWith(QStringLiteral(".tar.gz")) || lower.endsWith(QStringLiteral(".sha256"))) {
            continue;
        }

        int score = 40;
        if (lower.contains(QStringLiteral("theboyslauncher"))) {
            score += 25;
        }
        if (lower.contains(QStringLiteral("universal")) || (hostArm ? assetArm : assetX86)) {
            score += 25;
        }
        if (score > bestScore) {
            bestScore = score;
            bestAsset = obj;
        }
    }

    if (bestAsset.isEmpty()) {
        return false;
    }

    release->assetName = bestAsset.value(QStringLiteral("name")).toString().trimmed();
    release->assetUrl = bestAsset.value(QStringLiteral("browser_download_url")).toString().trimmed();
    release->sha256 = digestToSha256(bestAsset.value(QStringLiteral("digest")).toString());
    return true;
}

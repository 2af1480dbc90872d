module;
#include <QLoggingCategory>
#include <QRegularExpression>
#include <QString>

module theboys.backend.versionmodel;

import theboys.backend.logging;

namespace {
QString stripTagPrefix(const QString& text)
{
    QString cleaned = text.trimmed();
    if (cleaned.startsWith(QStringLiteral("v"), Qt::CaseInsensitive)
        && cleaned.size() > 1
        && cleaned.at(1).isDigit()) {
        cleaned.remove(0, 1);
    }
    return cleaned;
}

QString extractCommitHash(const QString& qualifier)
{
    const int plus = qualifier.indexOf(QLatin1Char('+'));
    if (plus >= 0) {
        return qualifier.mid(plus + 1).trimmed();
    }

    // Dev tags are published as `dev.<shortsha>`.
    static const QRegularExpression devHashRx(
        QStringLiteral("dev[.-]([0-9a-f]{6,40})$"),
        QRegularExpression::CaseInsensitiveOption
    );
    const QRegularExpressionMatch match = devHashRx.match(qualifier);
    if (match.hasMatch()) {
        return match.captured(1);
    }
    return {};
}

int compareInts(int a, int b)
{
    if (a < b) {
        return -1;
    }
    if (a > b) {
        return 1;
    }
    return 0;
}
}

bool Version::hasQualifier() const
{
    return !suffix.isEmpty();
}

QString Version::toString() const
{
    if (!numeric) {
        return suffix;
    }
    QString text = QStringLiteral("%1.%2.%3").arg(major).arg(minor).arg(patch);
    if (hasQualifier()) {
        text += suffix.startsWith(QLatin1Char('+')) ? suffix : QStringLiteral("-") + suffix;
    }
    return text;
}

bool Version::operator==(const Version& other) const
{
    return VersionModel::compare(*this, other) == VersionOrder::Equal;
}

Version VersionModel::parse(const QString& text)
{
    static const QRegularExpression versionRx(
        QStringLiteral("^(\\d+)(?:\\.(\\d+))?(?:\\.(\\d+))?(.*)$")
    );

    Version version;
    const QString cleaned = stripTagPrefix(text);
    const QRegularExpressionMatch match = versionRx.match(cleaned);
    if (match.hasMatch()) {
        bool majorOk = false;
        bool minorOk = true;
        bool patchOk = true;
        version.major = match.captured(1).toInt(&majorOk);
        version.minor = match.captured(2).isEmpty() ? 0 : match.captured(2).toInt(&minorOk);
        version.patch = match.captured(3).isEmpty() ? 0 : match.captured(3).toInt(&patchOk);
        version.numeric = majorOk && minorOk && patchOk;
    }

    if (!version.numeric) {
        qCDebug(lcVersion).noquote()
            << QStringLiteral("[Version] '%1' has no numeric triple, ordering as 0.0.0").arg(cleaned);
        version = Version();
        version.suffix = cleaned;
    } else {
        QString qualifier = match.captured(4).trimmed();
        if (qualifier.startsWith(QLatin1Char('-')) || qualifier.startsWith(QLatin1Char('.'))) {
            qualifier.remove(0, 1);
        }
        version.suffix = qualifier;
    }

    version.commitHash = extractCommitHash(version.suffix);
    version.channel = version.suffix.contains(QStringLiteral("dev"), Qt::CaseInsensitive)
        ? VersionChannel::Dev
        : VersionChannel::Stable;
    return version;
}

bool VersionModel::isDevBuild(const Version& version)
{
    return version.channel == VersionChannel::Dev;
}

bool VersionModel::isDevBuild(const QString& text)
{
    return isDevBuild(parse(text));
}

VersionOrder VersionModel::compare(const Version& a, const Version& b)
{
    int result = compareInts(a.major, b.major);
    if (result == 0) {
        result = compareInts(a.minor, b.minor);
    }
    if (result == 0) {
        result = compareInts(a.patch, b.patch);
    }
    if (result == 0) {
        if (!a.hasQualifier() && b.hasQualifier()) {
            result = 1;
        } else if (a.hasQualifier() && !b.hasQualifier()) {
            result = -1;
        } else {
            result = compareInts(QString::compare(a.suffix, b.suffix, Qt::CaseSensitive), 0);
        }
    }

    if (result < 0) {
        return VersionOrder::Less;
    }
    if (result > 0) {
        return VersionOrder::Greater;
    }
    return VersionOrder::Equal;
}

bool VersionModel::isNewer(const Version& current, const Version& candidate)
{
    return compare(candidate, current) == VersionOrder::Greater;
}

module;
#include <QDateTime>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QSaveFile>
#include <QString>
#include <QStringList>

module theboys.backend.migrator;

import theboys.backend.logging;
import theboys.backend.updateerror;

namespace {
constexpr qint64 kCompareChunk = 256 * 1024;

struct CopyStats
{
    int copied = 0;
    int identical = 0;
    QStringList conflicts;
    QStringList openDirectories; // canonical paths on the current descent
};

QDir::Filters entryFilters()
{
    return QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System;
}

bool sameContent(const QString& left, const QString& right)
{
    QFile a(left);
    QFile b(right);
    if (a.size() != b.size()) {
        return false;
    }
    if (!a.open(QIODevice::ReadOnly) || !b.open(QIODevice::ReadOnly)) {
        return false;
    }
    while (!a.atEnd()) {
        if (a.read(kCompareChunk) != b.read(kCompareChunk)) {
            return false;
        }
    }
    return b.atEnd();
}

QString joinRelative(const QString& parent, const QString& name)
{
    return parent.isEmpty() ? name : parent + QLatin1Char('/') + name;
}

// Copies `sourcePath` to `destPath` without ever replacing an existing file.
bool copyTree(const QString& sourcePath,
              const QString& destPath,
              const QString& relativePath,
              CopyStats *stats,
              QString *errorMessage)
{
    const QFileInfo source(sourcePath);
    const QFileInfo dest(destPath);

    if (source.isSymLink() && !source.exists()) {
        qCWarning(lcMigration).noquote()
            << QStringLiteral("[Migration] Skipping dangling link %1").arg(relativePath);
        return true;
    }

    if (source.isDir()) {
        // Linked directories are copied through their target, so the copy holds real data.
        const QString canonical = source.canonicalFilePath();
        if (stats->openDirectories.contains(canonical)) {
            qCWarning(lcMigration).noquote()
                << QStringLiteral("[Migration] Skipping link loop at %1").arg(relativePath);
            return true;
        }
        if (source.isSymLink()) {
            qCInfo(lcMigration).noquote() << QStringLiteral("[Migration] Following linked directory %1 -> %2")
                                                 .arg(relativePath, source.symLinkTarget());
        }
        if (dest.exists() && !dest.isDir()) {
            stats->conflicts.append(relativePath);
            return true;
        }
        if (!QDir().mkpath(destPath)) {
            *errorMessage = QStringLiteral("Failed to create directory %1.").arg(destPath);
            return false;
        }
        stats->openDirectories.append(canonical);
        const QFileInfoList children = QDir(sourcePath).entryInfoList(entryFilters(), QDir::Name);
        for (const QFileInfo& child : children) {
            if (!copyTree(child.absoluteFilePath(),
                          QDir(destPath).filePath(child.fileName()),
                          joinRelative(relativePath, child.fileName()),
                          stats,
                          errorMessage)) {
                return false;
            }
        }
        stats->openDirectories.removeLast();
        return true;
    }

    if (dest.exists() || dest.isSymLink()) {
        if (!dest.isDir() && sameContent(sourcePath, destPath)) {
            ++stats->identical;
        } else {
            stats->conflicts.append(relativePath);
        }
        return true;
    }

    if (!QFile::copy(sourcePath, destPath)) {
        *errorMessage = QStringLiteral("Failed to copy %1.").arg(relativePath);
        return false;
    }
    ++stats->copied;
    return true;
}

QString uniqueBackupPath(const QString& root)
{
    const QString base = QDir(root).filePath(
        QStringLiteral("theboys-portable-backup-%1")
            .arg(QDateTime::currentDateTime().toString(QStringLiteral("yyyy-MM-dd-HH-mm-ss"))));
    QString candidate = base;
    int suffix = 1;
    while (QFileInfo::exists(candidate)) {
        candidate = QStringLiteral("%1-%2").arg(base).arg(suffix++);
    }
    return candidate;
}
}

QString MigrationState::statusName() const
{
    switch (status) {
    case MigrationStatus::NotNeeded:
        return QStringLiteral("not-needed");
    case MigrationStatus::Pending:
        return QStringLiteral("pending");
    case MigrationStatus::InProgress:
        return QStringLiteral("in-progress");
    case MigrationStatus::Completed:
        return QStringLiteral("completed");
    case MigrationStatus::Failed:
        return QStringLiteral("failed");
    }
    return QStringLiteral("unknown");
}

Migrator::Migrator(const QString& legacyRoot, const QString& dataDirectory)
    : m_legacyRoot(QDir::cleanPath(legacyRoot))
    , m_dataDirectory(QDir::cleanPath(dataDirectory))
{
}

void Migrator::setBackupRoot(const QString& path)
{
    m_backupRoot = path;
}

QString Migrator::backupRoot() const
{
    return m_backupRoot.isEmpty() ? QDir::tempPath() : m_backupRoot;
}

QString Migrator::markerFileName()
{
    return QStringLiteral(".migration-completed");
}

QString Migrator::markerPath() const
{
    return QDir(m_dataDirectory).filePath(markerFileName());
}

QStringList Migrator::legacyEntries()
{
    return {
        QStringLiteral("instances"),
        QStringLiteral("config"),
        QStringLiteral("prism"),
        QStringLiteral("util"),
        QStringLiteral("logs"),
        QStringLiteral("settings.json"),
        QStringLiteral("modpacks.json"),
    };
}

QStringList Migrator::legacyIndicators()
{
    return {
        QStringLiteral("instances"),
        QStringLiteral("config"),
        QStringLiteral("prism"),
        QStringLiteral("util"),
    };
}

bool Migrator::isSameLocation() const
{
    const QString legacy = QFileInfo(m_legacyRoot).canonicalFilePath();
    const QString data = QFileInfo(m_dataDirectory).canonicalFilePath();
    if (!legacy.isEmpty() && !data.isEmpty()) {
        return legacy == data;
    }
    return QFileInfo(m_legacyRoot).absoluteFilePath() == QFileInfo(m_dataDirectory).absoluteFilePath();
}

MigrationState Migrator::detect() const
{
    MigrationState state;

    const QFileInfo marker(markerPath());
    if (marker.exists()) {
        state.status = MigrationStatus::Completed;
        state.completedAt = marker.lastModified();
        QFile file(marker.absoluteFilePath());
        if (file.open(QIODevice::ReadOnly)) {
            const QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
            if (doc.isObject()) {
                const QJsonObject root = doc.object();
                const QDateTime recorded = QDateTime::fromString(
                    root.value(QStringLiteral("completed_at")).toString(), Qt::ISODate);
                if (recorded.isValid()) {
                    state.completedAt = recorded;
                }
                state.backupPath = root.value(QStringLiteral("backup_path")).toString();
            }
        }
        return state;
    }

    if (isSameLocation()) {
        return state;
    }

    const QDir legacy(m_legacyRoot);
    for (const QString& indicator : legacyIndicators()) {
        if (QFileInfo::exists(legacy.filePath(indicator))) {
            state.status = MigrationStatus::Pending;
            break;
        }
    }
    return state;
}

LegacyInstallInfo Migrator::inspect() const
{
    LegacyInstallInfo info;
    info.rootPath = m_legacyRoot;

    const QDir legacy(m_legacyRoot);
    for (const QString& entry : legacyEntries()) {
        const QFileInfo entryInfo(legacy.filePath(entry));
        if (!entryInfo.exists()) {
            continue;
        }
        info.entries.append(entry);

        if (entryInfo.lastModified() > info.lastModified) {
            info.lastModified = entryInfo.lastModified();
        }
        if (!entryInfo.isDir()) {
            info.totalSize += entryInfo.size();
            continue;
        }

        QDirIterator it(entryInfo.absoluteFilePath(), entryFilters(), QDirIterator::Subdirectories);
        while (it.hasNext()) {
            it.next();
            const QFileInfo child = it.fileInfo();
            if (child.isFile()) {
                info.totalSize += child.size();
            }
            if (child.lastModified() > info.lastModified) {
                info.lastModified = child.lastModified();
            }
        }
    }

    info.instances = QDir(legacy.filePath(QStringLiteral("instances")))
                         .entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    info.configFiles = QDir(legacy.filePath(QStringLiteral("config")))
                           .entryList(QDir::Files | QDir::Hidden, QDir::Name);

    info.migrationRequired = detect().status == MigrationStatus::Pending;
    if (info.migrationRequired) {
        info.legacyVersion = detectLegacyVersion();
        if (info.legacyVersion.isEmpty()) {
            info.legacyVersion = QStringLiteral("unknown");
        }
    }
    return info;
}

MigrationResult Migrator::run(UpdateError *error)
{
    MigrationResult result;
    result.state = detect();
    if (result.state.status != MigrationStatus::Pending) {
        qCDebug(lcMigration).noquote()
            << QStringLiteral("[Migration] Nothing to do (%1)").arg(result.state.statusName());
        return result;
    }

    const auto failWith = [&](const QString& message) {
        result.state.status = MigrationStatus::Failed;
        setError(error, ErrorKind::MigrationFailed, message);
        qCCritical(lcMigration).noquote() << QStringLiteral("[Migration] %1").arg(message);
        return result;
    };

    QStringList entries;
    const QDir legacy(m_legacyRoot);
    for (const QString& entry : legacyEntries()) {
        if (QFileInfo::exists(legacy.filePath(entry))) {
            entries.append(entry);
        }
    }
    const QString legacyVersion = detectLegacyVersion();

    result.state.status = MigrationStatus::InProgress;
    qCInfo(lcMigration).noquote()
        << QStringLiteral("[Migration] Migrating %1 from %2 to %3")
               .arg(entries.join(QStringLiteral(", ")), m_legacyRoot, m_dataDirectory);

    QString backupPath;
    QString failure;
    if (!backUp(&backupPath, &failure)) {
        return failWith(QStringLiteral("Backup failed, legacy data left untouched: %1").arg(failure));
    }
    result.state.backupPath = backupPath;
    qCInfo(lcMigration).noquote() << QStringLiteral("[Migration] Backup created at %1").arg(backupPath);

    if (!QDir().mkpath(m_dataDirectory)) {
        return failWith(QStringLiteral("Failed to create data directory %1.").arg(m_dataDirectory));
    }
    if (!copyEntries(entries, &result, &failure)) {
        return failWith(QStringLiteral("Copy failed: %1 Backup kept at %2.").arg(failure, backupPath));
    }
    if (!verify(entries, &failure)) {
        return failWith(QStringLiteral("Verification failed: %1 Backup kept at %2.").arg(failure, backupPath));
    }

    result.state.completedAt = QDateTime::currentDateTimeUtc();
    if (!writeMarker(result, legacyVersion, &failure)) {
        return failWith(failure);
    }

    result.state.status = MigrationStatus::Completed;
    for (const QString& conflict : result.conflicts) {
        qCWarning(lcMigration).noquote()
            << QStringLiteral("[Migration] Kept existing %1, legacy copy differs").arg(conflict);
    }
    qCInfo(lcMigration).noquote()
        << QStringLiteral("[Migration] Completed: %1 files copied, %2 already present, %3 conflicts")
               .arg(result.copiedFiles)
               .arg(result.identicalFiles)
               .arg(result.conflicts.size());
    return result;
}

bool Migrator::backUp(QString *backupPath, QString *errorMessage) const
{
    const QString target = uniqueBackupPath(backupRoot());
    if (!QDir().mkpath(target)) {
        *errorMessage = QStringLiteral("Could not create %1.").arg(target);
        return false;
    }

    // The whole legacy tree is saved, minus the data and backup directories when they live inside it.
    QStringList excluded;
    for (const QString& path : {m_dataDirectory, target}) {
        const QString canonical = QFileInfo(path).canonicalFilePath();
        if (!canonical.isEmpty()) {
            excluded.append(canonical);
        }
    }

    CopyStats stats;
    const QFileInfoList children = QDir(m_legacyRoot).entryInfoList(entryFilters(), QDir::Name);
    for (const QFileInfo& child : children) {
        if (excluded.contains(child.canonicalFilePath())) {
            continue;
        }
        if (!copyTree(child.absoluteFilePath(), QDir(target).filePath(child.fileName()), child.fileName(), &stats,
                      errorMessage)) {
            QDir(target).removeRecursively();
            return false;
        }
    }

    *backupPath = target;
    return true;
}

bool Migrator::copyEntries(const QStringList& entries, MigrationResult *result, QString *errorMessage) const
{
    CopyStats stats;
    const QDir legacy(m_legacyRoot);
    const QDir data(m_dataDirectory);
    for (const QString& entry : entries) {
        if (!copyTree(legacy.filePath(entry), data.filePath(entry), entry, &stats, errorMessage)) {
            return false;
        }
        result->migratedEntries.append(entry);
    }

    result->copiedFiles = stats.copied;
    result->identicalFiles = stats.identical;
    result->conflicts = stats.conflicts;
    return true;
}

bool Migrator::verify(const QStringList& entries, QString *errorMessage) const
{
    const QDir legacy(m_legacyRoot);
    const QDir data(m_dataDirectory);
    for (const QString& entry : entries) {
        const QFileInfo source(legacy.filePath(entry));
        const QFileInfo dest(data.filePath(entry));
        if (!dest.exists()) {
            *errorMessage = QStringLiteral("%1 is missing from the data directory.").arg(entry);
            return false;
        }
        if (source.isDir() != dest.isDir()) {
            *errorMessage = QStringLiteral("%1 has a different type in the data directory.").arg(entry);
            return false;
        }
    }
    return true;
}

bool Migrator::writeMarker(const MigrationResult& result, const QString& legacyVersion, QString *errorMessage) const
{
    QJsonObject marker;
    marker.insert(QStringLiteral("completed_at"), result.state.completedAt.toString(Qt::ISODate));
    marker.insert(QStringLiteral("legacy_root"), m_legacyRoot);
    marker.insert(QStringLiteral("legacy_version"),
                  legacyVersion.isEmpty() ? QStringLiteral("unknown") : legacyVersion);
    marker.insert(QStringLiteral("migrated_entries"), QJsonArray::fromStringList(result.migratedEntries));
    marker.insert(QStringLiteral("migrated_files"), result.copiedFiles);
    marker.insert(QStringLiteral("identical_files"), result.identicalFiles);
    marker.insert(QStringLiteral("conflicts"), QJsonArray::fromStringList(result.conflicts));
    marker.insert(QStringLiteral("backup_path"), result.state.backupPath);

    QSaveFile file(markerPath());
    if (!file.open(QIODevice::WriteOnly)) {
        *errorMessage = QStringLiteral("Failed to open migration marker: %1").arg(file.errorString());
        return false;
    }
    if (file.write(QJsonDocument(marker).toJson(QJsonDocument::Indented)) < 0 || !file.commit()) {
        *errorMessage = QStringLiteral("Failed to write migration marker: %1").arg(file.errorString());
        return false;
    }
    return true;
}

QString Migrator::detectLegacyVersion() const
{
    const QDir legacy(m_legacyRoot);

    QFile versionFile(legacy.filePath(QStringLiteral("version.txt")));
    if (versionFile.open(QIODevice::ReadOnly)) {
        const QString version = QString::fromUtf8(versionFile.readAll()).trimmed();
        if (!version.isEmpty()) {
            return version;
        }
    }

    QFile settingsFile(legacy.filePath(QStringLiteral("settings.json")));
    if (settingsFile.open(QIODevice::ReadOnly)) {
        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(settingsFile.readAll(), &parseError);
        if (parseError.error == QJsonParseError::NoError && doc.isObject()) {
            return doc.object().value(QStringLiteral("version")).toString().trimmed();
        }
    }
    return {};
}

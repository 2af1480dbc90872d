module;
#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QProcess>
#include <QSaveFile>
#include <QString>
#include <QStringList>
#include <QTemporaryFile>
#include <QUrl>

#include <optional>

#if defined(Q_OS_WIN)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <shellapi.h>
#endif

module theboys.backend.updateapplier;

import theboys.backend.downloader;
import theboys.backend.installationprobe;
import theboys.backend.logging;
import theboys.backend.platform;
import theboys.backend.updateerror;

namespace {
constexpr int kHelperTimeoutMs = 45000;

QString defaultHelperName()
{
#if defined(Q_OS_WIN)
    return QStringLiteral("TheBoysUpdater.exe");
#else
    return QStringLiteral("TheBoysUpdater");
#endif
}

bool copyWithOverwrite(const QString& fromPath, const QString& toPath)
{
    if (QFileInfo::exists(toPath) && !QFile::remove(toPath)) {
        return false;
    }
    return QFile::copy(fromPath, toPath);
}

bool startHelperDetached(const QString& helperPath, const QString& jobPath, QString *errorOut)
{
#if defined(Q_OS_WIN)
    const QString nativeHelper = QDir::toNativeSeparators(helperPath);
    const QString nativeJob = QDir::toNativeSeparators(jobPath);
    if (QProcess::startDetached(helperPath, {QStringLiteral("--job"), jobPath})) {
        return true;
    }

    const QString args = QStringLiteral("--job \"%1\"").arg(nativeJob);
    const int rc = static_cast<int>(reinterpret_cast<qintptr>(
        ShellExecuteW(
            nullptr,
            L"runas",
            reinterpret_cast<LPCWSTR>(nativeHelper.utf16()),
            reinterpret_cast<LPCWSTR>(args.utf16()),
            nullptr,
            SW_SHOWNORMAL
        )
    ));
    if (rc <= 32) {
        if (errorOut != nullptr) {
            *errorOut = (rc == 1223)
                ? QStringLiteral("Administrator permission was denied.")
                : QStringLiteral("Failed to launch updater helper (code %1).").arg(rc);
        }
        return false;
    }
    return true;
#else
    const bool launched = QProcess::startDetached(helperPath, {QStringLiteral("--job"), jobPath});
    if (!launched && errorOut != nullptr) {
        *errorOut = QStringLiteral("Failed to launch updater helper %1.").arg(helperPath);
    }
    return launched;
#endif
}
}

QString applyStateName(ApplyState state)
{
    switch (state) {
    case ApplyState::Idle:
        return QStringLiteral("Idle");
    case ApplyState::Downloading:
        return QStringLiteral("Downloading");
    case ApplyState::Verifying:
        return QStringLiteral("Verifying");
    case ApplyState::Staged:
        return QStringLiteral("Staged");
    case ApplyState::Applying:
        return QStringLiteral("Applying");
    case ApplyState::Applied:
        return QStringLiteral("Applied");
    case ApplyState::RolledBack:
        return QStringLiteral("RolledBack");
    }
    return QStringLiteral("Unknown");
}

UpdateApplier::UpdateApplier(PlatformBackend& platform, InstallMode mode, const QString& dataDirectory)
    : m_platform(platform)
    , m_mode(mode)
    , m_dataDirectory(dataDirectory)
{
}

void UpdateApplier::setTargetPath(const QString& path)
{
    m_targetPath = path;
}

QString UpdateApplier::targetPath() const
{
    return m_targetPath.isEmpty() ? m_platform.executablePath() : m_targetPath;
}

void UpdateApplier::setHelperPath(const QString& path)
{
    m_helperPath = path;
}

QString UpdateApplier::helperPath() const
{
    if (!m_helperPath.isEmpty()) {
        return m_helperPath;
    }
    return QDir(QFileInfo(targetPath()).absolutePath()).filePath(defaultHelperName());
}

void UpdateApplier::setRelaunchArguments(const QStringList& arguments)
{
    m_relaunchArguments = arguments;
}

ApplyState UpdateApplier::state() const
{
    return m_state;
}

QString UpdateApplier::lastJobPath() const
{
    return m_lastJobPath;
}

QString UpdateApplier::updatesDirectory(const QString& dataDirectory)
{
    return QDir(dataDirectory).filePath(QStringLiteral("updates"));
}

QString UpdateApplier::stagedPathFor(const QString& targetPath)
{
    return targetPath + QStringLiteral(".staged");
}

QString UpdateApplier::backupPathFor(const QString& targetPath)
{
    return targetPath + QStringLiteral(".backup.old");
}

bool UpdateApplier::checkTargetWritable(UpdateError *error) const
{
    const QString targetDir = QFileInfo(targetPath()).absolutePath();
    QTemporaryFile probe(QDir(targetDir).filePath(QStringLiteral(".__theboys_write_probe_XXXXXX.tmp")));
    probe.setAutoRemove(true);
    if (probe.open()) {
        probe.close();
        return true;
    }

    if (m_mode == InstallMode::Installed) {
        setError(error, ErrorKind::ElevationRequired,
                 QStringLiteral("Install folder %1 is not writable. Re-run with administrator rights "
                                "or use a portable copy.").arg(QDir::toNativeSeparators(targetDir)));
    } else {
        setError(error, ErrorKind::ApplyFailed,
                 QStringLiteral("Launcher folder %1 is not writable.").arg(QDir::toNativeSeparators(targetDir)));
    }
    return false;
}

std::optional<ApplyOutcome> UpdateApplier::install(const QUrl& url,
                                                   const QString& expectedSha256,
                                                   Downloader& downloader,
                                                   UpdateError *error)
{
    m_state = ApplyState::Idle;
    m_lastJobPath.clear();

    UpdateError writableError;
    if (!checkTargetWritable(&writableError)) {
        fail(ApplyState::Idle, error, writableError.kind, writableError.message);
        return std::nullopt;
    }

    QString fileName = QFileInfo(url.path()).fileName();
    if (fileName.isEmpty()) {
        fileName = QStringLiteral("launcher-update.bin");
    }
    const QString downloadPath = QDir(updatesDirectory(m_dataDirectory)).filePath(fileName);

    m_state = ApplyState::Downloading;
    qCInfo(lcUpdate).noquote() << QStringLiteral("[Updater] Downloading %1").arg(url.toString());

    UpdateError downloadError;
    if (!downloader.fetch(url, expectedSha256, downloadPath, Downloader::kDefaultAttempts, &downloadError)) {
        fail(ApplyState::Idle, error, downloadError.kind, downloadError.message);
        return std::nullopt;
    }

    const QString verifiedHash = expectedSha256.isEmpty() ? downloader.lastSha256() : expectedSha256;
    const std::optional<ApplyOutcome> outcome = apply(downloadPath, verifiedHash, error);
    QFile::remove(downloadPath);
    return outcome;
}

std::optional<ApplyOutcome> UpdateApplier::apply(const QString& artifactPath,
                                                 const QString& expectedSha256,
                                                 UpdateError *error)
{
    m_lastJobPath.clear();
    const QString target = targetPath();
    if (!QFileInfo::exists(artifactPath)) {
        fail(ApplyState::Idle, error, ErrorKind::ApplyFailed,
             QStringLiteral("Update file %1 does not exist.").arg(artifactPath));
        return std::nullopt;
    }
    if (!QFileInfo::exists(target)) {
        fail(ApplyState::Idle, error, ErrorKind::ApplyFailed,
             QStringLiteral("Launcher executable %1 does not exist.").arg(target));
        return std::nullopt;
    }

    UpdateError writableError;
    if (!checkTargetWritable(&writableError)) {
        fail(ApplyState::Idle, error, writableError.kind, writableError.message);
        return std::nullopt;
    }

    QString sha256 = expectedSha256.trimmed().toLower();
    if (sha256.isEmpty()) {
        sha256 = Downloader::fileSha256Hex(artifactPath);
        if (sha256.isEmpty()) {
            fail(ApplyState::Idle, error, ErrorKind::ApplyFailed,
                 QStringLiteral("Failed to read update file %1.").arg(artifactPath));
            return std::nullopt;
        }
    }

    if (!stage(artifactPath, sha256, error)) {
        return std::nullopt;
    }

    if (m_platform.canReplaceRunningExecutable()) {
        return promoteInPlace(sha256, error);
    }
    return handOffToHelper(sha256, error);
}

bool UpdateApplier::stage(const QString& artifactPath, const QString& expectedSha256, UpdateError *error)
{
    const QString target = targetPath();
    const QString stagedPath = stagedPathFor(target);

    if (!copyWithOverwrite(artifactPath, stagedPath)) {
        QFile::remove(stagedPath);
        fail(ApplyState::Idle, error, ErrorKind::ApplyFailed,
             QStringLiteral("Failed to stage update file beside %1.").arg(target));
        return false;
    }

    m_state = ApplyState::Verifying;
    const QString stagedHash = Downloader::fileSha256Hex(stagedPath);
    if (stagedHash.isEmpty() || stagedHash != expectedSha256) {
        QFile::remove(stagedPath);
        fail(ApplyState::Idle, error, ErrorKind::VerificationFailed,
             QStringLiteral("Staged update does not match the expected hash (expected %1, got %2).")
                 .arg(expectedSha256, stagedHash.isEmpty() ? QStringLiteral("unreadable") : stagedHash));
        return false;
    }

    QString attributeError;
    if (!m_platform.applyExecutableAttributes(stagedPath, QFileInfo(target).permissions(), &attributeError)) {
        QFile::remove(stagedPath);
        fail(ApplyState::Idle, error, ErrorKind::ApplyFailed,
             QStringLiteral("Failed to preserve executable permissions: %1").arg(attributeError));
        return false;
    }

    m_state = ApplyState::Staged;
    qCInfo(lcUpdate).noquote() << QStringLiteral("[Updater] Staged update at %1").arg(stagedPath);
    return true;
}

std::optional<ApplyOutcome> UpdateApplier::promoteInPlace(const QString& sha256, UpdateError *error)
{
    const QString target = targetPath();
    const QString stagedPath = stagedPathFor(target);
    const QString backupPath = backupPathFor(target);

    if (!copyWithOverwrite(target, backupPath)) {
        QFile::remove(stagedPath);
        QFile::remove(backupPath);
        fail(ApplyState::Idle, error, ErrorKind::ApplyFailed,
             QStringLiteral("Failed to back up %1 before replacing it.").arg(target));
        return std::nullopt;
    }

    m_state = ApplyState::Applying;
    QString replaceError;
    const FileOpStatus replaced = m_platform.replaceFile(stagedPath, target, &replaceError);
    if (replaced != FileOpStatus::Ok) {
        QFile::remove(stagedPath);
        QFile::remove(backupPath);
        const bool denied = replaced == FileOpStatus::PermissionDenied && m_mode == InstallMode::Installed;
        fail(ApplyState::RolledBack, error, denied ? ErrorKind::ElevationRequired : ErrorKind::ApplyFailed,
             QStringLiteral("Failed to replace %1, original kept: %2").arg(target, replaceError));
        return std::nullopt;
    }

    const QString installedHash = Downloader::fileSha256Hex(target);
    if (installedHash != sha256) {
        QString restoreError;
        if (m_platform.replaceFile(backupPath, target, &restoreError) != FileOpStatus::Ok) {
            fail(ApplyState::Idle, error, ErrorKind::ApplyFailed,
                 QStringLiteral("Installed update is corrupt and restoring %1 failed: %2. "
                                "A copy of the previous build is at %3.").arg(target, restoreError, backupPath));
            return std::nullopt;
        }
        fail(ApplyState::RolledBack, error, ErrorKind::VerificationFailed,
             QStringLiteral("Installed update failed verification; previous build restored."));
        return std::nullopt;
    }

    QFile::remove(backupPath);
    m_state = ApplyState::Applied;
    qCInfo(lcUpdate).noquote() << QStringLiteral("[Updater] Update applied to %1").arg(target);
    return ApplyOutcome::AppliedInPlace;
}

std::optional<ApplyOutcome> UpdateApplier::handOffToHelper(const QString& sha256, UpdateError *error)
{
    const QString target = targetPath();
    const QString stagedPath = stagedPathFor(target);
    const QString helper = helperPath();

    if (!QFileInfo::exists(helper)) {
        QFile::remove(stagedPath);
        fail(ApplyState::Idle, error, ErrorKind::ApplyFailed,
             QStringLiteral("Updater helper %1 is missing.").arg(QDir::toNativeSeparators(helper)));
        return std::nullopt;
    }

    const QString updatesDir = updatesDirectory(m_dataDirectory);
    if (!QDir().mkpath(updatesDir)) {
        QFile::remove(stagedPath);
        fail(ApplyState::Idle, error, ErrorKind::ApplyFailed,
             QStringLiteral("Failed to create %1.").arg(updatesDir));
        return std::nullopt;
    }

    const QString jobPath = QDir(updatesDir).filePath(
        QStringLiteral("update-job-%1.json").arg(QString::number(QDateTime::currentMSecsSinceEpoch())));

    QJsonObject job;
    job.insert(QStringLiteral("pid"), static_cast<qint64>(QCoreApplication::applicationPid()));
    job.insert(QStringLiteral("current_executable"), target);
    job.insert(QStringLiteral("staged_executable"), stagedPath);
    job.insert(QStringLiteral("backup_executable"), backupPathFor(target));
    job.insert(QStringLiteral("working_directory"), QFileInfo(target).absolutePath());
    job.insert(QStringLiteral("expected_sha256"), sha256);
    job.insert(QStringLiteral("cleanup_source_on_success"), true);
    job.insert(QStringLiteral("timeout_ms"), kHelperTimeoutMs);
    job.insert(QStringLiteral("args"), QJsonArray::fromStringList(m_relaunchArguments));

    QSaveFile jobFile(jobPath);
    if (!jobFile.open(QIODevice::WriteOnly)
        || jobFile.write(QJsonDocument(job).toJson(QJsonDocument::Indented)) < 0
        || !jobFile.commit()) {
        QFile::remove(stagedPath);
        fail(ApplyState::Idle, error, ErrorKind::ApplyFailed, QStringLiteral("Failed to write update job file."));
        return std::nullopt;
    }

    QString launchError;
    if (!startHelperDetached(helper, jobPath, &launchError)) {
        QFile::remove(jobPath);
        QFile::remove(stagedPath);
        fail(ApplyState::Idle, error, ErrorKind::ApplyFailed,
             launchError.isEmpty() ? QStringLiteral("Failed to launch updater helper.") : launchError);
        return std::nullopt;
    }

    m_lastJobPath = jobPath;
    qCInfo(lcUpdate).noquote()
        << QStringLiteral("[Updater] Handed off update to helper process (job %1).").arg(jobPath);
    return ApplyOutcome::StagedForExternalRestart;
}

void UpdateApplier::fail(ApplyState state, UpdateError *error, ErrorKind kind, const QString& message)
{
    m_state = state;
    setError(error, kind, message);
    qCWarning(lcUpdate).noquote()
        << QStringLiteral("[Updater] %1 (%2)").arg(message, errorKindName(kind));
}

std::optional<HelperStatus> UpdateApplier::consumePendingStatus(const QString& dataDirectory, UpdateError *error)
{
    QDir updatesDir(updatesDirectory(dataDirectory));
    if (!updatesDir.exists()) {
        return std::nullopt;
    }

    const QFileInfoList statusFiles = updatesDir.entryInfoList(
        QStringList() << QStringLiteral("update-job-*.json.status.json"),
        QDir::Files,
        QDir::Name
    );
    if (statusFiles.isEmpty()) {
        return std::nullopt;
    }

    std::optional<HelperStatus> result;
    const QString statusPath = statusFiles.last().absoluteFilePath();
    QFile statusFile(statusPath);
    QJsonParseError parseError;
    QJsonDocument doc;
    const bool opened = statusFile.open(QIODevice::ReadOnly);
    if (opened) {
        doc = QJsonDocument::fromJson(statusFile.readAll(), &parseError);
        statusFile.close();
    }

    if (opened && parseError.error == QJsonParseError::NoError && doc.isObject()) {
        const QJsonObject root = doc.object();
        HelperStatus status;
        status.ok = root.value(QStringLiteral("ok")).toBool(false);
        status.message = root.value(QStringLiteral("message")).toString().trimmed();
        const qint64 timeMs = static_cast<qint64>(root.value(QStringLiteral("time_ms")).toDouble(0));
        if (timeMs > 0) {
            status.finishedAt = QDateTime::fromMSecsSinceEpoch(timeMs);
        }
        if (status.message.isEmpty()) {
            status.message = status.ok
                ? QStringLiteral("Update applied successfully.")
                : QStringLiteral("Updater helper failed.");
        }
        result = status;
    } else {
        setError(error, ErrorKind::ParseError,
                 QStringLiteral("Helper status %1 is unreadable; outcome of the last update is unknown.")
                     .arg(statusPath));
        qCWarning(lcUpdate).noquote() << QStringLiteral("[Updater] Ignoring unreadable helper status %1").arg(statusPath);
    }

    for (const QFileInfo& fileInfo : statusFiles) {
        QFile::remove(fileInfo.absoluteFilePath());
    }
    // Job files are only useful to the helper run that consumed them.
    const QFileInfoList jobFiles = updatesDir.entryInfoList(
        QStringList() << QStringLiteral("update-job-*.json"), QDir::Files);
    for (const QFileInfo& fileInfo : jobFiles) {
        QFile::remove(fileInfo.absoluteFilePath());
    }
    return result;
}

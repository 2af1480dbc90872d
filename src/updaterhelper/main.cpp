/*!
 * @file        main.cpp
 * @brief       TheBoysUpdater: replace-and-relaunch helper.
 *
 * @details
 * Started detached by the launcher on platforms that lock a running
 * executable. Waits for the launcher to exit, swaps the staged build in
 * with a backup of the old one, verifies it, relaunches it and records the
 * outcome in `<job>.status.json` for the launcher's next start.
 *
 * @copyright   Copyright (c) 2026 TheBoys.
 * @license     See LICENSE in repository root.
 */

#include <QByteArrayView>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QCryptographicHash>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QProcess>
#include <QSaveFile>
#include <QStringList>
#include <QThread>

#if defined(Q_OS_WIN)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <cerrno>
#include <csignal>
#endif

Q_LOGGING_CATEGORY(lcHelper, "theboys.updater")

namespace {
enum HelperExit {
    ExitOk = 0,
    ExitUsage = 2,
    ExitBadJob = 3,
    ExitTimeout = 4,
    ExitHashMismatch = 5,
    ExitReplaceFailed = 6,
    ExitInstalledHashMismatch = 7,
    ExitRelaunchFailed = 8
};

constexpr int kMinimumWaitMs = 5000;
constexpr int kDefaultWaitMs = 45000;

struct UpdateJob {
    qint64 pid = 0;
    QString currentExecutable;
    QString stagedExecutable;
    QString backupExecutable;
    QString workingDirectory;
    QString expectedSha256;
    QStringList args;
    int timeoutMs = kDefaultWaitMs;
    bool cleanupSourceOnSuccess = true;
};

QString fileDigest(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    QCryptographicHash hash(QCryptographicHash::Sha256);
    if (!hash.addData(&file)) {
        return {};
    }
    return QString::fromLatin1(hash.result().toHex());
}

void writeStatus(const QString& statusPath, bool ok, const QString& message)
{
    QJsonObject root;
    root.insert(QStringLiteral("ok"), ok);
    root.insert(QStringLiteral("message"), message);
    root.insert(QStringLiteral("time_ms"), QDateTime::currentMSecsSinceEpoch());

    QSaveFile file(statusPath);
    if (!file.open(QIODevice::WriteOnly)
        || file.write(QJsonDocument(root).toJson(QJsonDocument::Indented)) < 0
        || !file.commit()) {
        qCWarning(lcHelper).noquote() << QStringLiteral("Could not write status file %1").arg(statusPath);
    }
}

int finish(const QString& statusPath, HelperExit code, const QString& message)
{
    if (code == ExitOk) {
        qCInfo(lcHelper).noquote() << message;
    } else {
        qCWarning(lcHelper).noquote() << QStringLiteral("%1 (exit %2)").arg(message).arg(static_cast<int>(code));
    }
    writeStatus(statusPath, code == ExitOk, message);
    return code;
}

bool parseJob(const QString& jobPath, UpdateJob *jobOut, QString *errorOut)
{
    QFile file(jobPath);
    if (!file.open(QIODevice::ReadOnly)) {
        *errorOut = QStringLiteral("Could not open update job file.");
        return false;
    }
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        *errorOut = QStringLiteral("Update job file is invalid JSON.");
        return false;
    }

    const QJsonObject root = doc.object();
    UpdateJob job;
    job.pid = root.value(QStringLiteral("pid")).toVariant().toLongLong();
    job.currentExecutable = root.value(QStringLiteral("current_executable")).toString().trimmed();
    job.stagedExecutable = root.value(QStringLiteral("staged_executable")).toString().trimmed();
    job.backupExecutable = root.value(QStringLiteral("backup_executable")).toString().trimmed();
    job.workingDirectory = root.value(QStringLiteral("working_directory")).toString().trimmed();
    job.expectedSha256 = root.value(QStringLiteral("expected_sha256")).toString().trimmed().toLower();
    job.timeoutMs = qMax(kMinimumWaitMs, root.value(QStringLiteral("timeout_ms")).toInt(kDefaultWaitMs));
    job.cleanupSourceOnSuccess = root.value(QStringLiteral("cleanup_source_on_success")).toBool(true);
    for (const QJsonValue& value : root.value(QStringLiteral("args")).toArray()) {
        job.args.append(value.toString());
    }
    if (job.workingDirectory.isEmpty()) {
        job.workingDirectory = QFileInfo(job.currentExecutable).absolutePath();
    }

    if (job.pid <= 0
        || job.currentExecutable.isEmpty()
        || job.stagedExecutable.isEmpty()
        || job.backupExecutable.isEmpty()) {
        *errorOut = QStringLiteral("Update job missing required fields.");
        return false;
    }

    *jobOut = job;
    return true;
}

bool isProcessRunning(qint64 pid)
{
    if (pid <= 0) {
        return false;
    }
#if defined(Q_OS_WIN)
    HANDLE handle = OpenProcess(SYNCHRONIZE, FALSE, static_cast<DWORD>(pid));
    if (handle == nullptr) {
        return false;
    }
    const DWORD rc = WaitForSingleObject(handle, 0);
    CloseHandle(handle);
    return rc == WAIT_TIMEOUT;
#else
    if (kill(static_cast<pid_t>(pid), 0) == 0) {
        return true;
    }
    return errno != ESRCH;
#endif
}

bool waitForProcessExit(qint64 pid, int timeoutMs)
{
    const qint64 started = QDateTime::currentMSecsSinceEpoch();
    while (isProcessRunning(pid)) {
        if (QDateTime::currentMSecsSinceEpoch() - started > timeoutMs) {
            return false;
        }
        QThread::msleep(120);
    }
    return true;
}

// Windows keeps a just-exited image locked for a moment; retry renames there.
bool renameWithRetry(const QString& fromPath, const QString& toPath)
{
#if defined(Q_OS_WIN)
    constexpr int attempts = 40;
#else
    constexpr int attempts = 1;
#endif
    for (int i = 0; i < attempts; ++i) {
        if (QFile::rename(fromPath, toPath)) {
            return true;
        }
        QThread::msleep(150);
    }
    return false;
}

bool removeWithRetry(const QString& path)
{
    for (int i = 0; i < 40; ++i) {
        if (!QFileInfo::exists(path) || QFile::remove(path)) {
            return true;
        }
        QThread::msleep(150);
    }
    return !QFileInfo::exists(path);
}

bool replaceExecutable(const UpdateJob& job, QString *errorOut)
{
    if (!QFileInfo::exists(job.stagedExecutable)) {
        *errorOut = QStringLiteral("Staged file does not exist.");
        return false;
    }
    if (!removeWithRetry(job.backupExecutable)) {
        *errorOut = QStringLiteral("Could not remove stale backup.");
        return false;
    }

    const QFileDevice::Permissions originalPermissions = QFileInfo(job.currentExecutable).permissions();

    if (!renameWithRetry(job.currentExecutable, job.backupExecutable)) {
        *errorOut = QStringLiteral("Could not move current executable to backup.");
        return false;
    }
    if (!renameWithRetry(job.stagedExecutable, job.currentExecutable)) {
        if (!renameWithRetry(job.backupExecutable, job.currentExecutable)) {
            qCCritical(lcHelper).noquote() << QStringLiteral("[Helper] Could not restore backup %1").arg(job.backupExecutable);
        }
        *errorOut = QStringLiteral("Could not place staged executable.");
        return false;
    }

#if !defined(Q_OS_WIN)
    if (!QFile::setPermissions(job.currentExecutable, originalPermissions | QFileDevice::ExeOwner)) {
        if (!QFile::remove(job.currentExecutable) || !QFile::rename(job.backupExecutable, job.currentExecutable)) {
            qCCritical(lcHelper).noquote() << QStringLiteral("[Helper] Could not restore backup %1").arg(job.backupExecutable);
        }
        *errorOut = QStringLiteral("Failed to restore executable permissions.");
        return false;
    }
#else
    Q_UNUSED(originalPermissions);
#endif
    return true;
}

bool rollback(const UpdateJob& job)
{
    if (!QFileInfo::exists(job.backupExecutable)) {
        return false;
    }
    if (!removeWithRetry(job.currentExecutable)) {
        return false;
    }
    return renameWithRetry(job.backupExecutable, job.currentExecutable);
}
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("TheBoysUpdater"));

    QCommandLineParser parser;
    const QCommandLineOption jobOption(QStringLiteral("job"),
                                       QStringLiteral("Update job file written by the launcher."),
                                       QStringLiteral("path"));
    parser.addOption(jobOption);
    parser.parse(app.arguments());
    if (!parser.isSet(jobOption) || parser.value(jobOption).isEmpty()) {
        qCWarning(lcHelper) << "usage: TheBoysUpdater --job <path>";
        return ExitUsage;
    }

    const QString jobPath = parser.value(jobOption);
    const QString statusPath = jobPath + QStringLiteral(".status.json");

    UpdateJob job;
    QString jobError;
    if (!parseJob(jobPath, &job, &jobError)) {
        return finish(statusPath, ExitBadJob, jobError);
    }

    if (!waitForProcessExit(job.pid, job.timeoutMs)) {
        return finish(statusPath, ExitTimeout, QStringLiteral("Timed out waiting for the launcher to exit."));
    }

    const QString stagedHash = fileDigest(job.stagedExecutable);
    if (stagedHash.isEmpty() || (!job.expectedSha256.isEmpty() && stagedHash != job.expectedSha256)) {
        QFile::remove(job.stagedExecutable);
        return finish(statusPath, ExitHashMismatch, QStringLiteral("Staged file hash verification failed."));
    }

    QString replaceError;
    if (!replaceExecutable(job, &replaceError)) {
        return finish(statusPath, ExitReplaceFailed, replaceError);
    }

    if (fileDigest(job.currentExecutable) != stagedHash) {
        const bool restored = rollback(job);
        return finish(statusPath, ExitInstalledHashMismatch,
                      restored ? QStringLiteral("Installed file hash validation failed. Rolled back.")
                               : QStringLiteral("Installed file hash validation failed. Rollback failed."));
    }

    // The relaunched launcher reads the status on start, so it must exist first.
    finish(statusPath, ExitOk, QStringLiteral("Update applied successfully."));
    if (!QProcess::startDetached(job.currentExecutable, job.args, job.workingDirectory)) {
        const bool restored = rollback(job);
        return finish(statusPath, ExitRelaunchFailed,
                      restored ? QStringLiteral("Failed to relaunch updated launcher. Rolled back.")
                               : QStringLiteral("Failed to relaunch updated launcher. Rollback failed."));
    }

    if (job.cleanupSourceOnSuccess) {
        QFile::remove(job.stagedExecutable);
    }
    QFile::remove(job.backupExecutable);
    QFile::remove(jobPath);
    return ExitOk;
}

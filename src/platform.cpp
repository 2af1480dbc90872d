module;
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSettings>
#include <QString>
#include <QStringList>
#include <QSysInfo>

#include <memory>

#if defined(Q_OS_WIN)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <cerrno>
#include <cstdio>
#include <cstring>
#endif

#if defined(Q_OS_MACOS)
#include <sys/sysctl.h>
#include <sys/types.h>
#include <sys/xattr.h>
#endif

module theboys.backend.platform;

import theboys.backend.logging;

namespace {
constexpr qint64 kFallbackMemoryMB = 8192;

QString cleanAbsolute(const QString& path)
{
    return QDir::cleanPath(QFileInfo(path).absoluteFilePath());
}
}

QString PlatformBackend::executablePath() const
{
    return QCoreApplication::applicationFilePath();
}

FileOpStatus PlatformBackend::replaceFile(const QString& sourcePath, const QString& targetPath, QString *errorMessage)
{
#if defined(Q_OS_WIN)
    const std::wstring from = QDir::toNativeSeparators(sourcePath).toStdWString();
    const std::wstring to = QDir::toNativeSeparators(targetPath).toStdWString();
    if (MoveFileExW(from.c_str(), to.c_str(), MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        return FileOpStatus::Ok;
    }
    const DWORD code = GetLastError();
    setError(errorMessage, QStringLiteral("Could not replace %1 (Windows error %2).").arg(targetPath).arg(code));
    return code == ERROR_ACCESS_DENIED ? FileOpStatus::PermissionDenied : FileOpStatus::Failed;
#else
    const QByteArray from = QFile::encodeName(sourcePath);
    const QByteArray to = QFile::encodeName(targetPath);
    if (std::rename(from.constData(), to.constData()) == 0) {
        return FileOpStatus::Ok;
    }
    const int code = errno;
    setError(errorMessage, QStringLiteral("Could not replace %1: %2")
        .arg(targetPath, QString::fromLocal8Bit(std::strerror(code))));
    return (code == EACCES || code == EPERM || code == EROFS)
        ? FileOpStatus::PermissionDenied
        : FileOpStatus::Failed;
#endif
}

bool PlatformBackend::applyExecutableAttributes(const QString& path, QFileDevice::Permissions permissions, QString *errorMessage)
{
    const QFileDevice::Permissions executable = permissions
        | QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner;
    if (!QFile::setPermissions(path, executable)) {
        setError(errorMessage, QStringLiteral("Failed to set executable permissions on %1.").arg(path));
        return false;
    }
#if !defined(Q_OS_WIN)
    const QFileDevice::Permissions applied = QFileInfo(path).permissions();
    if (!applied.testFlag(QFileDevice::ExeOwner)) {
        setError(errorMessage, QStringLiteral("Executable bit did not stick on %1.").arg(path));
        return false;
    }
#endif
    return true;
}

bool PlatformBackend::isPathWithin(const QString& path, const QStringList& roots)
{
    const QString cleaned = cleanAbsolute(path);
    for (const QString& root : roots) {
        if (root.trimmed().isEmpty()) {
            continue;
        }
        const QString cleanRoot = cleanAbsolute(root);
        if (cleaned == cleanRoot || cleaned.startsWith(cleanRoot + QLatin1Char('/'))) {
            return true;
        }
    }
    return false;
}

void PlatformBackend::setError(QString *errorMessage, const QString& message)
{
    if (errorMessage != nullptr) {
        *errorMessage = message;
    }
}

namespace {
#if defined(Q_OS_WIN)
class WindowsPlatformBackend final : public PlatformBackend
{
public:
    QString osName() const override
    {
        return QStringLiteral("windows");
    }

    bool isRegisteredInstall(const QString& executableDir) const override
    {
        QSettings registry(
            QStringLiteral("HKEY_CURRENT_USER\\Software\\%1").arg(kApplicationName),
            QSettings::NativeFormat
        );
        const QString installPath = registry.value(QStringLiteral("InstallPath")).toString().trimmed();
        if (installPath.isEmpty() || !QFileInfo::exists(installPath)) {
            return false;
        }
        return QDir::cleanPath(QFileInfo(installPath).absoluteFilePath()).compare(
            QDir::cleanPath(QFileInfo(executableDir).absoluteFilePath()), Qt::CaseInsensitive) == 0;
    }

    QString userDataDirectory() const override
    {
        const QString localAppData = qEnvironmentVariable("LOCALAPPDATA").trimmed();
        if (!localAppData.isEmpty()) {
            return QDir(localAppData).filePath(kApplicationName);
        }
        return QDir(QDir::homePath()).filePath(QStringLiteral(".theboyslauncher"));
    }

    bool portableDataBesideExecutable() const override
    {
        return true;
    }

    qint64 totalMemoryMB() const override
    {
        MEMORYSTATUSEX status;
        status.dwLength = sizeof(status);
        if (!GlobalMemoryStatusEx(&status)) {
            qCWarning(lcPlatform).noquote() << "[Platform] GlobalMemoryStatusEx failed, assuming 8 GB.";
            return kFallbackMemoryMB;
        }
        const qint64 totalMB = static_cast<qint64>(status.ullTotalPhys / (1024ull * 1024ull));
        return totalMB > 0 ? totalMB : kFallbackMemoryMB;
    }

    bool canReplaceRunningExecutable() const override
    {
        return false;
    }

    QString updateAssetName() const override
    {
        return kApplicationName + QStringLiteral(".exe");
    }
};
#else
class PosixPlatformBackend : public PlatformBackend
{
public:
    bool isRegisteredInstall(const QString& executableDir) const override
    {
        return isPathWithin(executableDir, systemApplicationRoots());
    }

    bool portableDataBesideExecutable() const override
    {
        return false;
    }

    bool canReplaceRunningExecutable() const override
    {
        return true;
    }

protected:
    virtual QStringList systemApplicationRoots() const = 0;
};

#if defined(Q_OS_MACOS)
class MacPlatformBackend final : public PosixPlatformBackend
{
public:
    QString osName() const override
    {
        return QStringLiteral("macos");
    }

    QString userDataDirectory() const override
    {
        return QDir(QDir::homePath()).filePath(
            QStringLiteral("Library/Application Support/%1").arg(kApplicationName));
    }

    qint64 totalMemoryMB() const override
    {
        quint64 bytes = 0;
        size_t length = sizeof(bytes);
        if (sysctlbyname("hw.memsize", &bytes, &length, nullptr, 0) != 0 || bytes == 0) {
            qCWarning(lcPlatform).noquote() << "[Platform] sysctl hw.memsize failed, assuming 8 GB.";
            return kFallbackMemoryMB;
        }
        return static_cast<qint64>(bytes / (1024ull * 1024ull));
    }

    bool applyExecutableAttributes(const QString& path, QFileDevice::Permissions permissions, QString *errorMessage) override
    {
        if (!PosixPlatformBackend::applyExecutableAttributes(path, permissions, errorMessage)) {
            return false;
        }
        const QByteArray nativePath = QFile::encodeName(path);
        if (removexattr(nativePath.constData(), "com.apple.quarantine", 0) != 0 && errno != ENOATTR) {
            qCWarning(lcPlatform).noquote()
                << QStringLiteral("[Platform] Could not clear quarantine attribute on %1.").arg(path);
        }
        return true;
    }

    QString updateAssetName() const override
    {
        return kApplicationName + QStringLiteral("-mac-universal");
    }

protected:
    QStringList systemApplicationRoots() const override
    {
        return {
            QStringLiteral("/Applications"),
            QDir(QDir::homePath()).filePath(QStringLiteral("Applications")),
        };
    }
};
#else
class LinuxPlatformBackend final : public PosixPlatformBackend
{
public:
    QString osName() const override
    {
        return QStringLiteral("linux");
    }

    QString userDataDirectory() const override
    {
        return QDir(QDir::homePath()).filePath(QStringLiteral(".theboyslauncher"));
    }

    qint64 totalMemoryMB() const override
    {
        QFile meminfo(QStringLiteral("/proc/meminfo"));
        if (!meminfo.open(QIODevice::ReadOnly | QIODevice::Text)) {
            qCWarning(lcPlatform).noquote() << "[Platform] /proc/meminfo unreadable, assuming 8 GB.";
            return kFallbackMemoryMB;
        }
        // MemTotal:       16384000 kB
        while (!meminfo.atEnd()) {
            const QString line = QString::fromLatin1(meminfo.readLine()).simplified();
            if (!line.startsWith(QStringLiteral("MemTotal:"))) {
                continue;
            }
            const QStringList fields = line.split(QLatin1Char(' '), Qt::SkipEmptyParts);
            bool ok = false;
            const qint64 kb = fields.size() >= 2 ? fields.at(1).toLongLong(&ok) : 0;
            if (ok && kb > 0) {
                return kb / 1024;
            }
            break;
        }
        return kFallbackMemoryMB;
    }

    QString updateAssetName() const override
    {
        return kApplicationName + QStringLiteral("-linux");
    }

protected:
    QStringList systemApplicationRoots() const override
    {
        return {
            QStringLiteral("/usr/bin"),
            QStringLiteral("/usr/local/bin"),
            QStringLiteral("/usr/lib"),
            QStringLiteral("/usr/share"),
            QStringLiteral("/opt"),
            QStringLiteral("/snap"),
            QStringLiteral("/var/lib/flatpak"),
        };
    }
};
#endif
#endif
}

std::unique_ptr<PlatformBackend> createPlatformBackend()
{
#if defined(Q_OS_WIN)
    return std::make_unique<WindowsPlatformBackend>();
#elif defined(Q_OS_MACOS)
    return std::make_unique<MacPlatformBackend>();
#else
    return std::make_unique<LinuxPlatformBackend>();
#endif
}

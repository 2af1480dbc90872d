module;
#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QString>

module theboys.backend.installationprobe;

import theboys.backend.logging;

QString InstallationRecord::modeName() const
{
    return mode == InstallMode::Installed ? QStringLiteral("installed") : QStringLiteral("portable");
}

InstallationProbe::InstallationProbe(const PlatformBackend& platform)
    : m_platform(platform)
{
}

InstallationRecord InstallationProbe::probe() const
{
    InstallationRecord record;
    record.rootPath = QDir::cleanPath(QFileInfo(m_platform.executablePath()).absolutePath());
    record.mode = m_platform.isRegisteredInstall(record.rootPath)
        ? InstallMode::Installed
        : InstallMode::Portable;

    const QString overridePath = qEnvironmentVariable(kDataDirOverrideEnv).trimmed();
    if (!overridePath.isEmpty()) {
        record.dataPath = QDir::cleanPath(QFileInfo(overridePath).absoluteFilePath());
        record.dataPathOverridden = true;
    } else if (record.mode == InstallMode::Portable && m_platform.portableDataBesideExecutable()) {
        record.dataPath = record.rootPath;
    } else {
        record.dataPath = QDir::cleanPath(m_platform.userDataDirectory());
    }

    qCDebug(lcInstall).noquote()
        << QStringLiteral("[Install] %1 mode on %2, root %3, data %4%5")
               .arg(record.modeName(),
                    m_platform.osName(),
                    record.rootPath,
                    record.dataPath,
                    record.dataPathOverridden ? QStringLiteral(" (override)") : QString());
    return record;
}

QString InstallationProbe::dataDirectory() const
{
    return probe().dataPath;
}

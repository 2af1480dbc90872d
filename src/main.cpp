#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QLoggingCategory>
#include <QSysInfo>
#include <QTextStream>

#include <memory>
#include <optional>

import theboys.backend.downloader;
import theboys.backend.installationprobe;
import theboys.backend.logging;
import theboys.backend.migrator;
import theboys.backend.platform;
import theboys.backend.releaseclient;
import theboys.backend.selfupdater;
import theboys.backend.settingsstore;
import theboys.backend.updateapplier;
import theboys.backend.updateerror;
import theboys.backend.versionmodel;

namespace {
QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err()
{
    static QTextStream stream(stderr);
    return stream;
}

std::optional<bool> parseChannel(const QString& value)
{
    const QString lowered = value.trimmed().toLower();
    if (lowered == QStringLiteral("stable")) {
        return false;
    }
    if (lowered == QStringLiteral("dev")) {
        return true;
    }
    return std::nullopt;
}

int fail(const UpdateError& error)
{
    err() << QStringLiteral("error: %1").arg(error.message) << Qt::endl;
    return exitCodeFor(error.kind);
}
}

auto main(int argc, char *argv[]) -> int
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("TheBoys"));
    QCoreApplication::setApplicationName(kApplicationName);
#ifdef THEBOYS_VERSION
    QCoreApplication::setApplicationVersion(QStringLiteral(THEBOYS_VERSION));
#else
    QCoreApplication::setApplicationVersion(QStringLiteral("0.0.0"));
#endif

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("TheBoys modpack launcher"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption checkOption(QStringLiteral("check-update"),
                                         QStringLiteral("Check the release feed for a newer launcher."));
    const QCommandLineOption updateOption(QStringLiteral("update"),
                                          QStringLiteral("Download and install a newer launcher if one exists."));
    const QCommandLineOption channelOption(QStringLiteral("channel"),
                                           QStringLiteral("Channel for this run only (stable or dev)."),
                                           QStringLiteral("channel"));
    const QCommandLineOption switchOption(QStringLiteral("switch-channel"),
                                          QStringLiteral("Persistently switch to a channel and install its build."),
                                          QStringLiteral("channel"));
    const QCommandLineOption noMigrateOption(QStringLiteral("no-migrate"),
                                             QStringLiteral("Skip migration of a legacy portable layout."));
    const QCommandLineOption pathsOption(QStringLiteral("print-paths"),
                                         QStringLiteral("Print installation mode and data paths, then exit."));
    parser.addOption(checkOption);
    parser.addOption(updateOption);
    parser.addOption(channelOption);
    parser.addOption(switchOption);
    parser.addOption(noMigrateOption);
    parser.addOption(pathsOption);
    parser.process(app);

    std::optional<bool> channelOverride;
    if (parser.isSet(channelOption)) {
        channelOverride = parseChannel(parser.value(channelOption));
        if (!channelOverride.has_value()) {
            err() << QStringLiteral("error: unknown channel '%1'").arg(parser.value(channelOption)) << Qt::endl;
            return ExitCode::UsageError;
        }
    }
    std::optional<bool> switchTarget;
    if (parser.isSet(switchOption)) {
        switchTarget = parseChannel(parser.value(switchOption));
        if (!switchTarget.has_value()) {
            err() << QStringLiteral("error: unknown channel '%1'").arg(parser.value(switchOption)) << Qt::endl;
            return ExitCode::UsageError;
        }
    }

    const std::unique_ptr<PlatformBackend> platform = createPlatformBackend();
    const InstallationRecord install = InstallationProbe(*platform).probe();

    if (parser.isSet(pathsOption)) {
        out() << QStringLiteral("mode: %1").arg(install.modeName()) << Qt::endl
              << QStringLiteral("root: %1").arg(QDir::toNativeSeparators(install.rootPath)) << Qt::endl
              << QStringLiteral("data: %1").arg(QDir::toNativeSeparators(install.dataPath)) << Qt::endl;
        return ExitCode::Success;
    }

    if (!QDir().mkpath(install.dataPath)) {
        err() << QStringLiteral("error: cannot create data directory %1").arg(install.dataPath) << Qt::endl;
        return ExitCode::GenericFailure;
    }

    // Settings live in the data directory, so migration has to finish first.
    if (!parser.isSet(noMigrateOption)) {
        UpdateError migrationError;
        Migrator migrator(install.rootPath, install.dataPath);
        const MigrationResult migration = migrator.run(&migrationError);
        if (migration.state.status == MigrationStatus::Failed) {
            return fail(migrationError);
        }
        if (migration.state.status == MigrationStatus::Completed && !migration.migratedEntries.isEmpty()) {
            out() << QStringLiteral("Migrated legacy data (%1 files, %2 conflicts). Backup: %3")
                         .arg(migration.copiedFiles)
                         .arg(migration.conflicts.size())
                         .arg(QDir::toNativeSeparators(migration.state.backupPath))
                  << Qt::endl;
        }
    }

    const SettingsStore settingsStore(platform->totalMemoryMB());
    UpdateError settingsError;
    Settings settings = settingsStore.load(install.dataPath, &settingsError);

    applyLogFilter(settings.debugEnabled);
    QString sinkError;
    if (!installFileLogSink(QDir(install.dataPath).filePath(QStringLiteral("logs")), &sinkError)) {
        qCWarning(lcPlatform).noquote() << QStringLiteral("[Launcher] File logging disabled: %1").arg(sinkError);
    }
    qCInfo(lcInstall).noquote()
        << QStringLiteral("[Launcher] %1 %2 (%3, data %4)")
               .arg(kApplicationName, QCoreApplication::applicationVersion(), install.modeName(), install.dataPath);
    if (settingsError.isError()) {
        qCWarning(lcSettings).noquote() << QStringLiteral("[Launcher] %1").arg(settingsError.message);
    }
    qCInfo(lcSettings).noquote() << QStringLiteral("[Launcher] Game memory %1 MB (%2)")
                                        .arg(settingsStore.memoryForModpack(settings, 0))
                                        .arg(settings.autoRAM ? QStringLiteral("auto") : QStringLiteral("manual"));

    UpdateError statusError;
    if (const std::optional<HelperStatus> status = UpdateApplier::consumePendingStatus(install.dataPath, &statusError)) {
        if (status->ok) {
            qCInfo(lcUpdate).noquote() << QStringLiteral("[Updater] %1").arg(status->message);
        } else {
            qCWarning(lcUpdate).noquote() << QStringLiteral("[Updater] Install failed: %1").arg(status->message);
        }
    } else if (statusError.isError()) {
        err() << statusError.message << Qt::endl;
    }

    const bool wantsUpdate = parser.isSet(updateOption);
    if (!wantsUpdate && !parser.isSet(checkOption) && !switchTarget.has_value()) {
        return ExitCode::Success;
    }

    ReleaseClient releaseClient(AssetCriteria{
        platform->updateAssetName(),
        platform->osName(),
        QSysInfo::currentCpuArchitecture(),
    });
    Downloader downloader;
    UpdateApplier applier(*platform, install.mode, install.dataPath);
    SelfUpdater updater(releaseClient, downloader, applier, settingsStore, install.dataPath);

    const auto reportOutcome = [](ApplyOutcome outcome) {
        out() << (outcome == ApplyOutcome::AppliedInPlace
                      ? QStringLiteral("Update installed. Restart the launcher to use it.")
                      : QStringLiteral("Update staged. The launcher restarts once this process exits."))
              << Qt::endl;
    };

    if (switchTarget.has_value()) {
        UpdateError switchError;
        const std::optional<ChannelSwitch> switched = updater.switchChannel(settings, *switchTarget, &switchError);
        if (!switched.has_value()) {
            return fail(switchError);
        }
        if (switched->fellBackToStable) {
            out() << QStringLiteral("Dev build unavailable, installed stable %1 instead.")
                         .arg(switched->installed.version.toString())
                  << Qt::endl;
        }
        reportOutcome(switched->outcome);
        return ExitCode::Success;
    }

    Settings effective = settings;
    if (channelOverride.has_value()) {
        effective.devBuildsEnabled = *channelOverride;
    }

    const Version current = VersionModel::parse(QCoreApplication::applicationVersion());
    UpdateError checkError;
    const std::optional<UpdateCheck> check = updater.checkForUpdate(current, effective, &checkError);
    if (!check.has_value()) {
        return fail(checkError);
    }
    if (check->skipped) {
        out() << QStringLiteral("Development build, update check skipped.") << Qt::endl;
        return ExitCode::Success;
    }
    if (!check->updateAvailable) {
        out() << QStringLiteral("Up to date (%1, %2 channel).")
                     .arg(current.toString(), releaseChannelName(check->channel))
              << Qt::endl;
        return ExitCode::Success;
    }

    out() << QStringLiteral("Update available: %1 -> %2")
                 .arg(current.toString(), check->latest->version.toString())
          << Qt::endl;
    if (!wantsUpdate) {
        return ExitCode::Success;
    }

    UpdateError installError;
    const std::optional<ApplyOutcome> outcome = updater.installRelease(*check->latest, &installError);
    if (!outcome.has_value()) {
        return fail(installError);
    }
    reportOutcome(*outcome);
    return ExitCode::Success;
}

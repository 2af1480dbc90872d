#include <QtTest>

#include <QCryptographicHash>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include <memory>
#include <optional>

#include "support/fakeplatform.hpp"
#include "support/httpstub.hpp"

#ifndef Q_MOC_RUN
import theboys.backend.downloader;
import theboys.backend.installationprobe;
import theboys.backend.releaseclient;
import theboys.backend.selfupdater;
import theboys.backend.settingsstore;
import theboys.backend.updateapplier;
import theboys.backend.updateerror;
import theboys.backend.versionmodel;
#endif

namespace {
QString sha256Of(const QByteArray& data)
{
    return QString::fromLatin1(QCryptographicHash::hash(data, QCryptographicHash::Sha256).toHex());
}

QByteArray readAll(const QString& path)
{
    QFile file(path);
    return file.open(QIODevice::ReadOnly) ? file.readAll() : QByteArray();
}

bool writeFile(const QString& path, const QByteArray& content)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    return file.open(QIODevice::WriteOnly | QIODevice::Truncate) && file.write(content) == content.size();
}

QJsonObject release(const QString& tag, const QUrl& assetUrl, const QByteArray& content, bool prerelease)
{
    QJsonObject asset;
    asset.insert(QStringLiteral("name"), QStringLiteral("TheBoysLauncher-linux"));
    asset.insert(QStringLiteral("browser_download_url"), assetUrl.toString());
    asset.insert(QStringLiteral("digest"), QStringLiteral("sha256:%1").arg(sha256Of(content)));

    QJsonObject object;
    object.insert(QStringLiteral("tag_name"), tag);
    object.insert(QStringLiteral("prerelease"), prerelease);
    object.insert(QStringLiteral("assets"), QJsonArray{asset});
    return object;
}
}

class SelfUpdaterTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init()
    {
        m_root.reset(new QTemporaryDir());
        QVERIFY(m_root->isValid());
        m_target = m_root->filePath(QStringLiteral("bin/TheBoysLauncher"));
        m_dataDir = m_root->filePath(QStringLiteral("data"));
        QVERIFY(writeFile(m_target, m_runningBuild));
        QVERIFY(QFile::setPermissions(m_target, QFileDevice::ReadOwner | QFileDevice::WriteOwner
                                                    | QFileDevice::ExeOwner));

        m_platform.reset(new FakePlatform());
        m_platform->executable = m_target;
        m_server.reset(new HttpStub());
        QVERIFY(m_server->isListening());

        m_releaseClient.reset(new ReleaseClient(
            AssetCriteria{QStringLiteral("TheBoysLauncher-linux"), QStringLiteral("linux"), QStringLiteral("x86_64")},
            m_server->url(QStringLiteral("/releases"))));
        m_downloader.reset(new Downloader());
        m_downloader->setBaseDelay(0);
        m_applier.reset(new UpdateApplier(*m_platform, InstallMode::Portable, m_dataDir));
        m_store.reset(new SettingsStore(8192));
        m_updater.reset(new SelfUpdater(*m_releaseClient, *m_downloader, *m_applier, *m_store, m_dataDir));
        m_updater->setCheckTimeout(5000);
    }

    void endToEnd_updatesStableBuild()
    {
        publishFeed();
        m_server->enqueue(QStringLiteral("/assets/stable"), 200, m_stableBuild);

        const Settings settings = m_store->defaults();
        const Version current = VersionModel::parse(QStringLiteral("1.2.0"));

        UpdateError error;
        const std::optional<UpdateCheck> check = m_updater->checkForUpdate(current, settings, &error);
        QVERIFY2(check.has_value(), qPrintable(error.message));
        QVERIFY(check->updateAvailable);
        QCOMPARE(check->channel, ReleaseChannel::Stable);
        QCOMPARE(check->latest->version.toString(), QStringLiteral("1.3.0"));

        const std::optional<ApplyOutcome> outcome = m_updater->installRelease(*check->latest, &error);
        QVERIFY2(outcome.has_value(), qPrintable(error.message));
        QCOMPARE(*outcome, ApplyOutcome::AppliedInPlace);
        QCOMPARE(readAll(m_target), m_stableBuild);

        const std::optional<UpdateCheck> recheck =
            m_updater->checkForUpdate(check->latest->version, settings, &error);
        QVERIFY(recheck.has_value());
        QVERIFY(!recheck->updateAvailable);
    }

    void checkForUpdate_skipsUnversionedBuild()
    {
        publishFeed();
        UpdateError error;
        const std::optional<UpdateCheck> check =
            m_updater->checkForUpdate(VersionModel::parse(QStringLiteral("dev")), m_store->defaults(), &error);
        QVERIFY(check.has_value());
        QVERIFY(check->skipped);
        QVERIFY(!check->updateAvailable);
        QCOMPARE(m_server->hits(QStringLiteral("/releases")), 0);
    }

    void checkForUpdate_followsDevPreference()
    {
        publishFeed();
        Settings settings = m_store->defaults();
        settings.devBuildsEnabled = true;

        const std::optional<UpdateCheck> check =
            m_updater->checkForUpdate(VersionModel::parse(QStringLiteral("1.3.0")), settings);
        QVERIFY(check.has_value());
        QCOMPARE(check->channel, ReleaseChannel::Dev);
        QVERIFY(check->updateAvailable);
        QCOMPARE(check->latest->tag, QStringLiteral("v1.4.0-dev.abc1234"));
    }

    void checkForUpdate_surfacesFeedFailure()
    {
        m_server->enqueue(QStringLiteral("/releases"), 500, QByteArrayLiteral("down"));
        UpdateError error;
        QVERIFY(!m_updater->checkForUpdate(VersionModel::parse(QStringLiteral("1.2.0")), m_store->defaults(), &error)
                     .has_value());
        QCOMPARE(error.kind, ErrorKind::UpdateCheckFailed);
        QCOMPARE(exitCodeFor(error.kind), ExitCode::UpdateSystemFailure);
        QCOMPARE(readAll(m_target), m_runningBuild);
    }

    void switchChannel_installsDevAndPersistsPreference()
    {
        publishFeed();
        m_server->enqueue(QStringLiteral("/assets/dev"), 200, m_devBuild);

        UpdateError error;
        const std::optional<ChannelSwitch> switched = m_updater->switchChannel(m_store->defaults(), true, &error);
        QVERIFY2(switched.has_value(), qPrintable(error.message));
        QVERIFY(!switched->fellBackToStable);
        QVERIFY(switched->settings.devBuildsEnabled);
        QCOMPARE(switched->installed.tag, QStringLiteral("v1.4.0-dev.abc1234"));
        QCOMPARE(readAll(m_target), m_devBuild);
        QVERIFY(m_store->load(m_dataDir).devBuildsEnabled);
    }

    void switchChannel_downgradesToStable()
    {
        publishFeed();
        m_server->enqueue(QStringLiteral("/assets/stable"), 200, m_stableBuild);
        Settings settings = m_store->defaults();
        settings.devBuildsEnabled = true;
        QVERIFY(m_store->save(m_dataDir, settings));

        const std::optional<ChannelSwitch> switched = m_updater->switchChannel(settings, false);
        QVERIFY(switched.has_value());
        QCOMPARE(switched->installed.version.toString(), QStringLiteral("1.3.0"));
        QCOMPARE(readAll(m_target), m_stableBuild);
        QVERIFY(!m_store->load(m_dataDir).devBuildsEnabled);
    }

    void switchChannel_fallsBackToStableWhenDevInstallFails()
    {
        publishFeed();
        m_server->enqueue(QStringLiteral("/assets/dev"), 500, QByteArrayLiteral("broken"));
        m_server->enqueue(QStringLiteral("/assets/stable"), 200, m_stableBuild);

        UpdateError error;
        const std::optional<ChannelSwitch> switched = m_updater->switchChannel(m_store->defaults(), true, &error);
        QVERIFY2(switched.has_value(), qPrintable(error.message));
        QVERIFY(switched->fellBackToStable);
        QVERIFY(!switched->settings.devBuildsEnabled);
        QCOMPARE(readAll(m_target), m_stableBuild);
        QVERIFY(!m_store->load(m_dataDir).devBuildsEnabled);
    }

    void switchChannel_restoresPreferenceWhenEverythingFails()
    {
        publishFeed();
        m_server->enqueue(QStringLiteral("/assets/dev"), 500, QByteArrayLiteral("broken"));
        m_server->enqueue(QStringLiteral("/assets/stable"), 500, QByteArrayLiteral("broken"));
        Settings original = m_store->defaults();
        original.memoryMB = 5000;
        original.autoRAM = false;
        QVERIFY(m_store->save(m_dataDir, original));

        UpdateError error;
        QVERIFY(!m_updater->switchChannel(original, true, &error).has_value());
        QCOMPARE(error.kind, ErrorKind::DownloadFailed);
        QCOMPARE(m_store->load(m_dataDir), original);
        QCOMPARE(readAll(m_target), m_runningBuild);
    }

    void switchChannel_requiresReachableChannel()
    {
        m_server->enqueue(QStringLiteral("/releases"), 200,
                          QJsonDocument(QJsonArray{release(QStringLiteral("v1.3.0"),
                                                           m_server->url(QStringLiteral("/assets/stable")),
                                                           m_stableBuild, false)}).toJson());

        UpdateError error;
        QVERIFY(!m_updater->switchChannel(m_store->defaults(), true, &error).has_value());
        QCOMPARE(error.kind, ErrorKind::UpdateCheckFailed);
        QVERIFY(!QFile::exists(SettingsStore::settingsFilePath(m_dataDir)));
        QCOMPARE(m_server->hits(QStringLiteral("/assets/stable")), 0);
    }

private:
    void publishFeed()
    {
        const QJsonArray releases = {
            release(QStringLiteral("v1.2.0"), m_server->url(QStringLiteral("/assets/old")), m_runningBuild, false),
            release(QStringLiteral("v1.3.0"), m_server->url(QStringLiteral("/assets/stable")), m_stableBuild, false),
            release(QStringLiteral("v1.4.0-dev.abc1234"), m_server->url(QStringLiteral("/assets/dev")), m_devBuild,
                    true),
        };
        m_server->enqueue(QStringLiteral("/releases"), 200, QJsonDocument(releases).toJson());
    }

    std::unique_ptr<QTemporaryDir> m_root;
    std::unique_ptr<FakePlatform> m_platform;
    std::unique_ptr<HttpStub> m_server;
    std::unique_ptr<ReleaseClient> m_releaseClient;
    std::unique_ptr<Downloader> m_downloader;
    std::unique_ptr<UpdateApplier> m_applier;
    std::unique_ptr<SettingsStore> m_store;
    std::unique_ptr<SelfUpdater> m_updater;
    QString m_target;
    QString m_dataDir;
    const QByteArray m_runningBuild = QByteArrayLiteral("build 1.2.0");
    const QByteArray m_stableBuild = QByteArrayLiteral("build 1.3.0");
    const QByteArray m_devBuild = QByteArrayLiteral("build 1.4.0-dev");
};

QTEST_GUILESS_MAIN(SelfUpdaterTest)
#include "SelfUpdaterTest.moc"

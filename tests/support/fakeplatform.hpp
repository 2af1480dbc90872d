/*!
 * @file        fakeplatform.hpp
 * @brief       Scriptable platform backend for tests.
 *
 * @copyright   Copyright (c) 2026 TheBoys.
 * @license     See LICENSE in repository root.
 */

#ifndef THEBOYS_TESTS_FAKEPLATFORM_HPP
#define THEBOYS_TESTS_FAKEPLATFORM_HPP

#include <QFileDevice>
#include <QString>

#include <optional>

#ifndef Q_MOC_RUN
import theboys.backend.platform;
#endif

/**
 * @class FakePlatform
 * @brief Platform backend whose answers and failures are set by the test.
 *
 * File operations fall through to the real implementation unless a failure
 * is scripted.
 */
class FakePlatform : public PlatformBackend
{
public:
    QString os = QStringLiteral("linux");
    QString executable;
    bool registered = false;
    QString userData;
    bool dataBesideExecutable = false;
    qint64 memoryMB = 16384;
    bool replaceInPlace = true;
    QString assetName = QStringLiteral("TheBoysLauncher-linux");
    std::optional<FileOpStatus> replaceFailure;
    bool failAttributes = false;
    int replaceCalls = 0;

    QString osName() const override { return os; }
    QString executablePath() const override { return executable; }
    bool isRegisteredInstall(const QString&) const override { return registered; }
    QString userDataDirectory() const override { return userData; }
    bool portableDataBesideExecutable() const override { return dataBesideExecutable; }
    qint64 totalMemoryMB() const override { return memoryMB; }
    bool canReplaceRunningExecutable() const override { return replaceInPlace; }
    QString updateAssetName() const override { return assetName; }

    FileOpStatus replaceFile(const QString& sourcePath, const QString& targetPath, QString *errorMessage) override
    {
        ++replaceCalls;
        if (replaceFailure.has_value()) {
            setError(errorMessage, QStringLiteral("simulated replace failure"));
            return *replaceFailure;
        }
        return PlatformBackend::replaceFile(sourcePath, targetPath, errorMessage);
    }

    bool applyExecutableAttributes(const QString& path,
                                   QFileDevice::Permissions permissions,
                                   QString *errorMessage) override
    {
        if (failAttributes) {
            setError(errorMessage, QStringLiteral("simulated chmod failure"));
            return false;
        }
        return PlatformBackend::applyExecutableAttributes(path, permissions, errorMessage);
    }
};

#endif // THEBOYS_TESTS_FAKEPLATFORM_HPP

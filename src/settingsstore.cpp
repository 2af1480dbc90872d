module;
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QLoggingCategory>
#include <QSaveFile>
#include <QString>

#include <algorithm>

module theboys.backend.settingsstore;

import theboys.backend.logging;
import theboys.backend.updateerror;

namespace {
const QString kMemoryKey = QStringLiteral("memoryMB");
const QString kAutoRamKey = QStringLiteral("autoRam");
const QString kDevBuildsKey = QStringLiteral("devBuildsEnabled");
const QString kDebugKey = QStringLiteral("debugEnabled");

QString boolText(bool value)
{
    return value ? QStringLiteral("true") : QStringLiteral("false");
}
}

QJsonObject Settings::toJson() const
{
    QJsonObject json;
    json[kMemoryKey] = SettingsStore::clampMemoryMB(memoryMB);
    json[kAutoRamKey] = autoRAM;
    json[kDevBuildsKey] = devBuildsEnabled;
    json[kDebugKey] = debugEnabled;
    return json;
}

SettingsStore::SettingsStore(qint64 totalMemoryMB)
    : m_totalMemoryMB(totalMemoryMB)
{
}

Settings SettingsStore::load(const QString& dataDir, UpdateError *error) const
{
    const QString path = settingsFilePath(dataDir);
    const Settings fallback = defaults();

    QFile file(path);
    if (file.exists() && file.open(QIODevice::ReadOnly)) {
        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
        file.close();
        if (parseError.error == QJsonParseError::NoError && doc.isObject()) {
            const Settings loaded = fromJson(doc.object(), fallback);
            qCDebug(lcSettings).noquote()
                << QStringLiteral("[Settings] Loaded memoryMB=%1 autoRam=%2 devBuilds=%3 debug=%4")
                       .arg(loaded.memoryMB)
                       .arg(boolText(loaded.autoRAM), boolText(loaded.devBuildsEnabled), boolText(loaded.debugEnabled));
            return loaded;
        }

        qCWarning(lcSettings).noquote()
            << QStringLiteral("[Settings] %1 is corrupt (%2). Replacing with defaults.")
                   .arg(path, parseError.errorString());
        setError(error, ErrorKind::SettingsCorrupt,
                 QStringLiteral("Settings file was corrupt and has been reset to defaults."));
    } else {
        qCInfo(lcSettings).noquote()
            << QStringLiteral("[Settings] No readable settings at %1. Creating defaults.").arg(path);
    }

    UpdateError saveError;
    if (!save(dataDir, fallback, &saveError)) {
        setError(error, saveError.kind, saveError.message);
    }
    return fallback;
}

bool SettingsStore::save(const QString& dataDir, const Settings& settings, UpdateError *error) const
{
    if (!QDir().mkpath(dataDir)) {
        setError(error, ErrorKind::IoError, QStringLiteral("Could not create data directory: %1").arg(dataDir));
        return false;
    }

    const QString path = settingsFilePath(dataDir);
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        setError(error, ErrorKind::IoError, QStringLiteral("Failed to open settings file: %1").arg(path));
        qCWarning(lcSettings).noquote() << QStringLiteral("[Settings] Failed to open %1 for writing.").arg(path);
        return false;
    }

    const QByteArray payload = QJsonDocument(settings.toJson()).toJson(QJsonDocument::Indented);
    if (file.write(payload) != payload.size() || !file.commit()) {
        setError(error, ErrorKind::IoError, QStringLiteral("Failed to write settings file to disk."));
        qCWarning(lcSettings).noquote() << QStringLiteral("[Settings] Failed to commit %1.").arg(path);
        return false;
    }

    qCInfo(lcSettings).noquote()
        << QStringLiteral("[Settings] Saved memoryMB=%1 autoRam=%2 devBuilds=%3 debug=%4")
               .arg(clampMemoryMB(settings.memoryMB))
               .arg(boolText(settings.autoRAM), boolText(settings.devBuildsEnabled), boolText(settings.debugEnabled));
    return true;
}

Settings SettingsStore::defaults() const
{
    Settings settings;
    settings.memoryMB = autoMemoryMB(m_totalMemoryMB);
    settings.autoRAM = true;
    settings.devBuildsEnabled = false;
    settings.debugEnabled = false;
    return settings;
}

int SettingsStore::clampMemoryMB(qint64 memoryMB)
{
    return static_cast<int>(std::clamp<qint64>(memoryMB, kMinMemoryMB, kMaxMemoryMB));
}

int SettingsStore::autoMemoryMB(qint64 totalMemoryMB)
{
    if (totalMemoryMB <= 0) {
        totalMemoryMB = 32768;
    }
    return clampMemoryMB(totalMemoryMB / 2);
}

int SettingsStore::memoryForModpack(const Settings& settings, int recommendedMB) const
{
    if (!settings.autoRAM) {
        return clampMemoryMB(settings.memoryMB);
    }

    int memory = autoMemoryMB(m_totalMemoryMB);
    if (m_totalMemoryMB > 0 && memory > m_totalMemoryMB) {
        memory = clampMemoryMB(m_totalMemoryMB);
    }
    if (recommendedMB > 0 && recommendedMB <= kMaxMemoryMB) {
        int recommended = clampMemoryMB(recommendedMB);
        if (m_totalMemoryMB > 0 && recommended > m_totalMemoryMB) {
            recommended = clampMemoryMB(m_totalMemoryMB);
        }
        memory = std::min(memory, recommended);
    }
    return memory;
}

QString SettingsStore::settingsFilePath(const QString& dataDir)
{
    return QDir(dataDir).filePath(QStringLiteral("settings.json"));
}

Settings SettingsStore::fromJson(const QJsonObject& json, const Settings& fallback)
{
    Settings settings = fallback;

    const QJsonValue memory = json.value(kMemoryKey);
    if (memory.isDouble()) {
        settings.memoryMB = clampMemoryMB(memory.toInteger());
    }

    const QJsonValue autoRam = json.value(kAutoRamKey);
    if (autoRam.isBool()) {
        settings.autoRAM = autoRam.toBool();
    }

    const QJsonValue devBuilds = json.value(kDevBuildsKey);
    if (devBuilds.isBool()) {
        settings.devBuildsEnabled = devBuilds.toBool();
    }

    const QJsonValue debug = json.value(kDebugKey);
    if (debug.isBool()) {
        settings.debugEnabled = debug.toBool();
    }

    settings.memoryMB = clampMemoryMB(settings.memoryMB);
    return settings;
}

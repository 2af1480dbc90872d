/*!
 * @file        settingsstore.cppm
 * @brief       Persisted launcher settings.
 *
 * @details
 * Owns the `settings.json` document under the data directory. Settings are
 * passed around as explicit `Settings` values; nothing reads them from
 * process-wide state. Missing or unreadable files are replaced by
 * defaults, which are persisted immediately. Writes go through
 * `QSaveFile` so readers never see a half-written document.
 *
 * @copyright   Copyright (c) 2026 TheBoys.
 * @license     See LICENSE in repository root.
 */

module;
#include <QJsonObject>
#include <QString>
#include <QtTypes>

#ifndef Q_MOC_RUN
export module theboys.backend.settingsstore;
import theboys.backend.updateerror;
#endif

/**
 * @struct Settings
 * @brief User-configurable launcher settings.
 */
export struct Settings {
    int memoryMB = 4096;           //!< Java heap allocation, within [2048, 16384].
    bool autoRAM = true;           //!< Derive memory from system RAM per modpack.
    bool devBuildsEnabled = false; //!< Follow the dev release channel.
    bool debugEnabled = false;     //!< Emit debug-level log output.

    /**
     * @brief Serialize into the persisted JSON layout.
     * @return JSON object.
     */
    QJsonObject toJson() const;

    bool operator==(const Settings& other) const = default;
};

/**
 * @class SettingsStore
 * @brief Load/save API for `Settings`.
 *
 * @details
 * Callers serialize concurrent edits themselves; the store performs one
 * atomic replace per save.
 */
export class SettingsStore
{
public:
    static constexpr int kMinMemoryMB = 2048;
    static constexpr int kMaxMemoryMB = 16384;

    /**
     * @brief Construct a store.
     * @param totalMemoryMB Detected physical memory used for defaults.
     */
    explicit SettingsStore(qint64 totalMemoryMB);

    /**
     * @brief Load settings from `<dataDir>/settings.json`.
     *
     * @details
     * On a missing file or parse error the defaults are written back before
     * returning. `error` receives `SettingsCorrupt` when a malformed file was
     * replaced, or `IoError` when the defaults could not be persisted.
     *
     * @param dataDir Canonical data directory.
     * @param error Optional output describing recovered problems.
     * @return Loaded or default settings.
     */
    Settings load(const QString& dataDir, UpdateError *error = nullptr) const;

    /**
     * @brief Persist settings atomically.
     * @param dataDir Canonical data directory.
     * @param settings Values to store; memory is clamped first.
     * @param error Optional output on failure.
     * @return True when the file was committed.
     */
    bool save(const QString& dataDir, const Settings& settings, UpdateError *error = nullptr) const;

    /**
     * @brief Default settings for this machine.
     * @return Auto RAM on, memory at half of system RAM (clamped).
     */
    Settings defaults() const;

    /**
     * @brief Clamp a memory value into [2048, 16384].
     * @param memoryMB Requested megabytes.
     * @return Clamped value; idempotent.
     */
    static int clampMemoryMB(qint64 memoryMB);

    /**
     * @brief Auto memory baseline.
     * @param totalMemoryMB Physical memory, non-positive means unknown.
     * @return Half of total clamped, 16384 when unknown.
     */
    static int autoMemoryMB(qint64 totalMemoryMB);

    /**
     * @brief Memory to hand to a modpack launch.
     * @param settings Current settings.
     * @param recommendedMB Modpack recommendation, zero when none.
     * @return Clamped megabytes.
     */
    int memoryForModpack(const Settings& settings, int recommendedMB) const;

    /**
     * @brief Settings file location.
     * @param dataDir Canonical data directory.
     * @return Absolute file path.
     */
    static QString settingsFilePath(const QString& dataDir);

    /**
     * @brief Decode a settings document.
     * @param json Parsed root object.
     * @param fallback Values for missing keys.
     * @return Decoded settings, memory clamped.
     */
    static Settings fromJson(const QJsonObject& json, const Settings& fallback);

private:
    qint64 m_totalMemoryMB = 0;
};

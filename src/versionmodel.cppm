/*!
 * @file        versionmodel.cppm
 * @brief       Launcher version parsing and ordering.
 *
 * @details
 * Parses free-form release tags (`v1.2.3`, `1.2.3-dev`, `3.2.30-dev.adcb1ae`,
 * `1.2.3-dev+abc123`) into a numeric triple plus an optional qualifier.
 * Parsing never fails: unparsable input keeps the raw text as qualifier so
 * ordering stays total.
 *
 * Dev detection is deliberately narrower than semver pre-release: only a
 * qualifier containing "dev" marks a dev build; "beta" and "rc" do not.
 *
 * @copyright   Copyright (c) 2026 TheBoys.
 * @license     See LICENSE in repository root.
 */

module;
#include <QString>

export module theboys.backend.versionmodel;

/**
 * @enum VersionChannel
 * @brief Release channel a version belongs to.
 */
export enum class VersionChannel
{
    Stable, //!< No dev qualifier.
    Dev     //!< Qualifier contains "dev".
};

/**
 * @enum VersionOrder
 * @brief Result of comparing two versions.
 */
export enum class VersionOrder
{
    Less,
    Equal,
    Greater
};

/**
 * @struct Version
 * @brief Parsed version identifier.
 */
export struct Version {
    int major = 0;                                  //!< Major component.
    int minor = 0;                                  //!< Minor component.
    int patch = 0;                                  //!< Patch component.
    VersionChannel channel = VersionChannel::Stable; //!< Derived from the qualifier.
    QString suffix;                                 //!< Qualifier after the triple, empty when none.
    QString commitHash;                             //!< Commit hash carried by dev builds, empty when none.
    bool numeric = false;                           //!< True when a numeric triple was found.

    /**
     * @brief Whether a qualifier is present.
     * @return True when suffix is not empty.
     */
    bool hasQualifier() const;

    /**
     * @brief Canonical text form (`1.2.3` or `1.2.3-dev+abc`).
     * @return Version string without `v` prefix.
     */
    QString toString() const;

    bool operator==(const Version& other) const;
};

/**
 * @class VersionModel
 * @brief Stateless version helpers.
 */
export class VersionModel
{
public:
    /**
     * @brief Parse a version string.
     * @param text Free-form tag, optional `v` prefix.
     * @return Parsed version, never fails.
     */
    static Version parse(const QString& text);

    /**
     * @brief Whether a version is a development build.
     * @param version Parsed version.
     * @return True iff the qualifier contains "dev" case-insensitively.
     */
    static bool isDevBuild(const Version& version);

    /**
     * @brief Convenience overload parsing first.
     * @param text Version string.
     * @return Dev-build flag.
     */
    static bool isDevBuild(const QString& text);

    /**
     * @brief Total order over versions.
     *
     * @details
     * Numeric triple first. At equal triple an unqualified version ranks
     * above any qualified one. Two qualifiers compare lexicographically;
     * that last tie-break is deterministic but carries no recency meaning
     * for commit hashes.
     *
     * @param a Left operand.
     * @param b Right operand.
     * @return Ordering of `a` relative to `b`.
     */
    static VersionOrder compare(const Version& a, const Version& b);

    /**
     * @brief Whether candidate is strictly newer than current.
     * @param current Installed version.
     * @param candidate Remote version.
     * @return True when `compare(candidate, current)` is Greater.
     */
    static bool isNewer(const Version& current, const Version& candidate);
};

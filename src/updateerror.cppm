/*!
 * @file        updateerror.cppm
 * @brief       Error kinds shared by the update and migration backend.
 *
 * @details
 * Every fallible backend call reports failures through an optional
 * `UpdateError *` out-parameter. The kind decides how the caller reacts:
 * recoverable kinds are logged and defaulted locally, the rest are
 * surfaced to the user and, when fatal at startup, mapped to a dedicated
 * process exit code.
 *
 * @copyright   Copyright (c) 2026 TheBoys.
 * @license     See LICENSE in repository root.
 */

module;
#include <QString>

export module theboys.backend.updateerror;

/**
 * @enum ErrorKind
 * @brief Failure categories of the update/migration subsystem.
 */
export enum class ErrorKind
{
    None,               //!< No failure.
    ParseError,         //!< Unparsable input; defaults substituted.
    UpdateCheckFailed,  //!< Release metadata unreachable or malformed.
    DownloadFailed,     //!< Retry budget exhausted.
    VerificationFailed, //!< Artifact hash or content mismatch.
    ElevationRequired,  //!< Target location needs elevated write access.
    ApplyFailed,        //!< Staging, promotion or helper hand-off failed.
    MigrationFailed,    //!< Backup, copy or verification failed.
    SettingsCorrupt,    //!< Persisted settings replaced with defaults.
    IoError             //!< File-system write failed.
};

/**
 * @brief Process exit codes used by the launcher executable.
 */
export namespace ExitCode {
inline constexpr int Success = 0;
inline constexpr int GenericFailure = 1;
inline constexpr int UsageError = 2;
inline constexpr int UpdateSystemFailure = 10;
inline constexpr int MigrationFailure = 11;
}

/**
 * @struct UpdateError
 * @brief Failure kind plus a human-readable cause.
 */
export struct UpdateError {
    ErrorKind kind = ErrorKind::None; //!< Failure category.
    QString message;                  //!< Cause suitable for display.

    /**
     * @brief Whether a failure was recorded.
     * @return True when kind is not `None`.
     */
    bool isError() const
    {
        return kind != ErrorKind::None;
    }
};

/**
 * @brief Fill an optional error output.
 * @param error Optional output pointer.
 * @param kind Failure category.
 * @param message Cause.
 */
export inline void setError(UpdateError *error, ErrorKind kind, const QString& message)
{
    if (error == nullptr) {
        return;
    }
    error->kind = kind;
    error->message = message;
}

/**
 * @brief Stable name of an error kind for logs.
 * @param kind Failure category.
 * @return Kind name.
 */
export inline QString errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:
        return QStringLiteral("None");
    case ErrorKind::ParseError:
        return QStringLiteral("ParseError");
    case ErrorKind::UpdateCheckFailed:
        return QStringLiteral("UpdateCheckFailed");
    case ErrorKind::DownloadFailed:
        return QStringLiteral("DownloadFailed");
    case ErrorKind::VerificationFailed:
        return QStringLiteral("VerificationFailed");
    case ErrorKind::ElevationRequired:
        return QStringLiteral("ElevationRequired");
    case ErrorKind::ApplyFailed:
        return QStringLiteral("ApplyFailed");
    case ErrorKind::MigrationFailed:
        return QStringLiteral("MigrationFailed");
    case ErrorKind::SettingsCorrupt:
        return QStringLiteral("SettingsCorrupt");
    case ErrorKind::IoError:
        return QStringLiteral("IoError");
    }
    return QStringLiteral("Unknown");
}

/**
 * @brief Map a fatal startup failure to the process exit code.
 * @param kind Failure category.
 * @return Exit code distinguishing update-system and migration failures.
 */
export inline int exitCodeFor(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:
    case ErrorKind::ParseError:
    case ErrorKind::SettingsCorrupt:
        return ExitCode::Success;
    case ErrorKind::UpdateCheckFailed:
    case ErrorKind::DownloadFailed:
    case ErrorKind::VerificationFailed:
    case ErrorKind::ElevationRequired:
    case ErrorKind::ApplyFailed:
        return ExitCode::UpdateSystemFailure;
    case ErrorKind::MigrationFailed:
        return ExitCode::MigrationFailure;
    case ErrorKind::IoError:
        return ExitCode::GenericFailure;
    }
    return ExitCode::GenericFailure;
}

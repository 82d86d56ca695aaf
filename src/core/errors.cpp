#include "core/errors.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:            return "none";
        case ErrorKind::NetworkError:    return "network_error";
        case ErrorKind::ParseError:      return "parse_error";
        case ErrorKind::NotFound:        return "not_found";
        case ErrorKind::InvalidVersion:  return "invalid_version";
        case ErrorKind::Cancelled:       return "cancelled";
        case ErrorKind::Timeout:         return "timeout";
        case ErrorKind::BackupFailure:   return "backup_failure";
        case ErrorKind::SwapFailure:     return "swap_failure";
        case ErrorKind::VerifyFailure:   return "verify_failure";
        case ErrorKind::AlreadyUpToDate: return "already_up_to_date";
        case ErrorKind::NotSupported:    return "not_supported";
        case ErrorKind::LaunchFailure:   return "launch_failure";
        case ErrorKind::RelaunchFailure: return "relaunch_failure";
        case ErrorKind::RollbackFailed:  return "rollback_failed";
    }
    return "unknown";
}

std::string error_user_message(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "";
        case ErrorKind::NetworkError:
            return "Could not reach the update server. Check your connection and retry.";
        case ErrorKind::ParseError:
            return "The update server sent data that could not be read.";
        case ErrorKind::NotFound:
            return "No update package is published for this platform.";
        case ErrorKind::InvalidVersion:
            return "The published release has an unrecognised version number.";
        case ErrorKind::Cancelled:
            return "Download cancelled.";
        case ErrorKind::Timeout:
            return "Update failed, please retry.";
        case ErrorKind::BackupFailure:
            return "Could not back up the current version. Nothing was changed.";
        case ErrorKind::SwapFailure:
            return "Could not install the new version. The previous version was restored.";
        case ErrorKind::VerifyFailure:
            return "The update package failed verification.";
        case ErrorKind::AlreadyUpToDate:
            return "You are running the latest version.";
        case ErrorKind::NotSupported:
            return "Updates not supported in this installation mode.";
        case ErrorKind::LaunchFailure:
            return "Could not start the updater.";
        case ErrorKind::RelaunchFailure:
            return "The new version did not start. The previous version was restored.";
        case ErrorKind::RollbackFailed:
            return "Update failed and the previous version could not be restored: manual reinstall required.";
    }
    return "Unknown error.";
}

UpdaterExitCode exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
        case ErrorKind::AlreadyUpToDate:
            return UpdaterExitCode::Success;
        case ErrorKind::Timeout:         return UpdaterExitCode::Timeout;
        case ErrorKind::BackupFailure:   return UpdaterExitCode::BackupFailure;
        case ErrorKind::SwapFailure:     return UpdaterExitCode::SwapFailure;
        case ErrorKind::VerifyFailure:   return UpdaterExitCode::VerifyFailure;
        case ErrorKind::RelaunchFailure: return UpdaterExitCode::RelaunchFailure;
        case ErrorKind::RollbackFailed:  return UpdaterExitCode::RollbackFailed;
        default:
            return UpdaterExitCode::InvalidArguments;
    }
}

#pragma once

#include <string>

/// Failure taxonomy shared by the host process and the updater process.
/// AlreadyUpToDate is a normal outcome, not a failure.
enum class ErrorKind {
    None,
    NetworkError,
    ParseError,
    NotFound,
    InvalidVersion,
    Cancelled,
    Timeout,
    BackupFailure,
    SwapFailure,
    VerifyFailure,
    AlreadyUpToDate,
    NotSupported,
    LaunchFailure,
    RelaunchFailure,
    RollbackFailed
};

/// Exit status of the updater process. Values are part of the CLI contract.
enum class UpdaterExitCode : int {
    Success = 0,
    InvalidArguments = 1,
    Timeout = 2,
    BackupFailure = 3,
    SwapFailure = 4,
    VerifyFailure = 5,
    RelaunchFailure = 6,
    RollbackFailed = 7
};

/// Stable identifier used in log lines ("network_error", ...)
const char* error_kind_name(ErrorKind kind);

/// Human-readable text for the host UI
std::string error_user_message(ErrorKind kind);

UpdaterExitCode exit_code_for(ErrorKind kind);

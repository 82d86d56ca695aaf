#pragma once

#include <string>

struct LogOptions {
    std::string logger_name = "selfupdate";
    std::string level = "info";   // trace|debug|info|warn|error|critical|off
    std::string file_path;        // empty = no file sink
    bool console = true;          // stderr sink; off while a TUI owns the terminal
};

/// Install the process-wide default spdlog logger.
/// Falls back to console-only when the log file cannot be opened.
void init_logging(const LogOptions& options);

/// Flush the default logger (before handing off / exiting)
void flush_logging();

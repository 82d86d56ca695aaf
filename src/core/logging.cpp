#include "core/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/null_sink.h>

#include <filesystem>
#include <memory>
#include <vector>

namespace fs = std::filesystem;

static constexpr size_t kMaxLogFileSize = 1024 * 1024;
static constexpr size_t kMaxLogFiles = 3;

void init_logging(const LogOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;

    if (options.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    std::string file_error;
    if (!options.file_path.empty()) {
        try {
            auto parent = fs::path(options.file_path).parent_path();
            if (!parent.empty()) {
                fs::create_directories(parent);
            }
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                options.file_path, kMaxLogFileSize, kMaxLogFiles));
        } catch (const std::exception& e) {
            file_error = e.what();
        }
    }

    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>(options.logger_name, sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
    logger->set_level(spdlog::level::from_str(options.level));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (!file_error.empty()) {
        spdlog::warn("[Logging] Could not open log file {}: {}", options.file_path, file_error);
    }
}

void flush_logging() {
    if (auto logger = spdlog::default_logger()) {
        logger->flush();
    }
}

#include "core/install_context.hpp"

#include <filesystem>
#include <climits>
#include <cstdlib>
#include <unistd.h>

#ifdef __APPLE__
#include <mach-o/dyld.h>
#endif

namespace fs = std::filesystem;

std::string InstallContext::self_executable_path() {
    try {
#ifdef __APPLE__
        char raw_path[4096];
        uint32_t size = sizeof(raw_path);
        if (_NSGetExecutablePath(raw_path, &size) == 0) {
            char resolved[PATH_MAX];
            if (realpath(raw_path, resolved)) {
                return std::string(resolved);
            }
            return std::string(raw_path);
        }
#else
        // /proc/self/exe is a symlink to the running binary
        return fs::canonical("/proc/self/exe").string();
#endif
    } catch (const fs::filesystem_error&) {}
    return "";
}

bool InstallContext::is_packaged_install(const std::string& exe_dir) {
    if (exe_dir.empty()) return false;
    std::error_code ec;
    return fs::is_regular_file(fs::path(exe_dir) / kPackagedMarker, ec);
}

InstallContext InstallContext::for_executable(const std::string& exe_path) {
    InstallContext ctx;
    if (exe_path.empty()) {
        return ctx;
    }

    fs::path exe(exe_path);
    fs::path dir = exe.parent_path();

    ctx.current_executable_path = exe.string();
    ctx.backup_executable_path = exe.string() + kBackupSuffix;
    ctx.backup_record_path = exe.string() + kRecordSuffix;
    ctx.staging_directory = (dir / ("." + exe.filename().string() + "-staging-" +
                                    std::to_string(::getpid()))).string();
    ctx.updater_executable_path = (dir / kUpdaterName).string();
    ctx.is_packaged = is_packaged_install(dir.string());
    return ctx;
}

InstallContext InstallContext::resolve() {
    return for_executable(self_executable_path());
}

std::string InstallContext::executable_directory() const {
    return fs::path(current_executable_path).parent_path().string();
}

std::string InstallContext::executable_name() const {
    return fs::path(current_executable_path).filename().string();
}

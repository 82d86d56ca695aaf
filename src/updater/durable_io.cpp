#include "updater/durable_io.hpp"
#include "core/process.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

static bool fsync_fd_path(const std::string& path, int flags) {
    int fd = ::open(path.c_str(), flags | O_CLOEXEC);
    if (fd < 0) return false;
    bool ok = ::fsync(fd) == 0;
    ::close(fd);
    return ok;
}

bool fsync_file(const std::string& path) {
    return fsync_fd_path(path, O_RDONLY);
}

bool fsync_directory(const std::string& dir) {
    return fsync_fd_path(dir.empty() ? "." : dir, O_RDONLY | O_DIRECTORY);
}

std::string sibling_temp_path(const std::string& path, const std::string& tag) {
    fs::path p(path);
    std::string name = "." + p.filename().string() + "." + tag + "-" + std::to_string(current_pid());
    return (p.parent_path() / name).string();
}

bool durable_copy(const std::string& src, const std::string& dst, std::string& error) {
    std::string tmp = sibling_temp_path(dst, "tmp");
    std::error_code ec;

    fs::copy_file(src, tmp, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        error = "copy " + src + " -> " + tmp + ": " + ec.message();
        fs::remove(tmp, ec);
        return false;
    }

    auto perms = fs::status(src, ec).permissions();
    if (!ec) {
        fs::permissions(tmp, perms, fs::perm_options::replace, ec);
    }
    if (ec) {
        error = "set permissions on " + tmp + ": " + ec.message();
        fs::remove(tmp, ec);
        return false;
    }

    if (!fsync_file(tmp)) {
        error = "fsync " + tmp + ": " + std::strerror(errno);
        fs::remove(tmp, ec);
        return false;
    }

    fs::rename(tmp, dst, ec);
    if (ec) {
        error = "rename " + tmp + " -> " + dst + ": " + ec.message();
        fs::remove(tmp, ec);
        return false;
    }

    if (!fsync_directory(fs::path(dst).parent_path().string())) {
        error = "fsync directory of " + dst + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

bool durable_write(const std::string& path, const std::string& text, std::string& error) {
    std::string tmp = sibling_temp_path(path, "tmp");
    std::error_code ec;
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            error = "cannot open " + tmp;
            return false;
        }
        out << text;
        out.close();
        if (out.fail()) {
            error = "write " + tmp + " failed";
            fs::remove(tmp, ec);
            return false;
        }
    }

    if (!fsync_file(tmp)) {
        error = "fsync " + tmp + ": " + std::strerror(errno);
        fs::remove(tmp, ec);
        return false;
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        error = "rename " + tmp + " -> " + path + ": " + ec.message();
        fs::remove(tmp, ec);
        return false;
    }

    if (!fsync_directory(fs::path(path).parent_path().string())) {
        error = "fsync directory of " + path + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

#include "files/file_system.hpp"
#include "common/logger.hpp"

#include <cstdlib>
#include <filesystem>
#include <sys/wait.h>

namespace fs = std::filesystem;

namespace {

// Single-quote a path for /bin/sh
std::string shell_quote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace

LocalFileSystem::LocalFileSystem(std::string opener_command)
    : opener_command_(std::move(opener_command)) {}

bool LocalFileSystem::directory_exists(const std::string& path) const {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool LocalFileSystem::is_absolute(const std::string& path) const {
    return !path.empty() && fs::path(path).is_absolute();
}

bool LocalFileSystem::file_exists(const std::string& path) const {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool LocalFileSystem::delete_file(const std::string& path) {
    if (path.empty()) {
        return false;
    }
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) {
        LOG_WARN("Failed to delete ", path, ": ", ec.message());
        return false;
    }
    if (removed) {
        LOG_DEBUG("Deleted ", path);
    }
    return removed;
}

bool LocalFileSystem::open_file(const std::string& path) {
    if (opener_command_.empty()) {
        LOG_WARN("No opener command configured, cannot open ", path);
        return false;
    }
    std::string command = opener_command_ + " " + shell_quote(path) + " >/dev/null 2>&1";
    int rc = std::system(command.c_str());
    if (rc == -1 || !WIFEXITED(rc) || WEXITSTATUS(rc) != 0) {
        LOG_WARN("Opener '", opener_command_, "' failed for ", path, " (status ", rc, ")");
        return false;
    }
    LOG_INFO("Opened ", path, " with ", opener_command_);
    return true;
}

std::string LocalFileSystem::public_directory() const {
    if (const char* xdg = std::getenv("XDG_DOWNLOAD_DIR"); xdg && *xdg) {
        return xdg;
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return (fs::path(home) / "Downloads").string();
    }
    std::error_code ec;
    return fs::current_path(ec).string();
}

#include "core/paths.hpp"
#include "core/config.hpp"
#include <fstream>
#include <system_error>
#include <unistd.h>
#include <limits.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace clockwork::core::paths {

std::string hostname() {
    char buf[HOST_NAME_MAX + 1];
    if (gethostname(buf, sizeof(buf)) != 0) {
        return "unknown";
    }
    buf[HOST_NAME_MAX] = '\0';
    return std::string(buf);
}

fs::path expand_user(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return fs::path(path);
    }
    std::string home = config::get_env("HOME");
    if (home.empty()) {
        return fs::path(path);
    }
    return fs::path(home + path.substr(1));
}

bool ensure_directory(const fs::path& dir) {
    std::error_code ec;
    if (fs::is_directory(dir, ec)) {
        return true;
    }
    fs::create_directories(dir, ec);
    if (ec) {
        spdlog::error("Failed to create directory {}: {}", dir.string(), ec.message());
        return false;
    }
    return true;
}

bool write_file_atomic(const fs::path& path, const std::string& content) {
    // Dot-prefixed temp name keeps directory listings from picking it up
    fs::path tmp = path.parent_path() /
        ("." + path.filename().string() + ".tmp." + std::to_string(getpid()));

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            spdlog::error("Failed to open {} for writing", tmp.string());
            return false;
        }
        out << content;
        out.flush();
        if (!out) {
            spdlog::error("Failed to write {}", tmp.string());
            std::error_code ignored;
            fs::remove(tmp, ignored);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        spdlog::error("Failed to rename {} to {}: {}", tmp.string(), path.string(), ec.message());
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return false;
    }
    return true;
}

} // namespace clockwork::core::paths

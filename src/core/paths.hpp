#pragma once
#include <filesystem>
#include <string>

namespace clockwork::core::paths {

// Host name of this machine; "unknown" if unavailable.
std::string hostname();

// Expand a leading "~" to $HOME.
std::filesystem::path expand_user(const std::string& path);

// Create a directory (and parents). Returns false and logs on failure.
bool ensure_directory(const std::filesystem::path& dir);

// Write content to path atomically: temp file in the same directory, then rename.
bool write_file_atomic(const std::filesystem::path& path, const std::string& content);

} // namespace clockwork::core::paths

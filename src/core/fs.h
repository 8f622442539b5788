#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace core::fs {

/// Convenience alias so callers don't need to spell out std::filesystem::path.
using path = std::filesystem::path;

/// Creates the directory (and parents) if it does not exist.
/// Returns true on success or if the directory already exists.
bool ensure_directory(const path& dir);

/// Returns true if `p` refers to an existing regular file.
bool file_exists(const path& p);

/// Atomic rename from `src` to `dst`, replacing `dst` if it exists.
/// Returns true on success.
bool rename_safe(const path& src, const path& dst);

/// Reads the entire contents of `p` into a string.
/// Returns std::nullopt if the file cannot be opened or read.
std::optional<std::string> read_file(const path& p);

/// Writes `content` to `p` atomically (write to temp, then rename), so a
/// reader never observes a half-written snapshot.
/// Returns true on success.
bool write_file(const path& p, std::string_view content);

} // namespace core::fs

#include "fs.h"

#include <fstream>
#include <random>

namespace core::fs {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

/// Generates a short random suffix for temporary file names.
static std::string random_suffix()
{
    static constexpr char CHARS[] = "abcdefghijklmnopqrstuvwxyz0123456789";
    static constexpr int SUFFIX_LEN = 8;

    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<size_t> dist(0, sizeof(CHARS) - 2);

    std::string out;
    out.reserve(SUFFIX_LEN);
    for (int i = 0; i < SUFFIX_LEN; ++i) {
        out.push_back(CHARS[dist(rng)]);
    }
    return out;
}

/// Sibling temp file: "<name>.<suffix>.tmp" in the same directory, so the
/// final rename stays on one filesystem.
static path temp_path_for(const path& p)
{
    path tmp = p;
    tmp += "." + random_suffix() + ".tmp";
    return tmp;
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

bool ensure_directory(const path& dir)
{
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) {
        return true;
    }
    std::filesystem::create_directories(dir, ec);
    return !ec;
}

bool file_exists(const path& p)
{
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec);
}

bool rename_safe(const path& src, const path& dst)
{
    // rename(2) is atomic on the same filesystem and replaces the target if
    // it exists.
    std::error_code ec;
    std::filesystem::rename(src, dst, ec);
    return !ec;
}

std::optional<std::string> read_file(const path& p)
{
    std::ifstream ifs(p, std::ios::binary | std::ios::ate);
    if (!ifs.is_open()) {
        return std::nullopt;
    }

    auto size = ifs.tellg();
    if (size < 0) {
        return std::nullopt;
    }
    ifs.seekg(0, std::ios::beg);

    std::string content;
    content.resize(static_cast<size_t>(size));
    if (!ifs.read(content.data(), size)) {
        return std::nullopt;
    }
    return content;
}

bool write_file(const path& p, std::string_view content)
{
    if (p.has_parent_path()) {
        if (!ensure_directory(p.parent_path())) {
            return false;
        }
    }

    path tmp = temp_path_for(p);

    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            return false;
        }
        ofs.write(content.data(),
                  static_cast<std::streamsize>(content.size()));
        if (!ofs.good()) {
            ofs.close();
            std::error_code ec;
            std::filesystem::remove(tmp, ec);
            return false;
        }
        ofs.flush();
        ofs.close();
    }

    if (!rename_safe(tmp, p)) {
        std::error_code ec;
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

} // namespace core::fs

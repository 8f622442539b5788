#include "core/config.h"
#include "core/logging.h"

#include <cctype>
#include <charconv>
#include <fstream>
#include <string>

namespace core {

namespace {

std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return sv;
}

std::string_view strip_dashes(std::string_view sv) {
    if (sv.starts_with("--")) return sv.substr(2);
    if (sv.starts_with("-"))  return sv.substr(1);
    return sv;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

std::optional<bool> parse_bool(std::string_view sv) {
    sv = trim(sv);
    if (iequals(sv, "1") || iequals(sv, "true") ||
        iequals(sv, "yes") || iequals(sv, "on")) {
        return true;
    }
    if (iequals(sv, "0") || iequals(sv, "false") ||
        iequals(sv, "no") || iequals(sv, "off")) {
        return false;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Config -- internal helpers
// ---------------------------------------------------------------------------

void Config::insert(ValueMap& target, std::string_view key,
                    std::string value) {
    target[std::string{key}].push_back(std::move(value));
}

const std::vector<std::string>* Config::lookup(std::string_view key) const {
    std::string k{key};

    if (auto it = cli_values_.find(k); it != cli_values_.end()) {
        return &it->second;
    }
    if (auto it = file_values_.find(k); it != file_values_.end()) {
        return &it->second;
    }
    if (auto it = set_values_.find(k); it != set_values_.end()) {
        return &it->second;
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// Config -- source loading
// ---------------------------------------------------------------------------

std::vector<std::string> Config::parse_args(int argc, char* argv[]) {
    std::vector<std::string> positional;

    // argv[0] is the program name -- skip it.
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg.empty()) continue;

        if (!arg.starts_with("-")) {
            positional.emplace_back(arg);
            continue;
        }

        std::string_view stripped = strip_dashes(arg);
        auto eq_pos = stripped.find('=');
        if (eq_pos != std::string_view::npos) {
            std::string_view key = stripped.substr(0, eq_pos);
            std::string_view val = stripped.substr(eq_pos + 1);
            insert(cli_values_, trim(key), std::string{trim(val)});
        } else {
            insert(cli_values_, trim(stripped), "1");
        }
    }
    return positional;
}

Result<void> Config::parse_file(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return make_error(ErrorCode::STORAGE_NOT_FOUND,
                          "unable to open config file '" +
                              path.string() + "'");
    }

    LOG_INFO(LogCategory::CONFIG,
             "Config: loading configuration from '" + path.string() + "'");

    std::string line;
    int line_num = 0;
    while (std::getline(ifs, line)) {
        ++line_num;
        std::string_view sv = trim(std::string_view{line});

        if (sv.empty() || sv.front() == '#') continue;

        auto eq_pos = sv.find('=');
        if (eq_pos == std::string_view::npos) {
            // Bare words are boolean flags, as on the command line.
            insert(file_values_, sv, "1");
            continue;
        }

        std::string_view key = trim(sv.substr(0, eq_pos));
        std::string_view val = trim(sv.substr(eq_pos + 1));

        if (key.empty()) {
            return make_error(ErrorCode::PARSE_BAD_FORMAT,
                              "empty key on line " +
                                  std::to_string(line_num) + " of '" +
                                  path.string() + "'");
        }

        insert(file_values_, key, std::string{val});
    }
    return make_ok();
}

// ---------------------------------------------------------------------------
// Config -- setters / getters
// ---------------------------------------------------------------------------

void Config::set(std::string_view key, std::string value) {
    set_values_[std::string{key}] = {std::move(value)};
}

std::optional<std::string> Config::get(std::string_view key) const {
    const auto* vals = lookup(key);
    if (!vals || vals->empty()) return std::nullopt;
    return vals->front();
}

std::string Config::get_or(std::string_view key,
                           std::string_view default_val) const {
    auto val = get(key);
    return val.has_value() ? *val : std::string{default_val};
}

int64_t Config::get_int(std::string_view key, int64_t default_val) const {
    auto val = get(key);
    if (!val.has_value()) return default_val;

    int64_t result = default_val;
    const auto& s = *val;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), result);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        LOG_ERROR(LogCategory::CONFIG,
                  "Config: cannot parse '" + s +
                  "' as integer for key '" + std::string{key} + "'");
        return default_val;
    }
    return result;
}

bool Config::get_bool(std::string_view key, bool default_val) const {
    auto val = get(key);
    if (!val.has_value()) return default_val;
    return parse_bool(*val).value_or(default_val);
}

std::vector<std::string> Config::get_list(std::string_view key) const {
    std::string k{key};
    std::vector<std::string> result;

    for (const ValueMap* source : {&cli_values_, &file_values_, &set_values_}) {
        if (auto it = source->find(k); it != source->end()) {
            result.insert(result.end(),
                          it->second.begin(), it->second.end());
        }
    }
    return result;
}

bool Config::has(std::string_view key) const {
    return lookup(key) != nullptr;
}

} // namespace core

#include <murmur/config/config_helpers.h>

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <string_view>

namespace murmur::config {

namespace {

constexpr std::string_view kBlank = " \t\r\n\f\v";

std::string_view strip(std::string_view s) {
    const auto first = s.find_first_not_of(kBlank);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(kBlank);
    return s.substr(first, last - first + 1);
}

bool isQuoted(std::string_view v) {
    return v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front();
}

// Value text after '=': quoted values are taken verbatim, bare values lose a
// trailing "# comment".
std::string_view valueText(std::string_view raw) {
    raw = strip(raw);
    if (isQuoted(raw)) {
        return raw.substr(1, raw.size() - 2);
    }
    if (auto hash = raw.find('#'); hash != std::string_view::npos) {
        raw = strip(raw.substr(0, hash));
    }
    return raw;
}

Error lineError(size_t lineNo, std::string_view what) {
    return Error{ErrorCode::ConfigurationError,
                 std::string(what) + " at line " + std::to_string(lineNo)};
}

const char* envOrNull(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

template <typename T>
Result<std::optional<T>> lookupNumber(const ConfigMap& map, const std::string& key,
                                      const char* kind) {
    auto it = map.find(key);
    if (it == map.end()) {
        return std::optional<T>{};
    }
    const std::string& text = it->second;
    T value{};
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end || text.empty()) {
        return Error{ErrorCode::ConfigurationError,
                     key + ": expected " + kind + ", got '" + text + "'"};
    }
    return std::optional<T>{value};
}

} // namespace

std::filesystem::path expand_tilde(const std::string& path) {
    if (path.empty() || path.front() != '~') {
        return path;
    }
    const char* home = envOrNull("HOME");
    if (!home) {
        return path;
    }
    std::string_view rest(path);
    rest.remove_prefix(1);
    if (!rest.empty() && rest.front() == '/') {
        rest.remove_prefix(1);
    }
    return std::filesystem::path(home) / std::string(rest);
}

Result<ConfigMap> parse_config_file(const std::filesystem::path& config_path) {
    std::ifstream in(config_path);
    if (!in) {
        return Error{ErrorCode::NotFound, "Config file not readable: " + config_path.string()};
    }

    ConfigMap values;
    std::string section;
    std::string raw;
    for (size_t lineNo = 1; std::getline(in, raw); ++lineNo) {
        const std::string_view line = strip(raw);
        if (line.empty() || line.front() == '#') {
            continue;
        }

        if (line.front() == '[') {
            const auto close = line.find(']');
            if (close == std::string_view::npos) {
                return lineError(lineNo, "Unterminated section header");
            }
            section = std::string(strip(line.substr(1, close - 1)));
            continue;
        }

        const auto eq = line.find('=');
        if (eq == std::string_view::npos) {
            return lineError(lineNo, "Expected key = value");
        }
        const std::string_view key = strip(line.substr(0, eq));
        if (key.empty()) {
            return lineError(lineNo, "Missing key");
        }

        std::string fullKey = section.empty() ? std::string(key)
                                              : section + "." + std::string(key);
        values.insert_or_assign(std::move(fullKey), std::string(valueText(line.substr(eq + 1))));
    }
    return values;
}

Result<std::optional<std::string>> lookup_string(const ConfigMap& map, const std::string& key) {
    if (auto it = map.find(key); it != map.end()) {
        return std::optional<std::string>{it->second};
    }
    return std::optional<std::string>{};
}

Result<std::optional<long long>> lookup_int(const ConfigMap& map, const std::string& key) {
    return lookupNumber<long long>(map, key, "integer");
}

Result<std::optional<double>> lookup_double(const ConfigMap& map, const std::string& key) {
    return lookupNumber<double>(map, key, "number");
}

Result<std::optional<bool>> lookup_bool(const ConfigMap& map, const std::string& key) {
    auto it = map.find(key);
    if (it == map.end()) {
        return std::optional<bool>{};
    }
    std::string lowered;
    lowered.reserve(it->second.size());
    for (unsigned char c : it->second) {
        lowered.push_back(static_cast<char>(std::tolower(c)));
    }
    static constexpr std::string_view kTrue[] = {"true", "1", "yes", "on"};
    static constexpr std::string_view kFalse[] = {"false", "0", "no", "off"};
    for (auto word : kTrue) {
        if (lowered == word) {
            return std::optional<bool>{true};
        }
    }
    for (auto word : kFalse) {
        if (lowered == word) {
            return std::optional<bool>{false};
        }
    }
    return Error{ErrorCode::ConfigurationError,
                 key + ": expected boolean, got '" + it->second + "'"};
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* xdg = envOrNull("XDG_CONFIG_HOME")) {
        return std::filesystem::path(xdg) / "murmur" / "config.toml";
    }
    if (const char* home = envOrNull("HOME")) {
        return std::filesystem::path(home) / ".config" / "murmur" / "config.toml";
    }
    return std::filesystem::path("murmur") / "config.toml";
}

std::filesystem::path get_data_dir() {
    if (const char* xdg = envOrNull("XDG_DATA_HOME")) {
        return std::filesystem::path(xdg) / "murmur";
    }
    if (const char* home = envOrNull("HOME")) {
        return std::filesystem::path(home) / ".local" / "share" / "murmur";
    }
    return std::filesystem::current_path() / ".murmur";
}

} // namespace murmur::config

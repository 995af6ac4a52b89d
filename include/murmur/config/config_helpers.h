#pragma once

#include <murmur/core/types.h>

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace murmur::config {

/// Replace a leading "~" with $HOME; other paths pass through.
std::filesystem::path expand_tilde(const std::string& path);

/**
 * Flat view of a TOML-style file: "[section] key = value" becomes
 * "section.key" -> "value". Comments (#) and blank lines are skipped, quotes
 * are stripped. Dotted keys at top level ("search.default_k = 5") are kept as-is.
 */
using ConfigMap = std::map<std::string, std::string>;

Result<ConfigMap> parse_config_file(const std::filesystem::path& config_path);

// Typed lookups; a present but malformed value is a ConfigurationError.
Result<std::optional<std::string>> lookup_string(const ConfigMap& map, const std::string& key);
Result<std::optional<long long>> lookup_int(const ConfigMap& map, const std::string& key);
Result<std::optional<double>> lookup_double(const ConfigMap& map, const std::string& key);
Result<std::optional<bool>> lookup_bool(const ConfigMap& map, const std::string& key);

/// Returns the user config file path
/// Unix: $XDG_CONFIG_HOME/murmur/config.toml or ~/.config/murmur/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user data directory (database)
/// Unix: $XDG_DATA_HOME/murmur or ~/.local/share/murmur
std::filesystem::path get_data_dir();

} // namespace murmur::config

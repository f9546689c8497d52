#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace lexsearch::config {

// "~/x" -> "$HOME/x"; other paths, or an unset HOME, pass through.
std::filesystem::path expand_tilde(const std::string& path);

// Replace control characters (other than newline and tab) with '?'.
std::string sanitize_for_terminal(std::string_view in);

/**
 * @brief Read a flat TOML subset into "section.key" -> value
 *
 * Handles `[section]` headers, `key = value` pairs, single or double quoted
 * strings and `#` comments outside quotes. Arrays and inline tables are kept
 * as raw text. A missing or unreadable file yields an empty map.
 */
std::map<std::string, std::string> parse_simple_toml(const std::filesystem::path& path);

// Parse a single value from a TOML config file; empty when absent.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Returns the user config directory: $XDG_CONFIG_HOME/lexsearch or ~/.config/lexsearch
std::filesystem::path get_config_dir();

// Explicit override, then LEXSEARCH_CONFIG, then get_config_dir()/config.toml.
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace lexsearch::config

#include <lexsearch/config/config_helpers.h>

#include <cctype>
#include <cstdlib>
#include <fstream>

namespace lexsearch::config {

namespace {

bool isBlank(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view stripped(std::string_view s) {
    while (!s.empty() && isBlank(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && isBlank(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

// Cut a trailing "# comment", ignoring '#' inside quotes.
std::string strip_comment(const std::string& value) {
    char quote = 0;
    for (size_t i = 0; i < value.size(); ++i) {
        const char c = value[i];
        if (quote) {
            if (c == quote) {
                quote = 0;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return value.substr(0, i);
        }
    }
    return value;
}

// Right-hand side of `key = value`: comment cut, blanks trimmed, one level of
// matching quotes removed.
std::string tomlValue(const std::string& raw) {
    const std::string uncommented = strip_comment(raw);
    auto value = stripped(uncommented);
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        value = value.substr(1, value.size() - 2);
    }
    return std::string(value);
}

} // namespace

std::filesystem::path expand_tilde(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        return path;
    }
    return std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
}

std::string sanitize_for_terminal(std::string_view in) {
    std::string out(in);
    for (auto& c : out) {
        const auto u = static_cast<unsigned char>(c);
        if ((u < 0x20 && c != '\n' && c != '\t') || u == 0x7F) {
            c = '?';
        }
    }
    return out;
}

std::map<std::string, std::string> parse_simple_toml(const std::filesystem::path& path) {
    std::map<std::string, std::string> config;
    std::ifstream file(path);
    if (!file) {
        return config;
    }

    std::string raw;
    std::string currentSection;

    while (std::getline(file, raw)) {
        const std::string line(stripped(raw));

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = std::string(stripped(std::string_view(line).substr(1, end - 1)));
                if (!currentSection.empty()) {
                    currentSection += ".";
                }
            }
            continue;
        }

        // Parse key-value pairs
        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        const auto key = stripped(std::string_view(line).substr(0, eq));
        if (key.empty()) {
            continue;
        }
        config[currentSection + std::string(key)] = tomlValue(line.substr(eq + 1));
    }

    return config;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto values = parse_simple_toml(config_path);
    auto it = values.find(section.empty() ? key : section + "." + key);
    return it == values.end() ? std::string{} : it->second;
}

std::filesystem::path get_config_dir() {
    if (const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME"); xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "lexsearch";
    }
    if (const char* homeEnv = std::getenv("HOME"); homeEnv && *homeEnv) {
        return std::filesystem::path(homeEnv) / ".config" / "lexsearch";
    }
    return std::filesystem::path("~/.config") / "lexsearch";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("LEXSEARCH_CONFIG"); env && *env) {
        return expand_tilde(env);
    }
    return get_config_dir() / "config.toml";
}

} // namespace lexsearch::config

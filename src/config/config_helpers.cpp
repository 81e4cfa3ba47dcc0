#include <fstream>
#include <recall/config/config_helpers.h>

namespace recall::config {

namespace {

std::string strip_inline_comment(std::string v) {
    // A '#' inside a quoted string is part of the value
    char quote = 0;
    for (size_t i = 0; i < v.size(); ++i) {
        char c = v[i];
        if (quote) {
            if (c == quote) {
                quote = 0;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            v.erase(i);
            break;
        }
    }
    trim(v);
    return v;
}

std::string lower(std::string_view in) {
    std::string out(in);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

} // namespace

ConfigMap parse_config_file(const std::filesystem::path& config_path) {
    ConfigMap values;
    std::ifstream file(config_path);
    if (!file) {
        return values;
    }

    std::string line;
    std::string currentSection;
    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        v = strip_inline_comment(v);
        if (k.empty()) {
            continue;
        }

        // Support both "selection.threshold" and "[selection] threshold"
        std::string fullKey =
            currentSection.empty() || k.find('.') != std::string::npos ? k
                                                                        : currentSection + "." + k;
        values[fullKey] = unquote(v);
    }
    return values;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto values = parse_config_file(config_path);
    auto it = values.find(section.empty() ? key : section + "." + key);
    return it == values.end() ? std::string{} : it->second;
}

std::vector<std::string> parse_list(const std::string& raw) {
    std::vector<std::string> out;
    std::string s = raw;
    trim(s);
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
    }
    size_t start = 0;
    while (start <= s.size()) {
        size_t comma = s.find(',', start);
        std::string item = s.substr(start, comma == std::string::npos ? std::string::npos
                                                                      : comma - start);
        item = unquote(item);
        if (!item.empty()) {
            out.push_back(item);
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return out;
}

std::optional<double> parse_double(std::string_view raw) {
    std::string s(raw);
    trim(s);
    if (s.empty()) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        double v = std::stod(s, &consumed);
        if (consumed != s.size()) {
            return std::nullopt;
        }
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<long long> parse_integer(std::string_view raw) {
    std::string s(raw);
    trim(s);
    if (s.empty()) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        long long v = std::stoll(s, &consumed);
        if (consumed != s.size()) {
            return std::nullopt;
        }
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<bool> parse_bool(std::string_view raw) {
    std::string s = lower(raw);
    trim(s);
    if (s == "1" || s == "true" || s == "yes" || s == "y" || s == "on") {
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "n" || s == "off") {
        return false;
    }
    return std::nullopt;
}

std::filesystem::path get_config_dir() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    if (xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "recall";
    }
    if (homeEnv && *homeEnv) {
        return std::filesystem::path(homeEnv) / ".config" / "recall";
    }
    return std::filesystem::path("~/.config") / "recall";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("RECALL_CONFIG"); env && *env) {
        return expand_tilde(env);
    }
    return get_config_dir() / "config.toml";
}

} // namespace recall::config

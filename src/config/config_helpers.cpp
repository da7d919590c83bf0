#include <ferry/config/config_helpers.h>

#include <charconv>
#include <fstream>

namespace ferry::config {

Result<TomlSections> parse_toml_file(const std::filesystem::path& path) {
    TomlSections config;
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::FileNotFound, "Cannot open config file: " + path.string()};
    }

    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        // Parse key-value pairs
        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);
        trim(key);
        trim(value);

        // Remove inline comments outside of quotes
        bool inQuotes = false;
        for (size_t i = 0; i < value.size(); ++i) {
            if (value[i] == '"') {
                inQuotes = !inQuotes;
            } else if (value[i] == '#' && !inQuotes) {
                value.erase(i);
                trim(value);
                break;
            }
        }

        if (!value.empty() && value.front() != '[') {
            value = unquote(value);
        }

        config[currentSection][key] = value;
    }

    return config;
}

std::vector<std::string> parse_list(const std::string& raw) {
    std::string body = raw;
    trim(body);
    if (body.size() >= 2 && body.front() == '[' && body.back() == ']') {
        body = body.substr(1, body.size() - 2);
    }

    std::vector<std::string> out;
    size_t start = 0;
    while (start <= body.size()) {
        size_t comma = body.find(',', start);
        std::string item =
            body.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
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

std::optional<long long> parse_integer(std::string_view raw) {
    std::string s(raw);
    trim(s);
    // TOML allows 1_000_000
    s.erase(std::remove(s.begin(), s.end(), '_'), s.end());
    long long value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size() || s.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parse_double(std::string_view raw) {
    std::string s(raw);
    trim(s);
    if (s.empty()) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        double value = std::stod(s, &consumed);
        if (consumed != s.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<bool> parse_bool(std::string_view raw) {
    std::string s(raw);
    trim(s);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "true" || s == "1" || s == "yes" || s == "on") {
        return true;
    }
    if (s == "false" || s == "0" || s == "no" || s == "off") {
        return false;
    }
    return std::nullopt;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path(".config") / "ferry" / "config.toml";
    }

    return configHome / "ferry" / "config.toml";
}

} // namespace ferry::config

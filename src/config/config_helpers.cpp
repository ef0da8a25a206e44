#include <fstream>
#include <mcpgate/config/config_helpers.h>

namespace mcpgate::config {

std::optional<bool> parse_bool(std::string_view raw) {
    std::string v(raw);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "yes" || v == "on" || v == "1")
        return true;
    if (v == "false" || v == "no" || v == "off" || v == "0")
        return false;
    return std::nullopt;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
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
        if (eq == std::string::npos)
            continue;

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside quotes
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        } else if (v.size() > 1) {
            const char q = v.front();
            size_t close = v.find(q, 1);
            if (close != std::string::npos)
                v = v.substr(0, close + 1);
        }

        if ((currentSection == section && k == key) || k == section + "." + key) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (auto env = env_value("MCPGATE_CONFIG")) {
        return expand_tilde(*env);
    }

    if (auto xdg = env_value("XDG_CONFIG_HOME")) {
        return std::filesystem::path(*xdg) / "mcpgate" / "config.toml";
    }
    if (auto home = env_value("HOME")) {
        return std::filesystem::path(*home) / ".config" / "mcpgate" / "config.toml";
    }
    return std::filesystem::path("mcpgate.toml");
}

std::filesystem::path get_data_dir() {
    if (auto xdg = env_value("XDG_DATA_HOME")) {
        return std::filesystem::path(*xdg) / "mcpgate";
    }
    if (auto home = env_value("HOME")) {
        return std::filesystem::path(*home) / ".local" / "share" / "mcpgate";
    }
    return std::filesystem::current_path() / "mcpgate_data";
}

std::filesystem::path resolve_data_dir_from_config(const std::filesystem::path& config_path) {
    // 1) MCPGATE_DATA_DIR env
    if (auto env = env_value("MCPGATE_DATA_DIR")) {
        return expand_tilde(*env);
    }

    // 2) config.toml core.data_dir
    if (!config_path.empty()) {
        if (auto v = parse_config_value(config_path, "core", "data_dir"); !v.empty()) {
            return expand_tilde(v);
        }
    }

    // 3) XDG/HOME defaults
    return get_data_dir();
}

std::filesystem::path resolve_runtime_bin_dir_from_config(const std::filesystem::path& config_path,
                                                          const std::filesystem::path& data_dir) {
    if (auto env = env_value("MCPGATE_RUNTIME_BIN_DIR")) {
        return expand_tilde(*env);
    }
    if (!config_path.empty()) {
        if (auto v = parse_config_value(config_path, "core", "runtime_bin_dir"); !v.empty()) {
            return expand_tilde(v);
        }
    }
    return data_dir / "bin";
}

} // namespace mcpgate::config

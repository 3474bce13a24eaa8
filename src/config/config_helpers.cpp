#include <fstream>
#include <regdoc/config/config_helpers.h>

namespace regdoc::config {

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    const std::string dottedKey = section.empty() ? key : section + "." + key;

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
        trim(v);

        // Remove inline comments outside of quoted values
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        bool inSection = section.empty() ? currentSection.empty() : currentSection == section;
        if ((inSection && k == key) || (currentSection.empty() && k == dottedKey)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }
    if (const char* cfg_env = std::getenv("REGDOC_CONFIG"); cfg_env && *cfg_env) {
        return std::filesystem::path(cfg_env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("regdoc") / "config.toml";
    }

    return configHome / "regdoc" / "config.toml";
}

std::filesystem::path get_data_dir() {
    if (const char* xdg_data = std::getenv("XDG_DATA_HOME"); xdg_data && *xdg_data) {
        return std::filesystem::path(xdg_data) / "regdoc";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".local" / "share" / "regdoc";
    }
    return std::filesystem::current_path() / "regdoc_data";
}

std::filesystem::path resolve_data_dir_from_config(const std::filesystem::path& config_path) {
    // 1) REGDOC_DATA_DIR env
    if (const char* env = std::getenv("REGDOC_DATA_DIR"); env && *env) {
        return std::filesystem::path(env);
    }

    // 2) config.toml storage.data_dir
    if (!config_path.empty()) {
        if (auto value = parse_config_value(config_path, "storage", "data_dir"); !value.empty()) {
            return expand_tilde(value);
        }
    }

    // 3) XDG/HOME defaults
    return get_data_dir();
}

} // namespace regdoc::config

#include "app/Config.h"
#include "core/PlatformUtils.h"

#include <fstream>
#include <iostream>
#include <unordered_map>

namespace treenav {

// ============================================================================
// Singleton accessor
// ============================================================================
Config& Config::instance() {
    static Config inst;
    return inst;
}

std::string Config::getConfigPath() {
    return PlatformUtils::configDir() + "/treenav/config.json";
}

// ============================================================================
// parseColor - hex or one of the 16 terminal color names
// ============================================================================
bool Config::parseColor(const std::string& value, ThemeColor& out) {
    static const std::unordered_map<std::string, int> names = {
        {"black", 0},        {"red", 1},           {"green", 2},
        {"yellow", 3},       {"blue", 4},          {"magenta", 5},
        {"cyan", 6},         {"gray", 7},          {"grey", 7},
        {"darkgray", 8},     {"darkgrey", 8},      {"lightred", 9},
        {"lightgreen", 10},  {"lightyellow", 11},  {"lightblue", 12},
        {"lightmagenta", 13}, {"lightcyan", 14},   {"white", 15},
    };

    auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return false;
    }
    auto last = value.find_last_not_of(" \t\r\n");
    std::string s = value.substr(first, last - first + 1);

    RGBcolor rgb;
    if (PlatformUtils::hex2rgb(s, rgb)) {
        out.index = -1;
        out.rgb = rgb;
        return true;
    }

    auto it = names.find(PlatformUtils::toLowerAscii(s));
    if (it == names.end()) {
        return false;
    }
    out = ThemeColor::named(it->second);
    return true;
}

// ============================================================================
// load - read JSON config from disk; use defaults if file is missing
// ============================================================================
void Config::load() {
    loadFrom(getConfigPath());
}

bool Config::loadFrom(const std::string& path) {
    theme = Theme();

    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        // File does not exist -- use defaults.
        return true;
    }

    try {
        nlohmann::json j;
        ifs >> j;
        fromJson(j);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "treenav: failed to parse config: " << e.what() << std::endl;
        theme = Theme();
        return false;
    }
    return true;
}

// ============================================================================
// fromJson - deserialize settings, falling back to defaults for missing keys
// ============================================================================
void Config::fromJson(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("theme") || !j["theme"].is_object()) {
        return;
    }
    const auto& jt = j["theme"];

    auto readColor = [&jt](const char* key, ThemeColor& target) {
        if (jt.contains(key) && jt[key].is_string()) {
            ThemeColor parsed;
            if (parseColor(jt[key].get<std::string>(), parsed)) {
                target = parsed;
            }
        }
    };

    readColor("border", theme.border);
    readColor("highlight_bg", theme.highlightBg);
    readColor("starred", theme.starred);
    readColor("dim", theme.dim);
    readColor("text", theme.text);
}

} // namespace treenav

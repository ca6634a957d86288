#pragma once

#include "core/Types.h"
#include <string>
#include <nlohmann/json.hpp>

namespace treenav {

// A theme color: either one of the 16 basic terminal colors or an RGB value
// that the screen maps to the nearest color it can show.
struct ThemeColor {
    int index = -1;     // 0-15 for named colors, -1 for rgb
    RGBcolor rgb;

    static ThemeColor named(int idx) {
        ThemeColor c;
        c.index = idx;
        return c;
    }
    static ThemeColor fromRgb(int r, int g, int b) {
        ThemeColor c;
        c.rgb = {r / 255.0f, g / 255.0f, b / 255.0f};
        return c;
    }
};

struct Theme {
    ThemeColor border = ThemeColor::fromRgb(80, 200, 220);
    ThemeColor highlightBg = ThemeColor::fromRgb(40, 80, 100);
    ThemeColor starred = ThemeColor::fromRgb(250, 200, 50);
    ThemeColor dim = ThemeColor::fromRgb(100, 100, 100);
    ThemeColor text = ThemeColor::named(15);   // white
};

// ============================================================================
// Config - user theme, read once at startup
//
// The file is never written by treenav. Missing keys and unparsable values
// keep their defaults.
// ============================================================================

class Config {
public:
    static Config& instance();

    // Load from getConfigPath(). A missing file leaves the defaults.
    void load();

    // Load from `path`. Returns false when the file exists but is not JSON.
    bool loadFrom(const std::string& path);

    Theme theme;

    // Get config file path
    static std::string getConfigPath();

    // "#RRGGBB", "RRGGBB" or a color name ("lightblue", "grey", ...).
    static bool parseColor(const std::string& value, ThemeColor& out);

    void fromJson(const nlohmann::json& j);

private:
    Config() = default;
};

} // namespace treenav

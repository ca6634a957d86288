#pragma once

#include "Types.h"

#include <cstdint>
#include <ctime>
#include <string>

namespace treenav {
namespace PlatformUtils {

    // Get current time as double seconds (high-resolution monotonic clock).
    double getTime();

    // Current wall-clock time as seconds since the Unix epoch.
    int64_t epochSeconds();

    // Per-user data directory (XDG_DATA_HOME, ~/.local/share, ...).
    std::string dataDir();

    // Per-user config directory (XDG_CONFIG_HOME, ~/.config, ...).
    std::string configDir();

    // Abbreviate byte size the compact way ("512B", "1.5K", "2.0M", "3.1G").
    std::string formatSize(uint64_t bytes);

    // Final path component; the path itself when it has none ("/").
    std::string baseName(const std::string& path);

    // True when the basename starts with '.'.
    bool isHidden(const std::string& path);

    // ASCII-only lowercase; other bytes are left untouched.
    std::string toLowerAscii(const std::string& s);

    // Case-insensitive (ASCII) ordering.
    bool lessIgnoreCase(const std::string& a, const std::string& b);

    // True when path equals root or lies below it (component-wise).
    bool isWithin(const std::string& path, const std::string& root);

    // Decode UTF-8 into code points. Invalid bytes decode as U+FFFD.
    std::u32string decodeUtf8(const std::string& s);

    // Encode a single code point as UTF-8.
    std::string encodeUtf8(char32_t cp);

    // Truncate a UTF-8 string so it occupies at most `columns` terminal cells.
    std::string fitToWidth(const std::string& s, int columns);

    // Display width in terminal cells of a UTF-8 string.
    int displayWidth(const std::string& s);

    // Convert hex string "#RRGGBB" or "RRGGBB" to RGBcolor. Returns false
    // when the string is not a valid hex color.
    bool hex2rgb(const std::string& hexColor, RGBcolor& out);

} // namespace PlatformUtils
} // namespace treenav

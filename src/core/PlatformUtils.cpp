#include "PlatformUtils.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cwchar>
#include <string>

namespace treenav {
namespace PlatformUtils {

// ============================================================================
// getTime - high-resolution monotonic clock, returns seconds as double
// ============================================================================
double getTime() {
    using Clock = std::chrono::steady_clock;
    static const auto startTime = Clock::now();
    auto now = Clock::now();
    std::chrono::duration<double> elapsed = now - startTime;
    return elapsed.count();
}

int64_t epochSeconds() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    int64_t secs = std::chrono::duration_cast<std::chrono::seconds>(now).count();
    return secs < 0 ? 0 : secs;
}

// ============================================================================
// dataDir / configDir - platform-appropriate per-user locations
// ============================================================================
std::string dataDir() {
#if defined(__APPLE__)
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/Library/Application Support";
    }
    return ".";
#else
    const char* xdgData = std::getenv("XDG_DATA_HOME");
    if (xdgData && xdgData[0] == '/') {
        return std::string(xdgData);
    }
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.local/share";
    }
    return ".";
#endif
}

std::string configDir() {
#if defined(__APPLE__)
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/Library/Application Support";
    }
    return ".";
#else
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] == '/') {
        return std::string(xdgConfig);
    }
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config";
    }
    return ".";
#endif
}

// ============================================================================
// formatSize - one decimal above a kilobyte, binary multiples
// ============================================================================
std::string formatSize(uint64_t bytes) {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    char buf[32];
    if (bytes >= GB) {
        std::snprintf(buf, sizeof(buf), "%.1fG", static_cast<double>(bytes) / GB);
    } else if (bytes >= MB) {
        std::snprintf(buf, sizeof(buf), "%.1fM", static_cast<double>(bytes) / MB);
    } else if (bytes >= KB) {
        std::snprintf(buf, sizeof(buf), "%.1fK", static_cast<double>(bytes) / KB);
    } else {
        std::snprintf(buf, sizeof(buf), "%lluB", static_cast<unsigned long long>(bytes));
    }
    return std::string(buf);
}

// ============================================================================
// Path helpers
// ============================================================================
std::string baseName(const std::string& path) {
    std::string trimmed = path;
    while (trimmed.size() > 1 && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    auto slash = trimmed.find_last_of('/');
    if (slash == std::string::npos) {
        return trimmed;
    }
    if (slash + 1 == trimmed.size()) {
        return trimmed;   // "/"
    }
    return trimmed.substr(slash + 1);
}

bool isHidden(const std::string& path) {
    std::string name = baseName(path);
    return !name.empty() && name[0] == '.';
}

std::string toLowerAscii(const std::string& s) {
    std::string out = s;
    for (char& c : out) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return out;
}

bool lessIgnoreCase(const std::string& a, const std::string& b) {
    size_t len = std::min(a.size(), b.size());
    for (size_t i = 0; i < len; ++i) {
        char ac = (a[i] >= 'A' && a[i] <= 'Z') ? static_cast<char>(a[i] - 'A' + 'a') : a[i];
        char bc = (b[i] >= 'A' && b[i] <= 'Z') ? static_cast<char>(b[i] - 'A' + 'a') : b[i];
        if (ac != bc) {
            return static_cast<unsigned char>(ac) < static_cast<unsigned char>(bc);
        }
    }
    return a.size() < b.size();
}

bool isWithin(const std::string& path, const std::string& root) {
    if (path == root) {
        return true;
    }
    if (root == "/") {
        return !path.empty() && path[0] == '/';
    }
    return path.size() > root.size() &&
           path.compare(0, root.size(), root) == 0 &&
           path[root.size()] == '/';
}

// ============================================================================
// UTF-8
// ============================================================================
std::u32string decodeUtf8(const std::string& s) {
    std::u32string out;
    out.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        char32_t cp = 0;
        int extra = 0;
        if (c < 0x80) {
            cp = c;
        } else if ((c & 0xE0) == 0xC0) {
            cp = c & 0x1F;
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            cp = c & 0x0F;
            extra = 2;
        } else if ((c & 0xF8) == 0xF0) {
            cp = c & 0x07;
            extra = 3;
        } else {
            out.push_back(0xFFFD);
            ++i;
            continue;
        }

        if (i + static_cast<size_t>(extra) >= s.size()) {
            out.push_back(0xFFFD);
            break;
        }

        bool valid = true;
        for (int k = 1; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (!valid) {
            out.push_back(0xFFFD);
            ++i;
            continue;
        }

        out.push_back(cp);
        i += static_cast<size_t>(extra) + 1;
    }
    return out;
}

std::string encodeUtf8(char32_t cp) {
    std::string out;
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return out;
}

static int cellWidth(char32_t cp) {
    int w = ::wcwidth(static_cast<wchar_t>(cp));
    return w < 0 ? 1 : w;
}

std::string fitToWidth(const std::string& s, int columns) {
    std::string out;
    int used = 0;
    for (char32_t cp : decodeUtf8(s)) {
        int w = cellWidth(cp);
        if (used + w > columns) {
            break;
        }
        out += encodeUtf8(cp);
        used += w;
    }
    return out;
}

int displayWidth(const std::string& s) {
    int width = 0;
    for (char32_t cp : decodeUtf8(s)) {
        width += cellWidth(cp);
    }
    return width;
}

// ============================================================================
// hex2rgb
// ============================================================================
bool hex2rgb(const std::string& hexColor, RGBcolor& out) {
    std::string hex = hexColor;
    if (!hex.empty() && hex[0] == '#') {
        hex.erase(0, 1);
    }
    if (hex.size() != 6 || hex.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) {
        return false;
    }

    unsigned int r = 0, g = 0, b = 0;
    if (std::sscanf(hex.c_str(), "%02x%02x%02x", &r, &g, &b) != 3) {
        return false;
    }
    out.r = static_cast<float>(r) / 255.0f;
    out.g = static_cast<float>(g) / 255.0f;
    out.b = static_cast<float>(b) / 255.0f;
    return true;
}

} // namespace PlatformUtils
} // namespace treenav

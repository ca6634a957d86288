#include "Icons.h"
#include "PlatformUtils.h"

#include <unordered_map>

namespace treenav {
namespace Icons {

// UTF-8 encoded Nerd Font code points.
static constexpr const char* ICON_FOLDER_CLOSED = "\xef\x81\xbb";   // U+F07B
static constexpr const char* ICON_FOLDER_OPEN   = "\xef\x81\xbc";   // U+F07C
static constexpr const char* ICON_FILE_DEFAULT  = "\xef\x80\x96";   // U+F016
static constexpr const char* ICON_RUST          = "\xee\x9e\xa8";
static constexpr const char* ICON_CODE          = "\xef\x87\x89";
static constexpr const char* ICON_MARKDOWN      = "\xf3\xb0\x8d\x94";
static constexpr const char* ICON_TEXT          = "\xef\x83\xb6";
static constexpr const char* ICON_PYTHON        = "\xee\x9c\xbc";
static constexpr const char* ICON_JAVASCRIPT    = "\xee\x9d\x8e";
static constexpr const char* ICON_HTML          = "\xee\x9c\xb6";
static constexpr const char* ICON_CSS           = "\xee\x9d\x89";
static constexpr const char* ICON_CPP           = "\xee\x98\x9d";
static constexpr const char* ICON_TERMINAL      = "\xee\xaa\x85";
static constexpr const char* ICON_IMAGE         = "\xef\x87\x85";
static constexpr const char* ICON_ARCHIVE       = "\xef\x87\x86";
static constexpr const char* ICON_PDF           = "\xef\x87\x81";
static constexpr const char* ICON_AUDIO         = "\xef\x87\x87";
static constexpr const char* ICON_VIDEO         = "\xef\x87\x88";
static constexpr const char* ICON_LOCK          = "\xef\x80\xa3";
static constexpr const char* ICON_GIT           = "\xee\x9c\x82";

static const std::unordered_map<std::string, const char*>& extensionTable() {
    static const std::unordered_map<std::string, const char*> table = {
        {"rs", ICON_RUST},
        {"toml", ICON_CODE}, {"json", ICON_CODE}, {"yml", ICON_CODE}, {"yaml", ICON_CODE},
        {"md", ICON_MARKDOWN},
        {"txt", ICON_TEXT},
        {"py", ICON_PYTHON},
        {"js", ICON_JAVASCRIPT}, {"ts", ICON_JAVASCRIPT},
        {"html", ICON_HTML},
        {"css", ICON_CSS},
        {"c", ICON_CPP}, {"cc", ICON_CPP}, {"cpp", ICON_CPP}, {"cxx", ICON_CPP},
        {"h", ICON_CPP}, {"hpp", ICON_CPP},
        {"sh", ICON_TERMINAL}, {"bash", ICON_TERMINAL}, {"zsh", ICON_TERMINAL},
        {"png", ICON_IMAGE}, {"jpg", ICON_IMAGE}, {"jpeg", ICON_IMAGE},
        {"gif", ICON_IMAGE}, {"svg", ICON_IMAGE}, {"ico", ICON_IMAGE},
        {"zip", ICON_ARCHIVE}, {"tar", ICON_ARCHIVE}, {"gz", ICON_ARCHIVE},
        {"rar", ICON_ARCHIVE}, {"7z", ICON_ARCHIVE},
        {"pdf", ICON_PDF},
        {"mp3", ICON_AUDIO}, {"wav", ICON_AUDIO}, {"flac", ICON_AUDIO}, {"ogg", ICON_AUDIO},
        {"mp4", ICON_VIDEO}, {"avi", ICON_VIDEO}, {"mkv", ICON_VIDEO}, {"mov", ICON_VIDEO},
        {"lock", ICON_LOCK},
        {"git", ICON_GIT}, {"gitignore", ICON_GIT},
    };
    return table;
}

const char* fileIcon(const std::string& name) {
    std::string base = PlatformUtils::baseName(name);
    auto dot = base.find_last_of('.');
    if (dot == std::string::npos || dot + 1 == base.size()) {
        return ICON_FILE_DEFAULT;
    }
    // ".gitignore" -> "gitignore"
    std::string ext = base.substr(dot + 1);

    const auto& table = extensionTable();
    auto it = table.find(ext);
    if (it != table.end()) {
        return it->second;
    }
    return ICON_FILE_DEFAULT;
}

const char* dirIcon(bool expanded) {
    return expanded ? ICON_FOLDER_OPEN : ICON_FOLDER_CLOSED;
}

} // namespace Icons
} // namespace treenav

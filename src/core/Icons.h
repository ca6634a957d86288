#pragma once

#include <string>

namespace treenav {
namespace Icons {

    // Nerd Font glyph for a regular file, chosen by extension.
    const char* fileIcon(const std::string& name);

    // Open or closed folder glyph.
    const char* dirIcon(bool expanded);

} // namespace Icons
} // namespace treenav

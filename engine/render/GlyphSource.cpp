#include "GlyphSource.h"

#include <algorithm>
#include <cctype>

namespace Codex::Render {

std::string repairGlyphPath(std::string path) {
    static const std::string kBadPrefix = "assets_content_textures_";
    std::replace(path.begin(), path.end(), '\\', '/');
    if (path.size() > kBadPrefix.size()) {
        std::string head = path.substr(0, kBadPrefix.size());
        std::transform(head.begin(), head.end(), head.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (head == kBadPrefix) {
            path.erase(0, kBadPrefix.size());
            // The first remaining underscore separated directory from file name.
            auto us = path.find('_');
            if (us != std::string::npos) path[us] = '/';
        }
    }
    if (!path.empty()) path[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(path[0])));
    return path;
}

}  // namespace Codex::Render

#include "catalog/track_reference.h"

#include <algorithm>
#include <cctype>

namespace prerender::catalog {

std::string extensionOf(const std::string& uriOrPath) {
    std::string path = uriOrPath;
    auto cut = path.find_first_of("?#");
    if (cut != std::string::npos) {
        path.erase(cut);
    }
    auto slash = path.find_last_of('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    auto dot = name.find_last_of('.');
    if (dot == std::string::npos || dot + 1 >= name.size()) {
        return std::string();
    }
    std::string ext = name.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

}  // namespace prerender::catalog

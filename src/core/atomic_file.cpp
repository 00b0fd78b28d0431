#include "core/atomic_file.h"

#include <cstdio>
#include <fstream>
#include <system_error>

namespace prerender::atomic_file {

bool replace(const std::filesystem::path& target, const std::string& content, std::string& error) {
    if (target.empty()) {
        error = "empty path";
        return false;
    }

    auto tmp = target;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc | std::ios::binary);
        if (!out) {
            error = "cannot create " + tmp.string();
            return false;
        }
        out << content;
        out.flush();
        if (!out) {
            error = "write to " + tmp.string() + " failed";
            out.close();
            removeIfExists(tmp);
            return false;
        }
    }
    if (std::rename(tmp.c_str(), target.c_str()) != 0) {
        error = "cannot replace " + target.string();
        removeIfExists(tmp);
        return false;
    }
    return true;
}

bool removeIfExists(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    return !ec || ec == std::errc::no_such_file_or_directory;
}

}  // namespace prerender::atomic_file

#include "fs_util.h"
#include "log.h"
#include <fstream>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>

bool file_exists(const std::string& path) {
    struct stat st{};
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

bool ensure_parent_dir(const std::string& path) {
    auto pos = path.rfind('/');
    if (pos == std::string::npos || pos == 0) return true;

    std::string dir = path.substr(0, pos);
    size_t next = dir[0] == '/' ? 1 : 0;
    while (next != std::string::npos) {
        next = dir.find('/', next);
        std::string part = dir.substr(0, next);
        if (next != std::string::npos) ++next;
        if (part.empty() || part == "." || part == "..") continue;

        if (mkdir(part.c_str(), 0755) < 0 && errno != EEXIST) {
            LOG_ERROR("cannot create directory %s: %s", part.c_str(), strerror(errno));
            return false;
        }
    }

    struct stat st{};
    if (stat(dir.c_str(), &st) < 0 || !S_ISDIR(st.st_mode)) {
        LOG_ERROR("%s is not a directory", dir.c_str());
        return false;
    }
    return true;
}

bool read_lines(const std::string& path, std::vector<std::string>& lines) {
    std::ifstream f(path);
    if (!f) {
        LOG_ERROR("cannot open %s", path.c_str());
        return false;
    }

    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
    }
    return true;
}

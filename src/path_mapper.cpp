#include "path_mapper.hpp"
#include <algorithm>
#include <cctype>

std::string PosixPathMapper::to_mount_source(const std::string& host_path) const {
    return host_path;
}

std::string WindowsPathMapper::to_mount_source(const std::string& host_path) const {
    std::string p = host_path;
    std::replace(p.begin(), p.end(), '\\', '/');
    if (p.size() >= 2 && p[1] == ':' && std::isalpha(static_cast<unsigned char>(p[0]))) {
        std::string drive(1, static_cast<char>(std::tolower(static_cast<unsigned char>(p[0]))));
        return "/" + drive + p.substr(2);
    }
    return p;
}

std::unique_ptr<HostPathMapper> make_host_path_mapper() {
#ifdef _WIN32
    return std::make_unique<WindowsPathMapper>();
#else
    return std::make_unique<PosixPathMapper>();
#endif
}

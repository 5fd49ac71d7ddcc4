#include "pagezip/util.hpp"
#include "pagezip/errors.hpp"

#include <sys/stat.h>
#ifdef _WIN32
  #include <direct.h>
#endif
#include <cerrno>
#include <cstring>
#include <string>

namespace pagezip {

static bool is_dir(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

static void make_one(const std::string& path) {
#ifdef _WIN32
    const int rc = _mkdir(path.c_str());
#else
    const int rc = ::mkdir(path.c_str(), 0755);
#endif
    if (rc != 0 && !(errno == EEXIST && is_dir(path))) {
        throw PersistFailure("cannot create directory " + path + ": " + std::strerror(errno));
    }
}

void ensure_dir(const std::string& path) {
    if (path.empty() || is_dir(path)) return;
    for (size_t pos = path.find('/', 1); pos != std::string::npos; pos = path.find('/', pos + 1)) {
        const std::string prefix = path.substr(0, pos);
        if (!is_dir(prefix)) make_one(prefix);
    }
    make_one(path);
}

bool is_http_url(const std::string& s) {
    return s.rfind("http://", 0) == 0 || s.rfind("https://", 0) == 0;
}

std::string basename_of(const std::string& url) {
    const auto slash = url.find_last_of('/');
    return (slash == std::string::npos) ? url : url.substr(slash + 1);
}

std::string sanitize_title(const std::string& title) {
    std::string out = title;
    for (auto& c : out) {
        if (c == '/' || c == ' ') c = '_';
    }
    return out;
}

} // namespace pagezip

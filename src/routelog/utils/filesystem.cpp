#include <routelog/common/constants.h>
#include <routelog/common/logging.h>
#include <routelog/utils/filesystem.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>

namespace routelog::utils {

bool read_file(const std::string &path, std::string &out) {
    FILE *fp = std::fopen(path.c_str(), "rb");
    if (!fp) {
        ROUTELOG_LOG_DEBUG("cannot open {}: {}", path, std::strerror(errno));
        return false;
    }

    out.clear();
    std::vector<char> buffer(constants::fetch::FILE_IO_BUFFER_SIZE);
    std::size_t n;
    while ((n = std::fread(buffer.data(), 1, buffer.size(), fp)) > 0) {
        out.append(buffer.data(), n);
    }
    bool ok = !std::ferror(fp);
    std::fclose(fp);
    return ok;
}

std::string local_path(const std::string &reference) {
    static constexpr const char *FILE_SCHEME = "file://";
    static constexpr std::size_t FILE_SCHEME_LEN = 7;
    if (reference.compare(0, FILE_SCHEME_LEN, FILE_SCHEME) == 0) {
        return reference.substr(FILE_SCHEME_LEN);
    }
    return reference;
}

fs::path home_directory() {
    const char *home = std::getenv("HOME");
    if (home != nullptr && *home != '\0') {
        return fs::path(home);
    }
    return fs::temp_directory_path();
}

}  // namespace routelog::utils

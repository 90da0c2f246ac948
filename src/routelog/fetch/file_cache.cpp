#include <routelog/common/constants.h>
#include <routelog/common/logging.h>
#include <routelog/fetch/file_cache.h>
#include <routelog/utils/hash.h>
#include <unistd.h>

#include <atomic>
#include <fstream>
#include <system_error>
#include <utility>

namespace routelog {

namespace {
std::atomic<std::uint64_t> temp_counter{0};

fs::path temp_path_for(const fs::path &final_path) {
    std::string name = final_path.filename().string() + "." +
                       std::to_string(::getpid()) + "." +
                       std::to_string(temp_counter.fetch_add(1)) +
                       constants::cache::TEMP_SUFFIX;
    return final_path.parent_path() / name;
}
}  // namespace

FileCache::FileCache(fs::path directory) : directory_(std::move(directory)) {}

std::string FileCache::cache_key(const std::string &reference) {
    return utils::sha256_hex(reference);
}

fs::path FileCache::entry_path(const std::string &reference) const {
    return directory_ / cache_key(reference);
}

bool FileCache::load(const std::string &reference, std::string &out) const {
    auto path = entry_path(reference);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return false;
    }
    if (!utils::read_file(path.string(), out)) {
        ROUTELOG_LOG_WARN("Cannot read cache entry {}", path.string());
        return false;
    }
    ROUTELOG_LOG_DEBUG("Cache hit for {} ({})", reference, path.string());
    return true;
}

bool FileCache::store(const std::string &reference,
                      const std::string &bytes) const {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        ROUTELOG_LOG_WARN("Cannot create cache directory {}: {}",
                          directory_.string(), ec.message());
        return false;
    }

    auto final_path = entry_path(reference);
    auto temp_path = temp_path_for(final_path);
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            ROUTELOG_LOG_WARN("Cannot open cache temp file {}",
                              temp_path.string());
            return false;
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.close();
        if (!out) {
            ROUTELOG_LOG_WARN("Failed writing cache temp file {}",
                              temp_path.string());
            fs::remove(temp_path, ec);
            return false;
        }
    }

    fs::rename(temp_path, final_path, ec);
    if (ec) {
        ROUTELOG_LOG_WARN("Cannot move cache entry into place {}: {}",
                          final_path.string(), ec.message());
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        return false;
    }
    ROUTELOG_LOG_DEBUG("Cached {} as {}", reference, final_path.string());
    return true;
}

}  // namespace routelog

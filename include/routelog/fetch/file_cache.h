#ifndef ROUTELOG_FETCH_FILE_CACHE_H
#define ROUTELOG_FETCH_FILE_CACHE_H

#include <routelog/utils/filesystem.h>

#include <string>

namespace routelog {

/**
 * On-disk cache of downloaded segment files, keyed by the SHA-256 of the
 * reference. Entries are written to a temporary file and renamed into place,
 * so readers only ever see complete files.
 */
class FileCache {
   public:
    explicit FileCache(fs::path directory);

    static std::string cache_key(const std::string &reference);

    fs::path entry_path(const std::string &reference) const;

    /**
     * Returns false when there is no entry for the reference
     */
    bool load(const std::string &reference, std::string &out) const;

    /**
     * Returns false (and leaves no partial entry behind) when the entry
     * could not be written
     */
    bool store(const std::string &reference, const std::string &bytes) const;

    const fs::path &directory() const { return directory_; }

   private:
    fs::path directory_;
};

}  // namespace routelog

#endif  // ROUTELOG_FETCH_FILE_CACHE_H

#ifndef ROUTELOG_UTILS_FILESYSTEM_H
#define ROUTELOG_UTILS_FILESYSTEM_H

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace routelog::utils {

/**
 * Read a whole file into memory. Returns false if the file cannot be opened
 * or read.
 */
bool read_file(const std::string &path, std::string &out);

/**
 * Strip a "file://" prefix, leaving plain paths unchanged
 */
std::string local_path(const std::string &reference);

/**
 * User cache root: $HOME, or the temp directory when HOME is unset
 */
fs::path home_directory();

}  // namespace routelog::utils

#endif  // ROUTELOG_UTILS_FILESYSTEM_H

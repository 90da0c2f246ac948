#ifndef ROUTELOG_UTILS_HASH_H
#define ROUTELOG_UTILS_HASH_H

#include <string>

namespace routelog::utils {

/**
 * SHA-256 of a string as lowercase hex
 */
std::string sha256_hex(const std::string &data);

}  // namespace routelog::utils

#endif  // ROUTELOG_UTILS_HASH_H

#include <picosha2.h>
#include <routelog/utils/hash.h>

namespace routelog::utils {

std::string sha256_hex(const std::string &data) {
    return picosha2::hash256_hex_string(data);
}

}  // namespace routelog::utils

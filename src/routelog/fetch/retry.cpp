#include <routelog/fetch/retry.h>

#include <algorithm>
#include <stdexcept>

namespace routelog {

ExponentialBackoff::ExponentialBackoff(int attempts,
                                       std::chrono::milliseconds base_delay,
                                       std::chrono::milliseconds max_delay)
    : attempts_(attempts), base_delay_(base_delay), max_delay_(max_delay) {
    if (attempts < 1) {
        throw std::invalid_argument("retry attempts must be at least 1");
    }
    if (base_delay.count() < 0 || max_delay.count() < 0) {
        throw std::invalid_argument("retry delay cannot be negative");
    }
}

std::chrono::milliseconds ExponentialBackoff::delay(int attempt) const {
    if (attempt < 2) return std::chrono::milliseconds(0);
    int shift = std::min(attempt - 2, 20);
    auto delay = base_delay_ * (1LL << shift);
    return std::min<std::chrono::milliseconds>(delay, max_delay_);
}

}  // namespace routelog

#ifndef ROUTELOG_FETCH_RETRY_H
#define ROUTELOG_FETCH_RETRY_H

#include <chrono>
#include <memory>

namespace routelog {

/**
 * How often and how patiently a failed download is re-attempted
 */
class RetryPolicy {
   public:
    virtual ~RetryPolicy() = default;

    /**
     * Total number of attempts, at least 1
     */
    virtual int max_attempts() const = 0;

    /**
     * Pause before attempt number `attempt` (1 based, called for attempt >= 2)
     */
    virtual std::chrono::milliseconds delay(int attempt) const = 0;
};

class NoRetry : public RetryPolicy {
   public:
    int max_attempts() const override { return 1; }
    std::chrono::milliseconds delay(int) const override {
        return std::chrono::milliseconds(0);
    }
};

/**
 * base_delay, 2 * base_delay, 4 * base_delay, ... capped at max_delay
 */
class ExponentialBackoff : public RetryPolicy {
   public:
    ExponentialBackoff(int attempts, std::chrono::milliseconds base_delay,
                       std::chrono::milliseconds max_delay =
                           std::chrono::milliseconds(30000));

    int max_attempts() const override { return attempts_; }
    std::chrono::milliseconds delay(int attempt) const override;

   private:
    int attempts_;
    std::chrono::milliseconds base_delay_;
    std::chrono::milliseconds max_delay_;
};

}  // namespace routelog

#endif  // ROUTELOG_FETCH_RETRY_H

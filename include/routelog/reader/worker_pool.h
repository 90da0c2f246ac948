#ifndef ROUTELOG_READER_WORKER_POOL_H
#define ROUTELOG_READER_WORKER_POOL_H

#include <routelog/reader/thread_safe_queue.h>

#include <cstddef>
#include <functional>
#include <thread>
#include <vector>

namespace routelog {

/**
 * Fixed number of threads draining a shared job queue. Jobs must not
 * throw; wrap them if they can. The destructor closes the queue and joins.
 */
class WorkerPool {
   public:
    using Job = std::function<void()>;

    /**
     * Throws std::invalid_argument for zero workers
     */
    explicit WorkerPool(std::size_t worker_count);
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    void submit(Job job);

    /**
     * Stop accepting jobs, run the queued ones and join every worker
     */
    void join();

    std::size_t size() const { return workers_.size(); }

   private:
    void worker_loop();

    ThreadSafeQueue<Job> jobs_;
    std::vector<std::thread> workers_;
    bool joined_ = false;
};

}  // namespace routelog

#endif  // ROUTELOG_READER_WORKER_POOL_H

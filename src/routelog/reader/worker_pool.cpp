#include <routelog/common/logging.h>
#include <routelog/reader/worker_pool.h>

#include <stdexcept>
#include <utility>

namespace routelog {

WorkerPool::WorkerPool(std::size_t worker_count) {
    if (worker_count == 0) {
        throw std::invalid_argument("worker count must be at least 1");
    }
    workers_.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back(&WorkerPool::worker_loop, this);
    }
    ROUTELOG_LOG_DEBUG("Started worker pool with {} threads", worker_count);
}

WorkerPool::~WorkerPool() { join(); }

void WorkerPool::submit(Job job) {
    if (joined_) {
        throw std::logic_error("worker pool is already joined");
    }
    jobs_.push(std::move(job));
}

void WorkerPool::join() {
    if (joined_) return;
    joined_ = true;
    jobs_.close();
    for (auto &worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::worker_loop() {
    Job job;
    while (jobs_.wait_and_pop(job)) {
        job();
    }
}

}  // namespace routelog

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <routelog/reader/thread_safe_queue.h>
#include <routelog/reader/worker_pool.h>

#include <atomic>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace routelog;

TEST_CASE("C++ ThreadSafeQueue - Basic operations") {
    ThreadSafeQueue<int> queue;
    CHECK(queue.empty());

    int value = 0;
    CHECK_FALSE(queue.try_pop(value));

    queue.push(1);
    queue.push(2);
    CHECK_FALSE(queue.empty());
    CHECK(queue.try_pop(value));
    CHECK(value == 1);

    SUBCASE("Close drains remaining items") {
        queue.close();
        CHECK(queue.wait_and_pop(value));
        CHECK(value == 2);
        CHECK_FALSE(queue.wait_and_pop(value));
    }

    SUBCASE("Consumer wakes up on push") {
        int received = 0;
        CHECK(queue.wait_and_pop(received));
        CHECK(received == 2);

        std::thread consumer([&queue, &received] {
            queue.wait_and_pop(received);
        });
        queue.push(7);
        consumer.join();
        CHECK(received == 7);
    }
}

TEST_CASE("C++ WorkerPool - Runs every job") {
    SUBCASE("Results by index") {
        std::vector<int> results(100, 0);
        {
            WorkerPool pool(4);
            CHECK(pool.size() == 4);
            for (int i = 0; i < 100; ++i) {
                pool.submit([&results, i] { results[i] = i * i; });
            }
            pool.join();
        }
        for (int i = 0; i < 100; ++i) {
            CHECK(results[i] == i * i);
        }
    }

    SUBCASE("Jobs run on several threads") {
        std::mutex mutex;
        std::set<std::thread::id> threads;
        std::atomic<int> done{0};
        {
            WorkerPool pool(3);
            for (int i = 0; i < 30; ++i) {
                pool.submit([&] {
                    std::this_thread::sleep_for(std::chrono::milliseconds(2));
                    std::lock_guard<std::mutex> lock(mutex);
                    threads.insert(std::this_thread::get_id());
                    ++done;
                });
            }
        }
        CHECK(done.load() == 30);
        CHECK(threads.size() >= 1);
        CHECK(threads.size() <= 3);
        CHECK(threads.count(std::this_thread::get_id()) == 0);
    }

    SUBCASE("Invalid use") {
        CHECK_THROWS_AS(WorkerPool(0), std::invalid_argument);

        WorkerPool pool(1);
        pool.join();
        pool.join();
        CHECK_THROWS_AS(pool.submit([] {}), std::logic_error);
    }
}

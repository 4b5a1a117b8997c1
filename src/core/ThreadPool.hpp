#pragma once
#include <chrono>
#include <cstddef>
#include <map>
#include <vector>
#include <queue>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>

namespace broker
{
    // Worker pool that starts with `num_threads` workers and adds one whenever
    // a task is queued with no idle worker to take it. Every running task
    // therefore has a thread of its own. Workers above `num_threads` exit
    // after sitting idle for `idle_timeout`.
    class ThreadPool
    {
    public:
        // max_threads == 0 means no upper bound.
        explicit ThreadPool(size_t num_threads, size_t max_threads = 0,
                            std::chrono::milliseconds idle_timeout = std::chrono::seconds(60));
        ~ThreadPool();

        // Either queues the task or throws; a task is never both queued and
        // reported as failed.
        void enqueue(std::function<void()> task);

        size_t size();
        size_t idle();

    private:
        void worker_thread();
        void spawn_worker();
        void join_retired();

        std::map<std::thread::id, std::thread> workers;
        // Workers that exited on idle timeout, waiting to be joined.
        std::vector<std::thread> retired;
        std::queue<std::function<void()>> tasks;

        std::mutex queue_mutex;
        std::condition_variable condition;
        size_t min_workers;
        size_t max_workers;
        std::chrono::milliseconds idle_timeout;
        size_t idle_workers;
        bool stop;
    };
}

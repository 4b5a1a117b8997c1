#include "core/ThreadPool.hpp"
#include <stdexcept>
#include <string>

namespace broker
{
    ThreadPool::ThreadPool(size_t num_threads, size_t max_threads, std::chrono::milliseconds idle_timeout)
        : min_workers(num_threads), max_workers(max_threads), idle_timeout(idle_timeout), idle_workers(0),
          stop(false)
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        for (size_t i = 0; i < num_threads; ++i)
        {
            spawn_worker();
        }
    }

    // Caller holds queue_mutex.
    void ThreadPool::spawn_worker()
    {
        std::thread worker([this]
                           { this->worker_thread(); });
        std::thread::id id = worker.get_id();
        workers.emplace(id, std::move(worker));
    }

    // Caller holds queue_mutex. Retired threads have already given up the
    // lock and only need to return.
    void ThreadPool::join_retired()
    {
        for (std::thread &worker : retired)
        {
            worker.join();
        }
        retired.clear();
    }

    void ThreadPool::worker_thread()
    {
        while (true)
        {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(this->queue_mutex);
                ++this->idle_workers;
                // Wait until there's a task or the pool is stopped
                bool ready = this->condition.wait_for(lock, this->idle_timeout, [this]
                                                      { return this->stop || !this->tasks.empty(); });
                --this->idle_workers;

                if (!ready)
                {
                    if (this->workers.size() > this->min_workers)
                    {
                        auto self = this->workers.find(std::this_thread::get_id());
                        this->retired.push_back(std::move(self->second));
                        this->workers.erase(self);
                        return;
                    }
                    continue;
                }

                if (this->stop && this->tasks.empty())
                {
                    return;
                }

                task = std::move(this->tasks.front());
                this->tasks.pop();
            }
            task();
        }
    }

    void ThreadPool::enqueue(std::function<void()> task)
    {
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            if (stop)
            {
                throw std::runtime_error("enqueue on stopped ThreadPool");
            }
            join_retired();

            // Workers that have not reached the wait yet are not counted as
            // idle, so this can overshoot by a thread but never undershoot.
            // The worker is started before the task is queued so that a
            // failure leaves nothing behind.
            if (tasks.size() + 1 > idle_workers)
            {
                if (max_workers != 0 && workers.size() >= max_workers)
                {
                    throw std::runtime_error("ThreadPool is at its limit of " + std::to_string(max_workers) +
                                             " workers");
                }
                spawn_worker();
            }
            tasks.emplace(std::move(task));
        }
        condition.notify_one();
    }

    size_t ThreadPool::size()
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        return workers.size();
    }

    size_t ThreadPool::idle()
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        return idle_workers;
    }

    ThreadPool::~ThreadPool()
    {
        std::vector<std::thread> running;
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            stop = true;
            join_retired();
            // Once stop is set no worker retires, so the map is stable.
            for (auto &entry : workers)
            {
                running.push_back(std::move(entry.second));
            }
            workers.clear();
        }
        condition.notify_all();
        for (std::thread &worker : running)
        {
            worker.join();
        }
    }
}

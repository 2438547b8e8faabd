#pragma once
#include <vector>
#include <thread>
#include <queue>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <string>

class ThreadPool {
private:
    std::string name;
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    std::mutex queue_mutex;
    std::condition_variable condition;
    std::atomic<bool> stop{false};

    void worker_loop();

public:
    ThreadPool(size_t threads, std::string pool_name = "pool");
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Returns false once the pool is shutting down; the task is dropped.
    template<class F>
    bool enqueue(F&& f) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            if (stop) return false;
            tasks.emplace(std::forward<F>(f));
        }
        condition.notify_one();
        return true;
    }

    // Runs the queued tasks to completion, then joins the workers.
    void shutdown();

    size_t size() const { return workers.size(); }
};

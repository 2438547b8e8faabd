#include "thread_pool.hpp"
#include "logger.hpp"
#include <exception>

ThreadPool::ThreadPool(size_t threads, std::string pool_name) : name(std::move(pool_name)) {
    if (threads == 0) threads = 1;
    workers.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers.emplace_back([this] { worker_loop(); });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            condition.wait(lock, [this] { return stop || !tasks.empty(); });

            if (stop && tasks.empty()) return;

            task = std::move(tasks.front());
            tasks.pop();
        }

        // A throwing task must not take the worker down with it
        try {
            task();
        } catch (const std::exception& e) {
            Logger::error("Unhandled exception in " + name + " task: " + e.what());
        }
    }
}

void ThreadPool::shutdown() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        if (stop && workers.empty()) return;
        stop = true;
    }
    condition.notify_all();
    for (std::thread& worker : workers) {
        if (worker.joinable()) worker.join();
    }
    workers.clear();
}

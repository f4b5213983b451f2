#include "app/BackgroundRunner.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>

namespace Pequod {

ThreadBackgroundRunner::~ThreadBackgroundRunner() {
    joinAll();
}

void ThreadBackgroundRunner::post(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto finished = std::partition(workers_.begin(), workers_.end(),
                                   [](const Worker& w) { return !w.done->load(); });
    for (auto it = finished; it != workers_.end(); ++it) {
        it->thread.join();
    }
    workers_.erase(finished, workers_.end());

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([task = std::move(task), done]() {
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Background task failed: {}", e.what());
        }
        done->store(true);
    });
    workers_.push_back(Worker{std::move(thread), done});
}

void ThreadBackgroundRunner::joinAll() {
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers.swap(workers_);
    }
    for (auto& w : workers) {
        if (w.thread.joinable()) w.thread.join();
    }
}

}

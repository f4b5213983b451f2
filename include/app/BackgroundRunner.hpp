#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace Pequod {

class BackgroundRunner {
public:
    virtual ~BackgroundRunner() = default;
    virtual void post(std::function<void()> task) = 0;
};

// One thread per task. Finished threads are reaped on the next post, the
// rest are joined on shutdown.
class ThreadBackgroundRunner : public BackgroundRunner {
public:
    ThreadBackgroundRunner() = default;
    ~ThreadBackgroundRunner() override;
    ThreadBackgroundRunner(const ThreadBackgroundRunner&) = delete;
    ThreadBackgroundRunner& operator=(const ThreadBackgroundRunner&) = delete;

    void post(std::function<void()> task) override;
    void joinAll();

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::mutex mutex_;
    std::vector<Worker> workers_;
};

}

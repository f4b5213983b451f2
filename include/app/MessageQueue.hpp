#pragma once
#include <deque>
#include <iterator>
#include <mutex>
#include <vector>

namespace Pequod {

// Hand-off from background threads to the input loop.
template <typename T>
class MessageQueue {
public:
    void push(T message) {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(message));
    }

    std::vector<T> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> messages(std::make_move_iterator(queue_.begin()), std::make_move_iterator(queue_.end()));
        queue_.clear();
        return messages;
    }

private:
    std::mutex mutex_;
    std::deque<T> queue_;
};

}

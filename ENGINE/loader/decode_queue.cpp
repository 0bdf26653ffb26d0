#include "loader/decode_queue.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include "utils/log.hpp"

namespace mablocks {

namespace {

const log::Channel kLog{"DecodeQueue"};

void wait_and_log(std::future<void>& task) {
    if (!task.valid()) return;
    try {
        task.get();
    } catch (const std::exception& ex) {
        kLog.error(std::string("Task failed with exception: ") + ex.what());
    }
}

}

DecodeQueue::DecodeQueue(DecodeFunction decoder) : decoder_(std::move(decoder)) {}

DecodeQueue::~DecodeQueue() {
    wait_idle();
}

void DecodeQueue::request(std::string path, bool full) {
    if (!decoder_ || path.empty()) return;
    std::future<void> future = std::async(std::launch::async, [this, path = std::move(path), full]() {
        DecodeResult result;
        try {
            result = decoder_(path, full);
        } catch (const std::exception& ex) {
            result = DecodeResult{};
            result.error = "Failed to decode " + path + ": " + ex.what();
        }
        result.path = path;
        result.full = full;
        std::lock_guard<std::mutex> lock(mutex_);
        ready_.push_back(std::move(result));
    });

    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.push_back(std::move(future));
}

std::vector<DecodeResult> DecodeQueue::drain() {
    prune_completed_tasks();
    std::vector<DecodeResult> out;
    std::lock_guard<std::mutex> lock(mutex_);
    out.swap(ready_);
    return out;
}

void DecodeQueue::prune_completed_tasks() {
    std::vector<std::future<void>> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.begin();
        while (it != tasks_.end()) {
            if (!it->valid()) {
                it = tasks_.erase(it);
                continue;
            }
            if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                finished.push_back(std::move(*it));
                it = tasks_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& task : finished) {
        wait_and_log(task);
    }
}

bool DecodeQueue::is_busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& task : tasks_) {
        if (!task.valid()) continue;
        if (task.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            return true;
        }
    }
    return false;
}

void DecodeQueue::wait_idle() {
    std::vector<std::future<void>> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks.swap(tasks_);
    }
    for (auto& task : tasks) {
        wait_and_log(task);
    }
}

}

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <vector>

#include "loader/image_decoder.hpp"

namespace mablocks {

// Runs each decode request on its own std::async task. Finished results are
// parked behind a mutex until the owner drains them on its own thread.
class DecodeQueue {
  public:
    using DecodeFunction = std::function<DecodeResult(const std::string&, bool)>;

    explicit DecodeQueue(DecodeFunction decoder = decode_image);
    ~DecodeQueue();

    DecodeQueue(const DecodeQueue&) = delete;
    DecodeQueue& operator=(const DecodeQueue&) = delete;

    void request(std::string path, bool full);
    std::vector<DecodeResult> drain();

    bool is_busy() const;
    void wait_idle();

  private:
    void prune_completed_tasks();

  private:
    DecodeFunction decoder_;
    mutable std::mutex mutex_;
    std::vector<std::future<void>> tasks_;
    std::vector<DecodeResult> ready_;
};

}

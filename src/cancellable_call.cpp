#include "voxturn/cancellable_call.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

namespace voxturn {

CallReaper::~CallReaper() {
    std::vector<std::future<void>> calls;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls.swap(calls_);
    }
    if (!calls.empty()) {
        std::cout << "[Reaper] Waiting for " << calls.size() << " abandoned call(s)" << std::endl;
    }
    for (auto& call : calls) {
        if (call.valid()) {
            call.wait();
        }
    }
}

void CallReaper::adopt(std::future<void> call) {
    if (!call.valid()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.push_back(std::move(call));
}

void CallReaper::reap() {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.erase(std::remove_if(calls_.begin(), calls_.end(), [](std::future<void>& call) {
        return !call.valid() ||
               call.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }), calls_.end());
}

size_t CallReaper::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_.size();
}

} // namespace voxturn

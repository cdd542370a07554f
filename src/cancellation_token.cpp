#include "voxturn/cancellation_token.hpp"

#include <vector>

namespace voxturn {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {
}

bool CancellationToken::cancel(const std::string& reason) const {
    std::vector<Callback> callbacks;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled) {
            return false;
        }
        state_->cancelled = true;
        state_->reason = reason;
        for (auto& entry : state_->callbacks) {
            callbacks.push_back(std::move(entry.second));
        }
        state_->callbacks.clear();
        state_->invoking = true;
        state_->invoker = std::this_thread::get_id();
    }
    state_->cv.notify_all();

    // Outside the lock: a callback may inspect the token
    for (auto& callback : callbacks) {
        if (callback) {
            callback();
        }
    }

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->invoking = false;
    }
    state_->cv.notify_all();
    return true;
}

bool CancellationToken::isCancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

std::string CancellationToken::reason() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->reason;
}

std::string CancellationToken::awaitCancelled() const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait(lock, [this] { return state_->cancelled; });
    return state_->reason;
}

bool CancellationToken::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled; });
}

size_t CancellationToken::subscribe(Callback callback) const {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            size_t id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
            return id;
        }
    }
    if (callback) {
        callback();
    }
    return 0;
}

void CancellationToken::unsubscribe(size_t id) const {
    if (id == 0) {
        return;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->callbacks.erase(id);
    if (state_->invoking && state_->invoker != std::this_thread::get_id()) {
        state_->cv.wait(lock, [this] { return !state_->invoking; });
    }
}

} // namespace voxturn

#ifndef VOXTURN_CANCELLABLE_CALL_HPP
#define VOXTURN_CANCELLABLE_CALL_HPP

#include "voxturn/cancellation_token.hpp"
#include "voxturn/outcome.hpp"

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace voxturn {

// Owns calls that lost a race against cancellation. They were told to stop
// through their token; the reaper joins them once they return.
class CallReaper {
public:
    CallReaper() = default;
    ~CallReaper();

    CallReaper(const CallReaper&) = delete;
    CallReaper& operator=(const CallReaper&) = delete;

    void adopt(std::future<void> call);

    // Drop calls that have finished
    void reap();

    size_t pending() const;

private:
    std::vector<std::future<void>> calls_;
    mutable std::mutex mutex_;
};

// Runs `call` on its own thread and waits for whichever comes first: the
// call's outcome or cancellation of `token`. A result that arrives after
// cancellation is discarded. The call should observe the token itself.
template <typename T>
Outcome<T> raceCancellation(const CancellationToken& token,
                            std::function<Outcome<T>()> call,
                            CallReaper& reaper,
                            ErrorKind kind) {
    if (token.isCancelled()) {
        return Outcome<T>::cancelled(token.reason());
    }
    reaper.reap();

    struct RaceState {
        std::mutex mutex;
        std::condition_variable cv;
        bool done = false;
        std::optional<Outcome<T>> outcome;
    };
    auto state = std::make_shared<RaceState>();

    std::future<void> worker = std::async(std::launch::async, [state, call, kind]() {
        std::optional<Outcome<T>> result;
        try {
            result = call();
        } catch (const ExternalCallError& e) {
            result = Outcome<T>::error(e.kind(), e.what());
        } catch (const std::exception& e) {
            result = Outcome<T>::error(kind, e.what());
        }
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->outcome = std::move(result);
            state->done = true;
        }
        state->cv.notify_all();
    });

    {
        CancellationSubscription subscription(token, [state] {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->cv.notify_all();
        });
        std::unique_lock<std::mutex> lock(state->mutex);
        state->cv.wait(lock, [&state, &token] { return state->done || token.isCancelled(); });
    }

    if (token.isCancelled()) {
        reaper.adopt(std::move(worker));
        return Outcome<T>::cancelled(token.reason());
    }

    worker.get();
    std::lock_guard<std::mutex> lock(state->mutex);
    return std::move(*state->outcome);
}

// Same race for a call that returns a plain value and reports failure by throwing
template <typename T>
Outcome<T> runCancellable(const CancellationToken& token,
                          std::function<T()> call,
                          CallReaper& reaper,
                          ErrorKind kind) {
    return raceCancellation<T>(token, [call]() { return Outcome<T>::value(call()); }, reaper, kind);
}

} // namespace voxturn

#endif // VOXTURN_CANCELLABLE_CALL_HPP

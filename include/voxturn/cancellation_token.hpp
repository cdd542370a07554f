#ifndef VOXTURN_CANCELLATION_TOKEN_HPP
#define VOXTURN_CANCELLATION_TOKEN_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace voxturn {

// Copyable handle to a shared cancellation state. Once cancelled a token
// stays cancelled; the first reason wins.
class CancellationToken {
public:
    using Callback = std::function<void()>;

    CancellationToken();

    // Returns true only for the call that actually cancelled the token
    bool cancel(const std::string& reason = "Cancelled by user") const;

    bool isCancelled() const;

    // Empty while not cancelled
    std::string reason() const;

    // Blocks until cancelled, returns the reason
    std::string awaitCancelled() const;

    // Returns true if cancelled within the timeout
    bool waitFor(std::chrono::milliseconds timeout) const;

    // Registers a callback fired once on cancellation (immediately, on the
    // calling thread, if the token is already cancelled). Callbacks run
    // without the token lock held and must not block.
    size_t subscribe(Callback callback) const;

    // Once this returns the callback is not running and never will, so it
    // may safely capture objects owned by the subscriber.
    void unsubscribe(size_t id) const;

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
        std::string reason;
        size_t next_id = 1;
        std::map<size_t, Callback> callbacks;
        bool invoking = false;
        std::thread::id invoker;
    };

    std::shared_ptr<State> state_;
};

// Scoped subscription, unsubscribes on destruction
class CancellationSubscription {
public:
    CancellationSubscription(const CancellationToken& token, CancellationToken::Callback callback)
        : token_(token), id_(token.subscribe(std::move(callback))) {}
    ~CancellationSubscription() { token_.unsubscribe(id_); }

    CancellationSubscription(const CancellationSubscription&) = delete;
    CancellationSubscription& operator=(const CancellationSubscription&) = delete;

private:
    CancellationToken token_;
    size_t id_;
};

} // namespace voxturn

#endif // VOXTURN_CANCELLATION_TOKEN_HPP

#ifndef VOXTURN_BOUNDED_CHANNEL_HPP
#define VOXTURN_BOUNDED_CHANNEL_HPP

#include "voxturn/cancellation_token.hpp"
#include "voxturn/outcome.hpp"

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <string>

namespace voxturn {

// Single-producer / single-consumer queue with an explicit end-of-stream
// sentinel. Bridges a push-based source (curl write callback, worker thread)
// to a pull-based consumer.
template <typename T>
class BoundedChannel {
public:
    explicit BoundedChannel(size_t capacity = 64) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    // Blocks while full. Returns false once the consumer has closed the
    // channel or the producer already finished.
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return queue_.size() < capacity_ || closed_ || finished_; });
        if (closed_ || finished_) {
            return false;
        }
        queue_.push(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    // Producer side: no more items
    void finish() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            finished_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    // Producer side: the stream ended with an error after the queued items
    void fail(ErrorKind kind, const std::string& detail) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (finished_) {
                return;
            }
            finished_ = true;
            error_kind_ = kind;
            error_detail_ = detail;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    // Consumer side: stop accepting items, wakes a blocked producer
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            std::queue<T> empty;
            std::swap(queue_, empty);
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    // Consumer side: waits for the next item, the end sentinel, or cancellation
    Outcome<T> pop(const CancellationToken& token) {
        CancellationSubscription subscription(token, [this] {
            std::lock_guard<std::mutex> lock(mutex_);
            not_empty_.notify_all();
        });

        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this, &token] {
            return !queue_.empty() || finished_ || closed_ || token.isCancelled();
        });

        if (token.isCancelled()) {
            return Outcome<T>::cancelled(token.reason());
        }
        if (!queue_.empty()) {
            T item = std::move(queue_.front());
            queue_.pop();
            not_full_.notify_one();
            return Outcome<T>::value(std::move(item));
        }
        if (error_kind_ != ErrorKind::None) {
            return Outcome<T>::error(error_kind_, error_detail_);
        }
        return Outcome<T>::endOfStream();
    }

private:
    size_t capacity_;
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    bool finished_ = false;
    bool closed_ = false;
    ErrorKind error_kind_ = ErrorKind::None;
    std::string error_detail_;
};

} // namespace voxturn

#endif // VOXTURN_BOUNDED_CHANNEL_HPP

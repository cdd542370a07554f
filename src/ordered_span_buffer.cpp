#include "voxturn/ordered_span_buffer.hpp"

#include <iostream>

namespace voxturn {

OrderedSpanBuffer::OrderedSpanBuffer() : next_order_(0), wakeups_(0), seen_wakeups_(0) {
}

void OrderedSpanBuffer::put(SpanAudio audio) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (audio.order < next_order_) {
            std::cerr << "[OrderedBuffer] Late span #" << audio.order << " ignored" << std::endl;
            return;
        }
        size_t order = audio.order;
        spans_[order] = std::move(audio);
    }
    cv_.notify_all();
}

bool OrderedSpanBuffer::isNextReady() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spans_.find(next_order_) != spans_.end();
}

Outcome<SpanAudio> OrderedSpanBuffer::waitNext(const CancellationToken& token) {
    CancellationSubscription subscription(token, [this] {
        std::lock_guard<std::mutex> lock(mutex_);
        cv_.notify_all();
    });

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this, &token] {
        return spans_.find(next_order_) != spans_.end() || token.isCancelled();
    });

    if (token.isCancelled()) {
        return Outcome<SpanAudio>::cancelled(token.reason());
    }

    auto it = spans_.find(next_order_);
    SpanAudio audio = std::move(it->second);
    spans_.erase(it);
    next_order_++;
    return Outcome<SpanAudio>::value(std::move(audio));
}

void OrderedSpanBuffer::wake() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wakeups_++;
    }
    cv_.notify_all();
}

bool OrderedSpanBuffer::waitReady(const CancellationToken& token) {
    CancellationSubscription subscription(token, [this] {
        std::lock_guard<std::mutex> lock(mutex_);
        cv_.notify_all();
    });

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this, &token] {
        return spans_.find(next_order_) != spans_.end() || wakeups_ != seen_wakeups_ || token.isCancelled();
    });
    seen_wakeups_ = wakeups_;
    return !token.isCancelled();
}

size_t OrderedSpanBuffer::nextOrder() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_order_;
}

size_t OrderedSpanBuffer::buffered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spans_.size();
}

} // namespace voxturn

#ifndef VOXTURN_ORDERED_SPAN_BUFFER_HPP
#define VOXTURN_ORDERED_SPAN_BUFFER_HPP

#include "voxturn/audio_types.hpp"
#include "voxturn/cancellation_token.hpp"
#include "voxturn/outcome.hpp"

#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace voxturn {

struct SpanAudio {
    size_t order;  // position of the span within the turn
    std::string text;
    std::vector<AudioChunk> chunks;
    bool failed;
    std::string error;

    SpanAudio() : order(0), failed(false) {}
    SpanAudio(size_t ord, const std::string& t) : order(ord), text(t), failed(false) {}
};

// Collects span results that may complete out of order and releases them
// strictly by order number.
class OrderedSpanBuffer {
public:
    OrderedSpanBuffer();

    // Store a finished span under its order number
    void put(SpanAudio audio);

    // True if the next span in order is available
    bool isNextReady() const;

    // Wait for the next span in order (or cancellation) and advance
    Outcome<SpanAudio> waitNext(const CancellationToken& token);

    // Wake a waitReady() caller without storing a span
    void wake();

    // Wait until the next span is ready or wake() was called since the last
    // return. False on cancellation.
    bool waitReady(const CancellationToken& token);

    size_t nextOrder() const;
    size_t buffered() const;

private:
    std::map<size_t, SpanAudio> spans_;
    size_t next_order_;
    size_t wakeups_;
    size_t seen_wakeups_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace voxturn

#endif // VOXTURN_ORDERED_SPAN_BUFFER_HPP

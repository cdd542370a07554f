#ifndef VOXTURN_COLLABORATORS_HPP
#define VOXTURN_COLLABORATORS_HPP

#include "voxturn/audio_types.hpp"
#include "voxturn/bounded_channel.hpp"
#include "voxturn/cancellation_token.hpp"
#include "voxturn/outcome.hpp"

#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace voxturn {

struct Transcript {
    std::string text;
    float confidence = 0.0f;
    std::string language_code;
};

// Lazy, single-consumption sequence. next() must observe the token.
template <typename T>
class PullStream {
public:
    virtual ~PullStream() = default;

    virtual Outcome<T> next(const CancellationToken& token) = 0;
};

using FragmentStream = PullStream<std::string>;
using AudioStream = PullStream<AudioChunk>;

// Speech-to-text. Throws ExternalCallError on failure.
class Transcriber {
public:
    virtual ~Transcriber() = default;

    virtual Transcript transcribe(const SpeechSegment& segment,
                                  const std::string& language,
                                  const CancellationToken& token) = 0;
};

// Streaming text generation
class TextGenerator {
public:
    virtual ~TextGenerator() = default;

    virtual std::shared_ptr<FragmentStream> generateStream(const std::string& prompt,
                                                           const CancellationToken& token) = 0;
};

// Text-to-speech for one span
class Synthesizer {
public:
    virtual ~Synthesizer() = default;

    virtual std::shared_ptr<AudioStream> synthesizeStream(const std::string& text,
                                                          const std::string& voice,
                                                          const CancellationToken& token) = 0;
};

// Context documents for the prompt. Retrieval itself lives outside the core.
class ContextRetriever {
public:
    virtual ~ContextRetriever() = default;

    virtual std::vector<std::string> retrieve(const std::string& query, const CancellationToken& token) = 0;
};

class NullContextRetriever : public ContextRetriever {
public:
    std::vector<std::string> retrieve(const std::string&, const CancellationToken&) override { return {}; }
};

// Stream fed by one producer thread through a BoundedChannel. The producer
// receives the channel and a token that is cancelled when the consumer goes
// away; it must call finish() or fail() when done.
template <typename T>
class ChannelStream : public PullStream<T> {
public:
    using Producer = std::function<void(BoundedChannel<T>&, const CancellationToken&)>;

    ChannelStream(Producer producer, size_t capacity = 64)
        : channel_(std::make_shared<BoundedChannel<T>>(capacity)) {
        auto channel = channel_;
        CancellationToken stop = producer_stop_;
        producer_thread_ = std::thread([channel, stop, producer]() {
            try {
                producer(*channel, stop);
                channel->finish();
            } catch (const ExternalCallError& e) {
                channel->fail(e.kind(), e.what());
            } catch (const std::exception& e) {
                std::cerr << "[Stream] Producer failed: " << e.what() << std::endl;
                channel->fail(ErrorKind::Internal, e.what());
            }
        });
    }

    ~ChannelStream() override {
        producer_stop_.cancel("consumer closed");
        channel_->close();
        if (producer_thread_.joinable()) {
            producer_thread_.join();
        }
    }

    ChannelStream(const ChannelStream&) = delete;
    ChannelStream& operator=(const ChannelStream&) = delete;

    Outcome<T> next(const CancellationToken& token) override {
        auto outcome = channel_->pop(token);
        if (outcome.isCancelled()) {
            // Actively stop the producer, its result is no longer wanted
            producer_stop_.cancel(outcome.detail());
            channel_->close();
        }
        return outcome;
    }

private:
    std::shared_ptr<BoundedChannel<T>> channel_;
    CancellationToken producer_stop_;
    std::thread producer_thread_;
};

} // namespace voxturn

#endif // VOXTURN_COLLABORATORS_HPP

#ifndef VOXTURN_STREAMING_SYNTHESIS_CHUNKER_HPP
#define VOXTURN_STREAMING_SYNTHESIS_CHUNKER_HPP

#include "voxturn/collaborators.hpp"

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace voxturn {

struct ChunkerConfig {
    size_t max_chars = 80;        // length fallback threshold, in code points
    size_t hard_max_chars = 320;  // forced cutoff for text without any whitespace
};

// Re-segments streamed text fragments into spans worth synthesizing.
//
// Cut priority: sentence end (. ! ? newline) > clause break (, ; : " - " " – ")
// > last word boundary once the buffer exceeds max_chars > forced cutoff.
// Every character of the input ends up in exactly one span, except
// whitespace at span boundaries. A span never ends inside a word, apart from
// finish(), which flushes whatever the generator left behind (the upstream
// stream may itself have stopped mid-word), and the forced cutoff.
//
// Single writer, no locking.
class StreamingSynthesisChunker {
public:
    explicit StreamingSynthesisChunker(const ChunkerConfig& config = ChunkerConfig());

    // Append a fragment, return the spans that became ready (in order)
    std::vector<std::string> push(const std::string& fragment);

    // End of input: the trimmed remainder, if any
    std::optional<std::string> finish();

    const std::string& pending() const { return buffer_; }
    void clear() { buffer_.clear(); }

    static bool isPunctuationOnly(const std::string& text);
    static std::string trim(const std::string& text);

private:
    // Byte index one past the end of the next span, if a trigger fires
    // Cuts end strictly after `from`; text before it is a held prefix
    std::optional<size_t> findCut(size_t from) const;
    std::optional<size_t> findSentenceCut(size_t from) const;
    std::optional<size_t> findBreakCut(size_t from) const;
    std::optional<size_t> findLengthCut(size_t from) const;

    ChunkerConfig config_;
    std::string buffer_;
};

// Lazy adapter: pulls fragments from a generator stream on demand and yields
// spans. Queued spans are delivered before the end or an error of the source.
class SpanStream : public PullStream<std::string> {
public:
    SpanStream(std::shared_ptr<FragmentStream> source, const ChunkerConfig& config = ChunkerConfig());

    Outcome<std::string> next(const CancellationToken& token) override;

    // Everything pulled from the generator so far, as received
    const std::string& receivedText() const { return received_; }

private:
    std::shared_ptr<FragmentStream> source_;
    StreamingSynthesisChunker chunker_;
    std::deque<std::string> ready_;
    std::optional<Outcome<std::string>> terminal_;
    std::string received_;
};

} // namespace voxturn

#endif // VOXTURN_STREAMING_SYNTHESIS_CHUNKER_HPP

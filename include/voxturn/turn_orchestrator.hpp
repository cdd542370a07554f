#ifndef VOXTURN_TURN_ORCHESTRATOR_HPP
#define VOXTURN_TURN_ORCHESTRATOR_HPP

#include "voxturn/audio_types.hpp"
#include "voxturn/cancellable_call.hpp"
#include "voxturn/cancellation_token.hpp"
#include "voxturn/collaborators.hpp"
#include "voxturn/conversation.hpp"
#include "voxturn/ordered_span_buffer.hpp"
#include "voxturn/outcome.hpp"
#include "voxturn/streaming_synthesis_chunker.hpp"

#include <deque>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace voxturn {

struct OrchestratorConfig {
    std::string default_language = "de-DE";
    std::string default_voice = "de-DE-Chirp3-HD-Charon";
    size_t max_parallel_synthesis = 2;  // spans synthesized ahead of emission
    ChunkerConfig chunker;
    PromptConfig prompt;
};

struct Collaborators {
    std::shared_ptr<Transcriber> transcriber;
    std::shared_ptr<TextGenerator> generator;
    std::shared_ptr<Synthesizer> synthesizer;
    std::shared_ptr<ContextRetriever> retriever;
};

struct TurnRequest {
    enum class Source {
        Speech,
        Text
    };

    Source source = Source::Text;
    std::optional<SpeechSegment> segment;
    std::string text;
    std::string language;
    std::string voice;
    std::string turn_id;

    static TurnRequest fromSpeech(SpeechSegment segment, const std::string& language, const std::string& voice);
    static TurnRequest fromText(const std::string& text, const std::string& language, const std::string& voice);
};

enum class TurnState {
    Created,
    Transcribing,
    Generating,
    Synthesizing,
    Completed,
    Cancelled,
    Failed
};

const char* turnStateName(TurnState state);

struct TurnEvent {
    enum class Kind {
        Transcription,
        Audio,
        Completed,
        Cancelled,
        Failed
    };

    Kind kind = Kind::Failed;

    // Transcription
    Transcript transcript;

    // Audio
    AudioChunk chunk;
    size_t chunk_number = 0;  // 1-based across the turn
    size_t span_index = 0;    // 0-based span order

    // Completed
    size_t total_chunks = 0;
    std::string text;         // all synthesized spans

    // Failed: kind + detail, Cancelled: reason in detail
    ErrorKind error_kind = ErrorKind::None;
    std::string detail;

    bool isTerminal() const {
        return kind == Kind::Completed || kind == Kind::Cancelled || kind == Kind::Failed;
    }
};

class TurnOrchestrator;
struct SpanPull;

// Lazy event sequence of one turn. Driven by a single thread; next() blocks
// only inside cancellable waits. Once a terminal event was returned, next()
// keeps returning it.
class TurnStream {
    struct Key {
        explicit Key() = default;
    };

public:
    // Only TurnOrchestrator can name the key
    TurnStream(Key, TurnOrchestrator& orchestrator, TurnRequest request,
               CancellationToken token, ConversationHistory& history);
    ~TurnStream();

    TurnStream(const TurnStream&) = delete;
    TurnStream& operator=(const TurnStream&) = delete;

    TurnEvent next();

    TurnState state() const { return state_; }
    const std::string& turnId() const { return request_.turn_id; }

private:
    friend class TurnOrchestrator;

    TurnEvent transcribe();
    std::optional<TurnEvent> startGeneration();
    TurnEvent nextAudio();
    void startSpanPull();
    std::optional<Outcome<std::string>> takePulledSpan();
    void submitSpan(const std::string& text);
    void acceptSpanAudio(SpanAudio audio);

    TurnEvent finishCompleted();
    TurnEvent finishCancelled(const std::string& reason);
    TurnEvent finishFailed(ErrorKind kind, const std::string& detail);

    TurnOrchestrator& orchestrator_;
    TurnRequest request_;
    CancellationToken token_;
    ConversationHistory& history_;

    TurnState state_{TurnState::Created};
    std::optional<TurnEvent> terminal_;
    std::string query_;

    std::shared_ptr<SpanStream> spans_;
    std::shared_ptr<SpanPull> span_pull_;
    std::future<void> span_pull_task_;
    bool spans_done_{false};
    std::optional<Outcome<std::string>> generation_error_;

    std::shared_ptr<OrderedSpanBuffer> ordered_;
    std::map<size_t, std::future<void>> synthesis_;
    size_t next_span_order_{0};

    std::deque<TurnEvent> pending_audio_;
    size_t chunk_count_{0};
    std::string spoken_text_;
};

// Sequences transcription, generation, chunking and synthesis for one turn
// at a time per caller. Shared by all sessions; must outlive their streams.
class TurnOrchestrator {
public:
    TurnOrchestrator(Collaborators collaborators, const OrchestratorConfig& config = OrchestratorConfig());

    TurnOrchestrator(const TurnOrchestrator&) = delete;
    TurnOrchestrator& operator=(const TurnOrchestrator&) = delete;

    std::unique_ptr<TurnStream> runTurn(TurnRequest request,
                                        const CancellationToken& token,
                                        ConversationHistory& history);

    const OrchestratorConfig& config() const { return config_; }
    CallReaper& reaper() { return reaper_; }

private:
    friend class TurnStream;

    Collaborators collaborators_;
    OrchestratorConfig config_;
    PromptBuilder prompt_builder_;
    // Declared last: joins abandoned calls before anything else is destroyed
    CallReaper reaper_;
};

} // namespace voxturn

#endif // VOXTURN_TURN_ORCHESTRATOR_HPP

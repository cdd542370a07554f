#ifndef VOXTURN_SESSION_HPP
#define VOXTURN_SESSION_HPP

#include "voxturn/conversation.hpp"
#include "voxturn/process_registry.hpp"
#include "voxturn/protocol.hpp"
#include "voxturn/turn_orchestrator.hpp"
#include "voxturn/voice_activity_detector.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace voxturn {

struct SessionConfig {
    int sample_rate = 16000;   // of inbound audio frames
    std::string language;      // empty: orchestrator default
    std::string voice;         // empty: orchestrator default
    size_t history_entries = 10;
    VadConfig vad;
};

// One client connection. Inbound messages are handled sequentially on the
// caller's thread; each turn runs on a worker thread owned by the session,
// at most one at a time. Speech that ends while a turn is active is queued
// and starts as the next turn. Outbound messages go through the sink, serialized.
class Session {
public:
    using OutboundSink = std::function<void(const json&)>;

    Session(std::string id,
            TurnOrchestrator& orchestrator,
            ProcessRegistry& registry,
            std::shared_ptr<VoiceClassifier> classifier,
            OutboundSink sink,
            const SessionConfig& config = SessionConfig());
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void handleMessage(const std::string& text);
    void handleMessage(const json& message);

    // Cancel the active turn, wait for its worker and drop buffered audio
    void close();

    bool hasActiveTurn() const;
    std::string activeTurnId() const;

    // Wait until the current turn worker has sent its last message
    bool waitForTurn(std::chrono::milliseconds timeout);

    const std::string& id() const { return id_; }
    ConversationHistory& history() { return history_; }

private:
    void dispatch(const InboundMessage& message);
    void onAudioFrame(const InboundMessage& message);
    void onEndOfStream();
    void onTextPrompt(const InboundMessage& message);
    void onStartTurn(const InboundMessage& message);
    void onStopTurn(const InboundMessage& message);
    void onStopAll(const InboundMessage& message);
    void onListTurns();

    void onSegment(SpeechSegment segment);
    void queueSegment(SpeechSegment segment);
    TurnRequest speechRequest(SpeechSegment segment) const;
    bool startTurn(TurnRequest request, const TurnMetadata& metadata);
    TurnHandle registerTurn(TurnRequest& request, const TurnMetadata& metadata);
    void runTurns(TurnRequest request, TurnHandle handle);
    std::optional<SpeechSegment> runTurn(TurnRequest request, TurnHandle handle);
    std::optional<SpeechSegment> finishTurn();
    void joinWorker();

    void send(const json& message);

    std::string id_;
    TurnOrchestrator& orchestrator_;
    ProcessRegistry& registry_;
    OutboundSink sink_;
    SessionConfig config_;

    VoiceActivityDetector vad_;
    ConversationHistory history_;
    double clock_ms_{0.0};  // sample clock of inbound audio

    mutable std::mutex turn_mutex_;
    std::condition_variable turn_cv_;
    bool closed_{false};
    bool turn_active_{false};     // a new turn would be rejected
    bool worker_running_{false};  // the worker has not sent its last message yet
    std::string active_turn_id_;
    CancellationToken active_token_;
    std::optional<SpeechSegment> queued_segment_;  // speech finished while a turn was active
    std::thread worker_;

    std::mutex send_mutex_;
};

} // namespace voxturn

#endif // VOXTURN_SESSION_HPP

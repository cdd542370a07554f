#ifndef VOXTURN_PROTOCOL_HPP
#define VOXTURN_PROTOCOL_HPP

#include "voxturn/collaborators.hpp"
#include "voxturn/process_registry.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace voxturn {

using json = nlohmann::json;

// Inbound message that could not be understood
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
};

struct InboundMessage {
    enum class Type {
        AudioFrame,
        EndOfStream,
        TextPrompt,
        StartTurn,
        StopTurn,
        StopAll,
        ListTurns
    };

    Type type = Type::AudioFrame;

    std::vector<float> samples;  // audio_frame / pcm, start_turn audio_data
    bool has_text = false;
    std::string text;
    std::string voice;
    std::string language;

    std::string id;      // stop_turn
    std::string reason;  // stop_turn, stop_all

    std::map<std::string, std::string> metadata;  // start_turn
};

// Parse one inbound message. Throws ProtocolError for bad JSON, an unknown
// type or fields of the wrong type.
InboundMessage parseInbound(const std::string& text);
InboundMessage parseInbound(const json& message);

// Outbound messages
namespace outbound {

json turnStarted(const std::string& turn_id, const std::string& source);
json transcription(const std::string& turn_id, const Transcript& transcript);
json audioChunk(const std::string& turn_id, size_t chunk_number, const AudioChunk& chunk);
json turnEnd(const std::string& turn_id, size_t total_chunks, const std::string& text);
json turnError(const std::string& turn_id, ErrorKind kind, const std::string& error);
json turnCancelled(const std::string& turn_id, const std::string& reason);
json turnStopResult(const std::string& turn_id, bool stopped);
json allTurnsStopped(size_t count);
json activeTurns(const std::vector<TurnInfo>& turns, std::chrono::steady_clock::time_point now);
// kind: an ErrorKind name or "turn_active"
json error(const std::string& kind, const std::string& message);

} // namespace outbound

} // namespace voxturn

#endif // VOXTURN_PROTOCOL_HPP

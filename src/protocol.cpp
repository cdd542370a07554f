#include "voxturn/protocol.hpp"

namespace voxturn {

namespace {

std::string optionalString(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return "";
    }
    if (!it->is_string()) {
        throw ProtocolError(std::string("Field '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

std::vector<float> sampleArray(const json& value, const char* key) {
    if (!value.is_array()) {
        throw ProtocolError(std::string("Field '") + key + "' must be an array of numbers");
    }
    std::vector<float> samples;
    samples.reserve(value.size());
    for (const auto& sample : value) {
        if (!sample.is_number()) {
            throw ProtocolError(std::string("Field '") + key + "' must be an array of numbers");
        }
        samples.push_back(sample.get<float>());
    }
    return samples;
}

void readPrompt(const json& object, InboundMessage& message) {
    auto text = object.find("text");
    if (text != object.end() && !text->is_null()) {
        if (!text->is_string()) {
            throw ProtocolError("Field 'text' must be a string");
        }
        message.has_text = true;
        message.text = text->get<std::string>();
    }
    message.voice = optionalString(object, "voice");
    message.language = optionalString(object, "language");
}

} // namespace

InboundMessage parseInbound(const std::string& text) {
    json message;
    try {
        message = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ProtocolError(std::string("Invalid JSON: ") + e.what());
    }
    return parseInbound(message);
}

InboundMessage parseInbound(const json& message) {
    if (!message.is_object()) {
        throw ProtocolError("Message must be a JSON object");
    }
    auto type_it = message.find("type");
    if (type_it == message.end() || !type_it->is_string()) {
        throw ProtocolError("Message has no 'type'");
    }
    const std::string type = type_it->get<std::string>();

    InboundMessage inbound;

    if (type == "audio_frame" || type == "pcm") {
        inbound.type = InboundMessage::Type::AudioFrame;
        if (message.contains("samples")) {
            inbound.samples = sampleArray(message["samples"], "samples");
        } else if (message.contains("data")) {
            inbound.samples = sampleArray(message["data"], "data");
        } else {
            throw ProtocolError("Audio frame without 'samples'");
        }
    } else if (type == "end_of_stream") {
        inbound.type = InboundMessage::Type::EndOfStream;
    } else if (type == "text_prompt") {
        inbound.type = InboundMessage::Type::TextPrompt;
        // Fields may be nested in "data"
        auto data = message.find("data");
        if (data != message.end() && data->is_object()) {
            readPrompt(*data, inbound);
        } else {
            readPrompt(message, inbound);
        }
        if (!inbound.has_text) {
            throw ProtocolError("text_prompt without 'text'");
        }
    } else if (type == "start_turn") {
        inbound.type = InboundMessage::Type::StartTurn;
        readPrompt(message, inbound);
        auto audio = message.find("audio_data");
        if (audio != message.end() && !audio->is_null()) {
            inbound.samples = sampleArray(*audio, "audio_data");
        }
        auto metadata = message.find("metadata");
        if (metadata != message.end() && !metadata->is_null()) {
            if (!metadata->is_object()) {
                throw ProtocolError("Field 'metadata' must be an object");
            }
            for (auto it = metadata->begin(); it != metadata->end(); ++it) {
                inbound.metadata[it.key()] = it->is_string() ? it->get<std::string>() : it->dump();
            }
        }
    } else if (type == "stop_turn") {
        inbound.type = InboundMessage::Type::StopTurn;
        inbound.id = optionalString(message, "id");
        if (inbound.id.empty()) {
            throw ProtocolError("stop_turn without 'id'");
        }
        inbound.reason = optionalString(message, "reason");
    } else if (type == "stop_all") {
        inbound.type = InboundMessage::Type::StopAll;
        inbound.reason = optionalString(message, "reason");
    } else if (type == "list_turns") {
        inbound.type = InboundMessage::Type::ListTurns;
    } else {
        throw ProtocolError("Unknown message type '" + type + "'");
    }

    return inbound;
}

namespace outbound {

json turnStarted(const std::string& turn_id, const std::string& source) {
    return {{"type", "turn_started"}, {"turn_id", turn_id}, {"source", source}};
}

json transcription(const std::string& turn_id, const Transcript& transcript) {
    return {
        {"type", "transcription"},
        {"turn_id", turn_id},
        {"text", transcript.text},
        {"confidence", transcript.confidence},
        {"language_code", transcript.language_code}
    };
}

json audioChunk(const std::string& turn_id, size_t chunk_number, const AudioChunk& chunk) {
    return {
        {"type", "audio_chunk"},
        {"turn_id", turn_id},
        {"chunk_number", chunk_number},
        {"samples", chunk.samples},
        {"sample_rate", chunk.sample_rate},
        {"text", chunk.text}
    };
}

json turnEnd(const std::string& turn_id, size_t total_chunks, const std::string& text) {
    return {{"type", "turn_end"}, {"turn_id", turn_id}, {"total_chunks", total_chunks}, {"text", text}};
}

json turnError(const std::string& turn_id, ErrorKind kind, const std::string& error) {
    return {{"type", "turn_error"}, {"turn_id", turn_id}, {"kind", errorKindName(kind)}, {"error", error}};
}

json turnCancelled(const std::string& turn_id, const std::string& reason) {
    return {{"type", "turn_cancelled"}, {"turn_id", turn_id}, {"reason", reason}};
}

json turnStopResult(const std::string& turn_id, bool stopped) {
    return {{"type", "turn_stop_result"}, {"turn_id", turn_id}, {"stopped", stopped}};
}

json allTurnsStopped(size_t count) {
    return {{"type", "all_turns_stopped"}, {"count", count}};
}

json activeTurns(const std::vector<TurnInfo>& turns, std::chrono::steady_clock::time_point now) {
    json list = json::array();
    for (const auto& turn : turns) {
        auto age = std::chrono::duration_cast<std::chrono::milliseconds>(now - turn.started_at);
        list.push_back({
            {"turn_id", turn.id},
            {"name", turn.name},
            {"session_id", turn.metadata.session_id},
            {"age_ms", age.count()}
        });
    }
    return {{"type", "active_turns"}, {"turns", list}};
}

json error(const std::string& kind, const std::string& message) {
    return {{"type", "error"}, {"kind", kind}, {"error", message}};
}

} // namespace outbound

} // namespace voxturn

#include "voxturn/session.hpp"

#include <iostream>

namespace voxturn {

Session::Session(std::string id,
                 TurnOrchestrator& orchestrator,
                 ProcessRegistry& registry,
                 std::shared_ptr<VoiceClassifier> classifier,
                 OutboundSink sink,
                 const SessionConfig& config)
    : id_(std::move(id)),
      orchestrator_(orchestrator),
      registry_(registry),
      sink_(std::move(sink)),
      config_(config),
      vad_(std::move(classifier), config.vad),
      history_(config.history_entries) {
    std::cout << "[Session] " << id_ << " opened" << std::endl;
}

Session::~Session() {
    close();
}

void Session::handleMessage(const std::string& text) {
    InboundMessage message;
    try {
        message = parseInbound(text);
    } catch (const ProtocolError& e) {
        std::cerr << "[Session] " << id_ << " dropped message: " << e.what() << std::endl;
        send(outbound::error(errorKindName(ErrorKind::Protocol), e.what()));
        return;
    }
    dispatch(message);
}

void Session::handleMessage(const json& message) {
    InboundMessage inbound;
    try {
        inbound = parseInbound(message);
    } catch (const ProtocolError& e) {
        std::cerr << "[Session] " << id_ << " dropped message: " << e.what() << std::endl;
        send(outbound::error(errorKindName(ErrorKind::Protocol), e.what()));
        return;
    }
    dispatch(inbound);
}

void Session::dispatch(const InboundMessage& message) {
    if (closed_) {
        std::cerr << "[Session] " << id_ << " is closed, message ignored" << std::endl;
        return;
    }

    try {
        switch (message.type) {
            case InboundMessage::Type::AudioFrame: onAudioFrame(message); break;
            case InboundMessage::Type::EndOfStream: onEndOfStream(); break;
            case InboundMessage::Type::TextPrompt: onTextPrompt(message); break;
            case InboundMessage::Type::StartTurn: onStartTurn(message); break;
            case InboundMessage::Type::StopTurn: onStopTurn(message); break;
            case InboundMessage::Type::StopAll: onStopAll(message); break;
            case InboundMessage::Type::ListTurns: onListTurns(); break;
        }
    } catch (const std::exception& e) {
        std::cerr << "[Session] " << id_ << " error handling message: " << e.what() << std::endl;
        send(outbound::error(errorKindName(ErrorKind::Internal), e.what()));
    }
}

void Session::onAudioFrame(const InboundMessage& message) {
    if (message.samples.empty()) {
        return;
    }

    AudioFrame frame(message.samples, config_.sample_rate, clock_ms_);
    clock_ms_ += frame.durationMs();

    VadDecision decision = vad_.process(frame);
    if (decision.segment) {
        onSegment(std::move(*decision.segment));
    }
}

void Session::onEndOfStream() {
    auto segment = vad_.forceFlush();
    if (segment) {
        onSegment(std::move(*segment));
    }
}

void Session::onTextPrompt(const InboundMessage& message) {
    std::string language = message.language.empty() ? config_.language : message.language;
    std::string voice = message.voice.empty() ? config_.voice : message.voice;
    startTurn(TurnRequest::fromText(message.text, language, voice), TurnMetadata());
}

void Session::onStartTurn(const InboundMessage& message) {
    std::string language = message.language.empty() ? config_.language : message.language;
    std::string voice = message.voice.empty() ? config_.voice : message.voice;
    TurnMetadata metadata;
    metadata.attributes = message.metadata;

    if (message.has_text) {
        startTurn(TurnRequest::fromText(message.text, language, voice), metadata);
        return;
    }
    if (message.samples.empty()) {
        send(outbound::error(errorKindName(ErrorKind::Validation), "start_turn needs 'text' or 'audio_data'"));
        return;
    }

    // Client-side segmentation, the VAD is bypassed
    SpeechSegment segment;
    segment.samples = message.samples;
    segment.sample_rate = config_.sample_rate;
    segment.timestamp_start = clock_ms_;
    segment.timestamp_end = clock_ms_ + segment.durationMs();
    segment.speech_duration_ms = segment.durationMs();
    startTurn(TurnRequest::fromSpeech(std::move(segment), language, voice), metadata);
}

void Session::onStopTurn(const InboundMessage& message) {
    bool stopped = message.reason.empty()
        ? registry_.stop(message.id)
        : registry_.stop(message.id, message.reason);
    send(outbound::turnStopResult(message.id, stopped));
}

void Session::onStopAll(const InboundMessage& message) {
    size_t count = message.reason.empty()
        ? registry_.stopAll()
        : registry_.stopAll(message.reason);
    send(outbound::allTurnsStopped(count));
}

void Session::onListTurns() {
    send(outbound::activeTurns(registry_.activeTurns(), std::chrono::steady_clock::now()));
}

void Session::onSegment(SpeechSegment segment) {
    std::cout << "[Session] " << id_ << " speech segment #" << segment.segment_id << ": "
              << segment.durationMs() << " ms" << std::endl;
    {
        std::lock_guard<std::mutex> lock(turn_mutex_);
        if (turn_active_) {
            queueSegment(std::move(segment));
            return;
        }
    }
    startTurn(speechRequest(std::move(segment)), TurnMetadata());
}

void Session::queueSegment(SpeechSegment segment) {
    if (!queued_segment_) {
        std::cout << "[Session] " << id_ << " turn still active, speech segment #" << segment.segment_id
                  << " queued" << std::endl;
        queued_segment_ = std::move(segment);
        return;
    }

    // Consecutive segments while busy belong to one utterance
    SpeechSegment& queued = *queued_segment_;
    queued.samples.insert(queued.samples.end(), segment.samples.begin(), segment.samples.end());
    queued.timestamp_end = segment.timestamp_end;
    queued.speech_duration_ms += segment.speech_duration_ms;
    std::cout << "[Session] " << id_ << " speech segment #" << segment.segment_id
              << " appended to queued speech" << std::endl;
}

TurnRequest Session::speechRequest(SpeechSegment segment) const {
    return TurnRequest::fromSpeech(std::move(segment), config_.language, config_.voice);
}

bool Session::startTurn(TurnRequest request, const TurnMetadata& metadata) {
    bool busy;
    {
        std::lock_guard<std::mutex> lock(turn_mutex_);
        busy = turn_active_;
    }
    if (busy) {
        std::cerr << "[Session] " << id_ << " rejected input, turn " << activeTurnId()
                  << " is still active" << std::endl;
        send(outbound::error("turn_active", "A turn is already active in this session"));
        return false;
    }

    // The previous worker may still be returning from its last send
    joinWorker();

    {
        std::lock_guard<std::mutex> lock(turn_mutex_);
        worker_running_ = true;
    }
    TurnHandle handle = registerTurn(request, metadata);
    worker_ = std::thread(&Session::runTurns, this, std::move(request), handle);
    return true;
}

TurnHandle Session::registerTurn(TurnRequest& request, const TurnMetadata& metadata) {
    const bool speech = request.source == TurnRequest::Source::Speech;
    TurnMetadata turn_metadata = metadata;
    turn_metadata.session_id = id_;
    turn_metadata.language = request.language;
    turn_metadata.voice = request.voice;

    TurnHandle handle = registry_.start(speech ? "speech_turn" : "text_turn", turn_metadata);
    request.turn_id = handle.id;
    bool closing;
    {
        std::lock_guard<std::mutex> lock(turn_mutex_);
        turn_active_ = true;
        active_turn_id_ = handle.id;
        active_token_ = handle.token;
        closing = closed_;
    }
    if (closing) {
        handle.token.cancel("Session closed");
    }

    send(outbound::turnStarted(handle.id, speech ? "speech" : "text"));
    return handle;
}

void Session::runTurns(TurnRequest request, TurnHandle handle) {
    while (true) {
        std::optional<SpeechSegment> queued = runTurn(std::move(request), handle);
        if (!queued) {
            break;
        }
        std::cout << "[Session] " << id_ << " starting queued speech segment #" << queued->segment_id << std::endl;
        request = speechRequest(std::move(*queued));
        handle = registerTurn(request, TurnMetadata());
    }

    {
        std::lock_guard<std::mutex> lock(turn_mutex_);
        worker_running_ = false;
    }
    turn_cv_.notify_all();
}

std::optional<SpeechSegment> Session::runTurn(TurnRequest request, TurnHandle handle) {
    TurnRegistration registration(registry_, handle.id);
    const std::string turn_id = handle.id;
    std::optional<SpeechSegment> queued;

    try {
        auto stream = orchestrator_.runTurn(std::move(request), handle.token, history_);
        while (true) {
            TurnEvent event = stream->next();
            if (event.kind == TurnEvent::Kind::Transcription) {
                send(outbound::transcription(turn_id, event.transcript));
                continue;
            }
            if (event.kind == TurnEvent::Kind::Audio) {
                send(outbound::audioChunk(turn_id, event.chunk_number, event.chunk));
                continue;
            }

            // Deregister before the terminal message goes out
            stream.reset();
            registration.release();
            queued = finishTurn();

            switch (event.kind) {
                case TurnEvent::Kind::Completed:
                    send(outbound::turnEnd(turn_id, event.total_chunks, event.text));
                    break;
                case TurnEvent::Kind::Cancelled:
                    send(outbound::turnCancelled(turn_id, event.detail));
                    break;
                default:
                    send(outbound::turnError(turn_id, event.error_kind, event.detail));
                    break;
            }
            break;
        }
    } catch (const std::exception& e) {
        std::cerr << "[Session] " << id_ << " turn " << turn_id << " crashed: " << e.what() << std::endl;
        registration.release();
        queued = finishTurn();
        send(outbound::turnError(turn_id, ErrorKind::Internal, e.what()));
    }
    return queued;
}

std::optional<SpeechSegment> Session::finishTurn() {
    std::lock_guard<std::mutex> lock(turn_mutex_);
    active_turn_id_.clear();
    std::optional<SpeechSegment> next;
    if (!closed_) {
        next = std::move(queued_segment_);
    }
    queued_segment_.reset();
    // Queued speech takes over the turn slot, so new input is still rejected
    turn_active_ = next.has_value();
    return next;
}

void Session::joinWorker() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

void Session::close() {
    if (closed_) {
        return;
    }

    bool active;
    CancellationToken token;
    {
        std::lock_guard<std::mutex> lock(turn_mutex_);
        closed_ = true;
        if (queued_segment_) {
            std::cout << "[Session] " << id_ << " discarded queued speech segment #"
                      << queued_segment_->segment_id << std::endl;
            queued_segment_.reset();
        }
        active = turn_active_;
        token = active_token_;
    }
    if (active) {
        token.cancel("Session closed");
    }
    joinWorker();

    auto segment = vad_.forceFlush();
    if (segment) {
        std::cout << "[Session] " << id_ << " discarded " << segment->durationMs()
                  << " ms of unfinished speech" << std::endl;
    }
    vad_.reset();
    std::cout << "[Session] " << id_ << " closed" << std::endl;
}

bool Session::hasActiveTurn() const {
    std::lock_guard<std::mutex> lock(turn_mutex_);
    return turn_active_;
}

std::string Session::activeTurnId() const {
    std::lock_guard<std::mutex> lock(turn_mutex_);
    return active_turn_id_;
}

bool Session::waitForTurn(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(turn_mutex_);
    return turn_cv_.wait_for(lock, timeout, [this] { return !worker_running_; });
}

void Session::send(const json& message) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    try {
        sink_(message);
    } catch (const std::exception& e) {
        std::cerr << "[Session] " << id_ << " failed to send " << message.value("type", "message")
                  << ": " << e.what() << std::endl;
    }
}

} // namespace voxturn

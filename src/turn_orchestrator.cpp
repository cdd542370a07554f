#include "voxturn/turn_orchestrator.hpp"

#include <iostream>
#include <mutex>
#include <stdexcept>

namespace voxturn {

namespace {

TurnEvent makeEvent(TurnEvent::Kind kind) {
    TurnEvent event;
    event.kind = kind;
    return event;
}

std::string shortId(const std::string& id) {
    return id.size() > 8 ? id.substr(0, 8) : id;
}

} // namespace

// Result slot of the span pull running in the background
struct SpanPull {
    std::mutex mutex;
    std::optional<Outcome<std::string>> outcome;
};

TurnRequest TurnRequest::fromSpeech(SpeechSegment segment, const std::string& language, const std::string& voice) {
    TurnRequest request;
    request.source = Source::Speech;
    request.segment = std::move(segment);
    request.language = language;
    request.voice = voice;
    return request;
}

TurnRequest TurnRequest::fromText(const std::string& text, const std::string& language, const std::string& voice) {
    TurnRequest request;
    request.source = Source::Text;
    request.text = text;
    request.language = language;
    request.voice = voice;
    return request;
}

const char* turnStateName(TurnState state) {
    switch (state) {
        case TurnState::Created: return "created";
        case TurnState::Transcribing: return "transcribing";
        case TurnState::Generating: return "generating";
        case TurnState::Synthesizing: return "synthesizing";
        case TurnState::Completed: return "completed";
        case TurnState::Cancelled: return "cancelled";
        case TurnState::Failed: return "failed";
    }
    return "unknown";
}

// ============================================================================
// TurnOrchestrator
// ============================================================================

TurnOrchestrator::TurnOrchestrator(Collaborators collaborators, const OrchestratorConfig& config)
    : collaborators_(std::move(collaborators)),
      config_(config),
      prompt_builder_(config.prompt) {
    if (!collaborators_.transcriber || !collaborators_.generator || !collaborators_.synthesizer) {
        throw std::invalid_argument("TurnOrchestrator needs a transcriber, a generator and a synthesizer");
    }
    if (!collaborators_.retriever) {
        collaborators_.retriever = std::make_shared<NullContextRetriever>();
    }
    if (config_.max_parallel_synthesis == 0) {
        config_.max_parallel_synthesis = 1;
    }
}

std::unique_ptr<TurnStream> TurnOrchestrator::runTurn(TurnRequest request,
                                                      const CancellationToken& token,
                                                      ConversationHistory& history) {
    if (request.language.empty()) {
        request.language = config_.default_language;
    }
    request.voice = resolveVoice(request.voice, config_.default_voice);

    std::cout << "[Orchestrator] Turn " << shortId(request.turn_id) << " started ("
              << (request.source == TurnRequest::Source::Speech ? "speech" : "text")
              << ", " << request.language << ", " << request.voice << ")" << std::endl;

    return std::make_unique<TurnStream>(TurnStream::Key(), *this, std::move(request), token, history);
}

// ============================================================================
// TurnStream
// ============================================================================

TurnStream::TurnStream(Key, TurnOrchestrator& orchestrator, TurnRequest request,
                       CancellationToken token, ConversationHistory& history)
    : orchestrator_(orchestrator),
      request_(std::move(request)),
      token_(std::move(token)),
      history_(history),
      ordered_(std::make_shared<OrderedSpanBuffer>()) {
}

TurnStream::~TurnStream() {
    // Tasks still running belong to the reaper from here on
    for (auto& entry : synthesis_) {
        orchestrator_.reaper().adopt(std::move(entry.second));
    }
    if (span_pull_task_.valid()) {
        orchestrator_.reaper().adopt(std::move(span_pull_task_));
    }
}

TurnEvent TurnStream::next() {
    if (terminal_) {
        return *terminal_;
    }
    if (token_.isCancelled()) {
        return finishCancelled(token_.reason());
    }

    switch (state_) {
        case TurnState::Created:
            if (request_.source == TurnRequest::Source::Speech) {
                state_ = TurnState::Transcribing;
                return transcribe();
            }
            query_ = StreamingSynthesisChunker::trim(request_.text);
            if (query_.empty()) {
                return finishFailed(ErrorKind::Validation, "Empty prompt text");
            }
            state_ = TurnState::Generating;
            if (auto failed = startGeneration()) {
                return *failed;
            }
            return nextAudio();

        case TurnState::Transcribing:
            // The transcription event went out on the previous call
            state_ = TurnState::Generating;
            if (auto failed = startGeneration()) {
                return *failed;
            }
            return nextAudio();

        case TurnState::Generating:
        case TurnState::Synthesizing:
            return nextAudio();

        case TurnState::Completed:
        case TurnState::Cancelled:
        case TurnState::Failed:
            break;
    }
    return finishFailed(ErrorKind::Internal, "Turn in unexpected state");
}

TurnEvent TurnStream::transcribe() {
    if (!request_.segment) {
        return finishFailed(ErrorKind::Validation, "Speech turn without audio");
    }

    auto transcriber = orchestrator_.collaborators_.transcriber;
    auto segment = std::make_shared<SpeechSegment>(std::move(*request_.segment));
    request_.segment.reset();
    std::string language = request_.language;
    CancellationToken token = token_;

    std::cout << "[Orchestrator] Transcribing " << segment->durationMs() << " ms of audio" << std::endl;

    auto outcome = runCancellable<Transcript>(token_, [transcriber, segment, language, token]() {
        return transcriber->transcribe(*segment, language, token);
    }, orchestrator_.reaper(), ErrorKind::Transcription);

    if (outcome.isCancelled()) {
        return finishCancelled(outcome.detail());
    }
    if (outcome.isError()) {
        return finishFailed(ErrorKind::Transcription, outcome.detail());
    }
    if (token_.isCancelled()) {
        return finishCancelled(token_.reason());
    }

    Transcript transcript = outcome.take();
    query_ = StreamingSynthesisChunker::trim(transcript.text);
    if (query_.empty()) {
        return finishFailed(ErrorKind::Validation, "Empty transcript");
    }
    if (transcript.language_code.empty()) {
        transcript.language_code = request_.language;
    }

    std::cout << "[Orchestrator] Transcript: " << query_ << std::endl;

    TurnEvent event = makeEvent(TurnEvent::Kind::Transcription);
    event.transcript = std::move(transcript);
    event.transcript.text = query_;
    return event;
}

std::optional<TurnEvent> TurnStream::startGeneration() {
    const auto& config = orchestrator_.config_;
    CancellationToken token = token_;
    std::string query = query_;

    auto retriever = orchestrator_.collaborators_.retriever;
    auto documents = runCancellable<std::vector<std::string>>(token_, [retriever, query, token]() {
        return retriever->retrieve(query, token);
    }, orchestrator_.reaper(), ErrorKind::Internal);

    if (documents.isCancelled()) {
        return finishCancelled(documents.detail());
    }

    std::vector<std::string> context;
    if (documents.isError()) {
        std::cerr << "[Orchestrator] Context retrieval failed, continuing without: "
                  << documents.detail() << std::endl;
    } else {
        context = documents.take();
    }

    std::string prompt = orchestrator_.prompt_builder_.build(
        query_, context, history_.recent(config.prompt.history_window));

    auto generator = orchestrator_.collaborators_.generator;
    auto fragments = runCancellable<std::shared_ptr<FragmentStream>>(token_, [generator, prompt, token]() {
        return generator->generateStream(prompt, token);
    }, orchestrator_.reaper(), ErrorKind::Generation);

    if (fragments.isCancelled()) {
        return finishCancelled(fragments.detail());
    }
    if (fragments.isError()) {
        return finishFailed(ErrorKind::Generation, fragments.detail());
    }
    if (!fragments.get()) {
        return finishFailed(ErrorKind::Generation, "Generator returned no stream");
    }

    spans_ = std::make_shared<SpanStream>(fragments.take(), config.chunker);
    return std::nullopt;
}

TurnEvent TurnStream::nextAudio() {
    const size_t max_parallel = orchestrator_.config_.max_parallel_synthesis;

    while (true) {
        if (token_.isCancelled()) {
            return finishCancelled(token_.reason());
        }
        if (!pending_audio_.empty()) {
            TurnEvent event = std::move(pending_audio_.front());
            pending_audio_.pop_front();
            return event;
        }

        // Head of the line already synthesized
        if (ordered_->isNextReady()) {
            auto head = ordered_->waitNext(token_);
            if (head.isCancelled()) {
                return finishCancelled(head.detail());
            }
            acceptSpanAudio(head.take());
            continue;
        }

        if (auto span = takePulledSpan()) {
            switch (span->status()) {
                case Outcome<std::string>::Status::Value:
                    submitSpan(span->get());
                    break;
                case Outcome<std::string>::Status::EndOfStream:
                    spans_done_ = true;
                    break;
                case Outcome<std::string>::Status::Cancelled:
                    return finishCancelled(span->detail());
                case Outcome<std::string>::Status::Error:
                    std::cerr << "[Orchestrator] Generation failed after " << next_span_order_
                              << " span(s): " << span->detail() << std::endl;
                    generation_error_ = *span;
                    spans_done_ = true;
                    break;
            }
            continue;
        }

        // Keep the synthesis pipeline full
        if (!spans_done_ && !span_pull_task_.valid() && synthesis_.size() < max_parallel) {
            startSpanPull();
            continue;
        }

        if (spans_done_ && synthesis_.empty()) {
            if (generation_error_) {
                return finishFailed(ErrorKind::Generation, generation_error_->detail());
            }
            return finishCompleted();
        }

        // Either a span finishes synthesis or the generator delivers the next one
        if (!ordered_->waitReady(token_)) {
            return finishCancelled(token_.reason());
        }
    }
}

void TurnStream::startSpanPull() {
    if (!span_pull_) {
        span_pull_ = std::make_shared<SpanPull>();
    }
    auto spans = spans_;
    auto pull = span_pull_;
    auto ordered = ordered_;
    CancellationToken token = token_;

    span_pull_task_ = std::async(std::launch::async, [spans, pull, ordered, token]() {
        std::optional<Outcome<std::string>> result;
        try {
            result = spans->next(token);
        } catch (const std::exception& e) {
            result = Outcome<std::string>::error(ErrorKind::Generation, e.what());
        }
        {
            std::lock_guard<std::mutex> lock(pull->mutex);
            pull->outcome = std::move(result);
        }
        ordered->wake();
    });
}

std::optional<Outcome<std::string>> TurnStream::takePulledSpan() {
    if (!span_pull_task_.valid()) {
        return std::nullopt;
    }
    std::optional<Outcome<std::string>> outcome;
    {
        std::lock_guard<std::mutex> lock(span_pull_->mutex);
        outcome.swap(span_pull_->outcome);
    }
    if (outcome) {
        span_pull_task_.get();
    }
    return outcome;
}

void TurnStream::submitSpan(const std::string& text) {
    size_t order = next_span_order_++;
    state_ = TurnState::Synthesizing;

    auto synthesizer = orchestrator_.collaborators_.synthesizer;
    auto ordered = ordered_;
    CancellationToken token = token_;
    std::string voice = request_.voice;

    synthesis_[order] = std::async(std::launch::async, [synthesizer, ordered, token, voice, text, order]() {
        SpanAudio audio(order, text);
        try {
            auto stream = synthesizer->synthesizeStream(text, voice, token);
            if (!stream) {
                throw ExternalCallError(ErrorKind::Synthesis, "Synthesizer returned no stream");
            }
            bool done = false;
            while (!done) {
                auto chunk = stream->next(token);
                switch (chunk.status()) {
                    case Outcome<AudioChunk>::Status::Value: {
                        AudioChunk value = chunk.take();
                        value.text = text;
                        audio.chunks.push_back(std::move(value));
                        break;
                    }
                    case Outcome<AudioChunk>::Status::EndOfStream:
                        done = true;
                        break;
                    case Outcome<AudioChunk>::Status::Cancelled:
                    case Outcome<AudioChunk>::Status::Error:
                        audio.failed = true;
                        audio.error = chunk.detail();
                        done = true;
                        break;
                }
            }
        } catch (const std::exception& e) {
            audio.failed = true;
            audio.error = e.what();
        }
        ordered->put(std::move(audio));
    });
}

void TurnStream::acceptSpanAudio(SpanAudio audio) {
    auto it = synthesis_.find(audio.order);
    if (it != synthesis_.end()) {
        it->second.wait();
        synthesis_.erase(it);
    }

    if (audio.failed) {
        std::cerr << "[Orchestrator] Synthesis failed for span #" << audio.order
                  << ", skipping: " << audio.error << std::endl;
        return;
    }

    for (auto& chunk : audio.chunks) {
        TurnEvent event = makeEvent(TurnEvent::Kind::Audio);
        event.chunk = std::move(chunk);
        event.chunk_number = ++chunk_count_;
        event.span_index = audio.order;
        pending_audio_.push_back(std::move(event));
    }

    if (!spoken_text_.empty()) {
        spoken_text_ += " ";
    }
    spoken_text_ += audio.text;
}

TurnEvent TurnStream::finishCompleted() {
    state_ = TurnState::Completed;
    if (!spoken_text_.empty()) {
        history_.append(spoken_text_);
    }

    std::cout << "[Orchestrator] Turn " << shortId(request_.turn_id) << " completed: "
              << next_span_order_ << " span(s), " << chunk_count_ << " chunk(s)" << std::endl;

    TurnEvent event = makeEvent(TurnEvent::Kind::Completed);
    event.total_chunks = chunk_count_;
    event.text = spoken_text_;
    terminal_ = event;
    return event;
}

TurnEvent TurnStream::finishCancelled(const std::string& reason) {
    state_ = TurnState::Cancelled;
    pending_audio_.clear();

    std::cout << "[Orchestrator] Turn " << shortId(request_.turn_id) << " cancelled: " << reason << std::endl;

    TurnEvent event = makeEvent(TurnEvent::Kind::Cancelled);
    event.detail = reason;
    terminal_ = event;
    return event;
}

TurnEvent TurnStream::finishFailed(ErrorKind kind, const std::string& detail) {
    state_ = TurnState::Failed;

    std::cerr << "[Orchestrator] Turn " << shortId(request_.turn_id) << " failed ("
              << errorKindName(kind) << "): " << detail << std::endl;

    TurnEvent event = makeEvent(TurnEvent::Kind::Failed);
    event.error_kind = kind;
    event.detail = detail;
    terminal_ = event;
    return event;
}

} // namespace voxturn

#include "voxturn/voice_activity_detector.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace voxturn {

VoiceActivityDetector::VoiceActivityDetector(std::shared_ptr<VoiceClassifier> classifier, const VadConfig& config)
    : classifier_(std::move(classifier)), config_(config) {
    if (!classifier_) {
        throw std::invalid_argument("VoiceActivityDetector requires a classifier");
    }
}

VadDecision VoiceActivityDetector::process(const AudioFrame& frame) {
    bool has_voice = classify(frame);

    last_frame_ms_ = frame.timestamp_ms;
    last_frame_end_ms_ = frame.timestamp_ms + frame.durationMs();
    buffer_.push_back(frame);

    if (has_voice) {
        if (voice_frames_ == 0) {
            voice_run_start_ms_ = frame.timestamp_ms;
        }
        voice_frames_++;
        silence_frames_ = 0;
        last_voice_ms_ = frame.timestamp_ms;

        if (state_ == State::Idle) {
            if (voice_frames_ >= config_.min_voice_frames) {
                state_ = State::Speaking;
                first_voice_ms_ = voice_run_start_ms_;
                trimPreRoll();
                std::cout << "[VAD] Voice activity started at " << first_voice_ms_ << "ms" << std::endl;
            } else {
                trimPreRoll();
            }
            return VadDecision();
        }
    } else {
        silence_frames_++;
        voice_frames_ = 0;

        if (state_ == State::Idle) {
            trimPreRoll();
            return VadDecision();
        }

        double silence_ms = frame.timestamp_ms - last_voice_ms_;
        if (silence_frames_ >= config_.min_silence_frames && silence_ms >= config_.silence_threshold_ms) {
            double speech_ms = last_voice_ms_ - first_voice_ms_;
            if (speech_ms >= config_.min_speech_duration_ms && !buffer_.empty()) {
                std::cout << "[VAD] Voice activity ended. Speech duration: " << speech_ms
                          << "ms, silence: " << silence_ms << "ms" << std::endl;
                VadDecision decision;
                decision.should_flush = true;
                decision.segment = buildSegment();
                resetState();
                return decision;
            }
            std::cout << "[VAD] Speech too short (" << speech_ms << "ms), discarding" << std::endl;
            resetState();
            return VadDecision();
        }
    }

    // Still speaking: apply the capacity policy
    if (config_.max_segment_ms > 0 && bufferedDurationMs() >= config_.max_segment_ms) {
        double speech_ms = last_voice_ms_ - first_voice_ms_;
        if (speech_ms >= config_.min_speech_duration_ms) {
            std::cout << "[VAD] Segment reached " << config_.max_segment_ms << "ms, flushing" << std::endl;
            VadDecision decision;
            decision.should_flush = true;
            decision.segment = buildSegment();
            resetState();
            return decision;
        }
    }
    return VadDecision();
}

std::optional<SpeechSegment> VoiceActivityDetector::forceFlush() {
    if (state_ == State::Speaking && !buffer_.empty()) {
        double speech_ms = last_frame_ms_ - first_voice_ms_;
        if (speech_ms >= config_.min_speech_duration_ms) {
            std::cout << "[VAD] Processing final buffer: " << speech_ms << "ms of speech" << std::endl;
            SpeechSegment segment = buildSegment();
            resetState();
            return segment;
        }
    }
    resetState();
    return std::nullopt;
}

void VoiceActivityDetector::reset() {
    resetState();
    voice_run_start_ms_ = 0.0;
    first_voice_ms_ = 0.0;
    last_voice_ms_ = 0.0;
    last_frame_ms_ = 0.0;
    last_frame_end_ms_ = 0.0;
}

bool VoiceActivityDetector::classify(const AudioFrame& frame) {
    try {
        return classifier_->isVoice(frame);
    } catch (const std::exception& e) {
        std::cerr << "[VAD] Classification failed, treating frame as silence: " << e.what() << std::endl;
        return false;
    }
}

void VoiceActivityDetector::trimPreRoll() {
    // Pre-roll plus the voiced run that is confirming speech
    size_t keep = static_cast<size_t>(std::max(config_.pre_roll_frames, 0) + std::max(voice_frames_, 0));
    while (buffer_.size() > keep) {
        buffer_.pop_front();
    }
}

double VoiceActivityDetector::bufferedDurationMs() const {
    if (buffer_.empty()) {
        return 0.0;
    }
    return last_frame_end_ms_ - buffer_.front().timestamp_ms;
}

SpeechSegment VoiceActivityDetector::buildSegment() {
    SpeechSegment segment;
    size_t total = 0;
    for (const auto& f : buffer_) {
        total += f.samples.size();
    }
    segment.samples.reserve(total);
    for (const auto& f : buffer_) {
        segment.samples.insert(segment.samples.end(), f.samples.begin(), f.samples.end());
    }
    segment.sample_rate = buffer_.front().sample_rate;
    segment.timestamp_start = buffer_.front().timestamp_ms;
    segment.timestamp_end = last_frame_end_ms_;
    segment.speech_duration_ms = last_voice_ms_ - first_voice_ms_;
    segment.segment_id = next_segment_id_++;
    return segment;
}

void VoiceActivityDetector::resetState() {
    buffer_.clear();
    state_ = State::Idle;
    voice_frames_ = 0;
    silence_frames_ = 0;
}

} // namespace voxturn

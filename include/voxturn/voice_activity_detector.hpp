#ifndef VOXTURN_VOICE_ACTIVITY_DETECTOR_HPP
#define VOXTURN_VOICE_ACTIVITY_DETECTOR_HPP

#include "voxturn/audio_types.hpp"
#include "voxturn/voice_classifier.hpp"

#include <deque>
#include <memory>
#include <optional>

namespace voxturn {

struct VadConfig {
    int min_voice_frames = 1;           // consecutive voiced frames to start speaking
    int min_silence_frames = 1;         // consecutive silent frames to stop
    double silence_threshold_ms = 200;  // silence since last voice before a flush
    double min_speech_duration_ms = 50; // shorter bursts are dropped
    int pre_roll_frames = 50;           // frames kept from before speech was confirmed
    double max_segment_ms = 0;          // 0 = unbounded
};

struct VadDecision {
    bool should_flush = false;
    std::optional<SpeechSegment> segment;
};

// Frame-at-a-time speech boundary detector with hysteresis and pre-roll.
// Single writer: driven only by its session, not thread-safe.
class VoiceActivityDetector {
public:
    enum class State {
        Idle,
        Speaking
    };

    VoiceActivityDetector(std::shared_ptr<VoiceClassifier> classifier, const VadConfig& config = VadConfig());

    // Classify one frame and advance the state machine
    VadDecision process(const AudioFrame& frame);

    // Flush whatever speech is buffered (session teardown / end of stream).
    // Returns the segment at most once.
    std::optional<SpeechSegment> forceFlush();

    // Back to idle, drop all buffered audio
    void reset();

    State state() const { return state_; }
    bool isSpeaking() const { return state_ == State::Speaking; }
    int consecutiveVoiceFrames() const { return voice_frames_; }
    int consecutiveSilenceFrames() const { return silence_frames_; }
    size_t bufferedFrames() const { return buffer_.size(); }
    const VadConfig& config() const { return config_; }

private:
    bool classify(const AudioFrame& frame);
    void trimPreRoll();
    double bufferedDurationMs() const;
    SpeechSegment buildSegment();
    void resetState();

    std::shared_ptr<VoiceClassifier> classifier_;
    VadConfig config_;

    State state_{State::Idle};
    std::deque<AudioFrame> buffer_;
    int voice_frames_{0};
    int silence_frames_{0};
    double voice_run_start_ms_{0.0};
    double first_voice_ms_{0.0};
    double last_voice_ms_{0.0};
    double last_frame_ms_{0.0};
    double last_frame_end_ms_{0.0};
    size_t next_segment_id_{0};
};

} // namespace voxturn

#endif // VOXTURN_VOICE_ACTIVITY_DETECTOR_HPP

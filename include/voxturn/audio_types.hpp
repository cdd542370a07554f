#ifndef VOXTURN_AUDIO_TYPES_HPP
#define VOXTURN_AUDIO_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace voxturn {

// One block of mono PCM as received from the client
struct AudioFrame {
    std::vector<float> samples;  // [-1, 1]
    int sample_rate;
    double timestamp_ms;         // arrival time of the first sample

    AudioFrame() : sample_rate(16000), timestamp_ms(0.0) {}
    AudioFrame(std::vector<float> s, int sr, double ts)
        : samples(std::move(s)), sample_rate(sr), timestamp_ms(ts) {}

    double durationMs() const {
        return sample_rate > 0 ? samples.size() * 1000.0 / sample_rate : 0.0;
    }
};

// Speech between a detected start and end, pre-roll included
struct SpeechSegment {
    std::vector<float> samples;
    int sample_rate;
    double timestamp_start;      // ms, first buffered frame
    double timestamp_end;        // ms, end of the last buffered frame
    double speech_duration_ms;   // last voice - first voice
    size_t segment_id;

    SpeechSegment() : sample_rate(16000), timestamp_start(0.0), timestamp_end(0.0),
                      speech_duration_ms(0.0), segment_id(0) {}

    double durationMs() const {
        return sample_rate > 0 ? samples.size() * 1000.0 / sample_rate : 0.0;
    }
};

// Synthesized audio for one span, paired with the text that produced it
struct AudioChunk {
    std::vector<int16_t> samples;
    int sample_rate;
    std::string text;

    AudioChunk() : sample_rate(24000) {}
    AudioChunk(std::vector<int16_t> s, int sr, const std::string& t)
        : samples(std::move(s)), sample_rate(sr), text(t) {}
};

} // namespace voxturn

#endif // VOXTURN_AUDIO_TYPES_HPP

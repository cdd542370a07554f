#ifndef VOXTURN_VOICE_CLASSIFIER_HPP
#define VOXTURN_VOICE_CLASSIFIER_HPP

#include "voxturn/audio_types.hpp"

namespace voxturn {

// Decides whether a frame contains voice. Implementations may throw; the
// detector treats a failed classification as silence.
class VoiceClassifier {
public:
    virtual ~VoiceClassifier() = default;

    virtual bool isVoice(const AudioFrame& frame) = 0;
};

// RMS energy gate
class EnergyVoiceClassifier : public VoiceClassifier {
public:
    explicit EnergyVoiceClassifier(float threshold = 0.01f) : threshold_(threshold) {}

    bool isVoice(const AudioFrame& frame) override;

    void setThreshold(float threshold) { threshold_ = threshold; }
    float threshold() const { return threshold_; }

    static float rms(const std::vector<float>& samples);

private:
    float threshold_;
};

} // namespace voxturn

#endif // VOXTURN_VOICE_CLASSIFIER_HPP

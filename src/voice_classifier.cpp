#include "voxturn/voice_classifier.hpp"

#include <cmath>

namespace voxturn {

bool EnergyVoiceClassifier::isVoice(const AudioFrame& frame) {
    if (frame.samples.empty()) {
        return false;
    }
    return rms(frame.samples) > threshold_;
}

float EnergyVoiceClassifier::rms(const std::vector<float>& samples) {
    if (samples.empty()) {
        return 0.0f;
    }
    double sum = 0.0;
    for (float s : samples) {
        sum += static_cast<double>(s) * s;
    }
    return static_cast<float>(std::sqrt(sum / samples.size()));
}

} // namespace voxturn

#include "voxturn/config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace voxturn {

namespace {

const char* const kEnvironmentKeys[] = {
    "API_KEY", "OPENAI_API_KEY", "DEEPSEEK_API_KEY", "API_URL",
    "VOXTURN_CHAT_MODEL", "VOXTURN_TRANSCRIPTION_MODEL", "VOXTURN_SPEECH_MODEL",
    "VOXTURN_MAX_TOKENS", "VOXTURN_TIMEOUT_S", "VOXTURN_CHUNK_SAMPLES",
    "VOXTURN_LANGUAGE", "VOXTURN_VOICE", "VOXTURN_SAMPLE_RATE",
    "VOXTURN_SILENCE_MS", "VOXTURN_MIN_SPEECH_MS", "VOXTURN_MIN_VOICE_FRAMES",
    "VOXTURN_MIN_SILENCE_FRAMES", "VOXTURN_PRE_ROLL_FRAMES", "VOXTURN_MAX_SEGMENT_MS",
    "VOXTURN_ENERGY_THRESHOLD", "VOXTURN_MAX_CHARS", "VOXTURN_MAX_PARALLEL_SYNTHESIS",
    "VOXTURN_HISTORY_SIZE"
};

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, (last - first + 1));
}

template <typename T>
bool parseNumber(const std::string& key, const std::string& value, T& out);

template <>
bool parseNumber<int>(const std::string& key, const std::string& value, int& out) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        out = parsed;
        return true;
    } catch (const std::exception&) {
        std::cerr << "[Config] Invalid integer for " << key << ": " << value << std::endl;
        return false;
    }
}

template <>
bool parseNumber<long>(const std::string& key, const std::string& value, long& out) {
    try {
        size_t used = 0;
        long parsed = std::stol(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        out = parsed;
        return true;
    } catch (const std::exception&) {
        std::cerr << "[Config] Invalid integer for " << key << ": " << value << std::endl;
        return false;
    }
}

template <>
bool parseNumber<size_t>(const std::string& key, const std::string& value, size_t& out) {
    long parsed = 0;
    if (!parseNumber<long>(key, value, parsed)) {
        return false;
    }
    if (parsed < 0) {
        std::cerr << "[Config] Negative value for " << key << ": " << value << std::endl;
        return false;
    }
    out = static_cast<size_t>(parsed);
    return true;
}

template <>
bool parseNumber<double>(const std::string& key, const std::string& value, double& out) {
    try {
        size_t used = 0;
        double parsed = std::stod(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        out = parsed;
        return true;
    } catch (const std::exception&) {
        std::cerr << "[Config] Invalid number for " << key << ": " << value << std::endl;
        return false;
    }
}

template <>
bool parseNumber<float>(const std::string& key, const std::string& value, float& out) {
    double parsed = 0.0;
    if (!parseNumber<double>(key, value, parsed)) {
        return false;
    }
    out = static_cast<float>(parsed);
    return true;
}

} // namespace

bool applyConfigValue(const std::string& key, const std::string& value, AppConfig& config) {
    // API
    if (key == "API_KEY" || key == "OPENAI_API_KEY" || key == "DEEPSEEK_API_KEY") {
        config.api.api_key = value;
        return true;
    }
    if (key == "API_URL") {
        config.api.base_url = value;
        return true;
    }
    if (key == "VOXTURN_CHAT_MODEL") {
        config.api.chat_model = value;
        return true;
    }
    if (key == "VOXTURN_TRANSCRIPTION_MODEL") {
        config.api.transcription_model = value;
        return true;
    }
    if (key == "VOXTURN_SPEECH_MODEL") {
        config.api.speech_model = value;
        return true;
    }
    if (key == "VOXTURN_MAX_TOKENS") return parseNumber(key, value, config.api.max_tokens);
    if (key == "VOXTURN_TIMEOUT_S") return parseNumber(key, value, config.api.timeout_seconds);
    if (key == "VOXTURN_CHUNK_SAMPLES") return parseNumber(key, value, config.api.chunk_samples);

    // Turns
    if (key == "VOXTURN_LANGUAGE") {
        config.orchestrator.default_language = value;
        return true;
    }
    if (key == "VOXTURN_VOICE") {
        config.orchestrator.default_voice = value;
        return true;
    }
    if (key == "VOXTURN_MAX_CHARS") {
        if (!parseNumber(key, value, config.orchestrator.chunker.max_chars)) return false;
        config.orchestrator.chunker.hard_max_chars = config.orchestrator.chunker.max_chars * 4;
        return true;
    }
    if (key == "VOXTURN_MAX_PARALLEL_SYNTHESIS") {
        return parseNumber(key, value, config.orchestrator.max_parallel_synthesis);
    }
    if (key == "VOXTURN_HISTORY_SIZE") {
        if (!parseNumber(key, value, config.session.history_entries)) return false;
        config.orchestrator.prompt.history_window = config.session.history_entries;
        return true;
    }

    // Audio input and VAD
    if (key == "VOXTURN_SAMPLE_RATE") return parseNumber(key, value, config.session.sample_rate);
    if (key == "VOXTURN_SILENCE_MS") return parseNumber(key, value, config.session.vad.silence_threshold_ms);
    if (key == "VOXTURN_MIN_SPEECH_MS") return parseNumber(key, value, config.session.vad.min_speech_duration_ms);
    if (key == "VOXTURN_MIN_VOICE_FRAMES") return parseNumber(key, value, config.session.vad.min_voice_frames);
    if (key == "VOXTURN_MIN_SILENCE_FRAMES") return parseNumber(key, value, config.session.vad.min_silence_frames);
    if (key == "VOXTURN_PRE_ROLL_FRAMES") return parseNumber(key, value, config.session.vad.pre_roll_frames);
    if (key == "VOXTURN_MAX_SEGMENT_MS") return parseNumber(key, value, config.session.vad.max_segment_ms);
    if (key == "VOXTURN_ENERGY_THRESHOLD") return parseNumber(key, value, config.energy_threshold);

    return false;
}

bool loadConfigFromEnv(const std::string& env_file, AppConfig& config) {
    std::ifstream file(env_file);
    if (!file.is_open()) {
        // Try from current directory
        file.open("./" + env_file);
        if (!file.is_open()) {
            return false;
        }
    }

    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        line = trim(line);
        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        if (line.compare(0, 7, "export ") == 0) {
            line = trim(line.substr(7));
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "[Config] " << env_file << ":" << line_number << ": expected KEY=VALUE" << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        applyConfigValue(key, value, config);
    }

    std::cout << "[Config] Loaded " << env_file << std::endl;
    return true;
}

void applyEnvironment(AppConfig& config) {
    for (const char* key : kEnvironmentKeys) {
        const char* value = std::getenv(key);
        if (value && *value) {
            applyConfigValue(key, value, config);
        }
    }
}

} // namespace voxturn

#ifndef VOXTURN_CONFIG_HPP
#define VOXTURN_CONFIG_HPP

#include "voxturn/api_client.hpp"
#include "voxturn/session.hpp"
#include "voxturn/turn_orchestrator.hpp"

#include <string>

namespace voxturn {

struct AppConfig {
    ApiConfig api;
    OrchestratorConfig orchestrator;
    SessionConfig session;
    float energy_threshold = 0.01f;  // EnergyVoiceClassifier RMS threshold
};

// Apply one KEY=VALUE setting. Returns false for unknown keys and for
// values that do not parse (the previous value is kept).
bool applyConfigValue(const std::string& key, const std::string& value, AppConfig& config);

// Read a .env file (KEY=VALUE lines, # comments, optional quotes).
// Returns false if the file could not be opened.
bool loadConfigFromEnv(const std::string& env_file, AppConfig& config);

// Process environment overrides: API_KEY, API_URL and VOXTURN_*
void applyEnvironment(AppConfig& config);

} // namespace voxturn

#endif // VOXTURN_CONFIG_HPP

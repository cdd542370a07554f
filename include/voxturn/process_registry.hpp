#ifndef VOXTURN_PROCESS_REGISTRY_HPP
#define VOXTURN_PROCESS_REGISTRY_HPP

#include "voxturn/cancellation_token.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace voxturn {

struct TurnMetadata {
    std::string language;
    std::string voice;
    std::string session_id;
    std::map<std::string, std::string> attributes;
};

struct TurnInfo {
    std::string id;
    std::string name;
    std::chrono::steady_clock::time_point started_at;
    CancellationToken token;
    TurnMetadata metadata;
};

struct TurnHandle {
    std::string id;
    CancellationToken token;
};

// Thread-safe map of in-flight turns to their cancellation tokens.
// Shared by all sessions of a process.
// Tokens are cancelled under the registry lock; cancellation callbacks must
// not call back into the registry.
class ProcessRegistry {
public:
    ProcessRegistry() = default;

    ProcessRegistry(const ProcessRegistry&) = delete;
    ProcessRegistry& operator=(const ProcessRegistry&) = delete;

    // Register a new turn and hand out its token
    TurnHandle start(const std::string& name, const TurnMetadata& metadata = TurnMetadata());

    // Cancel one turn. False if the id is unknown (already cleaned up).
    bool stop(const std::string& id, const std::string& reason = "Stopped by user");

    // Cancel every registered turn, returns how many were cancelled by this call
    size_t stopAll(const std::string& reason = "All turns stopped");

    // Remove a finished turn. False if it was already removed.
    bool cleanup(const std::string& id);

    std::optional<TurnInfo> info(const std::string& id) const;
    std::vector<TurnInfo> activeTurns() const;
    size_t count() const;
    bool isActive(const std::string& id) const;

private:
    static std::string generateId();

    std::unordered_map<std::string, TurnInfo> turns_;
    mutable std::mutex mutex_;
};

// Calls cleanup() exactly once: on release() or when it goes out of scope
class TurnRegistration {
public:
    TurnRegistration(ProcessRegistry& registry, std::string id)
        : registry_(registry), id_(std::move(id)) {}
    ~TurnRegistration() { release(); }

    TurnRegistration(const TurnRegistration&) = delete;
    TurnRegistration& operator=(const TurnRegistration&) = delete;

    void release() {
        if (!released_) {
            released_ = true;
            registry_.cleanup(id_);
        }
    }

    const std::string& id() const { return id_; }

private:
    ProcessRegistry& registry_;
    std::string id_;
    bool released_ = false;
};

} // namespace voxturn

#endif // VOXTURN_PROCESS_REGISTRY_HPP

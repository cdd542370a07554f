#include "voxturn/process_registry.hpp"

#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

namespace voxturn {

TurnHandle ProcessRegistry::start(const std::string& name, const TurnMetadata& metadata) {
    TurnInfo info;
    info.name = name;
    info.started_at = std::chrono::steady_clock::now();
    info.metadata = metadata;

    std::lock_guard<std::mutex> lock(mutex_);
    // Collisions are practically impossible, but the map must never be overwritten
    do {
        info.id = generateId();
    } while (turns_.count(info.id) != 0);

    TurnHandle handle{info.id, info.token};
    turns_.emplace(info.id, std::move(info));
    return handle;
}

bool ProcessRegistry::stop(const std::string& id, const std::string& reason) {
    {
        // Cancelled under the lock so a concurrent cleanup() cannot slip in between
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = turns_.find(id);
        if (it == turns_.end()) {
            return false;
        }
        it->second.token.cancel(reason);
    }
    std::cout << "[Registry] Stop requested for turn " << id << ": " << reason << std::endl;
    return true;
}

size_t ProcessRegistry::stopAll(const std::string& reason) {
    size_t stopped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : turns_) {
            if (entry.second.token.cancel(reason)) {
                stopped++;
            }
        }
    }
    std::cout << "[Registry] Stopped " << stopped << " turn(s): " << reason << std::endl;
    return stopped;
}

bool ProcessRegistry::cleanup(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return turns_.erase(id) > 0;
}

std::optional<TurnInfo> ProcessRegistry::info(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = turns_.find(id);
    if (it == turns_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<TurnInfo> ProcessRegistry::activeTurns() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TurnInfo> result;
    result.reserve(turns_.size());
    for (const auto& entry : turns_) {
        result.push_back(entry.second);
    }
    return result;
}

size_t ProcessRegistry::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return turns_.size();
}

bool ProcessRegistry::isActive(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return turns_.count(id) != 0;
}

std::string ProcessRegistry::generateId() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    std::ostringstream out;
    out << std::hex << std::setfill('0')
        << std::setw(16) << rng()
        << std::setw(16) << rng();
    return out.str();
}

} // namespace voxturn

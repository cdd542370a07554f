#include "voxturn/conversation.hpp"

#include <algorithm>
#include <sstream>

namespace voxturn {

ConversationHistory::ConversationHistory(size_t max_entries)
    : max_entries_(max_entries == 0 ? 1 : max_entries) {
}

void ConversationHistory::append(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(text);
    while (entries_.size() > max_entries_) {
        entries_.pop_front();
    }
}

std::vector<std::string> ConversationHistory::recent(size_t n) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = std::min(n, entries_.size());
    return std::vector<std::string>(entries_.end() - count, entries_.end());
}

size_t ConversationHistory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void ConversationHistory::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

bool PromptBuilder::shouldUseContext(const std::string& query, const std::vector<std::string>& documents) const {
    return !documents.empty() && query.size() > config_.min_query_chars_for_context;
}

std::string PromptBuilder::build(const std::string& query,
                                 const std::vector<std::string>& documents,
                                 const std::vector<std::string>& history) const {
    std::ostringstream prompt;
    prompt << config_.base_instruction;

    if (shouldUseContext(query, documents)) {
        prompt << "\n\nContext:\n";
        for (size_t i = 0; i < documents.size(); ++i) {
            if (i > 0) prompt << "\n";
            prompt << documents[i];
        }
    }

    if (!history.empty()) {
        size_t window = std::min(history.size(), config_.history_window);
        prompt << "\n\nEarlier answers:";
        for (size_t i = history.size() - window; i < history.size(); ++i) {
            prompt << "\n- " << history[i];
        }
    }

    prompt << "\n\nQuestion: " << query;
    return prompt.str();
}

std::string resolveVoice(const std::string& preference, const std::string& default_voice) {
    if (preference.empty()) {
        return default_voice;
    }
    // Voice names look like "de-DE-Chirp3-HD-Charon"
    if (preference.find('-') == std::string::npos || preference.size() <= 5) {
        return default_voice;
    }
    return preference;
}

} // namespace voxturn

#ifndef VOXTURN_CONVERSATION_HPP
#define VOXTURN_CONVERSATION_HPP

#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace voxturn {

// Rolling window of recent turn texts, oldest evicted first
class ConversationHistory {
public:
    explicit ConversationHistory(size_t max_entries = 10);

    void append(const std::string& text);

    // The last n entries, oldest first
    std::vector<std::string> recent(size_t n) const;

    size_t size() const;
    size_t capacity() const { return max_entries_; }
    void clear();

private:
    size_t max_entries_;
    std::deque<std::string> entries_;
    mutable std::mutex mutex_;
};

struct PromptConfig {
    std::string base_instruction =
        "You are a helpful voice assistant. Answer in complete sentences, they are read "
        "aloud with text-to-speech. End your answer by inviting the user to ask a follow-up "
        "question and suggest a few.";
    size_t min_query_chars_for_context = 10;
    size_t history_window = 10;
};

class PromptBuilder {
public:
    explicit PromptBuilder(const PromptConfig& config = PromptConfig()) : config_(config) {}

    std::string build(const std::string& query,
                      const std::vector<std::string>& documents,
                      const std::vector<std::string>& history) const;

    // Context is only worth it for substantial queries
    bool shouldUseContext(const std::string& query, const std::vector<std::string>& documents) const;

    const PromptConfig& config() const { return config_; }

private:
    PromptConfig config_;
};

// Empty or malformed voice names fall back to the default
std::string resolveVoice(const std::string& preference, const std::string& default_voice);

} // namespace voxturn

#endif // VOXTURN_CONVERSATION_HPP

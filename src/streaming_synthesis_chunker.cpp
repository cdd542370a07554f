#include "voxturn/streaming_synthesis_chunker.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace voxturn {

namespace {

const char* const WHITESPACE = " \t\n\r";

const std::vector<std::string> SENTENCE_MARKS = {".", "!", "?", "\n", "。", "！", "？"};
const std::vector<std::string> BREAK_MARKS = {",", ";", ":", " - ", " – ", "，", "；", "："};

// Multi-byte characters that count as punctuation
const std::vector<std::string> WIDE_PUNCTUATION = {
    "。", "！", "？", "，", "；", "：", "、", "–", "—", "…", "“", "”", "‘", "’", "«", "»", "„"
};

size_t utf8CharLen(unsigned char ch) {
    if ((ch & 0x80) == 0) return 1;
    if ((ch & 0xE0) == 0xC0) return 2;
    if ((ch & 0xF0) == 0xE0) return 3;
    if ((ch & 0xF8) == 0xF0) return 4;
    return 1;  // stray continuation byte
}

size_t countCodePoints(const std::string& text) {
    size_t count = 0;
    for (size_t i = 0; i < text.size(); i += utf8CharLen(text[i])) {
        count++;
    }
    return count;
}

// Byte offset of the code point with the given index (clamped to size)
size_t byteOffsetOf(const std::string& text, size_t code_points) {
    size_t i = 0;
    size_t n = 0;
    while (i < text.size() && n < code_points) {
        i += utf8CharLen(text[i]);
        n++;
    }
    return std::min(i, text.size());
}

// End of the last mark starting at or after `from`
std::optional<size_t> lastMarkEnd(const std::string& text, const std::vector<std::string>& marks, size_t from) {
    std::optional<size_t> best;
    for (const auto& mark : marks) {
        size_t pos = text.rfind(mark);
        if (pos != std::string::npos && pos >= from) {
            size_t end = pos + mark.size();
            if (!best || end > *best) {
                best = end;
            }
        }
    }
    return best;
}

void trimLeftInPlace(std::string& text) {
    size_t first = text.find_first_not_of(WHITESPACE);
    if (first == std::string::npos) {
        text.clear();
    } else if (first > 0) {
        text.erase(0, first);
    }
}

} // namespace

StreamingSynthesisChunker::StreamingSynthesisChunker(const ChunkerConfig& config) : config_(config) {
    if (config_.max_chars == 0) {
        config_.max_chars = 1;
    }
    config_.hard_max_chars = std::max(config_.hard_max_chars, config_.max_chars);
}

std::vector<std::string> StreamingSynthesisChunker::push(const std::string& fragment) {
    buffer_ += fragment;

    std::vector<std::string> spans;
    while (true) {
        trimLeftInPlace(buffer_);
        if (buffer_.empty()) {
            break;
        }

        // A lone mark is not worth a synthesis call; it prefixes the next span
        // and the cut is searched again in the text after it
        std::optional<size_t> cut;
        std::string span;
        size_t from = 0;
        while ((cut = findCut(from))) {
            span = trim(buffer_.substr(0, *cut));
            if (!isPunctuationOnly(span)) {
                break;
            }
            from = *cut;
        }
        if (!cut) {
            break;
        }

        buffer_.erase(0, *cut);
        spans.push_back(span);
    }
    return spans;
}

std::optional<std::string> StreamingSynthesisChunker::finish() {
    std::string rest = trim(buffer_);
    buffer_.clear();
    if (rest.empty()) {
        return std::nullopt;
    }
    return rest;
}

std::optional<size_t> StreamingSynthesisChunker::findCut(size_t from) const {
    if (auto cut = findSentenceCut(from)) {
        return cut;
    }
    if (auto cut = findBreakCut(from)) {
        return cut;
    }
    return findLengthCut(from);
}

std::optional<size_t> StreamingSynthesisChunker::findSentenceCut(size_t from) const {
    return lastMarkEnd(buffer_, SENTENCE_MARKS, from);
}

std::optional<size_t> StreamingSynthesisChunker::findBreakCut(size_t from) const {
    auto end = lastMarkEnd(buffer_, BREAK_MARKS, from);
    if (!end) {
        return std::nullopt;
    }
    // Whitespace-terminated words after the break are complete, take them too
    size_t ws = buffer_.find_last_of(" \t\r");
    if (ws != std::string::npos && ws + 1 > *end) {
        return ws + 1;
    }
    return end;
}

std::optional<size_t> StreamingSynthesisChunker::findLengthCut(size_t from) const {
    size_t length = countCodePoints(buffer_);
    if (length <= config_.max_chars) {
        return std::nullopt;
    }

    size_t limit = byteOffsetOf(buffer_, config_.max_chars);
    size_t ws = buffer_.find_last_of(WHITESPACE, limit);
    if (ws != std::string::npos && ws > 0 && ws + 1 > from) {
        return ws + 1;
    }

    // First word alone is longer than the threshold
    ws = buffer_.find_first_of(WHITESPACE, std::max(limit, from));
    if (ws != std::string::npos) {
        return ws + 1;
    }

    if (length > config_.hard_max_chars) {
        size_t forced = byteOffsetOf(buffer_, config_.hard_max_chars);
        if (forced <= from) {
            return std::nullopt;
        }
        std::cout << "[Chunker] No word boundary in " << length << " characters, forcing a cut" << std::endl;
        return forced;
    }
    return std::nullopt;
}

bool StreamingSynthesisChunker::isPunctuationOnly(const std::string& text) {
    bool seen = false;
    for (size_t i = 0; i < text.size();) {
        size_t len = utf8CharLen(text[i]);
        if (len == 1) {
            unsigned char c = static_cast<unsigned char>(text[i]);
            if (std::isspace(c)) {
                i++;
                continue;
            }
            if (!std::ispunct(c)) {
                return false;
            }
        } else {
            std::string ch = text.substr(i, len);
            if (std::find(WIDE_PUNCTUATION.begin(), WIDE_PUNCTUATION.end(), ch) == WIDE_PUNCTUATION.end()) {
                return false;
            }
        }
        seen = true;
        i += len;
    }
    return seen;
}

std::string StreamingSynthesisChunker::trim(const std::string& text) {
    size_t first = text.find_first_not_of(WHITESPACE);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(WHITESPACE);
    return text.substr(first, last - first + 1);
}

SpanStream::SpanStream(std::shared_ptr<FragmentStream> source, const ChunkerConfig& config)
    : source_(std::move(source)), chunker_(config) {
}

Outcome<std::string> SpanStream::next(const CancellationToken& token) {
    while (true) {
        if (!ready_.empty()) {
            std::string span = std::move(ready_.front());
            ready_.pop_front();
            return Outcome<std::string>::value(std::move(span));
        }
        if (terminal_) {
            return *terminal_;
        }
        if (token.isCancelled()) {
            return Outcome<std::string>::cancelled(token.reason());
        }

        auto fragment = source_->next(token);
        switch (fragment.status()) {
            case Outcome<std::string>::Status::Value: {
                received_ += fragment.get();
                for (auto& span : chunker_.push(fragment.get())) {
                    ready_.push_back(std::move(span));
                }
                break;
            }
            case Outcome<std::string>::Status::EndOfStream: {
                if (auto last = chunker_.finish()) {
                    ready_.push_back(std::move(*last));
                }
                terminal_ = Outcome<std::string>::endOfStream();
                break;
            }
            case Outcome<std::string>::Status::Cancelled:
                ready_.clear();
                terminal_ = fragment;
                break;
            case Outcome<std::string>::Status::Error:
                std::cerr << "[Chunker] Generator stream failed: " << fragment.detail() << std::endl;
                if (!chunker_.pending().empty()) {
                    std::cerr << "[Chunker] Dropping unterminated text: " << chunker_.pending() << std::endl;
                    chunker_.clear();
                }
                terminal_ = fragment;
                break;
        }
    }
}

} // namespace voxturn

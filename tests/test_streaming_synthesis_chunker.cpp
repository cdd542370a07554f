#include "voxturn/streaming_synthesis_chunker.hpp"

#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <random>
#include <sstream>

using namespace voxturn;
using voxturn::fakes::Ending;
using voxturn::fakes::ScriptedFragmentStream;

namespace {

std::vector<std::string> feed(StreamingSynthesisChunker& chunker, const std::vector<std::string>& fragments) {
    std::vector<std::string> spans;
    for (const auto& fragment : fragments) {
        for (auto& span : chunker.push(fragment)) {
            spans.push_back(span);
        }
    }
    if (auto rest = chunker.finish()) {
        spans.push_back(*rest);
    }
    return spans;
}

std::vector<std::string> words(const std::string& text) {
    std::istringstream in(text);
    std::vector<std::string> result;
    std::string word;
    while (in >> word) {
        result.push_back(word);
    }
    return result;
}

size_t codePoints(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) count++;
    }
    return count;
}

} // namespace

TEST(StreamingSynthesisChunkerTest, GreetingScenario) {
    StreamingSynthesisChunker chunker;
    EXPECT_TRUE(chunker.push("Hall").empty());
    auto spans = chunker.push("o, wie ");
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0], "Hallo, wie");
    EXPECT_TRUE(chunker.push("geht es ").empty());
    spans = chunker.push("dir?");
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0], "geht es dir?");
    EXPECT_FALSE(chunker.finish().has_value());
}

TEST(StreamingSynthesisChunkerTest, SentenceEndsCutAfterLastMark) {
    StreamingSynthesisChunker chunker;
    auto spans = chunker.push("Das ist gut. Und das");
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0], "Das ist gut.");
    EXPECT_EQ(chunker.pending(), "Und das");
}

TEST(StreamingSynthesisChunkerTest, WideSentenceMarks) {
    StreamingSynthesisChunker chunker;
    auto spans = chunker.push("你好。今天");
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0], "你好。");
    EXPECT_EQ(chunker.finish().value_or(""), "今天");
}

TEST(StreamingSynthesisChunkerTest, FragmentationPreservesTextAndWords) {
    const std::string text =
        "Hallo, wie geht es dir? Mir geht es gut. Heute ist das Wetter schoen, aber morgen "
        "soll es regnen! Was machst du am Wochenende? Ich gehe wandern: in den Bergen ist es "
        "ruhig. Danach koche ich etwas - vielleicht Suppe. Und dann schlafe ich lange";
    const auto expected_words = words(text);

    std::mt19937 rng(1234);
    std::uniform_int_distribution<size_t> piece(1, 9);

    for (int round = 0; round < 200; ++round) {
        std::vector<std::string> fragments;
        for (size_t pos = 0; pos < text.size();) {
            size_t len = std::min(piece(rng), text.size() - pos);
            fragments.push_back(text.substr(pos, len));
            pos += len;
        }

        StreamingSynthesisChunker chunker;
        auto spans = feed(chunker, fragments);

        std::vector<std::string> span_words;
        for (const auto& span : spans) {
            ASSERT_FALSE(span.empty());
            EXPECT_FALSE(StreamingSynthesisChunker::isPunctuationOnly(span)) << span;
            EXPECT_EQ(span, StreamingSynthesisChunker::trim(span));
            for (auto& word : words(span)) {
                span_words.push_back(word);
            }
        }
        // Same words in the same order: nothing lost, nothing split
        ASSERT_EQ(span_words, expected_words) << "round " << round;
    }
}

TEST(StreamingSynthesisChunkerTest, LengthFallbackCutsAtWordBoundary) {
    ChunkerConfig config;
    config.max_chars = 20;
    config.hard_max_chars = 80;
    StreamingSynthesisChunker chunker(config);

    std::vector<std::string> fragments(30, "lorem ");
    auto spans = feed(chunker, fragments);

    ASSERT_GT(spans.size(), 1u);
    size_t total_words = 0;
    for (const auto& span : spans) {
        EXPECT_LE(codePoints(span), config.max_chars) << span;
        for (const auto& word : words(span)) {
            EXPECT_EQ(word, "lorem");
            total_words++;
        }
    }
    EXPECT_EQ(total_words, 30u);
}

TEST(StreamingSynthesisChunkerTest, LongWordIsKeptWhole) {
    ChunkerConfig config;
    config.max_chars = 10;
    config.hard_max_chars = 40;
    StreamingSynthesisChunker chunker(config);

    auto spans = chunker.push("Donaudampfschifffahrt ist");
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0], "Donaudampfschifffahrt");
    EXPECT_EQ(chunker.pending(), "ist");
}

TEST(StreamingSynthesisChunkerTest, ForcedCutWithoutWhitespace) {
    ChunkerConfig config;
    config.max_chars = 10;
    config.hard_max_chars = 40;
    StreamingSynthesisChunker chunker(config);

    auto spans = chunker.push(std::string(50, 'a'));
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0], std::string(40, 'a'));
    EXPECT_EQ(chunker.finish().value_or(""), std::string(10, 'a'));
}

TEST(StreamingSynthesisChunkerTest, PunctuationOnlyPrefixesNextSpan) {
    StreamingSynthesisChunker chunker;
    auto spans = chunker.push("Hallo.");
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0], "Hallo.");

    EXPECT_TRUE(chunker.push("!").empty());
    EXPECT_EQ(chunker.pending(), "!");

    spans = chunker.push(" Wie geht's?");
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0], "! Wie geht's?");
}

TEST(StreamingSynthesisChunkerTest, HeldMarkDoesNotBlockLengthCut) {
    ChunkerConfig config;
    config.max_chars = 80;
    StreamingSynthesisChunker chunker(config);

    auto spans = chunker.push("Wow!");
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_TRUE(chunker.push("!").empty());

    std::vector<std::string> emitted;
    for (int i = 0; i < 40; ++i) {
        for (auto& span : chunker.push(" wort")) {
            emitted.push_back(span);
        }
    }

    ASSERT_FALSE(emitted.empty());
    EXPECT_EQ(emitted[0].substr(0, 6), "! wort");
    for (const auto& span : emitted) {
        EXPECT_LE(codePoints(span), config.max_chars) << span;
    }
    EXPECT_LE(codePoints(chunker.pending()), config.max_chars);

    size_t total_words = 0;
    for (const auto& span : emitted) {
        total_words += words(span).size();
    }
    total_words += words(chunker.pending()).size();
    // The held mark counts as one word
    EXPECT_EQ(total_words, 41u);
}

TEST(StreamingSynthesisChunkerTest, HeldMarkDoesNotBlockClauseBreak) {
    StreamingSynthesisChunker chunker;
    chunker.push("Wirklich?");
    EXPECT_TRUE(chunker.push("!").empty());

    auto spans = chunker.push(" Ja, gut ");
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0], "! Ja, gut");
    EXPECT_EQ(chunker.pending(), "");
}

TEST(StreamingSynthesisChunkerTest, FinishFlushesRemainder) {
    StreamingSynthesisChunker chunker;
    EXPECT_TRUE(chunker.push("  ohne Satzende  ").empty());
    EXPECT_EQ(chunker.finish().value_or(""), "ohne Satzende");
    EXPECT_FALSE(chunker.finish().has_value());
}

TEST(StreamingSynthesisChunkerTest, IsPunctuationOnly) {
    EXPECT_TRUE(StreamingSynthesisChunker::isPunctuationOnly("!"));
    EXPECT_TRUE(StreamingSynthesisChunker::isPunctuationOnly(" ... "));
    EXPECT_TRUE(StreamingSynthesisChunker::isPunctuationOnly("。"));
    EXPECT_FALSE(StreamingSynthesisChunker::isPunctuationOnly("a."));
    EXPECT_FALSE(StreamingSynthesisChunker::isPunctuationOnly("   "));
    EXPECT_FALSE(StreamingSynthesisChunker::isPunctuationOnly("ü"));
}

TEST(SpanStreamTest, YieldsSpansThenEnd) {
    auto source = std::make_shared<ScriptedFragmentStream>(
        std::vector<std::string>{"Eins. ", "Zwei", " und drei"}, Ending::Finish);
    SpanStream spans(source);
    CancellationToken token;

    auto first = spans.next(token);
    ASSERT_TRUE(first.hasValue());
    EXPECT_EQ(first.get(), "Eins.");
    auto second = spans.next(token);
    ASSERT_TRUE(second.hasValue());
    EXPECT_EQ(second.get(), "Zwei und drei");
    EXPECT_TRUE(spans.next(token).isEnd());
    EXPECT_TRUE(spans.next(token).isEnd());
    EXPECT_EQ(spans.receivedText(), "Eins. Zwei und drei");
}

TEST(SpanStreamTest, GeneratorErrorAfterDeliveredSpans) {
    auto source = std::make_shared<ScriptedFragmentStream>(
        std::vector<std::string>{"Eins. Zwei"}, Ending::Fail);
    SpanStream spans(source);
    CancellationToken token;

    auto first = spans.next(token);
    ASSERT_TRUE(first.hasValue());
    EXPECT_EQ(first.get(), "Eins.");

    auto failed = spans.next(token);
    ASSERT_TRUE(failed.isError());
    EXPECT_EQ(failed.errorKind(), ErrorKind::Generation);
    // Terminal outcomes are sticky
    EXPECT_TRUE(spans.next(token).isError());
}

TEST(SpanStreamTest, CancelledTokenStopsStream) {
    auto source = std::make_shared<ScriptedFragmentStream>(
        std::vector<std::string>{"Eins. "}, Ending::Hang);
    SpanStream spans(source);
    CancellationToken token;

    ASSERT_TRUE(spans.next(token).hasValue());
    token.cancel("barge-in");
    auto outcome = spans.next(token);
    ASSERT_TRUE(outcome.isCancelled());
    EXPECT_EQ(outcome.detail(), "barge-in");
}

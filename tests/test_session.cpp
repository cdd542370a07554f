#include "voxturn/session.hpp"

#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <mutex>

using namespace voxturn;
using namespace voxturn::fakes;

namespace {

// Collects everything a session sends
class Outbox {
public:
    Session::OutboundSink sink() {
        return [this](const json& message) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                messages_.push_back(message);
            }
            cv_.notify_all();
        };
    }

    // Wait until `count` messages of `type` have arrived
    bool waitFor(const std::string& type, size_t count = 1,
                 std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return countLocked(type) >= count; });
    }

    std::vector<json> ofType(const std::string& type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<json> result;
        for (const auto& message : messages_) {
            if (message["type"] == type) {
                result.push_back(message);
            }
        }
        return result;
    }

    std::vector<std::string> types() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> result;
        for (const auto& message : messages_) {
            result.push_back(message["type"].get<std::string>());
        }
        return result;
    }

private:
    size_t countLocked(const std::string& type) const {
        size_t count = 0;
        for (const auto& message : messages_) {
            if (message["type"] == type) count++;
        }
        return count;
    }

    std::vector<json> messages_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

class SessionTest : public ::testing::Test {
protected:
    void build(std::vector<std::string> fragments, Ending ending) {
        Collaborators collaborators;
        collaborators.transcriber = std::make_shared<FakeTranscriber>("Wie wird das Wetter?");
        collaborators.generator = std::make_shared<ScriptedGenerator>(std::move(fragments), ending);
        collaborators.synthesizer = std::make_shared<FakeSynthesizer>(2);
        orchestrator = std::make_unique<TurnOrchestrator>(collaborators);
    }

    std::unique_ptr<Session> open(const std::string& id, Outbox& outbox) {
        SessionConfig config;
        config.vad.min_voice_frames = 3;
        config.vad.min_silence_frames = 5;
        config.vad.silence_threshold_ms = 200;
        config.vad.min_speech_duration_ms = 100;
        return std::make_unique<Session>(id, *orchestrator, registry,
            std::make_shared<EnergyVoiceClassifier>(0.01f), outbox.sink(), config);
    }

    static json textPrompt(const std::string& text) {
        return {{"type", "text_prompt"}, {"text", text}};
    }

    static json frame(float amplitude) {
        return {{"type", "audio_frame"}, {"samples", std::vector<float>(320, amplitude)}};
    }

    ProcessRegistry registry;
    std::unique_ptr<TurnOrchestrator> orchestrator;
};

} // namespace

TEST_F(SessionTest, TextPromptRunsTurnToEnd) {
    build({"Morgen ", "wird es sonnig."}, Ending::Finish);
    Outbox outbox;
    auto session = open("s1", outbox);

    session->handleMessage(textPrompt("Wie wird das Wetter?"));
    ASSERT_TRUE(outbox.waitFor("turn_end"));
    ASSERT_TRUE(session->waitForTurn(std::chrono::milliseconds(1000)));

    auto started = outbox.ofType("turn_started");
    ASSERT_EQ(started.size(), 1u);
    EXPECT_EQ(started[0]["source"], "text");
    const std::string turn_id = started[0]["turn_id"].get<std::string>();

    auto chunks = outbox.ofType("audio_chunk");
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0]["chunk_number"], 1);
    EXPECT_EQ(chunks[1]["chunk_number"], 2);
    EXPECT_EQ(chunks[0]["turn_id"], turn_id);
    EXPECT_EQ(chunks[0]["text"], "Morgen wird es sonnig.");

    auto end = outbox.ofType("turn_end")[0];
    EXPECT_EQ(end["turn_id"], turn_id);
    EXPECT_EQ(end["total_chunks"], 2);
    EXPECT_EQ(end["text"], "Morgen wird es sonnig.");

    EXPECT_EQ(outbox.types().front(), "turn_started");
    EXPECT_EQ(outbox.types().back(), "turn_end");
    EXPECT_FALSE(session->hasActiveTurn());
    EXPECT_EQ(registry.count(), 0u);
    EXPECT_EQ(session->history().size(), 1u);
}

TEST_F(SessionTest, SpeechSegmentStartsSpeechTurn) {
    build({"Sonnig."}, Ending::Finish);
    Outbox outbox;
    auto session = open("s1", outbox);

    for (int i = 0; i < 10; ++i) {
        session->handleMessage(frame(0.3f));
    }
    for (int i = 0; i < 15; ++i) {
        session->handleMessage(frame(0.0f));
    }

    ASSERT_TRUE(outbox.waitFor("turn_end"));
    ASSERT_TRUE(session->waitForTurn(std::chrono::milliseconds(1000)));

    auto types = outbox.types();
    ASSERT_EQ(types.size(), 5u);
    EXPECT_EQ(types[0], "turn_started");
    EXPECT_EQ(types[1], "transcription");
    EXPECT_EQ(types[2], "audio_chunk");
    EXPECT_EQ(types[3], "audio_chunk");
    EXPECT_EQ(types[4], "turn_end");

    EXPECT_EQ(outbox.ofType("turn_started")[0]["source"], "speech");
    EXPECT_EQ(outbox.ofType("transcription")[0]["text"], "Wie wird das Wetter?");
}

TEST_F(SessionTest, EndOfStreamFlushesOpenSpeech) {
    build({"Ja."}, Ending::Finish);
    Outbox outbox;
    auto session = open("s1", outbox);

    for (int i = 0; i < 10; ++i) {
        session->handleMessage(frame(0.3f));
    }
    EXPECT_TRUE(outbox.types().empty());

    session->handleMessage(json{{"type", "end_of_stream"}});
    ASSERT_TRUE(outbox.waitFor("turn_end"));
}

TEST_F(SessionTest, PromptDuringActiveTurnIsRejected) {
    build({"Eins. "}, Ending::Hang);
    Outbox outbox;
    auto session = open("s1", outbox);

    session->handleMessage(textPrompt("Erste Frage"));
    ASSERT_TRUE(outbox.waitFor("turn_started"));
    const std::string turn_id = outbox.ofType("turn_started")[0]["turn_id"].get<std::string>();
    EXPECT_TRUE(session->hasActiveTurn());
    EXPECT_EQ(session->activeTurnId(), turn_id);

    session->handleMessage(textPrompt("Zweite Frage"));
    auto errors = outbox.ofType("error");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0]["kind"], "turn_active");
    EXPECT_EQ(outbox.ofType("turn_started").size(), 1u);

    session->handleMessage(json{{"type", "stop_turn"}, {"id", turn_id}});
    auto stop_result = outbox.ofType("turn_stop_result");
    ASSERT_EQ(stop_result.size(), 1u);
    EXPECT_EQ(stop_result[0]["stopped"], true);

    ASSERT_TRUE(outbox.waitFor("turn_cancelled"));
    ASSERT_TRUE(session->waitForTurn(std::chrono::milliseconds(1000)));
    EXPECT_EQ(outbox.ofType("turn_cancelled")[0]["reason"], "Stopped by user");
    EXPECT_FALSE(session->hasActiveTurn());
    EXPECT_EQ(registry.count(), 0u);
    EXPECT_EQ(session->history().size(), 0u);
}

TEST_F(SessionTest, SpeechDuringActiveTurnIsQueued) {
    build({"Eins. "}, Ending::Hang);
    Outbox outbox;
    auto session = open("s1", outbox);

    session->handleMessage(textPrompt("Erste Frage"));
    ASSERT_TRUE(outbox.waitFor("turn_started"));
    const std::string first_id = outbox.ofType("turn_started")[0]["turn_id"].get<std::string>();

    // A full utterance while the first turn is still speaking
    for (int i = 0; i < 10; ++i) {
        session->handleMessage(frame(0.3f));
    }
    for (int i = 0; i < 15; ++i) {
        session->handleMessage(frame(0.0f));
    }
    EXPECT_TRUE(outbox.ofType("error").empty());
    EXPECT_EQ(outbox.ofType("turn_started").size(), 1u);
    EXPECT_TRUE(session->hasActiveTurn());

    session->handleMessage(json{{"type", "stop_turn"}, {"id", first_id}});
    ASSERT_TRUE(outbox.waitFor("turn_started", 2));
    auto started = outbox.ofType("turn_started");
    EXPECT_EQ(started[1]["source"], "speech");
    const std::string second_id = started[1]["turn_id"].get<std::string>();
    EXPECT_NE(second_id, first_id);
    ASSERT_TRUE(outbox.waitFor("transcription"));
    EXPECT_EQ(outbox.ofType("transcription")[0]["turn_id"], second_id);

    // The first turn ends before the queued one starts
    auto types = outbox.types();
    size_t cancelled_at = types.size();
    size_t second_started_at = 0;
    size_t seen_started = 0;
    for (size_t i = 0; i < types.size(); ++i) {
        if (types[i] == "turn_cancelled" && cancelled_at == types.size()) cancelled_at = i;
        if (types[i] == "turn_started" && ++seen_started == 2) second_started_at = i;
    }
    EXPECT_LT(cancelled_at, second_started_at);

    session->handleMessage(json{{"type", "stop_turn"}, {"id", second_id}});
    ASSERT_TRUE(outbox.waitFor("turn_cancelled", 2));
    ASSERT_TRUE(session->waitForTurn(std::chrono::milliseconds(1000)));
    EXPECT_FALSE(session->hasActiveTurn());
    EXPECT_EQ(registry.count(), 0u);
    EXPECT_TRUE(outbox.ofType("error").empty());
}

TEST_F(SessionTest, CloseDropsQueuedSpeech) {
    build({"Eins. "}, Ending::Hang);
    Outbox outbox;
    auto session = open("s1", outbox);

    session->handleMessage(textPrompt("Erste Frage"));
    ASSERT_TRUE(outbox.waitFor("turn_started"));
    for (int i = 0; i < 10; ++i) {
        session->handleMessage(frame(0.3f));
    }
    session->handleMessage(json{{"type", "end_of_stream"}});

    session->close();
    ASSERT_TRUE(outbox.waitFor("turn_cancelled"));
    EXPECT_EQ(outbox.ofType("turn_started").size(), 1u);
    EXPECT_FALSE(session->hasActiveTurn());
    EXPECT_EQ(registry.count(), 0u);
}

TEST_F(SessionTest, StopUnknownTurnReportsFalse) {
    build({"Ja."}, Ending::Finish);
    Outbox outbox;
    auto session = open("s1", outbox);

    session->handleMessage(json{{"type", "stop_turn"}, {"id", "unknown"}});
    auto result = outbox.ofType("turn_stop_result");
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0]["stopped"], false);
}

TEST_F(SessionTest, StopAllReachesEverySession) {
    build({"Eins. "}, Ending::Hang);
    Outbox first_out;
    Outbox second_out;
    auto first = open("s1", first_out);
    auto second = open("s2", second_out);

    first->handleMessage(textPrompt("Frage eins"));
    second->handleMessage(textPrompt("Frage zwei"));
    EXPECT_EQ(registry.count(), 2u);

    first->handleMessage(json{{"type", "stop_all"}, {"reason", "maintenance"}});
    auto stopped = first_out.ofType("all_turns_stopped");
    ASSERT_EQ(stopped.size(), 1u);
    EXPECT_EQ(stopped[0]["count"], 2);

    ASSERT_TRUE(first_out.waitFor("turn_cancelled"));
    ASSERT_TRUE(second_out.waitFor("turn_cancelled"));
    EXPECT_EQ(second_out.ofType("turn_cancelled")[0]["reason"], "maintenance");
    ASSERT_TRUE(first->waitForTurn(std::chrono::milliseconds(1000)));
    ASSERT_TRUE(second->waitForTurn(std::chrono::milliseconds(1000)));
    EXPECT_EQ(registry.count(), 0u);
}

TEST_F(SessionTest, ListTurnsShowsSessionTurns) {
    build({"Eins. "}, Ending::Hang);
    Outbox outbox;
    auto session = open("s1", outbox);

    session->handleMessage(json{
        {"type", "start_turn"},
        {"text", "Hallo"},
        {"metadata", {{"client", "kiosk"}}}
    });
    ASSERT_TRUE(outbox.waitFor("turn_started"));

    session->handleMessage(json{{"type", "list_turns"}});
    auto listed = outbox.ofType("active_turns");
    ASSERT_EQ(listed.size(), 1u);
    ASSERT_EQ(listed[0]["turns"].size(), 1u);
    EXPECT_EQ(listed[0]["turns"][0]["name"], "text_turn");
    EXPECT_EQ(listed[0]["turns"][0]["session_id"], "s1");
    EXPECT_GE(listed[0]["turns"][0]["age_ms"].get<long long>(), 0);

    auto info = registry.info(session->activeTurnId());
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->metadata.attributes.at("client"), "kiosk");

    session->close();
    ASSERT_TRUE(outbox.waitFor("turn_cancelled"));
    EXPECT_EQ(outbox.ofType("turn_cancelled")[0]["reason"], "Session closed");
    EXPECT_EQ(registry.count(), 0u);
}

TEST_F(SessionTest, MalformedMessagesKeepSessionAlive) {
    build({"Ja."}, Ending::Finish);
    Outbox outbox;
    auto session = open("s1", outbox);

    session->handleMessage(std::string("{not json"));
    session->handleMessage(std::string(R"({"type": "dance"})"));
    session->handleMessage(std::string(R"({"type": "audio_frame", "samples": "loud"})"));

    auto errors = outbox.ofType("error");
    ASSERT_EQ(errors.size(), 3u);
    for (const auto& error : errors) {
        EXPECT_EQ(error["kind"], "protocol");
    }

    session->handleMessage(std::string(R"({"type": "list_turns"})"));
    auto listed = outbox.ofType("active_turns");
    ASSERT_EQ(listed.size(), 1u);
    EXPECT_TRUE(listed[0]["turns"].empty());
}

TEST_F(SessionTest, StartTurnNeedsTextOrAudio) {
    build({"Ja."}, Ending::Finish);
    Outbox outbox;
    auto session = open("s1", outbox);

    session->handleMessage(json{{"type", "start_turn"}});
    auto errors = outbox.ofType("error");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0]["kind"], "validation");
    EXPECT_FALSE(session->hasActiveTurn());
}

TEST_F(SessionTest, StartTurnWithAudioSkipsDetector) {
    build({"Ja."}, Ending::Finish);
    Outbox outbox;
    auto session = open("s1", outbox);

    session->handleMessage(json{{"type", "start_turn"}, {"audio_data", std::vector<float>(1600, 0.1f)}});
    ASSERT_TRUE(outbox.waitFor("turn_end"));
    EXPECT_EQ(outbox.ofType("turn_started")[0]["source"], "speech");
    EXPECT_EQ(outbox.ofType("transcription").size(), 1u);
}

TEST_F(SessionTest, ClosedSessionIgnoresInput) {
    build({"Ja."}, Ending::Finish);
    Outbox outbox;
    auto session = open("s1", outbox);
    session->close();

    session->handleMessage(textPrompt("Hallo"));
    EXPECT_TRUE(outbox.types().empty());
}

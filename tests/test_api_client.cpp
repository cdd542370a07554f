#include "voxturn/api_client.hpp"

#include <gtest/gtest.h>

#include <cstdint>

using namespace voxturn;

namespace {

uint32_t readLE(const std::string& data, size_t offset, size_t bytes) {
    uint32_t value = 0;
    for (size_t i = 0; i < bytes; ++i) {
        value |= static_cast<uint32_t>(static_cast<unsigned char>(data[offset + i])) << (8 * i);
    }
    return value;
}

} // namespace

TEST(StreamLineTest, ContentDelta) {
    std::string content;
    EXPECT_EQ(parseStreamLine(R"(data: {"choices":[{"delta":{"content":"Hallo"}}]})", content),
              StreamLine::Content);
    EXPECT_EQ(content, "Hallo");

    EXPECT_EQ(parseStreamLine("data:{\"choices\":[{\"delta\":{\"content\":\" Welt\"}}]}\r", content),
              StreamLine::Content);
    EXPECT_EQ(content, " Welt");
}

TEST(StreamLineTest, DoneMarker) {
    std::string content;
    EXPECT_EQ(parseStreamLine("data: [DONE]", content), StreamLine::Done);
}

TEST(StreamLineTest, SkipsEverythingElse) {
    std::string content;
    EXPECT_EQ(parseStreamLine("", content), StreamLine::Skip);
    EXPECT_EQ(parseStreamLine(": keep-alive", content), StreamLine::Skip);
    EXPECT_EQ(parseStreamLine("event: ping", content), StreamLine::Skip);
    EXPECT_EQ(parseStreamLine(R"(data: {"choices":[{"delta":{"role":"assistant"}}]})", content),
              StreamLine::Skip);
    EXPECT_EQ(parseStreamLine(R"(data: {"choices":[{"delta":{"content":""}}]})", content),
              StreamLine::Skip);
    EXPECT_EQ(parseStreamLine("data: {broken", content), StreamLine::Skip);
}

TEST(WavTest, HeaderDescribesMono16Bit) {
    std::vector<float> samples = {0.0f, 1.0f, -1.0f, 2.0f};
    std::string wav = encodeWav(samples, 16000);

    ASSERT_EQ(wav.size(), 44u + 8u);
    EXPECT_EQ(wav.compare(0, 4, "RIFF"), 0);
    EXPECT_EQ(readLE(wav, 4, 4), 36u + 8u);
    EXPECT_EQ(wav.compare(8, 4, "WAVE"), 0);
    EXPECT_EQ(readLE(wav, 22, 2), 1u);       // channels
    EXPECT_EQ(readLE(wav, 24, 4), 16000u);   // sample rate
    EXPECT_EQ(readLE(wav, 34, 2), 16u);      // bits per sample
    EXPECT_EQ(wav.compare(36, 4, "data"), 0);
    EXPECT_EQ(readLE(wav, 40, 4), 8u);

    EXPECT_EQ(readLE(wav, 44, 2), 0u);
    EXPECT_EQ(readLE(wav, 46, 2), 32767u);
    EXPECT_EQ(static_cast<int16_t>(readLE(wav, 48, 2)), -32767);
    // Out of range samples are clamped
    EXPECT_EQ(readLE(wav, 50, 2), 32767u);
}

TEST(ApiClientTest, EndpointToleratesChatUrl) {
    ApiConfig config;
    config.base_url = "https://api.deepseek.com/v1/chat/completions";
    ApiClient client(config);
    EXPECT_EQ(client.endpoint("/audio/speech"), "https://api.deepseek.com/v1/audio/speech");
    EXPECT_EQ(client.getApiProvider(), "DeepSeek");

    config.base_url = "http://localhost:8080/v1/";
    ApiClient local(config);
    EXPECT_EQ(local.endpoint("/chat/completions"), "http://localhost:8080/v1/chat/completions");
    EXPECT_EQ(local.getApiProvider(), "Local API");
}

TEST(ApiClientTest, NeedsKeyToBeConfigured) {
    ApiConfig config;
    ApiClient client(config);
    EXPECT_FALSE(client.isConfigured());

    config.api_key = "sk-test";
    ApiClient configured(config);
    EXPECT_TRUE(configured.isConfigured());
}

TEST(ApiClientTest, UnconfiguredCallsFail) {
    ApiClient client{ApiConfig()};
    CancellationToken token;
    try {
        client.transcribe(std::vector<float>(160, 0.0f), 16000, "de-DE", token);
        FAIL() << "expected ExternalCallError";
    } catch (const ExternalCallError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Transcription);
    }
}

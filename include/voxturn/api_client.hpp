#ifndef VOXTURN_API_CLIENT_HPP
#define VOXTURN_API_CLIENT_HPP

#include "voxturn/cancellation_token.hpp"
#include "voxturn/collaborators.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace voxturn {

struct ApiConfig {
    std::string base_url = "https://api.openai.com/v1";
    std::string api_key;
    std::string chat_model = "gpt-4o-mini";
    std::string transcription_model = "whisper-1";
    std::string speech_model = "tts-1";
    float temperature = 0.7f;
    int max_tokens = 500;
    long timeout_seconds = 60;
    int speech_sample_rate = 24000;  // pcm response format of the speech endpoint
    size_t chunk_samples = 4800;     // samples per synthesized audio chunk
};

struct ChatMessage {
    std::string role;
    std::string content;

    ChatMessage(const std::string& r, const std::string& c) : role(r), content(c) {}
};

enum class StreamLine {
    Content,  // `content` holds the next fragment
    Done,     // data: [DONE]
    Skip      // keep-alive, role-only delta, comment or garbage
};

// Parse one line of an OpenAI-style SSE chat stream
StreamLine parseStreamLine(const std::string& line, std::string& content);

// Mono float samples as a 16-bit PCM WAV file image
std::string encodeWav(const std::vector<float>& samples, int sample_rate);

// Thin libcurl client for an OpenAI-compatible HTTP API. Every request
// observes the token and aborts the transfer once it is cancelled.
// Failures are thrown as ExternalCallError.
class ApiClient {
public:
    explicit ApiClient(const ApiConfig& config);
    ~ApiClient();

    ApiClient(const ApiClient&) = delete;
    ApiClient& operator=(const ApiClient&) = delete;

    bool isConfigured() const;

    // Provider name for display
    std::string getApiProvider() const;

    // base_url + path, tolerating a base that already names the chat endpoint
    std::string endpoint(const std::string& path) const;

    // POST /chat/completions with stream=true. on_fragment returns false to
    // stop reading.
    void streamChat(const std::vector<ChatMessage>& messages,
                    const std::function<bool(const std::string&)>& on_fragment,
                    const CancellationToken& token);

    // POST /audio/transcriptions
    Transcript transcribe(const std::vector<float>& samples,
                          int sample_rate,
                          const std::string& language,
                          const CancellationToken& token);

    // POST /audio/speech with response_format=pcm. on_samples receives blocks
    // of chunk_samples (the last one may be shorter) and returns false to stop.
    void streamSpeech(const std::string& text,
                      const std::string& voice,
                      const std::function<bool(std::vector<int16_t>)>& on_samples,
                      const CancellationToken& token);

    const ApiConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl;
};

class ApiTranscriber : public Transcriber {
public:
    explicit ApiTranscriber(std::shared_ptr<ApiClient> client) : client_(std::move(client)) {}

    Transcript transcribe(const SpeechSegment& segment,
                          const std::string& language,
                          const CancellationToken& token) override;

private:
    std::shared_ptr<ApiClient> client_;
};

class ApiGenerator : public TextGenerator {
public:
    explicit ApiGenerator(std::shared_ptr<ApiClient> client) : client_(std::move(client)) {}

    std::shared_ptr<FragmentStream> generateStream(const std::string& prompt,
                                                   const CancellationToken& token) override;

private:
    std::shared_ptr<ApiClient> client_;
};

class ApiSynthesizer : public Synthesizer {
public:
    explicit ApiSynthesizer(std::shared_ptr<ApiClient> client) : client_(std::move(client)) {}

    std::shared_ptr<AudioStream> synthesizeStream(const std::string& text,
                                                  const std::string& voice,
                                                  const CancellationToken& token) override;

private:
    std::shared_ptr<ApiClient> client_;
};

} // namespace voxturn

#endif // VOXTURN_API_CLIENT_HPP

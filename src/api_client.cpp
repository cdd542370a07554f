#include "voxturn/api_client.hpp"

#include <nlohmann/json.hpp>
#include <curl/curl.h>

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>

namespace voxturn {

using json = nlohmann::json;

namespace {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, (last - first + 1));
}

void appendLE(std::string& out, uint32_t value, int bytes) {
    for (int i = 0; i < bytes; ++i) {
        out.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
    }
}

// Extract a readable message from an error response body
std::string errorMessage(long status, const std::string& body) {
    std::string message = "HTTP " + std::to_string(status);
    try {
        json j = json::parse(body);
        if (j.contains("error")) {
            const auto& error = j["error"];
            if (error.is_object() && error.contains("message") && error["message"].is_string()) {
                return message + ": " + error["message"].get<std::string>();
            }
            if (error.is_string()) {
                return message + ": " + error.get<std::string>();
            }
        }
    } catch (const json::parse_error&) {
        // Not JSON, use the raw body
    }
    if (!body.empty()) {
        message += ": " + body.substr(0, 200);
    }
    return message;
}

// Per-request transfer state handed to the curl callbacks
struct Transfer {
    CURL* curl = nullptr;
    std::function<bool(const char*, size_t)> sink;  // false stops the transfer
    std::string error_body;
    long status = 0;
    bool stopped = false;
};

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* transfer = static_cast<Transfer*>(userp);
    size_t total_size = size * nmemb;

    if (transfer->status == 0) {
        curl_easy_getinfo(transfer->curl, CURLINFO_RESPONSE_CODE, &transfer->status);
    }
    if (transfer->status >= 400) {
        transfer->error_body.append(static_cast<char*>(contents), total_size);
        return total_size;
    }
    if (!transfer->sink(static_cast<char*>(contents), total_size)) {
        transfer->stopped = true;
        return 0;  // Stop the transfer
    }
    return total_size;
}

int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* token = static_cast<const CancellationToken*>(clientp);
    return token->isCancelled() ? 1 : 0;
}

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;
using MimeHandle = std::unique_ptr<curl_mime, decltype(&curl_mime_free)>;

} // namespace

StreamLine parseStreamLine(const std::string& line, std::string& content) {
    std::string trimmed = trim(line);
    // Empty keep-alive lines and SSE comments
    if (trimmed.empty() || trimmed[0] == ':') {
        return StreamLine::Skip;
    }
    if (trimmed.compare(0, 5, "data:") != 0) {
        return StreamLine::Skip;
    }

    std::string json_str = trim(trimmed.substr(5));
    if (json_str == "[DONE]") {
        return StreamLine::Done;
    }

    try {
        json j = json::parse(json_str);
        if (j.contains("choices") && j["choices"].is_array() && !j["choices"].empty()) {
            const auto& choice = j["choices"][0];
            if (choice.contains("delta") && choice["delta"].contains("content") &&
                choice["delta"]["content"].is_string()) {
                content = choice["delta"]["content"].get<std::string>();
                return content.empty() ? StreamLine::Skip : StreamLine::Content;
            }
        }
    } catch (const json::parse_error& e) {
        std::cerr << "[API] JSON parse error: " << e.what() << " for chunk: " << json_str << std::endl;
    }
    return StreamLine::Skip;
}

std::string encodeWav(const std::vector<float>& samples, int sample_rate) {
    const uint32_t data_size = static_cast<uint32_t>(samples.size() * 2);
    std::string wav;
    wav.reserve(44 + data_size);

    wav += "RIFF";
    appendLE(wav, 36 + data_size, 4);
    wav += "WAVE";
    wav += "fmt ";
    appendLE(wav, 16, 4);                                   // fmt chunk size
    appendLE(wav, 1, 2);                                    // PCM
    appendLE(wav, 1, 2);                                    // mono
    appendLE(wav, static_cast<uint32_t>(sample_rate), 4);
    appendLE(wav, static_cast<uint32_t>(sample_rate) * 2, 4);  // byte rate
    appendLE(wav, 2, 2);                                    // block align
    appendLE(wav, 16, 2);                                   // bits per sample
    wav += "data";
    appendLE(wav, data_size, 4);

    for (float sample : samples) {
        float clamped = std::max(-1.0f, std::min(1.0f, sample));
        auto value = static_cast<int16_t>(clamped * 32767.0f);
        appendLE(wav, static_cast<uint16_t>(value), 2);
    }
    return wav;
}

class ApiClient::Impl {
public:
    ApiConfig config;

    explicit Impl(const ApiConfig& cfg) : config(cfg) {}

    std::string getProviderName() const {
        const std::string& url = config.base_url;
        if (url.find("deepseek.com") != std::string::npos) {
            return "DeepSeek";
        } else if (url.find("openai.com") != std::string::npos) {
            return "OpenAI";
        } else if (url.find("groq.com") != std::string::npos) {
            return "Groq";
        } else if (url.find("localhost") != std::string::npos ||
                   url.find("127.0.0.1") != std::string::npos) {
            return "Local API";
        }
        return "Custom API";
    }

    CurlHandle newHandle(const std::string& url, curl_slist* headers, const CancellationToken& token) const {
        CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
        if (!curl) {
            throw ExternalCallError(ErrorKind::Transport, "Failed to initialize cURL");
        }
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, config.timeout_seconds);
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

        // Abort as soon as the turn is cancelled
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &token);

        // Check for proxy settings
        const char* https_proxy = std::getenv("https_proxy");
        if (!https_proxy) https_proxy = std::getenv("HTTPS_PROXY");
        if (https_proxy) {
            curl_easy_setopt(curl.get(), CURLOPT_PROXY, https_proxy);
        }
        return curl;
    }

    HeaderList authHeaders(const char* content_type) const {
        curl_slist* headers = nullptr;
        if (content_type) {
            headers = curl_slist_append(headers, content_type);
        }
        std::string auth_header = "Authorization: Bearer " + config.api_key;
        headers = curl_slist_append(headers, auth_header.c_str());
        return HeaderList(headers, &curl_slist_free_all);
    }

    // Runs the transfer. Returns false if it was cut short by the token or
    // by the sink; throws on transport and HTTP errors.
    bool perform(CURL* curl, Transfer& transfer, ErrorKind kind, const CancellationToken& token) const {
        transfer.curl = curl;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &transfer);

        CURLcode res = curl_easy_perform(curl);
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &transfer.status);

        if (res == CURLE_ABORTED_BY_CALLBACK || token.isCancelled()) {
            return false;
        }
        if (res == CURLE_WRITE_ERROR && transfer.stopped) {
            return false;
        }
        if (res != CURLE_OK) {
            std::cerr << "[API] cURL error: " << curl_easy_strerror(res) << std::endl;
            throw ExternalCallError(ErrorKind::Transport, curl_easy_strerror(res));
        }
        if (transfer.status >= 400) {
            std::string message = errorMessage(transfer.status, transfer.error_body);
            std::cerr << "[API] " << message << std::endl;
            throw ExternalCallError(kind, message);
        }
        return true;
    }
};

ApiClient::ApiClient(const ApiConfig& config) : impl(std::make_unique<Impl>(config)) {
    // Initialize cURL globally, once per process
    static const bool curl_initialized = [] {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        return true;
    }();
    (void)curl_initialized;
}

ApiClient::~ApiClient() = default;

bool ApiClient::isConfigured() const {
    return !impl->config.api_key.empty() && !impl->config.base_url.empty();
}

std::string ApiClient::getApiProvider() const {
    return impl->getProviderName();
}

const ApiConfig& ApiClient::config() const {
    return impl->config;
}

std::string ApiClient::endpoint(const std::string& path) const {
    std::string base = impl->config.base_url;
    const std::string chat_suffix = "/chat/completions";
    if (base.size() >= chat_suffix.size() &&
        base.compare(base.size() - chat_suffix.size(), chat_suffix.size(), chat_suffix) == 0) {
        base.erase(base.size() - chat_suffix.size());
    }
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + path;
}

void ApiClient::streamChat(const std::vector<ChatMessage>& messages,
                           const std::function<bool(const std::string&)>& on_fragment,
                           const CancellationToken& token) {
    if (!isConfigured()) {
        throw ExternalCallError(ErrorKind::Generation, "API key or URL not set");
    }

    json request;
    request["model"] = impl->config.chat_model;
    request["stream"] = true;
    request["temperature"] = impl->config.temperature;
    request["max_tokens"] = impl->config.max_tokens;

    json messages_json = json::array();
    for (const auto& msg : messages) {
        messages_json.push_back({{"role", msg.role}, {"content", msg.content}});
    }
    request["messages"] = messages_json;
    std::string request_body = request.dump();

    auto headers = impl->authHeaders("Content-Type: application/json");
    auto curl = impl->newHandle(endpoint("/chat/completions"), headers.get(), token);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request_body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request_body.length()));

    std::string buffer;
    bool done = false;
    Transfer transfer;
    transfer.sink = [&buffer, &done, &on_fragment](const char* data, size_t size) {
        buffer.append(data, size);

        // Process complete lines
        size_t pos = 0;
        while ((pos = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, pos);
            buffer.erase(0, pos + 1);
            if (done) {
                continue;
            }

            std::string content;
            switch (parseStreamLine(line, content)) {
                case StreamLine::Content:
                    if (!on_fragment(content)) {
                        return false;
                    }
                    break;
                case StreamLine::Done:
                    done = true;
                    break;
                case StreamLine::Skip:
                    break;
            }
        }
        return true;
    };

    if (!impl->perform(curl.get(), transfer, ErrorKind::Generation, token)) {
        return;
    }

    // A final line without trailing newline
    if (!done && !buffer.empty()) {
        std::string content;
        if (parseStreamLine(buffer, content) == StreamLine::Content) {
            on_fragment(content);
        }
    }
}

Transcript ApiClient::transcribe(const std::vector<float>& samples,
                                 int sample_rate,
                                 const std::string& language,
                                 const CancellationToken& token) {
    if (!isConfigured()) {
        throw ExternalCallError(ErrorKind::Transcription, "API key or URL not set");
    }

    std::string wav = encodeWav(samples, sample_rate);
    // "de-DE" -> "de"
    std::string iso_language = language.substr(0, language.find('-'));

    auto headers = impl->authHeaders(nullptr);
    auto curl = impl->newHandle(endpoint("/audio/transcriptions"), headers.get(), token);

    MimeHandle mime(curl_mime_init(curl.get()), &curl_mime_free);
    curl_mimepart* part = curl_mime_addpart(mime.get());
    curl_mime_name(part, "file");
    curl_mime_filename(part, "speech.wav");
    curl_mime_type(part, "audio/wav");
    curl_mime_data(part, wav.data(), wav.size());

    part = curl_mime_addpart(mime.get());
    curl_mime_name(part, "model");
    curl_mime_data(part, impl->config.transcription_model.c_str(), CURL_ZERO_TERMINATED);

    part = curl_mime_addpart(mime.get());
    curl_mime_name(part, "response_format");
    curl_mime_data(part, "json", CURL_ZERO_TERMINATED);

    if (!iso_language.empty()) {
        part = curl_mime_addpart(mime.get());
        curl_mime_name(part, "language");
        curl_mime_data(part, iso_language.c_str(), CURL_ZERO_TERMINATED);
    }
    curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());

    std::string response_string;
    Transfer transfer;
    transfer.sink = [&response_string](const char* data, size_t size) {
        response_string.append(data, size);
        return true;
    };

    Transcript transcript;
    transcript.language_code = language;
    if (!impl->perform(curl.get(), transfer, ErrorKind::Transcription, token)) {
        return transcript;
    }

    try {
        json response_json = json::parse(response_string);
        if (!response_json.contains("text") || !response_json["text"].is_string()) {
            throw ExternalCallError(ErrorKind::Transcription, "Transcription response without text");
        }
        transcript.text = response_json["text"].get<std::string>();
        transcript.confidence = response_json.value("confidence", 1.0f);
    } catch (const json::exception& e) {
        std::cerr << "[API] JSON parse error: " << e.what() << std::endl;
        throw ExternalCallError(ErrorKind::Transcription, std::string("Invalid transcription response: ") + e.what());
    }
    return transcript;
}

void ApiClient::streamSpeech(const std::string& text,
                             const std::string& voice,
                             const std::function<bool(std::vector<int16_t>)>& on_samples,
                             const CancellationToken& token) {
    if (!isConfigured()) {
        throw ExternalCallError(ErrorKind::Synthesis, "API key or URL not set");
    }

    json request;
    request["model"] = impl->config.speech_model;
    request["input"] = text;
    request["voice"] = voice;
    request["response_format"] = "pcm";
    std::string request_body = request.dump();

    auto headers = impl->authHeaders("Content-Type: application/json");
    auto curl = impl->newHandle(endpoint("/audio/speech"), headers.get(), token);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request_body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request_body.length()));

    const size_t chunk_samples = std::max<size_t>(1, impl->config.chunk_samples);
    std::string pending;  // raw little-endian int16 bytes

    auto emit = [&pending, &on_samples](size_t samples) {
        std::vector<int16_t> block(samples);
        for (size_t i = 0; i < samples; ++i) {
            auto lo = static_cast<uint8_t>(pending[2 * i]);
            auto hi = static_cast<uint8_t>(pending[2 * i + 1]);
            block[i] = static_cast<int16_t>(static_cast<uint16_t>(lo | (hi << 8)));
        }
        pending.erase(0, samples * 2);
        return on_samples(std::move(block));
    };

    Transfer transfer;
    transfer.sink = [&pending, &emit, chunk_samples](const char* data, size_t size) {
        pending.append(data, size);
        while (pending.size() >= chunk_samples * 2) {
            if (!emit(chunk_samples)) {
                return false;
            }
        }
        return true;
    };

    if (!impl->perform(curl.get(), transfer, ErrorKind::Synthesis, token)) {
        return;
    }

    if (pending.size() >= 2) {
        emit(pending.size() / 2);
    }
}

// ============================================================================
// Collaborator adapters
// ============================================================================

Transcript ApiTranscriber::transcribe(const SpeechSegment& segment,
                                      const std::string& language,
                                      const CancellationToken& token) {
    std::cout << "[API] Transcribing " << segment.durationMs() << " ms via "
              << client_->getApiProvider() << std::endl;
    return client_->transcribe(segment.samples, segment.sample_rate, language, token);
}

std::shared_ptr<FragmentStream> ApiGenerator::generateStream(const std::string& prompt,
                                                             const CancellationToken& token) {
    auto client = client_;
    std::vector<ChatMessage> messages;
    messages.emplace_back("user", prompt);
    CancellationToken turn = token;

    return std::make_shared<ChannelStream<std::string>>(
        [client, messages, turn](BoundedChannel<std::string>& channel, const CancellationToken& stop) {
            // Abort the request on turn cancellation or when the consumer goes away
            CancellationToken abort;
            CancellationSubscription on_turn(turn, [abort] { abort.cancel("Turn cancelled"); });
            CancellationSubscription on_stop(stop, [abort] { abort.cancel("Stream closed"); });

            client->streamChat(messages, [&channel](const std::string& fragment) {
                return channel.push(fragment);
            }, abort);
        });
}

std::shared_ptr<AudioStream> ApiSynthesizer::synthesizeStream(const std::string& text,
                                                              const std::string& voice,
                                                              const CancellationToken& token) {
    auto client = client_;
    CancellationToken turn = token;

    return std::make_shared<ChannelStream<AudioChunk>>(
        [client, text, voice, turn](BoundedChannel<AudioChunk>& channel, const CancellationToken& stop) {
            CancellationToken abort;
            CancellationSubscription on_turn(turn, [abort] { abort.cancel("Turn cancelled"); });
            CancellationSubscription on_stop(stop, [abort] { abort.cancel("Stream closed"); });

            const int sample_rate = client->config().speech_sample_rate;
            client->streamSpeech(text, voice, [&channel, &text, sample_rate](std::vector<int16_t> samples) {
                return channel.push(AudioChunk(std::move(samples), sample_rate, text));
            }, abort);
        });
}

} // namespace voxturn

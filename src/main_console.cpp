#include <iostream>
#include <fstream>
#include <string>
#include <memory>
#include <chrono>
#include <cstdlib>
#include <mutex>
#include <atomic>
#include <signal.h>

#include "voxturn/api_client.hpp"
#include "voxturn/config.hpp"
#include "voxturn/process_registry.hpp"
#include "voxturn/session.hpp"
#include "voxturn/turn_orchestrator.hpp"
#include "voxturn/voice_classifier.hpp"

using namespace voxturn;

std::atomic<bool> g_running(true);

void signalHandler(int signum) {
    g_running = false;
    // Restore default signal handler to allow force quit
    signal(signum, SIG_DFL);
}

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]" << std::endl;
    std::cout << "Reads session messages as JSON lines from stdin and writes replies as JSON lines." << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --env_file <path>           Path to .env file (default: .env)" << std::endl;
    std::cout << "  --api_key <key>             API key for the service" << std::endl;
    std::cout << "  --api_url <url>             API base URL (default: https://api.openai.com/v1)" << std::endl;
    std::cout << "  --model <model_name>        Chat model (default: gpt-4o-mini)" << std::endl;
    std::cout << "  --max_tokens <value>        Maximum tokens per answer (default: 500)" << std::endl;
    std::cout << "  --voice <name>              Default synthesis voice" << std::endl;
    std::cout << "  --language <code>           Default language (default: de-DE)" << std::endl;
    std::cout << "  --sample_rate <value>       Sample rate of inbound audio (default: 16000)" << std::endl;
    std::cout << "  --silence_ms <value>        Silence before a segment ends (default: 200)" << std::endl;
    std::cout << "  --min_speech_ms <value>     Shorter segments are dropped (default: 50)" << std::endl;
    std::cout << "  --energy_threshold <value>  RMS threshold of the energy VAD (default: 0.01)" << std::endl;
    std::cout << "  --max_chars <value>         Span length before a word-boundary cut (default: 80)" << std::endl;
    std::cout << "  --session_id <id>           Session name used in logs (default: console)" << std::endl;
    std::cout << "  --out <path>                Write replies to a file instead of stdout" << std::endl;
    std::cout << "  --sequential                Wait for each turn before reading the next line" << std::endl;
    std::cout << "  --help                      Show this help message" << std::endl;
    std::cout << "\nAPI configuration is read from the .env file, then API_KEY / API_URL / VOXTURN_*" << std::endl;
    std::cout << "environment variables, then the command line." << std::endl;
}

int main(int argc, char** argv) {
    AppConfig config;
    std::string env_file = ".env";
    std::string out_path;
    std::string session_id = "console";
    bool sequential = false;

    // First pass: the .env file has to be read before command line overrides
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--env_file" && i + 1 < argc) {
            env_file = argv[++i];
        }
    }
    loadConfigFromEnv(env_file, config);
    applyEnvironment(config);

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        }
        else if (arg == "--env_file" && i + 1 < argc) {
            ++i;
        }
        else if (arg == "--api_key" && i + 1 < argc) {
            config.api.api_key = argv[++i];
        }
        else if (arg == "--api_url" && i + 1 < argc) {
            config.api.base_url = argv[++i];
        }
        else if (arg == "--model" && i + 1 < argc) {
            config.api.chat_model = argv[++i];
        }
        else if (arg == "--max_tokens" && i + 1 < argc) {
            config.api.max_tokens = std::atoi(argv[++i]);
        }
        else if (arg == "--voice" && i + 1 < argc) {
            config.orchestrator.default_voice = argv[++i];
        }
        else if (arg == "--language" && i + 1 < argc) {
            config.orchestrator.default_language = argv[++i];
        }
        else if (arg == "--sample_rate" && i + 1 < argc) {
            config.session.sample_rate = std::atoi(argv[++i]);
        }
        else if (arg == "--silence_ms" && i + 1 < argc) {
            config.session.vad.silence_threshold_ms = std::atof(argv[++i]);
        }
        else if (arg == "--min_speech_ms" && i + 1 < argc) {
            config.session.vad.min_speech_duration_ms = std::atof(argv[++i]);
        }
        else if (arg == "--energy_threshold" && i + 1 < argc) {
            config.energy_threshold = static_cast<float>(std::atof(argv[++i]));
        }
        else if (arg == "--max_chars" && i + 1 < argc) {
            config.orchestrator.chunker.max_chars = static_cast<size_t>(std::atoi(argv[++i]));
            config.orchestrator.chunker.hard_max_chars = config.orchestrator.chunker.max_chars * 4;
        }
        else if (arg == "--session_id" && i + 1 < argc) {
            session_id = argv[++i];
        }
        else if (arg == "--out" && i + 1 < argc) {
            out_path = argv[++i];
        }
        else if (arg == "--sequential") {
            sequential = true;
        }
        else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    // Replies own stdout unless --out is given; logs move to stderr
    std::streambuf* stdout_buffer = std::cout.rdbuf();
    std::ofstream out_file;
    std::ostream* out = nullptr;
    std::ostream stdout_stream(stdout_buffer);
    if (!out_path.empty()) {
        out_file.open(out_path);
        if (!out_file.is_open()) {
            std::cerr << "Failed to open output file: " << out_path << std::endl;
            return 1;
        }
        out = &out_file;
    } else {
        std::cout.rdbuf(std::cerr.rdbuf());
        out = &stdout_stream;
    }

    auto client = std::make_shared<ApiClient>(config.api);
    if (!client->isConfigured()) {
        std::cerr << "Error: API not configured. Please set API key and URL via:" << std::endl;
        std::cerr << "  1. Command line: --api_key YOUR_KEY --api_url YOUR_URL" << std::endl;
        std::cerr << "  2. Environment variables: export API_KEY=YOUR_KEY API_URL=YOUR_URL" << std::endl;
        std::cerr << "  3. .env file: API_KEY=YOUR_KEY and API_URL=YOUR_URL" << std::endl;
        std::cout.rdbuf(stdout_buffer);
        return 1;
    }

    std::cout << "API configured (" << client->getApiProvider() << "), chat model: "
              << config.api.chat_model << std::endl;

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    int exit_code = 0;
    try {
        Collaborators collaborators;
        collaborators.transcriber = std::make_shared<ApiTranscriber>(client);
        collaborators.generator = std::make_shared<ApiGenerator>(client);
        collaborators.synthesizer = std::make_shared<ApiSynthesizer>(client);
        collaborators.retriever = std::make_shared<NullContextRetriever>();

        TurnOrchestrator orchestrator(collaborators, config.orchestrator);
        ProcessRegistry registry;
        auto classifier = std::make_shared<EnergyVoiceClassifier>(config.energy_threshold);

        std::mutex out_mutex;
        Session session(session_id, orchestrator, registry, classifier,
                        [out, &out_mutex](const json& message) {
                            std::lock_guard<std::mutex> lock(out_mutex);
                            *out << message.dump() << std::endl;
                        },
                        config.session);

        std::string line;
        while (g_running && std::getline(std::cin, line)) {
            if (line.empty()) continue;
            session.handleMessage(line);
            if (sequential) {
                while (g_running && !session.waitForTurn(std::chrono::milliseconds(100))) {
                }
            }
        }

        if (!g_running) {
            std::cout << "\nInterrupt signal received. Stopping..." << std::endl;
            registry.stopAll("Interrupted");
        } else {
            // Input closed: let the running turn finish, then speak the rest
            while (g_running && !session.waitForTurn(std::chrono::milliseconds(100))) {
            }
            session.handleMessage(json{{"type", "end_of_stream"}});
            while (g_running && !session.waitForTurn(std::chrono::milliseconds(100))) {
            }
            if (!g_running) {
                registry.stopAll("Interrupted");
            }
        }
        session.close();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = 1;
    }

    std::cout.rdbuf(stdout_buffer);
    return exit_code;
}

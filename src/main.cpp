#include "audio_capture.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "host_notifier.hpp"
#include "listen_session.hpp"
#include "transcriber.hpp"
#include "utils.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

namespace {
std::atomic<bool> g_interrupted{false};

void handle_sigint(int) {
    g_interrupted = true;
}

class ConsoleNotifier : public HostNotifier {
public:
    bool post(const std::string& text) override {
        std::cout << "[Transcription] " << text << "\n";
        return true;
    }
};
} // namespace

int main() {
    std::signal(SIGINT, handle_sigint);
    apply_log_level_from_env();

    std::cout << "Listing input devices...\n";
    AudioCapture::list_devices();

    const std::string model_path = env_or("MURMUR_VOSK_MODEL", "models/vosk-model-small-en-us-0.15");
    std::vector<std::string> wake_words = parse_wake_words(env_or("MURMUR_WAKE_WORDS", "hey computer"));
    if (wake_words.empty()) {
        std::cerr << "MURMUR_WAKE_WORDS holds no wake words.\n";
        return 1;
    }

    std::unique_ptr<InferenceService> model;
    try {
        model = make_transcriber(model_path);
        std::cout << "Transcription enabled using model: " << model_path << "\n";
    } catch (const ModelLoadError& e) {
        std::cerr << "Transcription unavailable: " << e.what() << "\n";
        return 1;
    }

    ConsoleNotifier console;
    std::unique_ptr<ListenSession> session;
    try {
        session = std::make_unique<ListenSession>(std::unique_ptr<AudioSource>(new AudioCapture(load_audio_config())),
                                                  std::move(model), wake_words, load_session_config(), &console);
    } catch (const MurmurError& e) {
        std::cerr << "Failed to set up listening: " << e.what() << "\n";
        return 1;
    }

    std::atomic<bool> done{false};
    std::thread watcher([&] {
        while (!done) {
            if (g_interrupted) {
                session->stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    std::cout << "\nSay one of:";
    for (const auto& word : wake_words) std::cout << " \"" << word << "\"";
    std::cout << "\nRunning... Press Ctrl+C to quit.\n";

    int status = 0;
    try {
        const std::string transcript = session->run();
        std::cout << "Session transcript: " << (transcript.empty() ? "(nothing recognised)" : transcript) << "\n";
    } catch (const DeviceError& e) {
        std::cerr << "Audio capture failed: " << e.what() << "\n";
        status = 1;
    } catch (const InferenceError& e) {
        std::cerr << "Transcription stopped: " << e.what() << "\n";
        status = 1;
    } catch (const MurmurError& e) {
        std::cerr << "Listening failed: " << e.what() << "\n";
        status = 1;
    }

    done = true;
    watcher.join();
    std::cout << "Exiting.\n";
    return status;
}

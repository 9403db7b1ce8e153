#include "transcriber.hpp"

#include "errors.hpp"
#include "normalizer.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#if defined(MURMUR_WITH_VOSK)
#include <vosk_api.h>
#endif

namespace {

#if defined(MURMUR_WITH_VOSK)
// Pulls the first "text" value out of a Vosk result. With alternatives enabled
// the first one is the best hypothesis.
std::string extract_text_field(const std::string& json) {
    auto pos = json.find("\"text\"");
    if (pos == std::string::npos) return {};
    pos = json.find(':', pos);
    if (pos == std::string::npos) return {};
    pos = json.find('"', pos);
    if (pos == std::string::npos) return {};

    std::string text;
    for (auto i = pos + 1; i < json.size(); ++i) {
        char c = json[i];
        if (c == '\\' && i + 1 < json.size()) {
            text += json[++i];
            continue;
        }
        if (c == '"') return text;
        text += c;
    }
    return {};
}

std::vector<int16_t> float_to_int16(const std::vector<float>& window) {
    std::vector<int16_t> pcm(window.size());
    for (std::size_t i = 0; i < window.size(); ++i) {
        float v = std::max(-1.0f, std::min(1.0f, window[i]));
        pcm[i] = static_cast<int16_t>(std::lround(v * 32767.0f));
    }
    return pcm;
}
#endif

} // namespace

const char* to_string(DecodeStrategy strategy) {
    switch (strategy) {
    case DecodeStrategy::Greedy: return "greedy";
    case DecodeStrategy::Detailed: return "detailed";
    }
    return "unknown";
}

struct Transcriber::Impl {
#if defined(MURMUR_WITH_VOSK)
    VoskModel* model{nullptr};
    VoskRecognizer* recognizer{nullptr};

    Impl(const std::string& model_path, int sample_rate) {
        vosk_set_log_level(log_enabled(LogLevel::Trace) ? 0 : -1);

        model = vosk_model_new(model_path.c_str());
        if (!model) {
            throw ModelLoadError("Failed to load Vosk model at " + model_path);
        }
        recognizer = vosk_recognizer_new(model, static_cast<float>(sample_rate));
        if (!recognizer) {
            vosk_model_free(model);
            model = nullptr;
            throw ModelLoadError("Failed to create Vosk recognizer");
        }
        vosk_recognizer_set_partial_words(recognizer, 0);
        log_info("Transcriber", "Loaded Vosk model: " + model_path);
    }

    ~Impl() {
        if (recognizer) {
            vosk_recognizer_free(recognizer);
            recognizer = nullptr;
        }
        if (model) {
            vosk_model_free(model);
            model = nullptr;
        }
    }

    std::vector<std::string> infer(const std::vector<float>& window, DecodeStrategy strategy) {
        if (!recognizer) {
            throw InferenceError("Vosk recognizer is not initialized", true);
        }

        const bool detailed = strategy == DecodeStrategy::Detailed;
        vosk_recognizer_set_max_alternatives(recognizer, detailed ? 3 : 0);
        vosk_recognizer_set_words(recognizer, detailed ? 1 : 0);

        std::vector<int16_t> pcm = float_to_int16(window);
        int rc = vosk_recognizer_accept_waveform(recognizer,
                                                 reinterpret_cast<const char*>(pcm.data()),
                                                 static_cast<int>(pcm.size() * sizeof(int16_t)));
        if (rc < 0) {
            vosk_recognizer_reset(recognizer);
            throw InferenceError("vosk_recognizer_accept_waveform failed on a " + std::to_string(window.size()) +
                                 " sample window");
        }

        const char* raw = vosk_recognizer_final_result(recognizer);
        std::string json = raw ? raw : "";
        vosk_recognizer_reset(recognizer);

        std::string text = extract_text_field(json);
        if (text.empty()) return {};
        return {text};
    }
#else
    Impl(const std::string&, int) {
        throw ModelLoadError("Vosk support not enabled; rebuild with MURMUR_ENABLE_VOSK=ON");
    }

    std::vector<std::string> infer(const std::vector<float>&, DecodeStrategy) { return {}; }
#endif
};

Transcriber::Transcriber(const std::string& model_path, int sample_rate)
    : impl_(std::make_unique<Impl>(model_path, sample_rate)) {}

Transcriber::~Transcriber() = default;

std::vector<std::string> Transcriber::infer(const std::vector<float>& window, DecodeStrategy strategy) {
    return impl_->infer(window, strategy);
}

std::unique_ptr<InferenceService> make_transcriber(const std::string& model_path) {
    if (model_path.empty()) {
        throw ModelLoadError("Model path is empty");
    }
    return std::make_unique<Transcriber>(model_path, static_cast<int>(kTargetSampleRate));
}

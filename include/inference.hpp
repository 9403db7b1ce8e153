#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

enum class DecodeStrategy {
    Greedy,     // single best hypothesis, used for wake-word checks
    Detailed,   // wider search, used for active transcription
};

const char* to_string(DecodeStrategy strategy);

// Speech-to-text over one window of mono 16 kHz samples. Implementations hold
// mutable decoder state and are not safe for concurrent calls.
class InferenceService {
public:
    virtual ~InferenceService() = default;

    // Throws InferenceError; fatal() is set when the model is unusable.
    virtual std::vector<std::string> infer(const std::vector<float>& window, DecodeStrategy strategy) = 0;
};

// Throws ModelLoadError.
using ModelFactory = std::function<std::unique_ptr<InferenceService>(const std::string& model_path)>;

#pragma once

#include "inference.hpp"

#include <memory>
#include <string>
#include <vector>

// Vosk-backed inference. Requires a build with MURMUR_ENABLE_VOSK=ON; without
// it construction throws ModelLoadError.
class Transcriber : public InferenceService {
public:
    Transcriber(const std::string& model_path, int sample_rate);
    ~Transcriber() override;

    std::vector<std::string> infer(const std::vector<float>& window, DecodeStrategy strategy) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

std::unique_ptr<InferenceService> make_transcriber(const std::string& model_path);

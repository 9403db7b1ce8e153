#pragma once

#include "audio_capture.hpp"
#include "listen_session.hpp"

#include <string>
#include <vector>

// Environment overrides on top of the struct defaults. Values that do not
// parse are reported and ignored.
AudioConfig load_audio_config();
SessionConfig load_session_config();

// MURMUR_LOG_LEVEL, if set.
void apply_log_level_from_env();

// Splits "hey computer, wake up" on commas and trims each word.
std::vector<std::string> parse_wake_words(const std::string& text);

std::string env_or(const char* name, const std::string& fallback);

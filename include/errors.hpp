#pragma once

#include <stdexcept>
#include <string>

class MurmurError : public std::runtime_error {
public:
    explicit MurmurError(const std::string& what) : std::runtime_error(what) {}
};

enum class DeviceErrorKind {
    Unavailable,        // no device, or it could not be opened
    ConfigUnsupported,  // the device refused the requested stream configuration
    StreamFailed,       // the running stream died
};

class DeviceError : public MurmurError {
public:
    DeviceError(DeviceErrorKind kind, const std::string& what)
        : MurmurError(what), kind_(kind) {}

    DeviceErrorKind kind() const { return kind_; }

private:
    DeviceErrorKind kind_;
};

class DeserializeError : public MurmurError {
public:
    explicit DeserializeError(const std::string& what) : MurmurError(what) {}
};

// A fatal InferenceError means the model or its state can no longer be used.
class InferenceError : public MurmurError {
public:
    explicit InferenceError(const std::string& what, bool fatal = false)
        : MurmurError(what), fatal_(fatal) {}

    bool fatal() const { return fatal_; }

private:
    bool fatal_;
};

class ModelLoadError : public MurmurError {
public:
    explicit ModelLoadError(const std::string& what) : MurmurError(what) {}
};

class ConfigError : public MurmurError {
public:
    explicit ConfigError(const std::string& what) : MurmurError(what) {}
};

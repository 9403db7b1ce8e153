#pragma once

#include "murmur.h"

#include <cstdint>
#include <string>

class HostNotifier {
public:
    virtual ~HostNotifier() = default;

    // Returns false when the host rejected the text.
    virtual bool post(const std::string& text) = 0;
};

// Forwards to the function pointer the host registered.
class PortNotifier : public HostNotifier {
public:
    PortNotifier(int64_t port, murmur_post_fn fn);

    bool post(const std::string& text) override;

    int64_t port() const { return port_; }

private:
    int64_t port_;
    murmur_post_fn fn_;
};

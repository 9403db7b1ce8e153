#include "host_notifier.hpp"

#include "utils.hpp"

PortNotifier::PortNotifier(int64_t port, murmur_post_fn fn) : port_(port), fn_(fn) {}

bool PortNotifier::post(const std::string& text) {
    if (!fn_) return false;
    if (fn_(port_, text.c_str(), text.size()) == 0) {
        log_error("Notifier", "host rejected transcript on port " + std::to_string(port_));
        return false;
    }
    log_trace("Notifier", "posted " + std::to_string(text.size()) + " bytes to port " + std::to_string(port_));
    return true;
}

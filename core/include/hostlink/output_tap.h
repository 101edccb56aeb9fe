#pragma once
#include "hostlink/host.h"
#include "hostlink/invocation_registry.h"

#include <atomic>
#include <cstdint>
#include <string>

namespace hostlink {

// Fans host output lines out to the registry's active listeners.
//
// The listener set is copied under the registry lock; pattern evaluation
// happens outside it. A listener finished by another thread between the
// snapshot and the append simply rejects the line.
class OutputTap {
public:
    explicit OutputTap(InvocationRegistry& registry) : registry_(registry) {}
    ~OutputTap();

    OutputTap(const OutputTap&) = delete;
    OutputTap& operator=(const OutputTap&) = delete;

    // Subscribe to `host` output. At most one host at a time.
    void attach(HostAdapter& host);
    void detach();

    void publish(const std::string& line);

    uint64_t lines_seen() const { return lines_seen_.load(); }

private:
    InvocationRegistry& registry_;
    HostAdapter* host_{nullptr};
    int subscription_{-1};
    std::atomic<uint64_t> lines_seen_{0};
};

} // namespace hostlink

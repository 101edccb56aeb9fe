#include "hostlink/output_tap.h"

namespace hostlink {

OutputTap::~OutputTap() {
    detach();
}

void OutputTap::attach(HostAdapter& host) {
    detach();
    host_ = &host;
    subscription_ = host.subscribe_output([this](const std::string& line) { publish(line); });
}

void OutputTap::detach() {
    if (host_ && subscription_ >= 0) host_->unsubscribe_output(subscription_);
    host_ = nullptr;
    subscription_ = -1;
}

void OutputTap::publish(const std::string& line) {
    lines_seen_++;
    auto listeners = registry_.snapshot_listeners();
    for (const auto& l : listeners) {
        if (!registry_.append_line(l.invocation, line)) continue;
        if (!l.patterns) continue;
        for (const auto& re : *l.patterns) {
            if (std::regex_search(line, re)) {
                registry_.finish(l.invocation, InvocationStatus::COMPLETED);
                break;
            }
        }
    }
}

} // namespace hostlink

#include "hostlink/invocation_registry.h"
#include "hostlink/hash.h"
#include "hostlink/text.h"

#include <algorithm>

namespace hostlink {

InvocationHandle InvocationRegistry::begin(const std::string& raw_text, CommandKind kind) {
    auto inv = std::make_shared<CommandInvocation>();
    inv->raw_text = raw_text;
    inv->kind = kind;
    inv->created_at_ms = now_epoch_ms();

    std::lock_guard<std::mutex> lk(mu_);
    int64_t us = std::max(now_epoch_us(), last_issue_us_ + 1);
    last_issue_us_ = us;
    inv->issue_us = us;
    inv->id = "cmd_" + std::to_string(us) + "_" + hash::short_hex(hash::fnv1a64(raw_text), 4);

    by_id_[inv->id] = inv;
    order_.push_back(inv->id);
    return inv;
}

bool InvocationRegistry::attach_listener(OutputListener listener) {
    if (!listener.invocation) return false;
    std::lock_guard<std::mutex> lk(mu_);
    if (listener.invocation->status != InvocationStatus::PENDING) return false;
    const std::string id = listener.invocation->id;
    listeners_[id] = std::move(listener);
    return true;
}

bool InvocationRegistry::append_line(const InvocationHandle& inv, const std::string& line) {
    if (!inv) return false;
    std::lock_guard<std::mutex> lk(mu_);
    if (inv->status != InvocationStatus::PENDING) return false;
    inv->captured_lines.push_back(line);
    return true;
}

bool InvocationRegistry::finish_locked(CommandInvocation& inv, InvocationStatus status, const std::string& error) {
    if (inv.status != InvocationStatus::PENDING) return false;
    if (status == InvocationStatus::PENDING) return false;
    inv.status = status;
    inv.error = error;
    inv.completed_at_ms = now_epoch_ms();
    listeners_.erase(inv.id);
    return true;
}

bool InvocationRegistry::finish(const InvocationHandle& inv, InvocationStatus status, const std::string& error) {
    if (!inv) return false;
    std::lock_guard<std::mutex> lk(mu_);
    return finish_locked(*inv, status, error);
}

InvocationStatus InvocationRegistry::status(const InvocationHandle& inv) const {
    std::lock_guard<std::mutex> lk(mu_);
    return inv ? inv->status : InvocationStatus::FAILED;
}

CommandInvocation InvocationRegistry::read(const InvocationHandle& inv) const {
    std::lock_guard<std::mutex> lk(mu_);
    return inv ? *inv : CommandInvocation{};
}

std::optional<CommandInvocation> InvocationRegistry::get(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = by_id_.find(id);
    if (it == by_id_.end()) return std::nullopt;
    return *it->second;
}

std::vector<CommandInvocation> InvocationRegistry::history() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<CommandInvocation> out;
    out.reserve(order_.size());
    for (const auto& id : order_) {
        auto it = by_id_.find(id);
        if (it != by_id_.end()) out.push_back(*it->second);
    }
    return out;
}

std::vector<OutputListener> InvocationRegistry::snapshot_listeners() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<OutputListener> out;
    out.reserve(listeners_.size());
    for (const auto& kv : listeners_) out.push_back(kv.second);
    std::sort(out.begin(), out.end(), [](const OutputListener& a, const OutputListener& b) {
        return a.invocation->issue_us < b.invocation->issue_us;
    });
    return out;
}

size_t InvocationRegistry::evict(size_t max_history) {
    std::lock_guard<std::mutex> lk(mu_);
    size_t evicted = 0;
    while (order_.size() > max_history) {
        const std::string id = order_.front();
        order_.pop_front();
        auto it = by_id_.find(id);
        if (it != by_id_.end()) {
            finish_locked(*it->second, InvocationStatus::TIMED_OUT, "evicted from history while pending");
            by_id_.erase(it);
        }
        // Orphans left behind by a failed registration heal here too.
        listeners_.erase(id);
        evicted++;
    }
    return evicted;
}

size_t InvocationRegistry::history_size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return order_.size();
}

size_t InvocationRegistry::listener_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return listeners_.size();
}

bool InvocationRegistry::listeners_consistent() const {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& kv : listeners_) {
        if (!kv.second.invocation) return false;
        if (kv.second.invocation->status != InvocationStatus::PENDING) return false;
    }
    return true;
}

InvocationResult to_result(const CommandInvocation& inv) {
    InvocationResult r;
    r.id = inv.id;
    r.command = inv.raw_text;
    r.kind = inv.kind;
    r.status = inv.status;
    r.lines = inv.captured_lines;
    r.output = text::join(inv.captured_lines, "\n");
    r.error = inv.error;
    r.timestamp = inv.created_at_ms / 1000;
    r.success = inv.status == InvocationStatus::COMPLETED || inv.status == InvocationStatus::TIMED_OUT;
    if (inv.completed_at_ms > 0) r.elapsed_ms = inv.completed_at_ms - inv.created_at_ms;
    return r;
}

} // namespace hostlink

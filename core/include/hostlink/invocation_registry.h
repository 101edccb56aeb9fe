#pragma once
#include "hostlink/types.h"

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace hostlink {

// One issued command. Fields are only read or written under the owning
// registry's mutex; use InvocationRegistry::read() for a consistent copy.
struct CommandInvocation {
    std::string id;
    std::string raw_text;
    CommandKind kind{CommandKind::HOST};
    std::vector<std::string> captured_lines;
    InvocationStatus status{InvocationStatus::PENDING};
    std::string error;
    int64_t issue_us{0};
    int64_t created_at_ms{0};
    int64_t completed_at_ms{0};
};

using InvocationHandle = std::shared_ptr<CommandInvocation>;

// Watches host output on behalf of one HOST invocation.
struct OutputListener {
    InvocationHandle invocation;
    std::shared_ptr<const std::vector<std::regex>> patterns;
    int timeout_ms{0};
    std::chrono::steady_clock::time_point started;
};

// History and listener maps of one engine behind a single mutex.
//
// Invariants:
//  - a listener is only ever registered for a PENDING invocation
//  - the transition out of PENDING and the listener removal happen in the
//    same critical section, exactly once per invocation
//  - captured_lines is frozen once status != PENDING
class InvocationRegistry {
public:
    InvocationRegistry() = default;
    InvocationRegistry(const InvocationRegistry&) = delete;
    InvocationRegistry& operator=(const InvocationRegistry&) = delete;

    // Creates a PENDING invocation with a fresh id and records it.
    // Ids are "cmd_<issue_us>_<hash4>"; issue_us strictly increases.
    InvocationHandle begin(const std::string& raw_text, CommandKind kind);

    // Returns false if the invocation is no longer PENDING.
    bool attach_listener(OutputListener listener);

    // Appends while PENDING; returns false (and drops the line) otherwise.
    bool append_line(const InvocationHandle& inv, const std::string& line);

    // PENDING -> `status`. Returns true only for the call that made the
    // transition; the listener (if any) is removed in the same step.
    bool finish(const InvocationHandle& inv, InvocationStatus status, const std::string& error = "");

    InvocationStatus status(const InvocationHandle& inv) const;
    CommandInvocation read(const InvocationHandle& inv) const;

    std::optional<CommandInvocation> get(const std::string& id) const;
    // Oldest first.
    std::vector<CommandInvocation> history() const;

    std::vector<OutputListener> snapshot_listeners() const;

    // Drops the oldest entries until at most `max_history` remain. A pending
    // victim loses its listener and ends TIMED_OUT with what it has so far.
    // Returns the number of evicted entries.
    size_t evict(size_t max_history);

    size_t history_size() const;
    size_t listener_count() const;

    // True when every registered listener belongs to a PENDING invocation.
    bool listeners_consistent() const;

private:
    bool finish_locked(CommandInvocation& inv, InvocationStatus status, const std::string& error);

    mutable std::mutex mu_;
    std::unordered_map<std::string, InvocationHandle> by_id_;
    std::deque<std::string> order_;
    std::unordered_map<std::string, OutputListener> listeners_;
    int64_t last_issue_us_{0};
};

// Formats an invocation for callers (lines joined with '\n').
InvocationResult to_result(const CommandInvocation& inv);

} // namespace hostlink

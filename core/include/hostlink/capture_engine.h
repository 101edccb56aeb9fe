#pragma once
#include "hostlink/catalog.h"
#include "hostlink/host.h"
#include "hostlink/invocation_registry.h"
#include "hostlink/log.h"
#include "hostlink/output_tap.h"
#include "hostlink/types.h"

#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace hostlink {

// Decides whether a CONTROL reply means "command not recognized".
class UnknownCommandMatcher {
public:
    virtual ~UnknownCommandMatcher() = default;
    virtual bool matches(const std::vector<std::string>& lines) const = 0;
};

// Any line containing one of the markers counts.
class SubstringUnknownMatcher : public UnknownCommandMatcher {
public:
    SubstringUnknownMatcher();
    explicit SubstringUnknownMatcher(std::vector<std::string> markers);
    bool matches(const std::vector<std::string>& lines) const override;

private:
    std::vector<std::string> markers_;
};

// Ordered completion patterns for HOST commands: console timestamps,
// error replies, the player-list banner and the startup "Done" banner.
std::vector<std::string> default_completion_patterns();

constexpr const char* kNoUsableResponse =
    "(no usable response: the command was not recognized and has no subcommands)";

struct EngineOptions {
    int timeout_ms{10000};
    int poll_ms{100};
    size_t max_history{100};
    std::vector<std::string> completion_patterns{default_completion_patterns()};
};

// Command Response Capture and Correlation Engine.
//
// invoke() blocks the calling worker until the command completes or its
// budget runs out. Safe to call from several threads at once.
class CaptureEngine {
public:
    // Throws std::regex_error if a completion pattern does not compile.
    CaptureEngine(HostAdapter& host, const CatalogIntrospector& catalog, EngineOptions opts = {});
    ~CaptureEngine();

    CaptureEngine(const CaptureEngine&) = delete;
    CaptureEngine& operator=(const CaptureEngine&) = delete;

    InvocationResult invoke(const std::string& command_text);
    // timeout_ms <= 0 uses the engine default.
    InvocationResult invoke(const std::string& command_text, int timeout_ms);

    std::optional<InvocationResult> lookup(const std::string& id) const;
    std::vector<InvocationResult> history() const;

    void set_unknown_matcher(std::unique_ptr<UnknownCommandMatcher> m);
    bool is_unknown_reply(const std::vector<std::string>& lines) const;

    // Not owned; may be null.
    void set_audit_logger(JsonlLogger* logger) { audit_ = logger; }

    InvocationRegistry& registry() { return registry_; }
    const InvocationRegistry& registry() const { return registry_; }
    OutputTap& tap() { return tap_; }
    const EngineOptions& options() const { return opts_; }

private:
    void run_control(const InvocationHandle& inv);
    void run_host(const InvocationHandle& inv, int timeout_ms);
    void audit_invoke(const CommandInvocation& inv);
    void audit_complete(const InvocationResult& r);

    HostAdapter& host_;
    const CatalogIntrospector& catalog_;
    EngineOptions opts_;
    std::shared_ptr<const std::vector<std::regex>> patterns_;

    InvocationRegistry registry_;
    OutputTap tap_;

    mutable std::mutex matcher_mu_;
    std::unique_ptr<UnknownCommandMatcher> unknown_;

    JsonlLogger* audit_{nullptr};
};

} // namespace hostlink

#include "hostlink/capture_engine.h"
#include "hostlink/json_mini.h"
#include "hostlink/text.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>
#include <thread>

namespace hostlink {

SubstringUnknownMatcher::SubstringUnknownMatcher()
    : markers_{"Unknown command", "Incomplete command", "Unknown or incomplete command"} {}

SubstringUnknownMatcher::SubstringUnknownMatcher(std::vector<std::string> markers)
    : markers_(std::move(markers)) {}

bool SubstringUnknownMatcher::matches(const std::vector<std::string>& lines) const {
    for (const auto& l : lines) {
        for (const auto& m : markers_) {
            if (text::contains(l, m)) return true;
        }
    }
    return false;
}

std::vector<std::string> default_completion_patterns() {
    return {
        R"(\[Server\] \[\d{2}:\d{2}:\d{2}\] \[Server thread/INFO\])",
        R"(^\[\d{2}:\d{2}:\d{2}\] \[Server thread/INFO\])",
        R"(Unknown command)",
        R"(Usage:)",
        R"(Syntax error)",
        R"(Cannot execute command|You do not have permission)",
        R"(No player was found|That player does not exist)",
        R"(There are \d+ of a max of \d+ players online)",
        R"(Done \(\d+\.\d+s\)!)",
    };
}

namespace {

// Reply sink for the CONTROL path: strips formatting, splits multi-line
// replies and appends to the invocation while it is still pending.
class RegistryReplySink : public ReplySink {
public:
    RegistryReplySink(InvocationRegistry& reg, InvocationHandle inv) : reg_(reg), inv_(std::move(inv)) {}

    void append(const std::string& reply) override {
        size_t start = 0;
        while (start <= reply.size()) {
            size_t nl = reply.find('\n', start);
            if (nl == std::string::npos) nl = reply.size();
            std::string line = text::strip_formatting(reply.substr(start, nl - start));
            if (!text::trim(line).empty()) (void)reg_.append_line(inv_, line);
            start = nl + 1;
        }
    }

private:
    InvocationRegistry& reg_;
    InvocationHandle inv_;
};

// Guarantees the invocation leaves PENDING on every exit path.
struct FinishGuard {
    InvocationRegistry& reg;
    InvocationHandle inv;
    ~FinishGuard() { reg.finish(inv, InvocationStatus::FAILED, "invocation aborted"); }
};

} // namespace

CaptureEngine::CaptureEngine(HostAdapter& host, const CatalogIntrospector& catalog, EngineOptions opts)
    : host_(host),
      catalog_(catalog),
      opts_(std::move(opts)),
      tap_(registry_),
      unknown_(std::make_unique<SubstringUnknownMatcher>()) {
    if (opts_.timeout_ms <= 0) opts_.timeout_ms = 10000;
    if (opts_.poll_ms <= 0) opts_.poll_ms = 100;
    if (opts_.max_history == 0) opts_.max_history = 1;

    auto compiled = std::make_shared<std::vector<std::regex>>();
    for (const auto& p : opts_.completion_patterns) {
        compiled->emplace_back(p, std::regex::ECMAScript);
    }
    patterns_ = compiled;

    tap_.attach(host_);
}

CaptureEngine::~CaptureEngine() {
    tap_.detach();
}

void CaptureEngine::set_unknown_matcher(std::unique_ptr<UnknownCommandMatcher> m) {
    std::lock_guard<std::mutex> lk(matcher_mu_);
    if (m) unknown_ = std::move(m);
}

bool CaptureEngine::is_unknown_reply(const std::vector<std::string>& lines) const {
    std::lock_guard<std::mutex> lk(matcher_mu_);
    return unknown_ && unknown_->matches(lines);
}

InvocationResult CaptureEngine::invoke(const std::string& command_text) {
    return invoke(command_text, opts_.timeout_ms);
}

InvocationResult CaptureEngine::invoke(const std::string& command_text, int timeout_ms) {
    if (timeout_ms <= 0) timeout_ms = opts_.timeout_ms;

    const CommandKind kind = classify_command(command_text);
    InvocationHandle inv = registry_.begin(command_text, kind);
    audit_invoke(registry_.read(inv));

    {
        FinishGuard guard{registry_, inv};
        try {
            if (kind == CommandKind::CONTROL) run_control(inv);
            else run_host(inv, timeout_ms);
        } catch (const std::exception& e) {
            std::cerr << "[engine] " << inv->id << " failed: " << e.what() << "\n";
            registry_.finish(inv, InvocationStatus::FAILED, e.what());
        } catch (...) {
            std::cerr << "[engine] " << inv->id << " failed: non-standard exception from host\n";
            registry_.finish(inv, InvocationStatus::FAILED, "unknown host error");
        }
    }

    InvocationResult r = to_result(registry_.read(inv));
    registry_.evict(opts_.max_history);
    audit_complete(r);
    return r;
}

void CaptureEngine::run_control(const InvocationHandle& inv) {
    RegistryReplySink sink(registry_, inv);
    host_.execute_admin(inv->raw_text, sink);

    std::vector<std::string> lines = registry_.read(inv).captured_lines;
    if (is_unknown_reply(lines)) {
        auto children = catalog_.children_of(inv->raw_text);
        if (children.empty()) {
            registry_.append_line(inv, kNoUsableResponse);
        } else {
            registry_.append_line(inv, "The command returned no result; its subcommands are:");
            for (const auto& c : children) {
                std::string entry = "  " + c.path;
                if (!c.description.empty()) entry += " - " + c.description;
                registry_.append_line(inv, entry);
            }
        }
    }
    registry_.finish(inv, InvocationStatus::COMPLETED);
}

void CaptureEngine::run_host(const InvocationHandle& inv, int timeout_ms) {
    std::string cmd = inv->raw_text;
    if (!cmd.empty() && cmd[0] == '/') cmd.erase(0, 1);

    OutputListener l;
    l.invocation = inv;
    l.patterns = patterns_;
    l.timeout_ms = timeout_ms;
    l.started = std::chrono::steady_clock::now();
    if (!registry_.attach_listener(l)) {
        std::cerr << "[engine] " << inv->id << " listener registration rejected\n";
    }

    host_.execute_raw(cmd);

    const auto deadline = l.started + std::chrono::milliseconds(timeout_ms);
    while (registry_.status(inv) == InvocationStatus::PENDING) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            registry_.finish(inv, InvocationStatus::TIMED_OUT);
            break;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(opts_.poll_ms)));
    }
}

std::optional<InvocationResult> CaptureEngine::lookup(const std::string& id) const {
    auto inv = registry_.get(id);
    if (!inv) return std::nullopt;
    return to_result(*inv);
}

std::vector<InvocationResult> CaptureEngine::history() const {
    std::vector<InvocationResult> out;
    for (const auto& inv : registry_.history()) out.push_back(to_result(inv));
    return out;
}

void CaptureEngine::audit_invoke(const CommandInvocation& inv) {
    if (!audit_) return;
    json_mini::Doc p(json_object_new_object());
    json_mini::put_string(p.root, "id", inv.id);
    json_mini::put_string(p.root, "command", inv.raw_text);
    json_mini::put_string(p.root, "kind", command_kind_name(inv.kind));
    audit_->event("invoke", json_mini::to_string(p.root));
}

void CaptureEngine::audit_complete(const InvocationResult& r) {
    if (!audit_) return;
    json_mini::Doc p(json_object_new_object());
    json_mini::put_string(p.root, "id", r.id);
    json_mini::put_string(p.root, "status", invocation_status_name(r.status));
    json_mini::put_bool(p.root, "success", r.success);
    json_mini::put_int(p.root, "elapsed_ms", r.elapsed_ms);
    json_object_object_add(p.root, "lines", json_mini::new_string_array(r.lines));
    if (!r.error.empty()) json_mini::put_string(p.root, "error", r.error);
    audit_->event("complete", json_mini::to_string(p.root));
}

} // namespace hostlink

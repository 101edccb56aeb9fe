#include "test_common.h"
#include "fake_host.h"

#include "hostlink/capture_engine.h"
#include "hostlink/catalog.h"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace hostlink;

static EngineOptions fast_options(size_t max_history = 100) {
    EngineOptions o;
    o.timeout_ms = 400;
    o.poll_ms = 10;
    o.max_history = max_history;
    return o;
}

static void control_reply_is_captured_synchronously() {
    FakeHost host;
    CatalogIntrospector catalog(host);
    CaptureEngine engine(host, catalog, fast_options());

    InvocationResult r = engine.invoke("!!hl status");
    expect_true(r.success, "control command should succeed");
    expect_true(r.kind == CommandKind::CONTROL, "!! prefix should classify as control");
    expect_true(r.status == InvocationStatus::COMPLETED, "control command should complete");
    expect_eq_ll((long long)r.lines.size(), 1, "one reply line");
    expect_eq_str(r.lines[0], "Bridge online", "formatting codes should be stripped");
    expect_true(host.raw_commands().empty(), "control command must not reach the console");
}

static void unknown_control_lists_subcommands() {
    FakeHost host;
    CatalogIntrospector catalog(host);
    CaptureEngine engine(host, catalog, fast_options());

    InvocationResult r = engine.invoke("!!bogus");
    expect_true(r.success, "unknown control command still succeeds");
    expect_contains(r.output, "Incomplete command", "interpreter reply kept");
    expect_contains(r.output, "!!bogus alpha - First child", "alpha listed");
    expect_contains(r.output, "!!bogus beta - Second child", "beta listed");
    expect_true(engine.is_unknown_reply(r.lines), "reply should read as unknown");

    // Nothing registered under this root at all.
    InvocationResult r2 = engine.invoke("!!nothing here");
    expect_true(r2.success, "unrecognized root still succeeds");
    expect_contains(r2.output, kNoUsableResponse, "no-usable-response marker expected");

    // Longest matching prefix: children of the argument node.
    InvocationResult r3 = engine.invoke("!!warp home bogus");
    expect_contains(r3.output, "!!warp <name> confirm", "children of the argument node expected");
}

static void host_command_completes_on_pattern() {
    FakeHost host;
    CatalogIntrospector catalog(host);
    EngineOptions o = fast_options();
    o.timeout_ms = 3000;
    CaptureEngine engine(host, catalog, o);

    host.on_raw([](const std::string& cmd, FakeHost& h) {
        if (cmd == "list") {
            h.emit_later({"There are 2 of a max of 20 players online: alex, sam"}, 30);
        }
    });

    auto t0 = std::chrono::steady_clock::now();
    InvocationResult r = engine.invoke("/list");
    auto took = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
    host.join_emitters();

    expect_true(r.success, "list should succeed");
    expect_true(r.kind == CommandKind::HOST, "list is a host command");
    expect_true(r.status == InvocationStatus::COMPLETED, "banner should complete the invocation");
    expect_true(took < 2500, "completion should beat the timeout budget");
    expect_eq_str(r.command, "/list", "command is reported as submitted");
    auto raw = host.raw_commands();
    expect_eq_ll((long long)raw.size(), 1, "one console line");
    expect_eq_str(raw[0], "list", "leading slash stripped before submission");
    expect_eq_ll((long long)r.lines.size(), 1, "banner captured");
}

static void host_timeout_keeps_partial_output_in_order() {
    FakeHost host;
    CatalogIntrospector catalog(host);
    CaptureEngine engine(host, catalog, fast_options());

    host.on_raw([](const std::string&, FakeHost& h) {
        h.emit("line one");
        h.emit("line two");
        h.emit("line three");
    });

    InvocationResult r = engine.invoke("say hello", 150);
    expect_true(r.status == InvocationStatus::TIMED_OUT, "no pattern matched: timed out");
    expect_true(r.success, "timeout with partial output is still success");
    expect_eq_ll((long long)r.lines.size(), 3, "all lines captured");
    expect_eq_str(r.lines[0], "line one", "order kept (0)");
    expect_eq_str(r.lines[2], "line three", "order kept (2)");
    expect_eq_str(r.output, "line one\nline two\nline three", "output joins lines");
    expect_true(r.elapsed_ms >= 140, "waited for the budget");

    // Lines after the terminal state are not appended.
    host.emit("late line");
    auto again = engine.lookup(r.id);
    expect_true(again.has_value(), "lookup by id");
    expect_eq_ll((long long)again->lines.size(), 3, "captured lines are frozen");
}

static void host_failure_reports_id() {
    FakeHost host;
    CatalogIntrospector catalog(host);
    CaptureEngine engine(host, catalog, fast_options());

    host.fail_raw = true;
    InvocationResult r = engine.invoke("weather clear");
    expect_true(!r.success, "submission failure is not success");
    expect_true(r.status == InvocationStatus::FAILED, "status failed");
    expect_true(!r.id.empty(), "id is still issued");
    expect_contains(r.error, "console closed", "error text from the host");
    expect_eq_ll((long long)engine.registry().listener_count(), 0, "listener removed on failure");

    host.fail_raw = false;
    host.fail_admin = true;
    InvocationResult c = engine.invoke("!!hl status");
    expect_true(!c.success && c.status == InvocationStatus::FAILED, "admin failure is failed");
}

static void history_is_bounded() {
    FakeHost host;
    CatalogIntrospector catalog(host);
    CaptureEngine engine(host, catalog, fast_options(5));

    std::vector<std::string> ids;
    for (int i = 0; i < 8; i++) ids.push_back(engine.invoke("!!hl status").id);

    auto hist = engine.history();
    expect_eq_ll((long long)hist.size(), 5, "history bounded by max_history");
    expect_eq_str(hist.front().id, ids[3], "oldest entries evicted first");
    expect_eq_str(hist.back().id, ids[7], "newest kept");
    expect_true(!engine.lookup(ids[0]).has_value(), "evicted id is forgotten");
    for (size_t i = 1; i < ids.size(); i++) {
        expect_true(ids[i] != ids[i - 1], "ids are unique");
    }
}

static void concurrent_invocations_stay_consistent() {
    FakeHost host;
    CatalogIntrospector catalog(host);
    CaptureEngine engine(host, catalog, fast_options(50));

    host.on_raw([](const std::string& cmd, FakeHost& h) {
        if (cmd == "list") h.emit("There are 0 of a max of 20 players online");
    });

    std::vector<std::thread> ts;
    for (int t = 0; t < 4; t++) {
        ts.emplace_back([&engine, t] {
            for (int i = 0; i < 10; i++) {
                if ((i + t) % 3 == 0) engine.invoke("!!hl status");
                else engine.invoke("list");
            }
        });
    }
    for (auto& t : ts) t.join();

    expect_true(engine.registry().listeners_consistent(), "listeners only for pending invocations");
    expect_eq_ll((long long)engine.registry().listener_count(), 0, "no listener outlives its invocation");
    expect_eq_ll((long long)engine.history().size(), 40, "every invocation recorded");
    for (const auto& r : engine.history()) {
        expect_true(r.status != InvocationStatus::PENDING, "nothing left pending");
    }
}

static void introspection_failure_still_answers() {
    FakeHost host;
    CatalogIntrospector catalog(host);
    CaptureEngine engine(host, catalog, fast_options());

    host.fail_roots = true;
    InvocationResult r = engine.invoke("!!bogus");
    expect_true(r.success, "unknown reply with broken introspection still succeeds");
    expect_contains(r.output, kNoUsableResponse, "falls back to the marker");
}

static void non_standard_throw_fails_the_invocation() {
    FakeHost host;
    CatalogIntrospector catalog(host);
    CaptureEngine engine(host, catalog, fast_options());

    CommandNode boom = CommandNode::literal("!!boom", "Throws", [](ReplySink&, const std::vector<std::string>&) {
        throw 42;
    });
    host.admin.register_root({"boom", "Boom", boom});
    host.on_raw([](const std::string& cmd, FakeHost&) {
        if (cmd == "crash") throw 7;
    });

    InvocationResult r = engine.invoke("!!boom");
    expect_true(!r.success, "throwing handler fails the invocation");
    expect_true(r.status == InvocationStatus::FAILED, "status FAILED");
    expect_eq_str(r.error, "unknown host error", "generic error text");
    expect_true(engine.lookup(r.id).has_value(), "failed invocation remembered");

    InvocationResult h = engine.invoke("crash");
    expect_true(h.status == InvocationStatus::FAILED, "console path fails too");
    expect_eq_str(h.error, "unknown host error", "generic error text on the console path");
    expect_eq_ll((long long)engine.registry().listener_count(), 0, "listener removed after the throw");
}

int main() {
    control_reply_is_captured_synchronously();
    unknown_control_lists_subcommands();
    host_command_completes_on_pattern();
    host_timeout_keeps_partial_output_in_order();
    host_failure_reports_id();
    history_is_bounded();
    concurrent_invocations_stay_consistent();
    introspection_failure_still_answers();
    non_standard_throw_fails_the_invocation();

    std::cerr << "test_capture_engine: ALL PASSED" << std::endl;
    return 0;
}

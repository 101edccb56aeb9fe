#include "test_common.h"

#include "hostlink/capture_engine.h"
#include "hostlink/catalog.h"
#include "hostlink/log_store.h"
#include "hostlink/process_host.h"
#include "hostlink/types.h"

#include <algorithm>
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <vector>

using namespace hostlink;

// Minimal console that behaves like a game server's stdin/stdout loop.
static const char* kScript =
    "echo 'Starting test host'\n"
    "echo 'Done (0.10s)! For help, type \"help\"'\n"
    "while read line; do\n"
    "  case \"$line\" in\n"
    "    stop) echo 'Stopping the server'; exit 0 ;;\n"
    "    list) echo 'There are 0 of a max of 20 players online:' ;;\n"
    "    *) echo \"echo: $line\" ;;\n"
    "  esac\n"
    "done\n";

static bool wait_for(const std::function<bool()>& cond, int ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
    while (!cond()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

int main() {
    // No argv configured.
    {
        ProcessHost idle(ProcessHostOptions{}, nullptr);
        std::string err;
        expect_true(!idle.start(&err), "start without argv fails");
        expect_contains(err, "no host command", "error explains why");
        bool threw = false;
        try {
            idle.execute_raw("list");
        } catch (const HostError&) {
            threw = true;
        }
        expect_true(threw, "raw command on a stopped host throws");
    }

    MemoryLogStore logs(200);
    ProcessHostOptions opts;
    opts.argv = {"/bin/sh", "-c", kScript};
    opts.stop_timeout_ms = 3000;
    ProcessHost host(opts, &logs);

    std::string err;
    expect_true(host.start(&err), "start: " + err);
    expect_true(host.is_running(), "running after start");
    expect_true(host.pid() > 0, "pid recorded");
    expect_true(wait_for([&] { return host.startup_done(); }, 5000), "startup banner seen");

    {
        CatalogIntrospector catalog(host);
        EngineOptions eo;
        eo.timeout_ms = 3000;
        eo.poll_ms = 10;
        CaptureEngine engine(host, catalog, eo);
        host.set_history_provider([&engine] {
            std::vector<std::string> out;
            for (const auto& r : engine.history()) {
                out.push_back(r.id + " [" + invocation_status_name(r.status) + "] " + r.command);
            }
            return out;
        });

        InvocationResult list = engine.invoke("/list");
        expect_true(list.status == InvocationStatus::COMPLETED, "list completed by banner");
        expect_contains(list.output, "There are 0 of a max of 20 players online", "banner captured");
        expect_true(list.elapsed_ms < 3000, "completed before the budget");

        InvocationResult echo = engine.invoke("say hello", 300);
        expect_true(echo.status == InvocationStatus::TIMED_OUT, "no completion pattern");
        expect_true(echo.success, "timed out still succeeds");
        expect_eq_str(echo.lines.at(0), "echo: say hello", "console echo captured");

        InvocationResult status = engine.invoke("!!hl status");
        expect_true(status.kind == CommandKind::CONTROL, "control command");
        expect_contains(status.output, "Hostlink bridge is online", "status reply");
        expect_contains(status.output, "running (pid", "reports the child");

        InvocationResult owners = engine.invoke("!!hl owner list");
        expect_contains(owners.output, "- hostlink (Hostlink): !!hl", "builtin owner listed");

        InvocationResult hist = engine.invoke("!!hl history 2");
        expect_contains(hist.output, "Recent commands:", "history header");
        expect_contains(hist.output, "[completed] !!hl owner list", "latest entry shown");
        expect_true(hist.output.find("/list") == std::string::npos, "count limits the entries");

        InvocationResult bad = engine.invoke("!!hl frobnicate");
        expect_contains(bad.output, "!!hl status", "unknown subcommand lists children");

        auto snap = logs.snapshot();
        bool saw_cmd = std::any_of(snap.begin(), snap.end(), [](const LogLine& l) {
            return l.is_command && l.content == "list" && l.source == "command";
        });
        bool saw_admin = std::any_of(snap.begin(), snap.end(), [](const LogLine& l) {
            return l.source == "admin" && l.content == "Hostlink bridge is online";
        });
        bool saw_host = std::any_of(snap.begin(), snap.end(), [](const LogLine& l) {
            return l.source == "host" && l.content == "Starting test host";
        });
        expect_true(saw_cmd, "console command logged");
        expect_true(saw_admin, "admin reply logged");
        expect_true(saw_host, "host output logged");

        host.set_history_provider({});
    }

    host.stop();
    expect_true(!host.is_running(), "stopped");
    expect_eq_ll(host.last_exit_code(), 0, "clean exit through the stop command");

    bool threw = false;
    try {
        host.execute_raw("list");
    } catch (const HostError&) {
        threw = true;
    }
    expect_true(threw, "raw command after stop throws");

    // Restart brings a fresh child up.
    expect_true(host.restart(&err), "restart: " + err);
    expect_true(wait_for([&] { return host.startup_done(); }, 5000), "startup banner after restart");
    host.stop();
    expect_true(!host.is_running(), "stopped again");

    std::cerr << "test_process_host: ALL PASSED" << std::endl;
    return 0;
}

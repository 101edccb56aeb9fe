#include "test_common.h"

#include "runner_utils.h"

#include <string>
#include <vector>

using namespace hostlink;

int main() {
    // Split at "--".
    {
        const char* argv[] = {"hostlink_cli", "serve", "--port", "9000", "--", "java", "-jar", "server.jar", "--", "nogui"};
        CliSplit s = split_cli(10, const_cast<char**>(argv), 2);
        expect_eq_ll((long long)s.flags.size(), 2, "flags before --");
        expect_eq_ll((long long)s.host_argv.size(), 5, "everything after the first -- is host argv");
        expect_eq_str(s.host_argv[0], "java", "host executable");
        expect_eq_str(s.host_argv[3], "--", "later -- kept verbatim");
    }

    // Overrides on top of the environment config.
    {
        ServerConfig cfg;
        std::vector<std::string> rest;
        std::string err;
        bool ok = apply_cli_overrides(cfg,
            {"--host", "0.0.0.0", "--port", "9100", "--allow", "10.0.0.1,10.0.0.2", "--workers", "4",
             "--timeout_ms", "2500", "--audit", "/tmp/a.jsonl", "--verbose"},
            &rest, &err);
        expect_true(ok, "overrides apply: " + err);
        expect_eq_str(cfg.host, "0.0.0.0", "host");
        expect_eq_ll(cfg.port, 9100, "port");
        expect_eq_ll((long long)cfg.allowed_ips.size(), 2, "allow list");
        expect_eq_ll(cfg.workers, 4, "workers");
        expect_eq_ll(cfg.cmd_timeout_ms, 2500, "timeout");
        expect_eq_str(cfg.audit_log, "/tmp/a.jsonl", "audit");
        expect_eq_ll((long long)rest.size(), 1, "unknown flag passed through");
        expect_eq_str(rest[0], "--verbose", "unknown flag");
    }

    // Malformed values are rejected with a message.
    {
        ServerConfig cfg;
        std::string err;
        expect_true(!apply_cli_overrides(cfg, {"--port", "70000"}, nullptr, &err), "port out of range");
        expect_contains(err, "--port", "error names the flag");
        expect_true(!apply_cli_overrides(cfg, {"--workers", "two"}, nullptr, &err), "non-numeric workers");
        expect_true(!apply_cli_overrides(cfg, {"--allow", " , "}, nullptr, &err), "empty allow list");

        std::vector<std::string> rest;
        expect_true(apply_cli_overrides(cfg, {"--port"}, &rest, &err), "flag without value is left over");
        expect_eq_str(rest.at(0), "--port", "dangling flag reported back");
    }

    // Bridge wiring without a managed process.
    {
        ServerConfig cfg;
        cfg.cmd_timeout_ms = 200;
        auto bridge = build_bridge(cfg, {});
        expect_true(!bridge->host->is_running(), "no process without argv");
        InvocationResult r = bridge->engine->invoke("!!hl history");
        expect_contains(r.output, "Recent commands:", "history provider wired to the engine");
        InvocationResult raw = bridge->engine->invoke("list");
        expect_true(!raw.success, "console command fails while the host is down");
        expect_contains(raw.error, "not running", "host error surfaced");
    }

    expect_true(gen_session_id().size() >= 16, "session id");
    expect_true(gen_session_id() != gen_session_id(), "session ids differ");

    std::cerr << "test_cli_overrides: ALL PASSED" << std::endl;
    return 0;
}

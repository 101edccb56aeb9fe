#include "cmd_serve.h"
#include "runner_utils.h"

#include "hostlink/config.h"
#include "hostlink/dispatcher.h"
#include "hostlink/text.h"
#include "hostlink/tool_service.h"
#include "hostlink/tool_synth.h"
#include "hostlink/worker_pool.h"
#include "hostlink/ws_server.h"

#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>

using namespace hostlink;

static std::atomic<bool> g_serve_running{true};

int cmd_serve(int argc, char** argv) {
    // Ignore SIGPIPE: writing to a dead child or a dropped client must not kill us
    ::signal(SIGPIPE, SIG_IGN);

    const Profile profile = detect_profile();
    apply_profile_defaults(profile);
    ServerConfig cfg = load_server_config();

    CliSplit split = split_cli(argc, argv, 2);
    std::vector<std::string> unknown;
    std::string err;
    if (!apply_cli_overrides(cfg, split.flags, &unknown, &err)) {
        std::cerr << "[serve] " << err << "\n";
        return 2;
    }
    if (!unknown.empty()) {
        std::cerr << "[serve] unknown argument: " << unknown.front() << "\n";
        std::cerr << "usage: hostlink_cli serve [--host H] [--port P] [--allow IPS] [--workers N] "
                     "[--timeout_ms MS] [--audit PATH] [-- <server argv...>]\n";
        return 2;
    }

    std::unique_ptr<BridgeStack> stack;
    try {
        stack = build_bridge(cfg, split.host_argv);
    } catch (const std::exception& e) {
        std::cerr << "[serve] " << e.what() << "\n";
        return 1;
    }

    if (!split.host_argv.empty()) {
        if (!stack->host->start(&err)) {
            std::cerr << "[serve] cannot start host: " << err << "\n";
            return 1;
        }
    } else {
        std::cerr << "[serve] no server command given; only administrative commands are available\n";
    }

    ToolSynthesizer synth(*stack->catalog);
    ToolService service(*stack->engine, *stack->catalog, synth, *stack->host, stack->logs.get(), cfg.dynamic_tools);
    McpDispatcher dispatcher(service);

    WorkerPool pool(cfg.workers);

    WsServerOptions wo;
    wo.host = cfg.host;
    wo.port = (uint16_t)cfg.port;
    wo.allowed_ips = cfg.allowed_ips;
    wo.max_message_bytes = cfg.max_message_bytes;
    wo.stop_wait_ms = cfg.stop_wait_ms;
    WsServer ws(wo, pool,
                [&dispatcher](const std::string& frame) { return dispatcher.handle(frame); },
                &McpDispatcher::may_block);

    try {
        ws.start();
    } catch (const std::exception& e) {
        std::cerr << "[serve] " << e.what() << "\n";
        pool.shutdown();
        stack->host->stop();
        return 1;
    }

    std::cerr << "[serve] profile=" << profile_name(profile)
              << " workers=" << cfg.workers
              << " timeout_ms=" << cfg.cmd_timeout_ms
              << " allow=" << text::join(cfg.allowed_ips, ",")
              << (cfg.audit_log.empty() ? "" : " audit=" + cfg.audit_log) << "\n";

    g_serve_running.store(true);
    std::signal(SIGTERM, [](int) { g_serve_running.store(false); });
    std::signal(SIGINT,  [](int) { g_serve_running.store(false); });

    while (g_serve_running.load()) {
        sleep_ms(100);
    }

    std::cerr << "[serve] shutting down\n";
    ws.stop();
    size_t dropped = pool.shutdown();
    if (dropped > 0) std::cerr << "[serve] dropped " << dropped << " queued request(s)\n";
    stack->host->stop();
    return 0;
}

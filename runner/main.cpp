#include "cmd_serve.h"
#include "runner_utils.h"

#include "hostlink/config.h"
#include "hostlink/json_mini.h"
#include "hostlink/stdio_bridge.h"
#include "hostlink/tool_service.h"
#include "hostlink/tool_synth.h"

#include <csignal>
#include <exception>
#include <iostream>
#include <optional>
#include <string>

using namespace hostlink;

// One-shot invocation against a freshly started server.
// Usage: hostlink_cli exec <command> [--timeout_ms N] [--startup_ms N] [-- <server argv...>]
// Prints the invocation result JSON to stdout.
static int cmd_exec(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: hostlink_cli exec <command> [--timeout_ms N] [--startup_ms N] [-- <server argv...>]\n";
        return 2;
    }
    ::signal(SIGPIPE, SIG_IGN);

    apply_profile_defaults(detect_profile());
    ServerConfig cfg = load_server_config();

    const std::string command = argv[2];
    CliSplit split = split_cli(argc, argv, 3);
    std::vector<std::string> rest;
    std::string err;
    if (!apply_cli_overrides(cfg, split.flags, &rest, &err)) {
        std::cerr << err << "\n";
        return 2;
    }
    int startup_ms = 0;
    for (size_t i = 0; i < rest.size(); i++) {
        if (rest[i] == "--startup_ms" && i + 1 < rest.size()) {
            try {
                startup_ms = std::stoi(rest[++i]);
            } catch (const std::exception&) {
                std::cerr << "--startup_ms expects an integer\n";
                return 2;
            }
            continue;
        }
        std::cerr << "unknown argument: " << rest[i] << "\n";
        return 2;
    }

    std::unique_ptr<BridgeStack> stack;
    try {
        stack = build_bridge(cfg, split.host_argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    if (!split.host_argv.empty()) {
        if (!stack->host->start(&err)) {
            std::cerr << "cannot start host: " << err << "\n";
            return 1;
        }
        // Optionally let the server finish booting before the command goes in.
        for (int waited = 0; waited < startup_ms && !stack->host->startup_done(); waited += 50) {
            sleep_ms(50);
        }
    }

    InvocationResult r = stack->engine->invoke(command);
    json_mini::Doc out = invocation_to_json(r);
    std::cout << json_mini::to_string(out.root, true) << "\n";

    stack->host->stop();
    return r.success ? 0 : 1;
}

// Prints the command catalog as JSON.
// Usage: hostlink_cli catalog [--owner ID]
static int cmd_catalog(int argc, char** argv) {
    std::optional<std::string> owner;
    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--owner" && i + 1 < argc) { owner = argv[++i]; continue; }
        std::cerr << "usage: hostlink_cli catalog [--owner ID]\n";
        return 2;
    }

    apply_profile_defaults(detect_profile());
    ServerConfig cfg = load_server_config();
    cfg.audit_log.clear();

    auto stack = build_bridge(cfg, {});
    ToolSynthesizer synth(*stack->catalog);
    ToolService service(*stack->engine, *stack->catalog, synth, *stack->host, stack->logs.get(), cfg.dynamic_tools);

    json_mini::Doc tree = service.command_tree(owner);
    std::cout << json_mini::to_string(tree.root, true) << "\n";
    return 0;
}

// Relays newline-delimited JSON-RPC between stdio and a running server.
// Usage: hostlink_cli bridge [--uri ws://HOST:PORT] [--connect_ms N]
// Without --uri the configured HOSTLINK_HOST/HOSTLINK_PORT are used.
static int cmd_bridge(int argc, char** argv) {
    ::signal(SIGPIPE, SIG_IGN);
    apply_profile_defaults(detect_profile());
    ServerConfig cfg = load_server_config();

    StdioBridgeOptions bo;
    bo.uri = "ws://" + cfg.host + ":" + std::to_string(cfg.port);
    bo.drain_timeout_ms = cfg.cmd_timeout_ms + 5000;
    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--uri" && i + 1 < argc) { bo.uri = argv[++i]; continue; }
        if (a == "--connect_ms" && i + 1 < argc) {
            try {
                bo.connect_timeout_ms = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "--connect_ms expects an integer\n";
                return 2;
            }
            continue;
        }
        std::cerr << "usage: hostlink_cli bridge [--uri ws://HOST:PORT] [--connect_ms N]\n";
        return 2;
    }
    return run_stdio_bridge(bo, std::cin, std::cout);
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "hostlink_cli <serve|exec|catalog|bridge> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "serve") return cmd_serve(argc, argv);
    if (cmd == "exec") return cmd_exec(argc, argv);
    if (cmd == "catalog") return cmd_catalog(argc, argv);
    if (cmd == "bridge") return cmd_bridge(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}

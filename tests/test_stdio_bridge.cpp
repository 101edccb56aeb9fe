#include "test_common.h"
#include "fake_host.h"

#include "hostlink/admission.h"
#include "hostlink/capture_engine.h"
#include "hostlink/catalog.h"
#include "hostlink/dispatcher.h"
#include "hostlink/json_mini.h"
#include "hostlink/log_store.h"
#include "hostlink/stdio_bridge.h"
#include "hostlink/tool_service.h"
#include "hostlink/tool_synth.h"
#include "hostlink/worker_pool.h"
#include "hostlink/ws_server.h"

#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace hostlink;
namespace jm = hostlink::json_mini;

static std::vector<std::string> lines_of(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream in(s);
    std::string l;
    while (std::getline(in, l)) {
        if (!l.empty()) out.push_back(l);
    }
    return out;
}

// Finds the reply carrying integer id `id`.
static jm::Doc reply_with_id(const std::vector<std::string>& lines, long long id) {
    for (const auto& l : lines) {
        jm::Doc d = jm::parse(l);
        if (d && jm::get_int(d.root, "id").value_or(-1) == id) return d;
    }
    die("no reply with id " + std::to_string(id));
    return jm::Doc{};
}

int main() {
    // Requests relayed to a live server; answers come back one per line.
    {
        FakeHost host;
        MemoryLogStore logs(100);
        CatalogIntrospector catalog(host);
        CaptureEngine engine(host, catalog);
        ToolSynthesizer synth(catalog);
        ToolService tools(engine, catalog, synth, host, &logs, true);
        McpDispatcher dispatcher(tools);

        WorkerPool pool(2);
        WsServerOptions o;
        o.port = 0;
        o.stop_wait_ms = 2000;
        WsServer server(o, pool,
                        [&dispatcher](const std::string& f) { return dispatcher.handle(f); },
                        &McpDispatcher::may_block);
        server.start();

        std::istringstream in(
            "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\",\"params\":{}}\n"
            "\n"
            "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"
            "this is not json\n"
            "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/call\",\"params\":{\"name\":\"execute_command\","
            "\"arguments\":{\"command\":\"!!hl status\"}}}\n");
        std::ostringstream out;

        StdioBridgeOptions bo;
        bo.uri = "ws://127.0.0.1:" + std::to_string(server.port());
        bo.connect_timeout_ms = 3000;
        bo.drain_timeout_ms = 5000;
        int rc = run_stdio_bridge(bo, in, out);
        expect_eq_ll(rc, 0, "clean exit at end of input");

        auto lines = lines_of(out.str());
        expect_eq_ll((long long)lines.size(), 3, "two replies and one local parse error");

        jm::Doc init = reply_with_id(lines, 1);
        expect_eq_str(jm::get_string(jm::member(init.root, "result"), "protocolVersion").value_or(""),
                      kProtocolVersion, "initialize relayed");
        jm::Doc call = reply_with_id(lines, 2);
        json_object* content = jm::member(jm::member(call.root, "result"), "content");
        expect_true(content && json_object_array_length(content) == 1, "tools/call result relayed");
        expect_contains(jm::get_string(json_object_array_get_idx(content, 0), "text").value_or(""),
                        "Bridge online", "tool output relayed");

        bool saw_parse_error = false;
        for (const auto& l : lines) {
            jm::Doc d = jm::parse(l);
            if (jm::get_int(jm::member(d.root, "error"), "code").value_or(0) == kRpcParseError) saw_parse_error = true;
        }
        expect_true(saw_parse_error, "bad line answered with a parse error");

        server.stop();
        pool.shutdown();
    }

    // Nothing listening: every request is answered with an internal error.
    {
        uint16_t port = 0;
        {
            WorkerPool pool(1);
            WsServerOptions o;
            o.port = 0;
            o.stop_wait_ms = 2000;
            WsServer scratch(o, pool, [](const std::string&) { return std::optional<std::string>(); });
            scratch.start();
            port = scratch.port();
            scratch.stop();
        }
        expect_true(!port_accepting("127.0.0.1", port), "port is free");

        std::istringstream in(
            "{\"jsonrpc\":\"2.0\",\"id\":7,\"method\":\"initialize\"}\n"
            "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n");
        std::ostringstream out;
        StdioBridgeOptions bo;
        bo.uri = "ws://127.0.0.1:" + std::to_string(port);
        bo.connect_timeout_ms = 2000;
        int rc = run_stdio_bridge(bo, in, out);
        expect_eq_ll(rc, 1, "failure exit code");

        auto lines = lines_of(out.str());
        expect_eq_ll((long long)lines.size(), 2, "connection error plus one answered request");
        jm::Doc first = jm::parse(lines[0]);
        expect_true(jm::has_key(first.root, "id") && jm::member(first.root, "id") == nullptr, "connection error has null id");
        expect_eq_ll(jm::get_int(jm::member(first.root, "error"), "code").value_or(0), kRpcInternalError,
                     "connection error code");
        jm::Doc req = reply_with_id(lines, 7);
        expect_eq_ll(jm::get_int(jm::member(req.root, "error"), "code").value_or(0), kRpcInternalError,
                     "request answered with an internal error");
    }

    std::cerr << "test_stdio_bridge: ALL PASSED" << std::endl;
    return 0;
}

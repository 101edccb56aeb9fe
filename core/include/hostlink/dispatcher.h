#pragma once
#include "hostlink/tool_service.h"

#include <optional>
#include <string>

namespace hostlink {

constexpr const char* kProtocolVersion = "2024-11-05";
constexpr const char* kStatusResourceUri = "hostlink://server/status";
constexpr const char* kCommandTreeResourceUri = "hostlink://commands/tree";

struct ServerInfo {
    std::string name{"hostlink"};
    std::string version{"0.1.0"};
};

// JSON-RPC 2.0 request handling, independent of the transport.
//
// handle() never throws: malformed input and failing handlers become error
// responses. Notifications (no "id") produce no response at all.
class McpDispatcher {
public:
    McpDispatcher(ToolService& tools, ServerInfo info = {});

    std::optional<std::string> handle(const std::string& frame);

    // True for requests that may run a command on the host (tools/call,
    // resources/read). Unparseable frames and everything else answer
    // without touching the host.
    static bool may_block(const std::string& frame);

private:
    json_mini::Doc dispatch(const std::string& method, json_object* params);

    json_mini::Doc initialize();
    json_mini::Doc tools_list();
    json_mini::Doc tools_call(json_object* params);
    json_mini::Doc resources_list();
    json_mini::Doc resources_read(json_object* params);

    ToolService& tools_;
    ServerInfo info_;
};

// {"jsonrpc":"2.0","id":<id>,"error":{"code":..,"message":..,"data":..}}
// `id` may be null (serialized as JSON null).
std::string make_error_response(json_object* id, int code, const std::string& message, const std::string& data = "");

} // namespace hostlink

#include "hostlink/dispatcher.h"
#include "hostlink/types.h"

#include <exception>
#include <iostream>

namespace hostlink {

std::string make_error_response(json_object* id, int code, const std::string& message, const std::string& data) {
    json_mini::Doc resp(json_object_new_object());
    json_mini::put_string(resp.root, "jsonrpc", "2.0");
    json_mini::put_shared(resp.root, "id", id);
    json_object* err = json_object_new_object();
    json_mini::put_int(err, "code", code);
    json_mini::put_string(err, "message", message);
    if (!data.empty()) json_mini::put_string(err, "data", data);
    json_object_object_add(resp.root, "error", err);
    return json_mini::to_string(resp.root);
}

static std::string make_result_response(json_object* id, json_mini::Doc result) {
    json_mini::Doc resp(json_object_new_object());
    json_mini::put_string(resp.root, "jsonrpc", "2.0");
    json_mini::put_shared(resp.root, "id", id);
    json_object_object_add(resp.root, "result", result.release());
    return json_mini::to_string(resp.root);
}

// Parses a serialized schema; falls back to an empty object schema.
static json_object* schema_object(const std::string& schema) {
    json_mini::Doc d = json_mini::parse(schema);
    if (!d) {
        json_object* o = json_object_new_object();
        json_mini::put_string(o, "type", "object");
        return o;
    }
    return d.release();
}

McpDispatcher::McpDispatcher(ToolService& tools, ServerInfo info)
    : tools_(tools), info_(std::move(info)) {}

std::optional<std::string> McpDispatcher::handle(const std::string& frame) {
    std::string perr;
    json_mini::Doc req = json_mini::parse_verbose(frame, &perr);
    if (!req) {
        return make_error_response(nullptr, kRpcParseError, "Parse error", perr);
    }
    if (!json_object_is_type(req.root, json_type_object)) {
        return make_error_response(nullptr, kRpcInvalidRequest, "Invalid Request", "request must be a JSON object");
    }

    const bool is_notification = !json_mini::has_key(req.root, "id");
    json_object* id = json_mini::member(req.root, "id");

    auto method = json_mini::get_string(req.root, "method");
    if (!method) {
        if (is_notification) return std::nullopt;
        return make_error_response(id, kRpcInvalidRequest, "Invalid Request", "missing 'method'");
    }

    try {
        json_mini::Doc result = dispatch(*method, json_mini::member(req.root, "params"));
        if (is_notification) return std::nullopt;
        return make_result_response(id, std::move(result));
    } catch (const RpcError& e) {
        if (is_notification) return std::nullopt;
        return make_error_response(id, e.code(), e.what(), e.data());
    } catch (const std::exception& e) {
        std::cerr << "[serve] " << *method << " failed: " << e.what() << "\n";
        if (is_notification) return std::nullopt;
        return make_error_response(id, kRpcInternalError, "Internal error", e.what());
    } catch (...) {
        std::cerr << "[serve] " << *method << " failed: non-standard exception\n";
        if (is_notification) return std::nullopt;
        return make_error_response(id, kRpcInternalError, "Internal error", "unknown error");
    }
}

bool McpDispatcher::may_block(const std::string& frame) {
    json_mini::Doc req = json_mini::parse(frame);
    auto method = json_mini::get_string(req.root, "method");
    return method && (*method == "tools/call" || *method == "resources/read");
}

json_mini::Doc McpDispatcher::dispatch(const std::string& method, json_object* params) {
    if (method == "initialize") return initialize();
    if (method == "tools/list") return tools_list();
    if (method == "tools/call") return tools_call(params);
    if (method == "resources/list") return resources_list();
    if (method == "resources/read") return resources_read(params);
    if (method == "ping") return json_mini::Doc(json_object_new_object());
    if (method == "notifications/initialized") return json_mini::Doc(json_object_new_object());
    throw RpcError(kRpcMethodNotFound, "Method not found", "Unknown method: " + method);
}

json_mini::Doc McpDispatcher::initialize() {
    json_mini::Doc r(json_object_new_object());
    json_mini::put_string(r.root, "protocolVersion", kProtocolVersion);
    json_object* caps = json_object_new_object();
    json_object_object_add(caps, "tools", json_object_new_object());
    json_object_object_add(caps, "resources", json_object_new_object());
    json_object_object_add(r.root, "capabilities", caps);
    json_object* si = json_object_new_object();
    json_mini::put_string(si, "name", info_.name);
    json_mini::put_string(si, "version", info_.version);
    json_object_object_add(r.root, "serverInfo", si);
    return r;
}

json_mini::Doc McpDispatcher::tools_list() {
    json_mini::Doc r(json_object_new_object());
    json_object* arr = json_object_new_array();
    for (const auto& t : tools_.list_tools()) {
        json_object* o = json_object_new_object();
        json_mini::put_string(o, "name", t.name);
        json_mini::put_string(o, "description", t.description);
        json_object_object_add(o, "inputSchema", schema_object(t.input_schema));
        json_object_object_add(o, "outputSchema", schema_object(t.output_schema));
        if (!t.bound_command_prefix.empty()) {
            json_object* meta = json_object_new_object();
            json_mini::put_string(meta, "bound_command_prefix", t.bound_command_prefix);
            json_object_object_add(meta, "subcommands", json_mini::new_string_array(t.subcommands));
            json_object_object_add(o, "metadata", meta);
        }
        json_object_array_add(arr, o);
    }
    json_object_object_add(r.root, "tools", arr);
    return r;
}

json_mini::Doc McpDispatcher::tools_call(json_object* params) {
    auto name = json_mini::get_string(params, "name");
    if (!name || name->empty()) throw RpcError(kRpcInvalidParams, "Invalid params", "missing 'name'");

    json_object* args = json_mini::member(params, "arguments");
    json_mini::Doc result = tools_.call_tool(*name, args);
    bool ok = json_mini::get_bool(result.root, "success").value_or(true);

    json_mini::Doc r(json_object_new_object());
    json_object* content = json_object_new_array();
    json_object* item = json_object_new_object();
    json_mini::put_string(item, "type", "text");
    json_mini::put_string(item, "text", json_mini::to_string(result.root, true));
    json_object_array_add(content, item);
    json_object_object_add(r.root, "content", content);
    json_mini::put_bool(r.root, "isError", !ok);
    return r;
}

json_mini::Doc McpDispatcher::resources_list() {
    auto res = [](const char* uri, const char* name, const char* desc) {
        json_object* o = json_object_new_object();
        json_mini::put_string(o, "uri", uri);
        json_mini::put_string(o, "name", name);
        json_mini::put_string(o, "description", desc);
        json_mini::put_string(o, "mimeType", "application/json");
        return o;
    };
    json_mini::Doc r(json_object_new_object());
    json_object* arr = json_object_new_array();
    json_object_array_add(arr, res(kStatusResourceUri, "Server status", "Bridge and host status"));
    json_object_array_add(arr, res(kCommandTreeResourceUri, "Command tree", "Every available command"));
    json_object_object_add(r.root, "resources", arr);
    return r;
}

json_mini::Doc McpDispatcher::resources_read(json_object* params) {
    auto uri = json_mini::get_string(params, "uri");
    if (!uri) throw RpcError(kRpcInvalidParams, "Invalid params", "missing 'uri'");

    json_mini::Doc body;
    if (*uri == kStatusResourceUri) body = tools_.server_status(false);
    else if (*uri == kCommandTreeResourceUri) body = tools_.command_tree(std::nullopt);
    else throw RpcError(kRpcMethodNotFound, "Unknown resource", "Resource '" + *uri + "' not found");

    json_mini::Doc r(json_object_new_object());
    json_object* contents = json_object_new_array();
    json_object* item = json_object_new_object();
    json_mini::put_string(item, "uri", *uri);
    json_mini::put_string(item, "mimeType", "application/json");
    json_mini::put_string(item, "text", json_mini::to_string(body.root, true));
    json_object_array_add(contents, item);
    json_object_object_add(r.root, "contents", contents);
    return r;
}

} // namespace hostlink

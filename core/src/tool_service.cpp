#include "hostlink/tool_service.h"
#include "hostlink/log_store.h"
#include "hostlink/text.h"
#include "hostlink/types.h"

#include <algorithm>

namespace hostlink {

namespace {

const char* kLogLinesSchema = R"({"type":"object","properties":{
  "success":{"type":"boolean"},"total_lines":{"type":"integer"},
  "requested_lines":{"type":"integer"},"returned_lines":{"type":"integer"},
  "logs":{"type":"array","items":{"type":"object","properties":{
    "line_number":{"type":"integer"},"content":{"type":"string"},
    "timestamp":{"type":"integer"},"source":{"type":"string"},"is_command":{"type":"boolean"}}}},
  "timestamp":{"type":"integer"}}})";

ToolDescriptor make_tool(const char* name, const char* desc, const char* in, const std::string& out) {
    ToolDescriptor t;
    t.name = name;
    t.description = desc;
    t.input_schema = in;
    t.output_schema = out;
    return t;
}

json_object* log_line_json(const LogLine& l) {
    json_object* o = json_object_new_object();
    json_mini::put_int(o, "line_number", l.line_number);
    json_mini::put_string(o, "content", l.content);
    json_mini::put_int(o, "timestamp", l.timestamp_ms);
    json_mini::put_string(o, "source", l.source);
    json_mini::put_bool(o, "is_command", l.is_command);
    return o;
}

json_object* log_lines_json(const std::vector<LogLine>& lines) {
    json_object* arr = json_object_new_array();
    for (const auto& l : lines) json_object_array_add(arr, log_line_json(l));
    return arr;
}

json_object* search_hits_json(const std::vector<LogSearchHit>& hits) {
    json_object* arr = json_object_new_array();
    for (const auto& h : hits) {
        json_object* r = log_line_json(h.line);
        json_mini::put_int(r, "search_id", h.search_id);
        json_object_object_add(r, "context_before", log_lines_json(h.context_before));
        json_object_object_add(r, "context_after", log_lines_json(h.context_after));
        json_object_array_add(arr, r);
    }
    return arr;
}

std::string require_string(json_object* args, const char* key) {
    auto v = json_mini::get_string(args, key);
    if (!v || text::trim(*v).empty()) {
        throw RpcError(kRpcInvalidParams, "Invalid params", std::string("missing or empty '") + key + "'");
    }
    return *v;
}

int64_t now_s() { return now_epoch_ms() / 1000; }

} // namespace

std::vector<ToolDescriptor> static_tools() {
    const std::string cmd_out = command_result_output_schema();
    std::vector<ToolDescriptor> t;

    t.push_back(make_tool("execute_command",
        "Run a command and capture its real output. '!!' commands go to the administrative "
        "interpreter; anything else goes to the host console (a leading '/' is optional).",
        R"({"type":"object","properties":{"command":{"type":"string","description":"Command to run"}},"required":["command"]})",
        cmd_out));

    t.push_back(make_tool("get_command_tree",
        "List available commands with owner, path and description.",
        R"({"type":"object","properties":{"owner_id":{"type":"string","description":"Only commands registered by this owner (optional)"}}})",
        R"({"type":"object","properties":{"success":{"type":"boolean"},"total_commands":{"type":"integer"},
            "commands":{"type":"array","items":{"type":"object","properties":{"owner_id":{"type":"string"},
            "owner_name":{"type":"string"},"command":{"type":"string"},"description":{"type":"string"},
            "type":{"type":"string"}}}},"timestamp":{"type":"integer"}}})"));

    t.push_back(make_tool("get_server_status",
        "Report bridge and host status, optionally with the online player list.",
        R"({"type":"object","properties":{"include_players":{"type":"boolean","default":true}}})",
        R"({"type":"object","properties":{"success":{"type":"boolean"},"timestamp":{"type":"integer"},
            "status":{"type":"string"},"status_detail":{"type":"string"},"server_running":{"type":"boolean"},
            "server_startup":{"type":"boolean"},"owner_list_detail":{"type":"string"},
            "players":{"type":"object","properties":{"list_command_result":{"type":"string"}}}}})"));

    t.push_back(make_tool("get_recent_logs",
        "Return the most recent host output lines (at most 50).",
        R"({"type":"object","properties":{"lines_count":{"type":"integer","minimum":1,"maximum":50,"default":20}}})",
        kLogLinesSchema));

    t.push_back(make_tool("get_logs_range",
        "Return host output lines with start_line <= line_number < end_line (at most 50).",
        R"({"type":"object","properties":{"start_line":{"type":"integer","minimum":0,"default":0},
            "end_line":{"type":"integer","minimum":1}},"required":["end_line"]})",
        kLogLinesSchema));

    t.push_back(make_tool("search_logs",
        "Search host output by substring (case-insensitive) or regular expression. Newest matches first.",
        R"({"type":"object","properties":{"query":{"type":"string"},"use_regex":{"type":"boolean","default":false},
            "context_lines":{"type":"integer","minimum":0,"maximum":10,"default":0},
            "max_results":{"type":"integer","minimum":1,"maximum":5,"default":5}},"required":["query"]})",
        R"({"type":"object","properties":{"success":{"type":"boolean"},"query":{"type":"string"},
            "use_regex":{"type":"boolean"},"context_lines":{"type":"integer"},"total_matches":{"type":"integer"},
            "returned_results":{"type":"integer"},"remaining_results":{"type":"integer"},
            "results":{"type":"array"},"timestamp":{"type":"integer"}}})"));

    t.push_back(make_tool("search_logs_by_ids",
        "Page through the matches of the last search_logs call by search_id (1 is the newest match).",
        R"({"type":"object","properties":{"start_id":{"type":"integer","minimum":1},
            "end_id":{"type":"integer","minimum":1},
            "context_lines":{"type":"integer","minimum":0,"maximum":10,"default":0}},"required":["start_id","end_id"]})",
        R"({"type":"object","properties":{"success":{"type":"boolean"},"query":{"type":"string"},
            "start_id":{"type":"integer"},"end_id":{"type":"integer"},"context_lines":{"type":"integer"},
            "total_matches":{"type":"integer"},"returned_results":{"type":"integer"},
            "remaining_results":{"type":"integer"},"results":{"type":"array"},"timestamp":{"type":"integer"}}})"));

    t.push_back(make_tool("get_command_result",
        "Read back a remembered invocation by its command_id.",
        R"({"type":"object","properties":{"command_id":{"type":"string"}},"required":["command_id"]})",
        cmd_out));

    return t;
}

json_mini::Doc invocation_to_json(const InvocationResult& r) {
    json_mini::Doc o(json_object_new_object());
    json_mini::put_bool(o.root, "success", r.success);
    json_mini::put_string(o.root, "command", r.command);
    json_mini::put_string(o.root, "command_id", r.id);
    json_mini::put_string(o.root, "kind", command_kind_name(r.kind));
    json_mini::put_string(o.root, "status", invocation_status_name(r.status));
    json_mini::put_string(o.root, "output", r.output);
    json_object_object_add(o.root, "responses", json_mini::new_string_array(r.lines));
    if (!r.error.empty()) json_mini::put_string(o.root, "error", r.error);
    json_mini::put_int(o.root, "elapsed_ms", r.elapsed_ms);
    json_mini::put_int(o.root, "timestamp", r.timestamp);
    return o;
}

ToolService::ToolService(CaptureEngine& engine,
                         const CatalogIntrospector& catalog,
                         ToolSynthesizer& synth,
                         const HostAdapter& host,
                         const LogStore* logs,
                         bool dynamic_tools)
    : engine_(engine), catalog_(catalog), synth_(synth), host_(host), logs_(logs), dynamic_tools_(dynamic_tools) {}

std::vector<ToolDescriptor> ToolService::list_tools() {
    auto tools = static_tools();
    if (dynamic_tools_) {
        auto dyn = synth_.build_tool_menu();
        tools.insert(tools.end(), dyn.begin(), dyn.end());
    }
    return tools;
}

json_mini::Doc ToolService::call_tool(const std::string& name, json_object* arguments) {
    if (name == "execute_command") return execute_command(arguments);
    if (name == "get_command_tree") {
        auto owner = json_mini::get_string(arguments, "owner_id");
        if (owner && owner->empty()) owner.reset();
        return command_tree(owner);
    }
    if (name == "get_server_status") {
        return server_status(json_mini::get_bool(arguments, "include_players").value_or(true));
    }
    if (name == "get_recent_logs") return recent_logs(arguments);
    if (name == "get_logs_range") return logs_range(arguments);
    if (name == "search_logs") return search_logs(arguments);
    if (name == "search_logs_by_ids") return search_logs_by_ids(arguments);
    if (name == "get_command_result") return command_result(arguments);

    if (dynamic_tools_ && ToolSynthesizer::is_dynamic_name(name)) return call_dynamic(name, arguments);
    throw RpcError(kRpcMethodNotFound, "Unknown tool", "Tool '" + name + "' not found");
}

json_mini::Doc ToolService::execute_command(json_object* args) {
    std::string cmd = text::trim(require_string(args, "command"));
    return invocation_to_json(engine_.invoke(cmd));
}

json_mini::Doc ToolService::call_dynamic(const std::string& name, json_object* args) {
    const std::string sub = json_mini::get_string(args, "subcommand").value_or("");
    const std::string extra = json_mini::get_string(args, "args").value_or("");
    auto cmd = synth_.resolve_command(name, sub, extra);
    if (!cmd) throw RpcError(kRpcMethodNotFound, "Unknown tool", "Tool '" + name + "' not found");

    InvocationResult r = engine_.invoke(*cmd);
    json_mini::Doc o = invocation_to_json(r);
    json_mini::put_string(o.root, "tool", name);

    if (r.success && engine_.is_unknown_reply(r.lines)) {
        auto prefix = synth_.prefix_for(name).value_or(*cmd);
        std::string hint = "Hint: the command was not recognized. Run '" + prefix +
                           " help' or call get_command_tree to see valid subcommands.";
        json_mini::put_string(o.root, "output", r.output.empty() ? hint : r.output + "\n" + hint);
        json_mini::put_string(o.root, "hint", hint);
    }
    return o;
}

json_mini::Doc ToolService::command_tree(const std::optional<std::string>& owner_filter) {
    auto entries = catalog_.list_commands(owner_filter);
    json_mini::Doc o(json_object_new_object());
    json_mini::put_bool(o.root, "success", true);
    json_mini::put_int(o.root, "total_commands", (int64_t)entries.size());
    json_object* arr = json_object_new_array();
    for (const auto& e : entries) {
        json_object* c = json_object_new_object();
        json_mini::put_string(c, "owner_id", e.owner_id);
        json_mini::put_string(c, "owner_name", e.owner_name);
        json_mini::put_string(c, "command", e.path);
        json_mini::put_string(c, "description", e.description);
        json_mini::put_string(c, "type", catalog_entry_kind_name(e.kind));
        json_object_array_add(arr, c);
    }
    json_object_object_add(o.root, "commands", arr);
    json_mini::put_int(o.root, "timestamp", now_s());
    return o;
}

json_mini::Doc ToolService::server_status(bool include_players) {
    auto status = engine_.invoke(std::string(kBuiltinRootLiteral) + " status");
    auto owners = engine_.invoke(std::string(kBuiltinRootLiteral) + " owner list");

    json_mini::Doc o(json_object_new_object());
    json_mini::put_bool(o.root, "success", status.success);
    json_mini::put_int(o.root, "timestamp", now_s());
    json_mini::put_string(o.root, "status", status.success ? "online" : "error");
    json_mini::put_string(o.root, "status_detail", status.success ? status.output : status.error);
    json_mini::put_bool(o.root, "server_running", host_.is_running());
    json_mini::put_bool(o.root, "server_startup", host_.startup_done());
    json_mini::put_string(o.root, "owner_list_detail", owners.success ? owners.output : owners.error);

    if (include_players) {
        json_object* players = json_object_new_object();
        if (host_.is_running()) {
            auto list = engine_.invoke("list");
            json_mini::put_string(players, "list_command_result", list.success ? list.output : list.error);
        } else {
            json_mini::put_string(players, "list_command_result", "host is not running");
        }
        json_object_object_add(o.root, "players", players);
    }
    return o;
}

const LogStore& ToolService::require_logs() const {
    if (!logs_) throw RpcError(kRpcInternalError, "Internal error", "log store unavailable");
    return *logs_;
}

json_mini::Doc ToolService::recent_logs(json_object* args) {
    const LogStore& logs = require_logs();
    int64_t n = std::clamp<int64_t>(json_mini::get_int(args, "lines_count").value_or(20), 1, 50);
    auto lines = logs.latest((size_t)n);

    json_mini::Doc o(json_object_new_object());
    json_mini::put_bool(o.root, "success", true);
    json_mini::put_int(o.root, "total_lines", logs.total_lines());
    json_mini::put_int(o.root, "requested_lines", n);
    json_mini::put_int(o.root, "returned_lines", (int64_t)lines.size());
    json_object_object_add(o.root, "logs", log_lines_json(lines));
    json_mini::put_int(o.root, "timestamp", now_s());
    return o;
}

json_mini::Doc ToolService::logs_range(json_object* args) {
    const LogStore& logs = require_logs();
    int64_t start = std::max<int64_t>(0, json_mini::get_int(args, "start_line").value_or(0));
    auto end_opt = json_mini::get_int(args, "end_line");
    if (!end_opt) throw RpcError(kRpcInvalidParams, "Invalid params", "missing 'end_line'");
    int64_t end = *end_opt;
    if (end <= start) throw RpcError(kRpcInvalidParams, "Invalid params", "end_line must be greater than start_line");
    end = std::min(end, start + 50);

    auto lines = logs.range(start, end);
    json_mini::Doc o(json_object_new_object());
    json_mini::put_bool(o.root, "success", true);
    json_mini::put_int(o.root, "total_lines", logs.total_lines());
    json_mini::put_int(o.root, "start_line", start);
    json_mini::put_int(o.root, "end_line", end);
    json_mini::put_int(o.root, "requested_lines", end - start);
    json_mini::put_int(o.root, "returned_lines", (int64_t)lines.size());
    json_object_object_add(o.root, "logs", log_lines_json(lines));
    json_mini::put_int(o.root, "timestamp", now_s());
    return o;
}

json_mini::Doc ToolService::search_logs(json_object* args) {
    const LogStore& logs = require_logs();
    std::string query = require_string(args, "query");
    bool use_regex = json_mini::get_bool(args, "use_regex").value_or(false);
    int context = (int)std::clamp<int64_t>(json_mini::get_int(args, "context_lines").value_or(0), 0, 10);
    int max_results = (int)std::clamp<int64_t>(json_mini::get_int(args, "max_results").value_or(5), 1, 5);

    auto res = search_log_lines(logs.snapshot(), query, use_regex, context, max_results);
    if (!res.ok) throw RpcError(kRpcInvalidParams, "Invalid params", res.error);

    json_mini::Doc o(json_object_new_object());
    json_mini::put_bool(o.root, "success", true);
    json_mini::put_string(o.root, "query", query);
    json_mini::put_bool(o.root, "use_regex", use_regex);
    json_mini::put_int(o.root, "context_lines", context);
    json_mini::put_int(o.root, "total_matches", res.total_matches);
    json_mini::put_int(o.root, "returned_results", (int64_t)res.hits.size());
    json_mini::put_int(o.root, "remaining_results", res.total_matches - (int64_t)res.hits.size());

    json_object_object_add(o.root, "results", search_hits_json(res.hits));
    json_mini::put_int(o.root, "timestamp", now_s());

    std::lock_guard<std::mutex> lk(search_mu_);
    have_search_ = true;
    last_query_ = query;
    last_ranking_ = std::move(res.ranked_line_numbers);
    return o;
}

json_mini::Doc ToolService::search_logs_by_ids(json_object* args) {
    const LogStore& logs = require_logs();
    auto start_opt = json_mini::get_int(args, "start_id");
    auto end_opt = json_mini::get_int(args, "end_id");
    if (!start_opt || !end_opt) throw RpcError(kRpcInvalidParams, "Invalid params", "missing 'start_id' or 'end_id'");
    const int64_t start = *start_opt;
    if (start < 1) throw RpcError(kRpcInvalidParams, "Invalid params", "start_id must be at least 1");
    if (*end_opt < start) throw RpcError(kRpcInvalidParams, "Invalid params", "end_id must not be less than start_id");
    const int64_t end = std::min(*end_opt, start + kMaxHitsPerPage - 1);
    int context = (int)std::clamp<int64_t>(json_mini::get_int(args, "context_lines").value_or(0), 0, 10);

    std::string query;
    std::vector<int64_t> ranking;
    {
        std::lock_guard<std::mutex> lk(search_mu_);
        if (!have_search_) {
            json_mini::Doc o(json_object_new_object());
            json_mini::put_bool(o.root, "success", false);
            json_mini::put_string(o.root, "error", "no search_logs call to page through yet");
            json_mini::put_int(o.root, "timestamp", now_s());
            return o;
        }
        query = last_query_;
        ranking = last_ranking_;
    }

    auto hits = hits_by_rank(logs, ranking, start, end, context);
    const int64_t total = (int64_t)ranking.size();

    json_mini::Doc o(json_object_new_object());
    json_mini::put_bool(o.root, "success", true);
    json_mini::put_string(o.root, "query", query);
    json_mini::put_int(o.root, "start_id", start);
    json_mini::put_int(o.root, "end_id", end);
    json_mini::put_int(o.root, "context_lines", context);
    json_mini::put_int(o.root, "total_matches", total);
    json_mini::put_int(o.root, "returned_results", (int64_t)hits.size());
    json_mini::put_int(o.root, "remaining_results", std::max<int64_t>(0, total - end));
    json_object_object_add(o.root, "results", search_hits_json(hits));
    json_mini::put_int(o.root, "timestamp", now_s());
    return o;
}

json_mini::Doc ToolService::command_result(json_object* args) {
    std::string id = require_string(args, "command_id");
    auto r = engine_.lookup(id);
    if (!r) {
        json_mini::Doc o(json_object_new_object());
        json_mini::put_bool(o.root, "success", false);
        json_mini::put_string(o.root, "command_id", id);
        json_mini::put_string(o.root, "error", "no invocation with this id is remembered");
        json_mini::put_int(o.root, "timestamp", now_s());
        return o;
    }
    return invocation_to_json(*r);
}

} // namespace hostlink

#pragma once
#include "hostlink/capture_engine.h"
#include "hostlink/catalog.h"
#include "hostlink/host.h"
#include "hostlink/json_mini.h"
#include "hostlink/tool_synth.h"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hostlink {

// Tools always offered, independent of the command graph.
std::vector<ToolDescriptor> static_tools();

// Executes tools/call requests. Static tools are handled here; any other
// name is routed through the synthesizer to the capture engine.
class ToolService {
public:
    ToolService(CaptureEngine& engine,
                const CatalogIntrospector& catalog,
                ToolSynthesizer& synth,
                const HostAdapter& host,
                const LogStore* logs,
                bool dynamic_tools = true);

    // Static tools first, then the synthesized ones (refreshing the cache).
    std::vector<ToolDescriptor> list_tools();

    // Returns the structured result object.
    // Throws RpcError(-32601) for unknown tools, RpcError(-32602) for bad
    // arguments. `arguments` may be null.
    json_mini::Doc call_tool(const std::string& name, json_object* arguments);

    json_mini::Doc server_status(bool include_players);
    json_mini::Doc command_tree(const std::optional<std::string>& owner_filter);

    bool dynamic_tools() const { return dynamic_tools_; }

private:
    json_mini::Doc execute_command(json_object* args);
    json_mini::Doc recent_logs(json_object* args);
    json_mini::Doc logs_range(json_object* args);
    json_mini::Doc search_logs(json_object* args);
    json_mini::Doc search_logs_by_ids(json_object* args);
    json_mini::Doc command_result(json_object* args);
    json_mini::Doc call_dynamic(const std::string& name, json_object* args);

    const LogStore& require_logs() const;

    CaptureEngine& engine_;
    const CatalogIntrospector& catalog_;
    ToolSynthesizer& synth_;
    const HostAdapter& host_;
    const LogStore* logs_;
    bool dynamic_tools_;

    // Ranking of the most recent search_logs call, paged by search_logs_by_ids.
    std::mutex search_mu_;
    bool have_search_{false};
    std::string last_query_;
    std::vector<int64_t> last_ranking_;
};

// Most hits a single search_logs_by_ids call returns.
constexpr int64_t kMaxHitsPerPage = 10;

// Shape shared by execute_command, dynamic tools and get_command_result.
json_mini::Doc invocation_to_json(const InvocationResult& r);

} // namespace hostlink

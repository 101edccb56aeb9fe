#pragma once
#include "hostlink/catalog.h"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hostlink {

// A protocol-visible tool. Schemas are serialized JSON objects.
struct ToolDescriptor {
    std::string name;
    std::string description;
    std::string input_schema;
    std::string output_schema;
    std::string bound_command_prefix; // empty for static tools
    std::vector<std::string> subcommands;
};

constexpr const char* kAdminToolPrefix = "admin_";
constexpr const char* kHostToolPrefix = "host_";

// Output schema shared by every tool that runs a command.
std::string command_result_output_schema();

// Turns catalog entries into one tool per top-level command token.
class ToolSynthesizer {
public:
    explicit ToolSynthesizer(const CatalogIntrospector& catalog) : catalog_(catalog) {}

    // Rebuilds the menu and replaces the name -> prefix cache.
    std::vector<ToolDescriptor> build_tool_menu();

    // Pure grouping; does not touch the cache.
    static std::vector<ToolDescriptor> synthesize(const std::vector<CommandCatalogEntry>& entries);
    static std::vector<ToolDescriptor> fallback_tools();

    // "admin_x" -> "!!x", "host_x" -> "x"; nullopt for any other name.
    static std::optional<std::string> decode_prefix(const std::string& tool_name);
    static bool is_dynamic_name(const std::string& tool_name);

    // Cache first, then name decoding.
    std::optional<std::string> prefix_for(const std::string& tool_name) const;

    // "<prefix> <subcommand> <args>" with empty parts dropped.
    std::optional<std::string> resolve_command(const std::string& tool_name,
                                               const std::string& subcommand,
                                               const std::string& args) const;

    size_t cached_tools() const;

private:
    const CatalogIntrospector& catalog_;
    mutable std::mutex mu_;
    std::unordered_map<std::string, std::string> prefix_cache_;
};

} // namespace hostlink

#pragma once
#include "hostlink/host.h"

#include <optional>
#include <string>
#include <vector>

namespace hostlink {

enum class CatalogEntryKind {
    BUILTIN,        // registered by the built-in admin owner
    PLUGIN_COMMAND, // registered by any other owner
    HOST_NATIVE,    // raw console commands the host always understands
};

const char* catalog_entry_kind_name(CatalogEntryKind k);

struct CommandCatalogEntry {
    std::string owner_id;
    std::string owner_name;
    std::string path;        // e.g. "!!hl owner list", "!!hl history <count>"
    std::string description;
    CatalogEntryKind kind{CatalogEntryKind::PLUGIN_COMMAND};
};

constexpr const char* kBuiltinOwnerId = "hostlink";
constexpr const char* kBuiltinOwnerName = "Hostlink";
constexpr const char* kBuiltinRootLiteral = "!!hl";

// Flattens the host command graph. Entries are produced fresh on every call;
// nothing is cached between requests.
class CatalogIntrospector {
public:
    explicit CatalogIntrospector(const HostAdapter& host,
                                 int max_depth = 3,
                                 std::string builtin_owner = kBuiltinOwnerId);

    // Breadth-first over every root, at most `max_depth` tokens deep.
    // Never throws: introspection failures yield fallback_entries() plus the host natives.
    std::vector<CommandCatalogEntry> list_commands(const std::optional<std::string>& owner_filter = std::nullopt) const;

    // Nodes one level below the deepest node reachable along `command_text`
    // (whitespace-separated tokens, literals matched exactly, any token
    // accepted by an argument node). Empty when no root matches.
    std::vector<CommandCatalogEntry> children_of(const std::string& command_text) const;

    int max_depth() const { return max_depth_; }

    static std::vector<CommandCatalogEntry> fallback_entries();
    static std::vector<CommandCatalogEntry> host_native_entries();

private:
    const HostAdapter& host_;
    int max_depth_;
    std::string builtin_owner_;
};

} // namespace hostlink

#include "hostlink/catalog.h"
#include "hostlink/text.h"

#include <deque>
#include <exception>
#include <iostream>

namespace hostlink {

const char* catalog_entry_kind_name(CatalogEntryKind k) {
    switch (k) {
        case CatalogEntryKind::BUILTIN:        return "builtin";
        case CatalogEntryKind::PLUGIN_COMMAND: return "plugin_command";
        case CatalogEntryKind::HOST_NATIVE:    return "host_native";
    }
    return "plugin_command";
}

static std::string path_token(const CommandNode& n) {
    if (n.is_literal()) return n.label();
    return "<" + n.label() + ">";
}

CatalogIntrospector::CatalogIntrospector(const HostAdapter& host, int max_depth, std::string builtin_owner)
    : host_(host), max_depth_(max_depth < 1 ? 1 : max_depth), builtin_owner_(std::move(builtin_owner)) {}

std::vector<CommandCatalogEntry> CatalogIntrospector::fallback_entries() {
    auto mk = [](const char* path, const char* desc) {
        CommandCatalogEntry e;
        e.owner_id = kBuiltinOwnerId;
        e.owner_name = kBuiltinOwnerName;
        e.path = path;
        e.description = desc;
        e.kind = CatalogEntryKind::BUILTIN;
        return e;
    };
    return {
        mk("!!hl status",     "Show bridge and host status"),
        mk("!!hl help",       "Show administrative help"),
        mk("!!hl owner list", "List command owners"),
        mk("!!hl start",      "Start the managed host"),
        mk("!!hl stop",       "Stop the managed host"),
        mk("!!hl restart",    "Restart the managed host"),
        mk("!!hl history",    "Show recently issued commands"),
    };
}

std::vector<CommandCatalogEntry> CatalogIntrospector::host_native_entries() {
    auto mk = [](const char* path, const char* desc) {
        CommandCatalogEntry e;
        e.owner_id = "host";
        e.owner_name = "Host console";
        e.path = path;
        e.description = desc;
        e.kind = CatalogEntryKind::HOST_NATIVE;
        return e;
    };
    return {
        mk("/help", "Show host console help"),
        mk("/list", "List online players"),
    };
}

std::vector<CommandCatalogEntry> CatalogIntrospector::list_commands(const std::optional<std::string>& owner_filter) const {
    std::vector<CommandCatalogEntry> out;
    try {
        auto roots = host_.command_roots();

        struct Pending {
            const CommandNode* node;
            std::string path;
            int depth;
        };

        for (const auto& root : roots) {
            if (owner_filter && root.owner_id != *owner_filter) continue;

            const CatalogEntryKind kind = root.owner_id == builtin_owner_
                ? CatalogEntryKind::BUILTIN : CatalogEntryKind::PLUGIN_COMMAND;

            std::deque<Pending> q;
            q.push_back(Pending{&root.node, path_token(root.node), 1});
            while (!q.empty()) {
                Pending p = q.front();
                q.pop_front();

                if (p.node->is_literal() && p.node->executable()) {
                    CommandCatalogEntry e;
                    e.owner_id = root.owner_id;
                    e.owner_name = root.owner_name;
                    e.path = p.path;
                    e.description = p.node->description();
                    e.kind = kind;
                    out.push_back(std::move(e));
                }

                if (p.depth >= max_depth_) continue;
                for (const auto& child : p.node->children()) {
                    q.push_back(Pending{&child, p.path + " " + path_token(child), p.depth + 1});
                }
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[engine] command graph introspection failed: " << e.what() << "\n";
        out = fallback_entries();
        if (owner_filter) return out;
        auto native = host_native_entries();
        out.insert(out.end(), native.begin(), native.end());
        return out;
    }

    if (owner_filter) {
        if (out.empty()) return fallback_entries();
        return out;
    }

    auto native = host_native_entries();
    out.insert(out.end(), native.begin(), native.end());
    return out;
}

std::vector<CommandCatalogEntry> CatalogIntrospector::children_of(const std::string& command_text) const {
    std::vector<CommandCatalogEntry> out;
    auto tokens = text::split_ws(command_text);
    if (tokens.empty()) return out;

    std::vector<CommandRoot> roots;
    try {
        roots = host_.command_roots();
    } catch (const std::exception& e) {
        std::cerr << "[engine] command graph introspection failed: " << e.what() << "\n";
        return out;
    }

    for (const auto& root : roots) {
        if (!root.node.is_literal() || root.node.label() != tokens[0]) continue;

        // Deepest node reachable along the submitted tokens; a trailing
        // token nothing accepts leaves us at its parent.
        const CommandNode* cur = &root.node;
        std::string path = root.node.label();
        for (size_t i = 1; i < tokens.size(); i++) {
            const CommandNode* next = nullptr;
            for (const auto& child : cur->children()) {
                if (child.is_literal() && child.label() == tokens[i]) { next = &child; break; }
            }
            if (!next) {
                for (const auto& child : cur->children()) {
                    if (!child.is_literal()) { next = &child; break; }
                }
            }
            if (!next) break;
            cur = next;
            path += " " + path_token(*next);
        }

        const CatalogEntryKind kind = root.owner_id == builtin_owner_
            ? CatalogEntryKind::BUILTIN : CatalogEntryKind::PLUGIN_COMMAND;
        for (const auto& child : cur->children()) {
            CommandCatalogEntry e;
            e.owner_id = root.owner_id;
            e.owner_name = root.owner_name;
            e.path = path + " " + path_token(child);
            e.description = child.description();
            e.kind = kind;
            out.push_back(std::move(e));
        }
    }
    return out;
}

} // namespace hostlink

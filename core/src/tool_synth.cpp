#include "hostlink/tool_synth.h"
#include "hostlink/hash.h"
#include "hostlink/json_mini.h"
#include "hostlink/text.h"
#include "hostlink/types.h"

#include <map>
#include <set>

namespace hostlink {

std::string command_result_output_schema() {
    json_mini::Doc s(json_object_new_object());
    json_mini::put_string(s.root, "type", "object");
    json_object* props = json_object_new_object();

    auto typed = [](const char* t) {
        json_object* o = json_object_new_object();
        json_mini::put_string(o, "type", t);
        return o;
    };
    json_object_object_add(props, "success", typed("boolean"));
    json_object_object_add(props, "command", typed("string"));
    json_object_object_add(props, "command_id", typed("string"));
    json_object_object_add(props, "status", typed("string"));
    json_object_object_add(props, "output", typed("string"));
    json_object* responses = typed("array");
    json_object_object_add(responses, "items", typed("string"));
    json_object_object_add(props, "responses", responses);
    json_object_object_add(props, "error", typed("string"));
    json_object_object_add(props, "timestamp", typed("integer"));

    json_object_object_add(s.root, "properties", props);
    return json_mini::to_string(s.root);
}

namespace {

struct Group {
    std::string prefix;             // "!!hl" or "help"
    std::string first_token;        // as it appears in the catalog
    std::vector<std::pair<std::string, std::string>> subs; // suffix, description
    std::string root_description;
};

std::string tool_name_for(const std::string& first_token) {
    if (text::starts_with(first_token, kControlSigil)) {
        return kAdminToolPrefix + text::sanitize_identifier(first_token.substr(2));
    }
    std::string t = first_token;
    if (!t.empty() && t[0] == '/') t.erase(0, 1);
    return kHostToolPrefix + text::sanitize_identifier(t);
}

std::string input_schema_for(const Group& g) {
    json_mini::Doc s(json_object_new_object());
    json_mini::put_string(s.root, "type", "object");
    json_object* props = json_object_new_object();

    std::vector<std::string> names;
    for (const auto& sub : g.subs) {
        if (!sub.first.empty()) names.push_back(sub.first);
    }
    if (!names.empty()) {
        json_object* sub = json_object_new_object();
        json_mini::put_string(sub, "type", "string");
        json_object_object_add(sub, "enum", json_mini::new_string_array(names));
        json_mini::put_string(sub, "description", "Subcommand of " + g.first_token);
        json_object_object_add(props, "subcommand", sub);
    }

    json_object* args = json_object_new_object();
    json_mini::put_string(args, "type", "string");
    json_mini::put_string(args, "description", "Extra arguments appended after the subcommand (optional)");
    json_object_object_add(props, "args", args);

    json_object_object_add(s.root, "properties", props);
    return json_mini::to_string(s.root);
}

std::string description_for(const Group& g) {
    std::string d = "Run " + g.first_token + " commands.";
    if (!g.root_description.empty()) d += " " + g.root_description;
    bool any = false;
    for (const auto& sub : g.subs) {
        if (sub.first.empty()) continue;
        if (!any) {
            d += "\nSubcommands:";
            any = true;
        }
        d += "\n- " + sub.first;
        if (!sub.second.empty()) d += ": " + sub.second;
    }
    return d;
}

} // namespace

std::vector<ToolDescriptor> ToolSynthesizer::synthesize(const std::vector<CommandCatalogEntry>& entries) {
    std::vector<Group> groups;
    std::map<std::string, size_t> index;

    for (const auto& e : entries) {
        auto tokens = text::split_ws(e.path);
        if (tokens.empty()) continue;
        const std::string& first = tokens[0];

        auto it = index.find(first);
        if (it == index.end()) {
            Group g;
            g.first_token = first;
            g.prefix = first;
            if (!g.prefix.empty() && g.prefix[0] == '/') g.prefix.erase(0, 1);
            index[first] = groups.size();
            groups.push_back(std::move(g));
            it = index.find(first);
        }
        Group& g = groups[it->second];

        std::string suffix = text::join(std::vector<std::string>(tokens.begin() + 1, tokens.end()), " ");
        if (suffix.empty()) {
            if (g.root_description.empty()) g.root_description = e.description;
            continue;
        }
        bool dup = false;
        for (const auto& s : g.subs) {
            if (s.first == suffix) { dup = true; break; }
        }
        if (!dup) g.subs.emplace_back(suffix, e.description);
    }

    std::vector<ToolDescriptor> out;
    std::set<std::string> used;
    const std::string out_schema = command_result_output_schema();
    for (const auto& g : groups) {
        ToolDescriptor t;
        t.name = tool_name_for(g.first_token);
        if (t.name == kAdminToolPrefix || t.name == kHostToolPrefix || used.count(t.name)) {
            t.name += (t.name.back() == '_' ? "" : "_") + hash::short_hex(hash::fnv1a64(g.first_token), 4);
        }
        used.insert(t.name);
        t.description = description_for(g);
        t.input_schema = input_schema_for(g);
        t.output_schema = out_schema;
        t.bound_command_prefix = g.prefix;
        for (const auto& s : g.subs) t.subcommands.push_back(s.first);
        out.push_back(std::move(t));
    }
    return out;
}

std::vector<ToolDescriptor> ToolSynthesizer::fallback_tools() {
    auto entries = CatalogIntrospector::fallback_entries();
    auto native = CatalogIntrospector::host_native_entries();
    entries.insert(entries.end(), native.begin(), native.end());
    return synthesize(entries);
}

std::vector<ToolDescriptor> ToolSynthesizer::build_tool_menu() {
    auto entries = catalog_.list_commands();
    bool introspected = false;
    for (const auto& e : entries) {
        if (e.kind != CatalogEntryKind::HOST_NATIVE) { introspected = true; break; }
    }
    std::vector<ToolDescriptor> tools = introspected ? synthesize(entries) : fallback_tools();

    std::lock_guard<std::mutex> lk(mu_);
    prefix_cache_.clear();
    for (const auto& t : tools) prefix_cache_[t.name] = t.bound_command_prefix;
    return tools;
}

bool ToolSynthesizer::is_dynamic_name(const std::string& tool_name) {
    return decode_prefix(tool_name).has_value();
}

std::optional<std::string> ToolSynthesizer::decode_prefix(const std::string& tool_name) {
    const std::string admin = kAdminToolPrefix;
    const std::string host = kHostToolPrefix;
    if (text::starts_with(tool_name, admin) && tool_name.size() > admin.size()) {
        return std::string(kControlSigil) + tool_name.substr(admin.size());
    }
    if (text::starts_with(tool_name, host) && tool_name.size() > host.size()) {
        return tool_name.substr(host.size());
    }
    return std::nullopt;
}

std::optional<std::string> ToolSynthesizer::prefix_for(const std::string& tool_name) const {
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = prefix_cache_.find(tool_name);
        if (it != prefix_cache_.end()) return it->second;
    }
    return decode_prefix(tool_name);
}

std::optional<std::string> ToolSynthesizer::resolve_command(const std::string& tool_name,
                                                            const std::string& subcommand,
                                                            const std::string& args) const {
    auto prefix = prefix_for(tool_name);
    if (!prefix) return std::nullopt;
    std::vector<std::string> parts{*prefix};
    std::string s = text::trim(subcommand);
    std::string a = text::trim(args);
    if (!s.empty()) parts.push_back(s);
    if (!a.empty()) parts.push_back(a);
    return text::join(parts, " ");
}

size_t ToolSynthesizer::cached_tools() const {
    std::lock_guard<std::mutex> lk(mu_);
    return prefix_cache_.size();
}

} // namespace hostlink

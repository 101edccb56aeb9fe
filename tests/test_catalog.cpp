#include "test_common.h"
#include "fake_host.h"

#include "hostlink/catalog.h"

#include <algorithm>
#include <string>
#include <vector>

using namespace hostlink;

static bool has_path(const std::vector<CommandCatalogEntry>& es, const std::string& path) {
    return std::any_of(es.begin(), es.end(), [&](const CommandCatalogEntry& e) { return e.path == path; });
}

static const CommandCatalogEntry* find_path(const std::vector<CommandCatalogEntry>& es, const std::string& path) {
    for (const auto& e : es) if (e.path == path) return &e;
    return nullptr;
}

int main() {
    FakeHost host;

    // Breadth-first flattening, executable literals only, natives appended.
    {
        CatalogIntrospector cat(host, 3);
        auto es = cat.list_commands();
        expect_eq_ll((long long)es.size(), 8, "entry count at depth 3");
        expect_true(has_path(es, "!!hl status"), "builtin status");
        expect_true(has_path(es, "!!hl owner list"), "three-token path");
        expect_true(!has_path(es, "!!hl owner"), "non-executable node skipped");
        expect_true(!has_path(es, "!!hl"), "root without handler skipped");
        expect_true(has_path(es, "!!warp"), "executable root listed");
        expect_true(has_path(es, "!!warp <name> confirm"), "argument token shown in angle brackets");
        expect_true(has_path(es, "/help") && has_path(es, "/list"), "host natives appended");

        const auto* st = find_path(es, "!!hl status");
        expect_true(st && st->kind == CatalogEntryKind::BUILTIN, "builtin owner kind");
        expect_eq_str(st->description, "Show status", "description carried over");
        const auto* al = find_path(es, "!!bogus alpha");
        expect_true(al && al->kind == CatalogEntryKind::PLUGIN_COMMAND, "plugin kind");
        expect_eq_str(al->owner_name, "Demo Plugin", "owner name carried over");
        expect_true(es.back().kind == CatalogEntryKind::HOST_NATIVE, "natives come last");

        // Level order within one root.
        auto pos = [&](const std::string& p) {
            for (size_t i = 0; i < es.size(); i++) if (es[i].path == p) return (long long)i;
            return -1LL;
        };
        expect_true(pos("!!hl status") < pos("!!hl owner list"), "shallower paths first");
    }

    // Depth bound counts every token.
    {
        CatalogIntrospector cat(host, 2);
        auto es = cat.list_commands();
        expect_true(!has_path(es, "!!hl owner list"), "depth 2 excludes three-token paths");
        expect_true(!has_path(es, "!!warp <name> confirm"), "depth 2 excludes argument paths");
        expect_eq_ll((long long)es.size(), 6, "entry count at depth 2");
    }

    // Owner filter.
    {
        CatalogIntrospector cat(host);
        auto es = cat.list_commands(std::string("demo"));
        expect_eq_ll((long long)es.size(), 2, "only demo entries");
        expect_true(!has_path(es, "/help"), "natives not appended under a filter");

        auto none = cat.list_commands(std::string("nobody"));
        auto fb = CatalogIntrospector::fallback_entries();
        expect_eq_ll((long long)none.size(), (long long)fb.size(), "unknown owner yields fallback");
        expect_true(has_path(none, "!!hl owner list"), "fallback has owner list");
    }

    // Introspection failure.
    {
        CatalogIntrospector cat(host);
        host.fail_roots = true;
        auto es = cat.list_commands();
        const long long builtin = (long long)CatalogIntrospector::fallback_entries().size();
        const long long native = (long long)CatalogIntrospector::host_native_entries().size();
        expect_eq_ll((long long)es.size(), builtin + native, "fallback plus host natives on failure");
        expect_true(es.back().kind == CatalogEntryKind::HOST_NATIVE, "host natives kept on failure");
        expect_eq_ll((long long)cat.list_commands(std::string("demo")).size(), builtin, "filtered failure is fallback only");
        expect_true(cat.children_of("!!bogus").empty(), "children_of empty on failure");
        host.fail_roots = false;
    }

    // Subcommands below the deepest matching node.
    {
        CatalogIntrospector cat(host);
        auto kids = cat.children_of("!!bogus");
        expect_eq_ll((long long)kids.size(), 2, "two children");
        expect_eq_str(kids[0].path, "!!bogus alpha", "first child path");
        expect_eq_str(kids[1].description, "Second child", "second child description");

        auto hl = cat.children_of("!!hl owner nonsense");
        expect_eq_ll((long long)hl.size(), 1, "stops at owner");
        expect_eq_str(hl[0].path, "!!hl owner list", "child of owner");

        auto warp = cat.children_of("!!warp spawn");
        expect_eq_ll((long long)warp.size(), 1, "argument accepts any token");
        expect_eq_str(warp[0].path, "!!warp <name> confirm", "path through the argument");

        auto top = cat.children_of("!!warp");
        expect_eq_str(top[0].path, "!!warp <name>", "argument child path");

        expect_true(cat.children_of("!!missing").empty(), "no matching root");
        expect_true(cat.children_of("   ").empty(), "blank command");
    }

    expect_eq_str(catalog_entry_kind_name(CatalogEntryKind::HOST_NATIVE), "host_native", "kind name");

    std::cerr << "test_catalog: ALL PASSED" << std::endl;
    return 0;
}

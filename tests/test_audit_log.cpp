#include "test_common.h"
#include "fake_host.h"

#include "hostlink/capture_engine.h"
#include "hostlink/catalog.h"
#include "hostlink/json_mini.h"
#include "hostlink/log.h"

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include <unistd.h>

using namespace hostlink;
namespace jm = hostlink::json_mini;

int main() {
    std::string path = "/tmp/hostlink_test_audit_" + std::to_string(::getpid()) + ".jsonl";
    std::remove(path.c_str());

    expect_eq_str(canonicalize_json(R"({"b":1,"a":{"d":[2,1],"c":null}})"), R"({"a":{"c":null,"d":[2,1]},"b":1})",
                  "keys sorted recursively");
    expect_eq_str(canonicalize_json(R"([{"z":true,"y":"a/b"},"x"])"), R"([{"y":"a/b","z":true},"x"])",
                  "objects inside arrays sorted, slashes kept");
    expect_eq_str(canonicalize_json("not json"), "not json", "unparseable input returned as is");

    {
        JsonlLogger audit("sess_test", path);
        expect_true(audit.ok(), "audit log opens");

        FakeHost host;
        CatalogIntrospector catalog(host);
        CaptureEngine engine(host, catalog);
        engine.set_audit_logger(&audit);

        InvocationResult r = engine.invoke("!!hl status");
        expect_true(r.success, "invocation succeeded");
        engine.set_audit_logger(nullptr);
        engine.invoke("!!hl status");
    }

    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    expect_eq_ll((long long)lines.size(), 2, "invoke and complete recorded once");

    jm::Doc first = jm::parse(lines[0]);
    jm::Doc second = jm::parse(lines[1]);
    expect_true(first && second, "each line is a JSON object");
    expect_true(lines[0].rfind(R"({"event":"invoke","payload":)", 0) == 0, "canonical key order");
    expect_eq_str(jm::get_string(first.root, "session_id").value_or(""), "sess_test", "session id");
    expect_eq_ll(jm::get_int(first.root, "seq").value_or(-1), 0, "first seq");
    expect_eq_ll(jm::get_int(second.root, "seq").value_or(-1), 1, "second seq");
    expect_eq_str(jm::get_string(second.root, "event").value_or(""), "complete", "completion event");

    json_object* p1 = jm::member(first.root, "payload");
    json_object* p2 = jm::member(second.root, "payload");
    expect_eq_str(jm::get_string(p1, "command").value_or(""), "!!hl status", "command recorded");
    expect_eq_str(jm::get_string(p1, "kind").value_or(""), "control", "kind recorded");
    expect_eq_str(jm::get_string(p2, "id").value_or("?"), jm::get_string(p1, "id").value_or("!"), "ids correlate");
    expect_eq_str(jm::get_string(p2, "status").value_or(""), "completed", "status recorded");
    expect_true(jm::get_string(second.root, "ts").value_or("").size() == 20, "UTC timestamp");

    std::remove(path.c_str());
    std::cerr << "test_audit_log: ALL PASSED" << std::endl;
    return 0;
}

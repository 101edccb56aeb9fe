#include "hostlink/log.h"
#include "hostlink/json_mini.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>
#include <string>

namespace hostlink {

static std::string utc_stamp() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// json-c emits object members in insertion order, so rebuilding every
// object with its keys inserted in sorted order is enough.
static json_object* sorted_copy(json_object* v) {
    if (!v) return nullptr;
    if (json_object_is_type(v, json_type_object)) {
        std::map<std::string, json_object*> members;
        json_object_object_foreach(v, key, val) members[key] = val;
        json_object* o = json_object_new_object();
        for (const auto& kv : members) json_object_object_add(o, kv.first.c_str(), sorted_copy(kv.second));
        return o;
    }
    if (json_object_is_type(v, json_type_array)) {
        json_object* a = json_object_new_array();
        const size_t n = json_object_array_length(v);
        for (size_t i = 0; i < n; i++) json_object_array_add(a, sorted_copy(json_object_array_get_idx(v, i)));
        return a;
    }
    return json_object_get(v);
}

static std::string canonical_text(json_object* v) {
    json_mini::Doc sorted(sorted_copy(v));
    return json_mini::to_string(sorted.root);
}

std::string canonicalize_json(const std::string& raw) {
    json_mini::Doc d = json_mini::parse(raw);
    if (!d) return raw;
    return canonical_text(d.root);
}

JsonlLogger::JsonlLogger(const std::string& session_id, const std::string& path)
    : session_id_(session_id), path_(path), out_(path, std::ios::out | std::ios::app) {}

void JsonlLogger::event(const std::string& name, const std::string& payload_json) {
    json_mini::Doc rec(json_object_new_object());
    json_mini::put_string(rec.root, "event", name);
    json_mini::Doc payload = json_mini::parse(payload_json);
    json_object_object_add(rec.root, "payload",
                           payload ? payload.release() : json_mini::new_string(payload_json));
    json_mini::put_string(rec.root, "session_id", session_id_);
    json_mini::put_string(rec.root, "ts", utc_stamp());

    std::lock_guard<std::mutex> lk(mu_);
    json_mini::put_int(rec.root, "seq", (int64_t)seq_++);
    out_ << canonical_text(rec.root) << "\n";
    out_.flush();
}

} // namespace hostlink

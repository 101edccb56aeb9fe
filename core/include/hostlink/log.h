#pragma once
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace hostlink {

// Append-only JSONL audit trail. One canonical (sorted-key) object per line:
//   {"event":..., "payload":{...}, "seq":N, "session_id":..., "ts":"..."}
// Safe to call from several worker threads.
class JsonlLogger {
public:
    JsonlLogger(const std::string& session_id, const std::string& path);
    void event(const std::string& name, const std::string& payload_json);
    const std::string& path() const { return path_; }
    bool ok() const { return out_.good(); }

private:
    std::string session_id_;
    std::string path_;
    std::mutex mu_;
    std::ofstream out_;
    uint64_t seq_{0};
};

// Canonical JSON: parse then re-serialize with sorted keys.
// Returns input unchanged if parsing fails (best-effort).
std::string canonicalize_json(const std::string& raw);

} // namespace hostlink

#pragma once
#include "hostlink/host.h"

#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace hostlink {

// Bounded in-memory store of recent host output. Line numbers are global
// and keep increasing after old lines fall off the front.
class MemoryLogStore : public LogStore {
public:
    explicit MemoryLogStore(size_t capacity = 5000);

    void add(const std::string& content, const std::string& source, bool is_command = false);

    std::vector<LogLine> latest(size_t n) const override;
    std::vector<LogLine> range(int64_t start, int64_t end) const override;
    std::vector<LogLine> snapshot() const override;
    int64_t total_lines() const override;

    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    mutable std::mutex mu_;
    std::deque<LogLine> lines_;
    int64_t next_line_{0};
};

struct LogSearchHit {
    int64_t search_id{0};   // 1-based rank among all matches
    LogLine line;
    std::vector<LogLine> context_before;
    std::vector<LogLine> context_after;
};

struct LogSearchResult {
    bool ok{true};
    std::string error;      // set when the pattern does not compile
    int64_t total_matches{0};
    std::vector<LogSearchHit> hits;
    std::vector<int64_t> ranked_line_numbers; // every match, newest first
};

// Case-insensitive substring or ECMAScript regex search over `lines`.
// Newest matches come first; at most `max_results` hits are returned.
LogSearchResult search_log_lines(const std::vector<LogLine>& lines,
                                 const std::string& query,
                                 bool use_regex,
                                 int context_lines,
                                 int max_results);

// Re-reads matches ranked [start_id, end_id] (1-based, inclusive) of an
// earlier search from `store`. Lines that have since fallen out of the store
// are skipped; context is taken from what the store still holds.
std::vector<LogSearchHit> hits_by_rank(const LogStore& store,
                                       const std::vector<int64_t>& ranked_line_numbers,
                                       int64_t start_id,
                                       int64_t end_id,
                                       int context_lines);

} // namespace hostlink

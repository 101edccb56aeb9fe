#include "hostlink/log_store.h"
#include "hostlink/types.h"

#include <algorithm>
#include <cctype>
#include <regex>

namespace hostlink {

MemoryLogStore::MemoryLogStore(size_t capacity) : capacity_(capacity ? capacity : 1) {}

void MemoryLogStore::add(const std::string& content, const std::string& source, bool is_command) {
    std::lock_guard<std::mutex> lk(mu_);
    LogLine l;
    l.line_number = next_line_++;
    l.content = content;
    l.timestamp_ms = now_epoch_ms();
    l.source = source;
    l.is_command = is_command;
    lines_.push_back(std::move(l));
    while (lines_.size() > capacity_) lines_.pop_front();
}

std::vector<LogLine> MemoryLogStore::latest(size_t n) const {
    std::lock_guard<std::mutex> lk(mu_);
    size_t take = std::min(n, lines_.size());
    return std::vector<LogLine>(lines_.end() - (std::ptrdiff_t)take, lines_.end());
}

std::vector<LogLine> MemoryLogStore::range(int64_t start, int64_t end) const {
    std::vector<LogLine> out;
    if (end <= start) return out;
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& l : lines_) {
        if (l.line_number >= end) break;
        if (l.line_number >= start) out.push_back(l);
    }
    return out;
}

std::vector<LogLine> MemoryLogStore::snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    return std::vector<LogLine>(lines_.begin(), lines_.end());
}

int64_t MemoryLogStore::total_lines() const {
    std::lock_guard<std::mutex> lk(mu_);
    return next_line_;
}

static std::string lower(std::string s) {
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

LogSearchResult search_log_lines(const std::vector<LogLine>& lines,
                                 const std::string& query,
                                 bool use_regex,
                                 int context_lines,
                                 int max_results) {
    LogSearchResult res;
    context_lines = std::clamp(context_lines, 0, 10);
    max_results = std::clamp(max_results, 1, 5);

    std::regex re;
    if (use_regex) {
        try {
            re = std::regex(query, std::regex::ECMAScript | std::regex::icase);
        } catch (const std::regex_error& e) {
            res.ok = false;
            res.error = std::string("invalid regex: ") + e.what();
            return res;
        }
    }
    const std::string needle = lower(query);

    std::vector<size_t> matches;
    for (size_t i = 0; i < lines.size(); i++) {
        bool hit = use_regex ? std::regex_search(lines[i].content, re)
                             : lower(lines[i].content).find(needle) != std::string::npos;
        if (hit) matches.push_back(i);
    }
    res.total_matches = (int64_t)matches.size();

    std::reverse(matches.begin(), matches.end());
    res.ranked_line_numbers.reserve(matches.size());
    for (size_t idx : matches) res.ranked_line_numbers.push_back(lines[idx].line_number);

    int64_t rank = 0;
    for (size_t idx : matches) {
        if ((int)res.hits.size() >= max_results) break;
        LogSearchHit h;
        h.search_id = ++rank;
        h.line = lines[idx];
        size_t from = idx >= (size_t)context_lines ? idx - (size_t)context_lines : 0;
        for (size_t j = from; j < idx; j++) h.context_before.push_back(lines[j]);
        size_t to = std::min(lines.size(), idx + 1 + (size_t)context_lines);
        for (size_t j = idx + 1; j < to; j++) h.context_after.push_back(lines[j]);
        res.hits.push_back(std::move(h));
    }
    return res;
}

std::vector<LogSearchHit> hits_by_rank(const LogStore& store,
                                       const std::vector<int64_t>& ranked_line_numbers,
                                       int64_t start_id,
                                       int64_t end_id,
                                       int context_lines) {
    std::vector<LogSearchHit> out;
    context_lines = std::clamp(context_lines, 0, 10);
    start_id = std::max<int64_t>(1, start_id);
    end_id = std::min<int64_t>(end_id, (int64_t)ranked_line_numbers.size());

    for (int64_t id = start_id; id <= end_id; id++) {
        const int64_t ln = ranked_line_numbers[(size_t)(id - 1)];
        auto window = store.range(std::max<int64_t>(0, ln - context_lines), ln + context_lines + 1);
        auto it = std::find_if(window.begin(), window.end(),
                               [ln](const LogLine& l) { return l.line_number == ln; });
        if (it == window.end()) continue;

        LogSearchHit h;
        h.search_id = id;
        h.line = *it;
        h.context_before.assign(window.begin(), it);
        h.context_after.assign(it + 1, window.end());
        out.push_back(std::move(h));
    }
    return out;
}

} // namespace hostlink

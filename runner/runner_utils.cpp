#include "runner_utils.h"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <random>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace hostlink {

CliSplit split_cli(int argc, char** argv, int first) {
    CliSplit out;
    bool after = false;
    for (int i = first; i < argc; i++) {
        std::string a = argv[i];
        if (!after && a == "--") { after = true; continue; }
        if (after) out.host_argv.push_back(a);
        else out.flags.push_back(a);
    }
    return out;
}

static bool parse_int_flag(const std::string& name, const std::string& v, int lo, int hi, int* out, std::string* err) {
    try {
        size_t used = 0;
        int x = std::stoi(v, &used);
        if (used != v.size() || x < lo || x > hi) throw std::out_of_range(v);
        *out = x;
        return true;
    } catch (const std::exception&) {
        if (err) *err = name + " expects an integer in [" + std::to_string(lo) + ", " + std::to_string(hi) + "], got '" + v + "'";
        return false;
    }
}

bool apply_cli_overrides(ServerConfig& cfg,
                         const std::vector<std::string>& flags,
                         std::vector<std::string>* rest,
                         std::string* err) {
    for (size_t i = 0; i < flags.size(); i++) {
        const std::string& a = flags[i];
        const bool has_value = i + 1 < flags.size();
        if (a == "--host" && has_value) { cfg.host = flags[++i]; continue; }
        if (a == "--port" && has_value) {
            if (!parse_int_flag(a, flags[++i], 0, 65535, &cfg.port, err)) return false;
            continue;
        }
        if (a == "--allow" && has_value) {
            auto list = split_csv(flags[++i]);
            if (list.empty()) {
                if (err) *err = "--allow expects a comma separated address list";
                return false;
            }
            cfg.allowed_ips = list;
            continue;
        }
        if (a == "--workers" && has_value) {
            if (!parse_int_flag(a, flags[++i], 1, 64, &cfg.workers, err)) return false;
            continue;
        }
        if (a == "--timeout_ms" && has_value) {
            if (!parse_int_flag(a, flags[++i], 100, 600000, &cfg.cmd_timeout_ms, err)) return false;
            continue;
        }
        if (a == "--audit" && has_value) { cfg.audit_log = flags[++i]; continue; }
        if (rest) rest->push_back(a);
    }
    return true;
}

std::string gen_session_id() {
    uint64_t t = (uint64_t)std::chrono::high_resolution_clock::now().time_since_epoch().count();
    uint64_t r = 0;
    try {
        std::random_device rd;
        r = ((uint64_t)rd() << 32) ^ (uint64_t)rd();
    } catch (const std::exception&) {
        r = 0x9e3779b97f4a7c15ULL;
    }
    std::mt19937_64 rng{t ^ r};
    std::ostringstream oss;
    oss << std::hex << rng() << rng();
    return oss.str();
}

void sleep_ms(int ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

BridgeStack::~BridgeStack() {
    if (host) host->set_history_provider(nullptr);
    engine.reset();
    audit.reset();
    catalog.reset();
    host.reset();
    logs.reset();
}

std::unique_ptr<BridgeStack> build_bridge(const ServerConfig& cfg, const std::vector<std::string>& host_argv) {
    auto s = std::make_unique<BridgeStack>();
    s->cfg = cfg;
    s->logs = std::make_unique<MemoryLogStore>(cfg.log_capacity);

    ProcessHostOptions po;
    po.argv = host_argv;
    s->host = std::make_unique<ProcessHost>(po, s->logs.get());

    s->catalog = std::make_unique<CatalogIntrospector>(*s->host, cfg.catalog_depth);

    if (!cfg.audit_log.empty()) {
        s->audit = std::make_unique<JsonlLogger>(gen_session_id(), cfg.audit_log);
        if (!s->audit->ok()) throw std::runtime_error("cannot open audit log: " + cfg.audit_log);
    }

    EngineOptions eo;
    eo.timeout_ms = cfg.cmd_timeout_ms;
    eo.poll_ms = cfg.poll_ms;
    eo.max_history = (size_t)cfg.max_history;
    s->engine = std::make_unique<CaptureEngine>(*s->host, *s->catalog, eo);
    s->engine->set_audit_logger(s->audit.get());

    CaptureEngine* engine = s->engine.get();
    s->host->set_history_provider([engine] {
        std::vector<std::string> lines;
        for (const auto& r : engine->history()) {
            lines.push_back(r.id + " [" + invocation_status_name(r.status) + "] " + r.command);
        }
        return lines;
    });
    return s;
}

} // namespace hostlink

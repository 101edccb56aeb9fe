#pragma once

#include "hostlink/capture_engine.h"
#include "hostlink/catalog.h"
#include "hostlink/config.h"
#include "hostlink/log.h"
#include "hostlink/log_store.h"
#include "hostlink/process_host.h"

#include <memory>
#include <string>
#include <vector>

namespace hostlink {

// argv split at "--": flags before it, managed-server argv after it.
struct CliSplit {
    std::vector<std::string> flags;
    std::vector<std::string> host_argv;
};

CliSplit split_cli(int argc, char** argv, int first);

// Applies --host/--port/--allow/--workers/--timeout_ms/--audit on top of
// `cfg`. Arguments it does not recognize are appended to `rest` (if given).
// Returns false with *err set on a malformed value.
bool apply_cli_overrides(ServerConfig& cfg,
                         const std::vector<std::string>& flags,
                         std::vector<std::string>* rest,
                         std::string* err);

std::string gen_session_id();
void sleep_ms(int ms);

// The engine stack shared by serve and exec. Members are declared in
// construction order; the destructor unwinds the engine before the host.
struct BridgeStack {
    ServerConfig cfg;
    std::unique_ptr<MemoryLogStore> logs;
    std::unique_ptr<ProcessHost> host;
    std::unique_ptr<CatalogIntrospector> catalog;
    std::unique_ptr<JsonlLogger> audit;
    std::unique_ptr<CaptureEngine> engine;

    ~BridgeStack();
};

// Throws std::runtime_error if the audit log cannot be opened.
std::unique_ptr<BridgeStack> build_bridge(const ServerConfig& cfg, const std::vector<std::string>& host_argv);

} // namespace hostlink

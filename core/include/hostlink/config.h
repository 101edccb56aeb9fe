#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace hostlink {

enum class Profile { DEV, PROD };

// Detect profile from HOSTLINK_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: lenient (large frames, generous timeouts)
// PROD: strict (256 KiB frames, loopback-only allow-list)
void apply_profile_defaults(Profile p);

// Everything the serve/exec commands need, resolved from the environment.
struct ServerConfig {
    std::string host{"127.0.0.1"};
    int port{8765};
    std::vector<std::string> allowed_ips{"127.0.0.1"};

    int workers{2};
    int cmd_timeout_ms{10000};
    int poll_ms{100};
    int max_history{100};
    int catalog_depth{3};
    bool dynamic_tools{true};

    size_t max_message_bytes{1024 * 1024};
    int stop_wait_ms{5000};
    size_t log_capacity{5000};

    std::string audit_log; // empty = no audit trail
};

// Read HOSTLINK_* variables; anything unset or malformed keeps the default.
// Values are clamped to sane ranges.
ServerConfig load_server_config();

int getenv_int(const char* key, int defv);
std::string getenv_str(const char* key, const std::string& defv);

// "a, b,,c" -> {"a","b","c"}
std::vector<std::string> split_csv(const std::string& s);

} // namespace hostlink

#include "hostlink/config.h"
#include "hostlink/text.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace hostlink {

Profile detect_profile() {
    const char* env = std::getenv("HOSTLINK_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any worker threads are created.
    // setenv() is not thread-safe with getenv() on some platforms.
    // overwrite=0: won't override existing env vars
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("HOSTLINK_MAX_MESSAGE_BYTES", "1048576", NO_OVERWRITE);
            setenv("HOSTLINK_CMD_TIMEOUT_MS",    "10000",   NO_OVERWRITE);
            setenv("HOSTLINK_WORKERS",           "2",       NO_OVERWRITE);
            setenv("HOSTLINK_DYNAMIC_TOOLS",     "1",       NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("HOSTLINK_MAX_MESSAGE_BYTES", "262144",  NO_OVERWRITE);
            setenv("HOSTLINK_CMD_TIMEOUT_MS",    "10000",   NO_OVERWRITE);
            setenv("HOSTLINK_WORKERS",           "2",       NO_OVERWRITE);
            setenv("HOSTLINK_DYNAMIC_TOOLS",     "1",       NO_OVERWRITE);
            // Network: loopback only unless the operator widens it explicitly
            setenv("HOSTLINK_ALLOWED_IPS",       "127.0.0.1", NO_OVERWRITE);
            break;
    }
}

int getenv_int(const char* key, int defv) {
    const char* v = std::getenv(key);
    if (!v || !*v) return defv;
    errno = 0;
    char* end = nullptr;
    long x = std::strtol(v, &end, 10);
    if (errno != 0 || end == v || *end != '\0') return defv;
    if (x < INT_MIN || x > INT_MAX) return defv;
    return (int)x;
}

std::string getenv_str(const char* key, const std::string& defv) {
    const char* v = std::getenv(key);
    if (!v) return defv;
    return std::string(v);
}

std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        size_t comma = s.find(',', start);
        if (comma == std::string::npos) comma = s.size();
        std::string item = text::trim(s.substr(start, comma - start));
        if (!item.empty()) out.push_back(item);
        start = comma + 1;
    }
    return out;
}

ServerConfig load_server_config() {
    ServerConfig c;
    c.host = getenv_str("HOSTLINK_HOST", c.host);
    c.port = std::clamp(getenv_int("HOSTLINK_PORT", c.port), 0, 65535);

    if (const char* ips = std::getenv("HOSTLINK_ALLOWED_IPS")) {
        auto list = split_csv(ips);
        if (!list.empty()) c.allowed_ips = list;
    }

    c.workers        = std::clamp(getenv_int("HOSTLINK_WORKERS", c.workers), 1, 64);
    c.cmd_timeout_ms = std::clamp(getenv_int("HOSTLINK_CMD_TIMEOUT_MS", c.cmd_timeout_ms), 100, 600000);
    c.poll_ms        = std::clamp(getenv_int("HOSTLINK_POLL_MS", c.poll_ms), 5, 1000);
    c.max_history    = std::clamp(getenv_int("HOSTLINK_MAX_HISTORY", c.max_history), 1, 100000);
    c.catalog_depth  = std::clamp(getenv_int("HOSTLINK_CATALOG_DEPTH", c.catalog_depth), 1, 16);
    c.dynamic_tools  = getenv_int("HOSTLINK_DYNAMIC_TOOLS", 1) != 0;

    int max_msg = getenv_int("HOSTLINK_MAX_MESSAGE_BYTES", (int)c.max_message_bytes);
    c.max_message_bytes = (size_t)std::clamp(max_msg, 1024, 64 * 1024 * 1024);

    c.stop_wait_ms = std::clamp(getenv_int("HOSTLINK_STOP_WAIT_MS", c.stop_wait_ms), 0, 60000);
    c.log_capacity = (size_t)std::clamp(getenv_int("HOSTLINK_LOG_CAPACITY", (int)c.log_capacity), 16, 1000000);

    c.audit_log = getenv_str("HOSTLINK_AUDIT_LOG", "");
    return c;
}

} // namespace hostlink

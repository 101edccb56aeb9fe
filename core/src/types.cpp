#include "hostlink/types.h"

namespace hostlink {

const char* command_kind_name(CommandKind k) {
    switch (k) {
        case CommandKind::CONTROL: return "control";
        case CommandKind::HOST:    return "host";
    }
    return "host";
}

const char* invocation_status_name(InvocationStatus s) {
    switch (s) {
        case InvocationStatus::PENDING:   return "pending";
        case InvocationStatus::COMPLETED: return "completed";
        case InvocationStatus::TIMED_OUT: return "timed_out";
        case InvocationStatus::FAILED:    return "failed";
    }
    return "failed";
}

CommandKind classify_command(const std::string& command_text) {
    if (command_text.rfind(kControlSigil, 0) == 0) return CommandKind::CONTROL;
    return CommandKind::HOST;
}

int64_t now_epoch_ms() {
    using namespace std::chrono;
    return (int64_t)duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

int64_t now_epoch_us() {
    using namespace std::chrono;
    return (int64_t)duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace hostlink

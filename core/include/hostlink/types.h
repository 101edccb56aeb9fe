#pragma once
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace hostlink {

// Two-character marker routing a command to the host's administrative
// interpreter instead of its raw console.
constexpr const char* kControlSigil = "!!";

enum class CommandKind {
    CONTROL, // "!!..." -> admin interpreter, synchronous reply sink
    HOST,    // anything else -> raw console, output observed asynchronously
};

enum class InvocationStatus {
    PENDING,
    COMPLETED,
    TIMED_OUT,
    FAILED,
};

const char* command_kind_name(CommandKind k);
const char* invocation_status_name(InvocationStatus s);

CommandKind classify_command(const std::string& command_text);

// What a caller gets back from CaptureEngine::invoke.
// TIMED_OUT is still success=true: partial output is a valid answer.
struct InvocationResult {
    bool success{false};
    std::string id;
    std::string command;
    CommandKind kind{CommandKind::HOST};
    InvocationStatus status{InvocationStatus::PENDING};
    std::string output;             // lines joined with '\n'
    std::vector<std::string> lines;
    std::string error;
    int64_t timestamp{0};           // epoch seconds at issue
    int64_t elapsed_ms{0};
};

// Host rejected or threw on command submission.
class HostError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// JSON-RPC error codes used on the wire.
constexpr int kRpcParseError = -32700;
constexpr int kRpcInvalidRequest = -32600;
constexpr int kRpcMethodNotFound = -32601;
constexpr int kRpcInvalidParams = -32602;
constexpr int kRpcInternalError = -32603;

// A failure that maps onto a JSON-RPC error object.
class RpcError : public std::runtime_error {
public:
    RpcError(int code, const std::string& message, std::string data = {})
        : std::runtime_error(message), code_(code), data_(std::move(data)) {}
    int code() const { return code_; }
    const std::string& data() const { return data_; }

private:
    int code_;
    std::string data_;
};

int64_t now_epoch_ms();
int64_t now_epoch_us();

} // namespace hostlink

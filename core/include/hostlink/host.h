#pragma once

// host.h
//
// The narrow surface the engine needs from a managed host: an administrative
// entry point with a synchronous reply sink, a raw fire-and-forget console,
// an output-line subscription and the registered command graph.

#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace hostlink {

// Receives reply lines from the administrative interpreter, in order.
class ReplySink {
public:
    virtual ~ReplySink() = default;
    virtual void append(const std::string& line) = 0;
};

// Handler bound to an executable node. `args` holds the values matched by
// argument nodes along the path, in order.
using CommandHandler = std::function<void(ReplySink& sink, const std::vector<std::string>& args)>;

struct CommandNode;

struct LiteralNode {
    std::string text;
    std::string description;
    CommandHandler handler; // empty => not executable on its own
    std::vector<CommandNode> children;
};

// Matches exactly one whitespace-free token.
struct ArgumentNode {
    std::string name;
    std::string description;
    CommandHandler handler;
    std::vector<CommandNode> children;
};

struct CommandNode {
    std::variant<LiteralNode, ArgumentNode> node;

    static CommandNode literal(std::string text, std::string description = {}, CommandHandler handler = {});
    static CommandNode argument(std::string name, std::string description = {}, CommandHandler handler = {});

    // Appends a child and returns *this for chaining.
    CommandNode& then(CommandNode child);

    bool is_literal() const { return std::holds_alternative<LiteralNode>(node); }
    const std::string& label() const;
    const std::string& description() const;
    const CommandHandler& handler() const;
    const std::vector<CommandNode>& children() const;
    bool executable() const { return static_cast<bool>(handler()); }
};

// One registered command tree and who registered it.
struct CommandRoot {
    std::string owner_id;
    std::string owner_name;
    CommandNode node;
};

using OutputCallback = std::function<void(const std::string& line)>;

class HostAdapter {
public:
    virtual ~HostAdapter() = default;

    // Runs a "!!" command to completion, replying through `sink` before
    // returning. Throws HostError if the command cannot be submitted.
    virtual void execute_admin(const std::string& command, ReplySink& sink) = 0;

    // Hands one line to the host console. Output shows up later on the
    // subscription. Throws HostError if the host cannot accept it.
    virtual void execute_raw(const std::string& command) = 0;

    // Snapshot of the registered command graph. May throw.
    virtual std::vector<CommandRoot> command_roots() const = 0;

    virtual int subscribe_output(OutputCallback cb) = 0;
    virtual void unsubscribe_output(int id) = 0;

    virtual bool is_running() const = 0;
    virtual bool startup_done() const = 0;
};

struct LogLine {
    int64_t line_number{0};
    std::string content;
    int64_t timestamp_ms{0};
    std::string source;   // "host", "admin" or "command"
    bool is_command{false};
};

// Read side of the host's recent-output store.
class LogStore {
public:
    virtual ~LogStore() = default;
    virtual std::vector<LogLine> latest(size_t n) const = 0;
    // Lines with start <= line_number < end.
    virtual std::vector<LogLine> range(int64_t start, int64_t end) const = 0;
    virtual std::vector<LogLine> snapshot() const = 0;
    virtual int64_t total_lines() const = 0;
};

} // namespace hostlink

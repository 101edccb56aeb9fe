#pragma once
#include "hostlink/admin_interpreter.h"
#include "hostlink/host.h"
#include "hostlink/log_store.h"

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <regex>
#include <string>
#include <thread>
#include <vector>

namespace hostlink {

struct ProcessHostOptions {
    std::vector<std::string> argv;   // argv[0] is the executable; empty = no managed process
    std::string cwd;
    std::string stop_command{"stop"};
    int stop_timeout_ms{10000};
    // A line matching this marks startup as complete.
    std::string startup_pattern{R"(Done \(\d+\.\d+s\)!)"};
};

// Host adapter around a child process (typically a game server). Console
// input goes to the child's stdin; merged stdout/stderr is read line by line,
// recorded in the log store and published to output subscribers.
class ProcessHost : public HostAdapter {
public:
    // `logs` is not owned and may be null.
    ProcessHost(ProcessHostOptions opts, MemoryLogStore* logs);
    ~ProcessHost() override;

    ProcessHost(const ProcessHost&) = delete;
    ProcessHost& operator=(const ProcessHost&) = delete;

    // Returns false with *err set if the process cannot be spawned.
    bool start(std::string* err);
    // Sends the stop command, waits, then kills the process group.
    void stop();
    bool restart(std::string* err);

    AdminInterpreter& admin() { return admin_; }

    // Lines shown by "!!hl history".
    void set_history_provider(std::function<std::vector<std::string>()> provider);

    void execute_admin(const std::string& command, ReplySink& sink) override;
    void execute_raw(const std::string& command) override;
    std::vector<CommandRoot> command_roots() const override;
    int subscribe_output(OutputCallback cb) override;
    void unsubscribe_output(int id) override;
    bool is_running() const override { return running_.load(); }
    bool startup_done() const override { return startup_done_.load(); }

    int pid() const { return pid_.load(); }
    int last_exit_code() const { return exit_code_.load(); }

private:
    void register_builtin_commands();
    void reader_loop(int out_fd, int pid);
    void publish(const std::string& line);
    void write_line(const std::string& line);

    ProcessHostOptions opts_;
    MemoryLogStore* logs_;
    AdminInterpreter admin_;
    std::regex startup_re_;

    std::mutex lifecycle_mu_;   // start/stop/restart
    std::mutex stdin_mu_;
    int stdin_fd_{-1};
    std::thread reader_;
    std::atomic<int> pid_{-1};
    std::atomic<bool> running_{false};
    std::atomic<bool> startup_done_{false};
    std::atomic<int> exit_code_{-1};

    std::mutex sub_mu_;
    std::mutex dispatch_mu_;
    std::map<int, OutputCallback> subscribers_;
    int next_sub_{1};

    std::mutex history_mu_;
    std::function<std::vector<std::string>()> history_;
};

} // namespace hostlink

#include "hostlink/process_host.h"
#include "hostlink/catalog.h"
#include "hostlink/text.h"
#include "hostlink/types.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <set>

#include <fcntl.h>
#include <sys/prctl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace hostlink {

namespace {

// Mirrors admin replies into the log store on their way to the caller.
class TeeSink : public ReplySink {
public:
    TeeSink(ReplySink& inner, MemoryLogStore* logs) : inner_(inner), logs_(logs) {}
    void append(const std::string& line) override {
        if (logs_) logs_->add(line, "admin");
        inner_.append(line);
    }

private:
    ReplySink& inner_;
    MemoryLogStore* logs_;
};

bool wait_until_stopped(const std::atomic<bool>& running, int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (running.load()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return true;
}

} // namespace

ProcessHost::ProcessHost(ProcessHostOptions opts, MemoryLogStore* logs)
    : opts_(std::move(opts)), logs_(logs), startup_re_(opts_.startup_pattern, std::regex::ECMAScript) {
    register_builtin_commands();
}

ProcessHost::~ProcessHost() {
    stop();
}

void ProcessHost::set_history_provider(std::function<std::vector<std::string>()> provider) {
    std::lock_guard<std::mutex> lk(history_mu_);
    history_ = std::move(provider);
}

void ProcessHost::register_builtin_commands() {
    CommandNode root = CommandNode::literal(kBuiltinRootLiteral, "Hostlink administrative commands");

    root.then(CommandNode::literal("status", "Show bridge and host status",
        [this](ReplySink& s, const std::vector<std::string>&) {
            s.append("Hostlink bridge is online");
            if (running_.load()) s.append("Host process: running (pid " + std::to_string(pid_.load()) + ")");
            else s.append("Host process: stopped (last exit code " + std::to_string(exit_code_.load()) + ")");
            s.append(std::string("Startup complete: ") + (startup_done_.load() ? "yes" : "no"));
            s.append("Registered command roots: " + std::to_string(admin_.roots().size()));
        }));

    root.then(CommandNode::literal("help", "Show administrative help",
        [this](ReplySink& s, const std::vector<std::string>&) {
            s.append("Available administrative commands:");
            for (const auto& r : admin_.roots()) {
                for (const auto& c : r.node.children()) {
                    std::string line = "  " + r.node.label() + " " + c.label();
                    if (!c.description().empty()) line += " - " + c.description();
                    s.append(line);
                }
                if (r.node.executable()) s.append("  " + r.node.label() + " - " + r.node.description());
            }
        }));

    root.then(CommandNode::literal("owner", "Command owner queries")
        .then(CommandNode::literal("list", "List command owners",
            [this](ReplySink& s, const std::vector<std::string>&) {
                auto roots = admin_.roots();
                std::set<std::string> seen;
                s.append("Command owners:");
                for (const auto& r : roots) {
                    if (!seen.insert(r.owner_id).second) continue;
                    std::vector<std::string> literals;
                    for (const auto& rr : roots) {
                        if (rr.owner_id == r.owner_id) literals.push_back(rr.node.label());
                    }
                    s.append("- " + r.owner_id + " (" + r.owner_name + "): " + text::join(literals, ", "));
                }
            })));

    root.then(CommandNode::literal("start", "Start the managed host",
        [this](ReplySink& s, const std::vector<std::string>&) {
            if (running_.load()) { s.append("Host is already running"); return; }
            std::string err;
            if (start(&err)) s.append("Host started (pid " + std::to_string(pid_.load()) + ")");
            else s.append("Failed to start host: " + err);
        }));

    root.then(CommandNode::literal("stop", "Stop the managed host",
        [this](ReplySink& s, const std::vector<std::string>&) {
            if (!running_.load()) { s.append("Host is not running"); return; }
            s.append("Stopping host...");
            stop();
            s.append("Host stopped (exit code " + std::to_string(exit_code_.load()) + ")");
        }));

    root.then(CommandNode::literal("restart", "Restart the managed host",
        [this](ReplySink& s, const std::vector<std::string>&) {
            std::string err;
            if (restart(&err)) s.append("Host restarted (pid " + std::to_string(pid_.load()) + ")");
            else s.append("Failed to restart host: " + err);
        }));

    auto show_history = [this](ReplySink& s, const std::vector<std::string>& args) {
        std::vector<std::string> lines;
        {
            std::lock_guard<std::mutex> lk(history_mu_);
            if (history_) lines = history_();
        }
        size_t limit = 10;
        if (!args.empty()) {
            try {
                long v = std::stol(args[0]);
                if (v > 0) limit = (size_t)v;
            } catch (const std::exception&) {
                s.append("Invalid count: " + args[0]);
                return;
            }
        }
        if (lines.empty()) { s.append("No commands issued yet"); return; }
        size_t from = lines.size() > limit ? lines.size() - limit : 0;
        s.append("Recent commands:");
        for (size_t i = from; i < lines.size(); i++) s.append("  " + lines[i]);
    };
    root.then(CommandNode::literal("history", "Show recently issued commands", show_history)
        .then(CommandNode::argument("count", "How many entries to show", show_history)));

    admin_.register_root(CommandRoot{kBuiltinOwnerId, kBuiltinOwnerName, std::move(root)});
}

bool ProcessHost::start(std::string* err) {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (running_.load()) {
        if (err) *err = "host is already running";
        return false;
    }
    if (opts_.argv.empty() || opts_.argv[0].empty()) {
        if (err) *err = "no host command configured";
        return false;
    }
    if (reader_.joinable()) reader_.join();

    // A child that exits between our liveness check and write() must not kill us.
    ::signal(SIGPIPE, SIG_IGN);

    int in_pipe[2];
    int out_pipe[2];
    if (::pipe2(in_pipe, O_CLOEXEC) != 0) {
        if (err) *err = std::string("pipe(in) failed: ") + std::strerror(errno);
        return false;
    }
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        if (err) *err = std::string("pipe(out) failed: ") + std::strerror(errno);
        ::close(in_pipe[0]); ::close(in_pipe[1]);
        return false;
    }

    std::vector<char*> cargv;
    cargv.reserve(opts_.argv.size() + 1);
    for (const auto& s : opts_.argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        if (err) *err = std::string("fork failed: ") + std::strerror(errno);
        ::close(in_pipe[0]); ::close(in_pipe[1]);
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        return false;
    }

    if (pid == 0) {
        // child
        (void)dup2(in_pipe[0], STDIN_FILENO);
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(out_pipe[1], STDERR_FILENO);

        // own process group so stop() can signal the whole subtree
        (void)setpgid(0, 0);

        long maxfd = sysconf(_SC_OPEN_MAX);
        if (maxfd < 256) maxfd = 256;
        for (int fd = 3; fd < maxfd; fd++) {
            (void)close(fd);
        }

        if (!opts_.cwd.empty() && chdir(opts_.cwd.c_str()) != 0) _exit(126);

        (void)prctl(PR_SET_PDEATHSIG, SIGTERM);

        execvp(cargv[0], cargv.data());
        _exit(127);
    }

    // parent
    (void)setpgid(pid, pid);
    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    {
        std::lock_guard<std::mutex> slk(stdin_mu_);
        stdin_fd_ = in_pipe[1];
    }
    pid_.store((int)pid);
    exit_code_.store(-1);
    startup_done_.store(false);
    running_.store(true);

    reader_ = std::thread([this, fd = out_pipe[0], p = (int)pid] { reader_loop(fd, p); });
    std::cerr << "[host] started pid=" << pid << " cmd=" << opts_.argv[0] << "\n";
    return true;
}

void ProcessHost::stop() {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (running_.load()) {
        const int pid = pid_.load();
        std::cerr << "[host] stopping pid=" << pid << "\n";
        try {
            write_line(opts_.stop_command);
        } catch (const HostError& e) {
            std::cerr << "[host] stop command not delivered: " << e.what() << "\n";
        }
        if (!wait_until_stopped(running_, opts_.stop_timeout_ms) && pid > 0) {
            std::cerr << "[host] pid=" << pid << " ignored stop command, sending SIGTERM\n";
            (void)kill(-pid, SIGTERM);
            (void)kill(pid, SIGTERM);
            if (!wait_until_stopped(running_, 2000)) {
                (void)kill(-pid, SIGKILL);
                (void)kill(pid, SIGKILL);
            }
        }
    }
    if (reader_.joinable()) reader_.join();
}

bool ProcessHost::restart(std::string* err) {
    stop();
    return start(err);
}

void ProcessHost::reader_loop(int out_fd, int pid) {
    std::string buf;
    char chunk[4096];

    auto handle_line = [this](std::string line) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        line = text::strip_formatting(line);
        if (logs_) logs_->add(line, "host");
        if (!startup_done_.load() && std::regex_search(line, startup_re_)) startup_done_.store(true);
        publish(line);
    };

    while (true) {
        ssize_t n = ::read(out_fd, chunk, sizeof(chunk));
        if (n > 0) {
            buf.append(chunk, (size_t)n);
            size_t pos;
            while ((pos = buf.find('\n')) != std::string::npos) {
                std::string line = buf.substr(0, pos);
                buf.erase(0, pos + 1);
                handle_line(std::move(line));
            }
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break; // EOF or error
    }
    if (!buf.empty()) handle_line(buf);
    ::close(out_fd);

    int status = 0;
    int code = -1;
    while (true) {
        pid_t w = ::waitpid((pid_t)pid, &status, 0);
        if (w == (pid_t)pid) {
            if (WIFEXITED(status)) code = WEXITSTATUS(status);
            else if (WIFSIGNALED(status)) code = 128 + WTERMSIG(status);
            break;
        }
        if (w < 0 && errno == EINTR) continue;
        break;
    }

    {
        std::lock_guard<std::mutex> lk(stdin_mu_);
        if (stdin_fd_ >= 0) ::close(stdin_fd_);
        stdin_fd_ = -1;
    }
    exit_code_.store(code);
    pid_.store(-1);
    running_.store(false);
    std::cerr << "[host] pid=" << pid << " exited with code " << code << "\n";
}

void ProcessHost::write_line(const std::string& line) {
    std::string data = line + "\n";
    std::lock_guard<std::mutex> lk(stdin_mu_);
    if (stdin_fd_ < 0) throw HostError("host process is not running");
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(stdin_fd_, data.data() + off, data.size() - off);
        if (n > 0) { off += (size_t)n; continue; }
        if (n < 0 && errno == EINTR) continue;
        throw HostError(std::string("write to host failed: ") + std::strerror(errno));
    }
}

void ProcessHost::execute_admin(const std::string& command, ReplySink& sink) {
    if (logs_) logs_->add(command, "command", true);
    TeeSink tee(sink, logs_);
    admin_.execute(command, tee);
}

void ProcessHost::execute_raw(const std::string& command) {
    if (!running_.load()) throw HostError("host process is not running");
    if (logs_) logs_->add(command, "command", true);
    write_line(command);
}

std::vector<CommandRoot> ProcessHost::command_roots() const {
    return admin_.roots();
}

int ProcessHost::subscribe_output(OutputCallback cb) {
    std::lock_guard<std::mutex> lk(sub_mu_);
    int id = next_sub_++;
    subscribers_[id] = std::move(cb);
    return id;
}

void ProcessHost::unsubscribe_output(int id) {
    {
        std::lock_guard<std::mutex> lk(sub_mu_);
        subscribers_.erase(id);
    }
    // Wait out a dispatch that may still hold the old callback.
    std::lock_guard<std::mutex> dlk(dispatch_mu_);
}

void ProcessHost::publish(const std::string& line) {
    std::vector<OutputCallback> cbs;
    {
        std::lock_guard<std::mutex> lk(sub_mu_);
        cbs.reserve(subscribers_.size());
        for (const auto& kv : subscribers_) cbs.push_back(kv.second);
    }
    std::lock_guard<std::mutex> dlk(dispatch_mu_);
    for (const auto& cb : cbs) {
        try {
            cb(line);
        } catch (const std::exception& e) {
            std::cerr << "[host] output subscriber failed: " << e.what() << "\n";
        }
    }
}

} // namespace hostlink

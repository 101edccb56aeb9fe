#include "hostlink/stdio_bridge.h"
#include "hostlink/dispatcher.h"
#include "hostlink/json_mini.h"
#include "hostlink/text.h"
#include "hostlink/types.h"

#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_no_tls_client.hpp>

#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <thread>

namespace hostlink {

namespace {

typedef websocketpp::client<websocketpp::config::asio_client> ws_client;

enum class LinkState { CONNECTING, OPEN, CLOSED };

class StdioBridge {
public:
    StdioBridge(const StdioBridgeOptions& opts, std::ostream& out) : opts_(opts), out_(out) {
        client_.clear_access_channels(websocketpp::log::alevel::all);
        client_.clear_error_channels(websocketpp::log::elevel::all);
        client_.init_asio();

        client_.set_open_handler([this](websocketpp::connection_hdl) {
            std::lock_guard<std::mutex> lk(mu_);
            state_ = LinkState::OPEN;
            cv_.notify_all();
        });
        client_.set_fail_handler([this](websocketpp::connection_hdl h) {
            websocketpp::lib::error_code ec;
            auto con = client_.get_con_from_hdl(h, ec);
            std::lock_guard<std::mutex> lk(mu_);
            if (!ec) fail_reason_ = con->get_ec().message();
            state_ = LinkState::CLOSED;
            cv_.notify_all();
        });
        client_.set_close_handler([this](websocketpp::connection_hdl) { on_closed(); });
        client_.set_message_handler([this](websocketpp::connection_hdl, ws_client::message_ptr m) {
            on_frame(m->get_payload());
        });
    }

    ~StdioBridge() { shutdown(); }

    StdioBridge(const StdioBridge&) = delete;
    StdioBridge& operator=(const StdioBridge&) = delete;

    bool connect(std::string* err) {
        websocketpp::lib::error_code ec;
        auto con = client_.get_connection(opts_.uri, ec);
        if (ec) {
            if (err) *err = ec.message();
            return false;
        }
        hdl_ = con->get_handle();
        client_.connect(con);
        io_thread_ = std::thread([this] {
            try {
                client_.run();
            } catch (const std::exception& e) {
                std::cerr << "[bridge] event loop failed: " << e.what() << "\n";
            }
            std::lock_guard<std::mutex> lk(mu_);
            state_ = LinkState::CLOSED;
            cv_.notify_all();
        });

        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait_for(lk, std::chrono::milliseconds(opts_.connect_timeout_ms),
                     [this] { return state_ != LinkState::CONNECTING; });
        if (state_ == LinkState::OPEN) return true;
        if (err) *err = fail_reason_.empty() ? "timed out" : fail_reason_;
        return false;
    }

    void forward(const std::string& frame, json_object* id, bool has_id) {
        bool open;
        {
            std::lock_guard<std::mutex> lk(mu_);
            open = state_ == LinkState::OPEN;
            if (open && has_id) outstanding_++;
        }
        if (!open) {
            if (has_id) write_error(id, "Connection lost", "not connected to " + opts_.uri);
            return;
        }

        websocketpp::lib::error_code ec;
        client_.send(hdl_, frame, websocketpp::frame::opcode::text, ec);
        if (ec) {
            {
                std::lock_guard<std::mutex> lk(mu_);
                if (has_id && outstanding_ > 0) outstanding_--;
            }
            if (has_id) write_error(id, "Send error", ec.message());
        }
    }

    // Blocks until every forwarded request has been answered, the link is
    // gone, or the drain budget runs out.
    void drain() {
        std::unique_lock<std::mutex> lk(mu_);
        bool done = cv_.wait_for(lk, std::chrono::milliseconds(opts_.drain_timeout_ms),
                                 [this] { return outstanding_ == 0 || state_ != LinkState::OPEN; });
        if (!done) std::cerr << "[bridge] " << outstanding_ << " request(s) unanswered at exit\n";
    }

    void shutdown() {
        bool open;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (stopped_) return;
            stopped_ = true;
            closing_ = true;
            open = state_ == LinkState::OPEN;
        }
        if (open) {
            websocketpp::lib::error_code ec;
            client_.close(hdl_, websocketpp::close::status::normal, "input closed", ec);
            std::unique_lock<std::mutex> lk(mu_);
            cv_.wait_for(lk, std::chrono::seconds(2), [this] { return state_ == LinkState::CLOSED; });
        }
        client_.stop();
        if (io_thread_.joinable()) io_thread_.join();
    }

    void write_line(const std::string& line) {
        std::lock_guard<std::mutex> lk(out_mu_);
        out_ << line << "\n";
        out_.flush();
    }

    void write_error(json_object* id, const std::string& message, const std::string& data) {
        write_line(make_error_response(id, kRpcInternalError, message, data));
    }

    bool dropped() const {
        std::lock_guard<std::mutex> lk(mu_);
        return dropped_;
    }

private:
    void on_frame(const std::string& payload) {
        write_line(payload);
        json_mini::Doc d = json_mini::parse(payload);
        if (!json_mini::has_key(d.root, "id")) return;
        std::lock_guard<std::mutex> lk(mu_);
        if (outstanding_ > 0) outstanding_--;
        cv_.notify_all();
    }

    void on_closed() {
        bool report;
        {
            std::lock_guard<std::mutex> lk(mu_);
            report = state_ == LinkState::OPEN && !closing_;
            if (report) dropped_ = true;
            state_ = LinkState::CLOSED;
            cv_.notify_all();
        }
        if (report) {
            std::cerr << "[bridge] server closed the connection\n";
            write_error(nullptr, "Connection closed", "the server at " + opts_.uri + " closed the connection");
        }
    }

    StdioBridgeOptions opts_;
    std::ostream& out_;
    std::mutex out_mu_;

    ws_client client_;
    websocketpp::connection_hdl hdl_;
    std::thread io_thread_;

    mutable std::mutex mu_;
    std::condition_variable cv_;
    LinkState state_{LinkState::CONNECTING};
    std::string fail_reason_;
    size_t outstanding_{0};
    bool closing_{false};
    bool dropped_{false};
    bool stopped_{false};
};

} // namespace

int run_stdio_bridge(const StdioBridgeOptions& opts, std::istream& in, std::ostream& out) {
    StdioBridge bridge(opts, out);
    std::string err;
    const bool up = bridge.connect(&err);
    if (!up) {
        std::cerr << "[bridge] cannot reach " << opts.uri << ": " << err << "\n";
        bridge.write_error(nullptr, "Connection refused", "cannot reach " + opts.uri + ": " + err);
    }

    std::string line;
    while (std::getline(in, line)) {
        line = text::trim(line);
        if (line.empty()) continue;

        std::string perr;
        json_mini::Doc req = json_mini::parse_verbose(line, &perr);
        if (!req) {
            bridge.write_line(make_error_response(nullptr, kRpcParseError, "Parse error", perr));
            continue;
        }
        const bool has_id = json_mini::has_key(req.root, "id");
        json_object* id = json_mini::member(req.root, "id");
        if (!up) {
            if (has_id) bridge.write_error(id, "Connection lost", "not connected to " + opts.uri);
            continue;
        }
        bridge.forward(line, id, has_id);
    }

    if (up) bridge.drain();
    bridge.shutdown();
    return (up && !bridge.dropped()) ? 0 : 1;
}

} // namespace hostlink

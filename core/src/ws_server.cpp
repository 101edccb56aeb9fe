#include "hostlink/ws_server.h"
#include "hostlink/admission.h"

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace hostlink {

WsServer::WsServer(WsServerOptions opts, WorkerPool& pool, FrameHandler handler, FrameRouter may_block)
    : opts_(std::move(opts)),
      pool_(pool),
      handler_(std::move(handler)),
      may_block_(std::move(may_block)),
      quick_pool_(opts_.quick_workers) {
    ws_.clear_access_channels(websocketpp::log::alevel::all);
    ws_.clear_error_channels(websocketpp::log::elevel::all);
    ws_.set_error_channels(websocketpp::log::elevel::rerror | websocketpp::log::elevel::fatal);

    ws_.init_asio();
    ws_.set_reuse_addr(true);
    ws_.set_max_message_size(opts_.max_message_bytes);

    ws_.set_open_handler([this](connection_hdl hdl) { on_open(hdl); });
    ws_.set_close_handler([this](connection_hdl hdl) { on_close(hdl); });
    ws_.set_fail_handler([this](connection_hdl hdl) { on_fail(hdl); });
    ws_.set_message_handler([this](connection_hdl hdl, ws_endpoint::message_ptr msg) {
        on_message(hdl, msg);
    });
}

WsServer::~WsServer() {
    stop();
}

void WsServer::start() {
    if (running_.load()) return;

    websocketpp::lib::error_code ec;
    ws_.listen(opts_.host, std::to_string(opts_.port), ec);
    if (ec) {
        throw std::runtime_error("listen on " + opts_.host + ":" + std::to_string(opts_.port) +
                                 " failed: " + ec.message());
    }
    websocketpp::lib::asio::error_code aec;
    auto ep = ws_.get_local_endpoint(aec);
    bound_port_.store(aec ? opts_.port : ep.port());

    ws_.start_accept(ec);
    if (ec) {
        websocketpp::lib::error_code ignored;
        ws_.stop_listening(ignored);
        throw std::runtime_error("start_accept failed: " + ec.message());
    }

    io_done_.store(false);
    running_.store(true);
    io_thread_ = std::thread([this] {
        try {
            ws_.run();
        } catch (const std::exception& e) {
            std::cerr << "[ws] event loop failed: " << e.what() << "\n";
        }
        io_done_.store(true);
    });
    std::cerr << "[ws] listening on ws://" << opts_.host << ":" << bound_port_.load() << "\n";
}

void WsServer::stop() {
    std::lock_guard<std::mutex> lk(stop_mu_);
    if (!running_.exchange(false)) return;

    // Listening socket and connections are owned by the asio thread.
    ws_.get_io_service().post([this] {
        websocketpp::lib::error_code ec;
        ws_.stop_listening(ec);
        if (ec) std::cerr << "[ws] stop_listening: " << ec.message() << "\n";

        std::vector<connection_hdl> open;
        {
            std::lock_guard<std::mutex> clk(conn_mu_);
            open.assign(connections_.begin(), connections_.end());
        }
        for (auto& hdl : open) {
            websocketpp::lib::error_code cec;
            ws_.close(hdl, websocketpp::close::status::going_away, "Server shutting down", cec);
        }
    });

    // run() returns once the closing handshakes finish; force it otherwise.
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(opts_.stop_wait_ms);
    while (!io_done_.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    if (!io_done_.load()) {
        std::cerr << "[ws] connections did not close in time, stopping event loop\n";
        ws_.stop();
    }
    if (io_thread_.joinable()) io_thread_.join();
    size_t dropped = quick_pool_.shutdown();
    if (dropped > 0) std::cerr << "[ws] dropped " << dropped << " queued quick frame(s)\n";

    {
        std::lock_guard<std::mutex> clk(conn_mu_);
        connections_.clear();
    }

    const uint16_t port = bound_port_.load();
    if (port != 0 && !wait_port_released(opts_.host, port, opts_.stop_wait_ms)) {
        std::cerr << "[ws] port " << port << " still accepting after " << opts_.stop_wait_ms << " ms\n";
    }
    std::cerr << "[ws] stopped\n";
}

size_t WsServer::connection_count() const {
    std::lock_guard<std::mutex> lk(conn_mu_);
    return connections_.size();
}

bool WsServer::admitted(connection_hdl hdl) const {
    std::lock_guard<std::mutex> lk(conn_mu_);
    return connections_.count(hdl) != 0;
}

void WsServer::on_open(connection_hdl hdl) {
    websocketpp::lib::error_code ec;
    auto con = ws_.get_con_from_hdl(hdl, ec);
    if (ec) return;

    std::string peer;
    websocketpp::lib::asio::error_code aec;
    auto remote = con->get_raw_socket().remote_endpoint(aec);
    if (!aec) peer = normalize_peer_address(remote.address().to_string());

    if (peer.empty() || !ip_allowed(peer, opts_.allowed_ips)) {
        rejected_++;
        std::cerr << "[ws] rejected connection from " << (peer.empty() ? "<unknown>" : peer) << "\n";
        websocketpp::lib::error_code cec;
        ws_.close(hdl, websocketpp::close::status::policy_violation, "IP not allowed", cec);
        return;
    }

    std::lock_guard<std::mutex> lk(conn_mu_);
    connections_.insert(hdl);
}

void WsServer::on_close(connection_hdl hdl) {
    std::lock_guard<std::mutex> lk(conn_mu_);
    connections_.erase(hdl);
}

void WsServer::on_fail(connection_hdl hdl) {
    websocketpp::lib::error_code ec;
    auto con = ws_.get_con_from_hdl(hdl, ec);
    if (!ec) std::cerr << "[ws] connection failed: " << con->get_ec().message() << "\n";
    std::lock_guard<std::mutex> lk(conn_mu_);
    connections_.erase(hdl);
}

void WsServer::on_message(connection_hdl hdl, ws_endpoint::message_ptr msg) {
    if (!admitted(hdl)) return;
    if (msg->get_opcode() != websocketpp::frame::opcode::text) return;

    std::string payload = msg->get_payload();
    WorkerPool& lane = (!may_block_ || may_block_(payload)) ? pool_ : quick_pool_;
    bool queued = lane.post([this, hdl, payload] {
        std::optional<std::string> resp = handler_(payload);
        if (!resp) return;
        websocketpp::lib::error_code ec;
        ws_.send(hdl, *resp, websocketpp::frame::opcode::text, ec);
        if (ec) std::cerr << "[ws] send failed: " << ec.message() << "\n";
    });
    if (!queued) std::cerr << "[ws] dropping frame: worker pool is shut down\n";
}

} // namespace hostlink

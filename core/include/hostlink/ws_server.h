#pragma once
#include "hostlink/worker_pool.h"

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace hostlink {

typedef websocketpp::server<websocketpp::config::asio> ws_endpoint;
typedef websocketpp::connection_hdl connection_hdl;

// Text frame in, optional text frame out (nullopt: send nothing).
using FrameHandler = std::function<std::optional<std::string>(const std::string& frame)>;

// True when handling `frame` may wait on the host. Such frames share the
// bounded command pool; the rest are answered on the server's quick lane.
using FrameRouter = std::function<bool(const std::string& frame)>;

struct WsServerOptions {
    std::string host{"127.0.0.1"};
    uint16_t port{8765};               // 0 picks a free port
    std::vector<std::string> allowed_ips{"127.0.0.1"};
    size_t max_message_bytes{1024 * 1024};
    int stop_wait_ms{5000};
    int quick_workers{2};              // threads for frames the router calls non-blocking
};

// WebSocket transport. The asio thread only accepts, admits and reads
// frames. Frames that may block go to the shared worker pool, everything
// else to a small pool owned by the server, so a saturated command pool
// never delays initialize or tools/list. Without a router every frame goes
// to the shared pool. Replies are sent from the worker thread.
class WsServer {
public:
    WsServer(WsServerOptions opts, WorkerPool& pool, FrameHandler handler, FrameRouter may_block = {});
    ~WsServer();

    WsServer(const WsServer&) = delete;
    WsServer& operator=(const WsServer&) = delete;

    // Binds, listens and starts the asio thread. Throws std::runtime_error
    // if the address cannot be bound.
    void start();

    // Closes every connection, releases the listening socket and waits for
    // the port to become free. Callable from any thread except the asio
    // thread itself; idempotent.
    void stop();

    bool running() const { return running_.load(); }
    uint16_t port() const { return bound_port_.load(); }
    size_t connection_count() const;
    uint64_t rejected_count() const { return rejected_.load(); }

private:
    void on_open(connection_hdl hdl);
    void on_close(connection_hdl hdl);
    void on_fail(connection_hdl hdl);
    void on_message(connection_hdl hdl, ws_endpoint::message_ptr msg);
    bool admitted(connection_hdl hdl) const;

    WsServerOptions opts_;
    WorkerPool& pool_;
    FrameHandler handler_;
    FrameRouter may_block_;

    ws_endpoint ws_;
    std::thread io_thread_;
    std::atomic<bool> io_done_{false};
    std::atomic<bool> running_{false};
    std::atomic<uint16_t> bound_port_{0};
    std::atomic<uint64_t> rejected_{0};

    mutable std::mutex conn_mu_;
    std::set<connection_hdl, std::owner_less<connection_hdl>> connections_;
    std::mutex stop_mu_;

    // Last member: its threads send through ws_ and must be joined first.
    WorkerPool quick_pool_;
};

} // namespace hostlink

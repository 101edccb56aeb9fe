#pragma once

#include <iosfwd>
#include <string>

namespace hostlink {

struct StdioBridgeOptions {
    std::string uri{"ws://127.0.0.1:8765"};
    int connect_timeout_ms{5000};
    int drain_timeout_ms{15000};   // wait for outstanding replies once input ends
};

// Lets a client that only speaks newline-delimited JSON-RPC on stdio reach
// the WebSocket server. Each request line read from `in` is sent as one
// text frame; each frame the server sends back is written to `out` as one
// line.
//
// Lines that are not JSON get a -32700 reply without being forwarded. When
// the server cannot be reached, or drops the connection, one -32603 error
// with a null id is written and every later request with an id is answered
// with -32603 as well.
//
// Returns 0 when input ended with the connection intact, 1 otherwise.
int run_stdio_bridge(const StdioBridgeOptions& opts, std::istream& in, std::ostream& out);

} // namespace hostlink

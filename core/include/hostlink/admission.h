#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace hostlink {

// Strips an IPv4-mapped IPv6 prefix ("::ffff:1.2.3.4" -> "1.2.3.4").
std::string normalize_peer_address(const std::string& addr);

// Exact match against the allow-list; "0.0.0.0" in the list admits anyone.
bool ip_allowed(const std::string& peer, const std::vector<std::string>& allowed);

// True if a TCP connect to host:port succeeds right now.
// A wildcard host is probed through loopback.
bool port_accepting(const std::string& host, uint16_t port);

// Polls every 100 ms until nothing accepts on host:port or `wait_ms`
// elapses. Returns true once the port is free.
bool wait_port_released(const std::string& host, uint16_t port, int wait_ms);

} // namespace hostlink

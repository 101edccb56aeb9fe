#include "hostlink/admission.h"
#include "hostlink/text.h"

#include <cctype>
#include <chrono>
#include <cstring>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace hostlink {

std::string normalize_peer_address(const std::string& addr) {
    std::string a = text::trim(addr);
    if (a.size() > 2 && a.front() == '[' && a.back() == ']') a = a.substr(1, a.size() - 2);
    static const std::string mapped = "::ffff:";
    if (a.size() > mapped.size()) {
        std::string head = a.substr(0, mapped.size());
        for (auto& c : head) c = (char)std::tolower((unsigned char)c);
        if (head == mapped && a.find('.') != std::string::npos) return a.substr(mapped.size());
    }
    return a;
}

bool ip_allowed(const std::string& peer, const std::vector<std::string>& allowed) {
    const std::string p = normalize_peer_address(peer);
    for (const auto& a : allowed) {
        if (a == "0.0.0.0") return true;
        if (normalize_peer_address(a) == p) return true;
    }
    return false;
}

bool port_accepting(const std::string& host, uint16_t port) {
    std::string probe = host;
    if (probe.empty() || probe == "0.0.0.0") probe = "127.0.0.1";
    if (probe == "::") probe = "::1";

    const bool v6 = probe.find(':') != std::string::npos;
    int fd = ::socket(v6 ? AF_INET6 : AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return false;

    int rc = -1;
    if (v6) {
        sockaddr_in6 addr{};
        addr.sin6_family = AF_INET6;
        addr.sin6_port = htons(port);
        if (::inet_pton(AF_INET6, probe.c_str(), &addr.sin6_addr) == 1) {
            rc = ::connect(fd, (sockaddr*)&addr, sizeof(addr));
        }
    } else {
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        if (::inet_pton(AF_INET, probe.c_str(), &addr.sin_addr) == 1) {
            rc = ::connect(fd, (sockaddr*)&addr, sizeof(addr));
        }
    }
    ::close(fd);
    return rc == 0;
}

bool wait_port_released(const std::string& host, uint16_t port, int wait_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(wait_ms);
    while (true) {
        if (!port_accepting(host, port)) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

} // namespace hostlink

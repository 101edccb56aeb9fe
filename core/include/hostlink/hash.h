#pragma once
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace hostlink::hash {

// FNV-1a 64 (stable, non-crypto). Used for invocation ids and tool-name
// disambiguation, never for integrity.
inline uint64_t fnv1a64_bytes(const uint8_t* data, size_t n) {
    uint64_t h = 1469598103934665603ULL;
    for (size_t i=0;i<n;i++) { h ^= data[i]; h *= 1099511628211ULL; }
    return h;
}
inline uint64_t fnv1a64(const std::string& s) {
    return fnv1a64_bytes(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

// Lower `digits` hex digits of the hash, zero padded ("a3f0" for digits=4).
inline std::string short_hex(uint64_t v, int digits) {
    if (digits <= 0) return {};
    if (digits < 16) v &= ((1ULL << (4 * digits)) - 1);
    std::ostringstream oss;
    oss << std::hex << std::setw(digits) << std::setfill('0') << v;
    return oss.str();
}

} // namespace hostlink::hash

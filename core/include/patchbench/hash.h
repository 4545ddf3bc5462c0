#pragma once
#include <array>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace patchbench::hash {

// ---------- FNV-1a 64 (stable, non-crypto) ----------
// Used for short failure signatures, never for integrity.
inline uint64_t fnv1a64(const std::string& s) {
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : s) { h ^= c; h *= 1099511628211ULL; }
    return h;
}

inline std::string hex64(uint64_t v) {
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << v;
    return oss.str();
}

// ---------- SHA-256 ----------
// Incremental hasher; event log chain and patch artifact digests.
class Sha256 {
public:
    Sha256();
    void update(const void* data, size_t n);
    void update(const std::string& s) { update(s.data(), s.size()); }
    std::array<uint8_t, 32> digest();
    std::string hex_digest();

private:
    void compress(const uint8_t* block);

    uint32_t state_[8];
    uint8_t buf_[64];
    size_t buf_len_{0};
    uint64_t total_{0};
    bool done_{false};
};

std::string sha256_hex(const std::string& s);

} // namespace patchbench::hash

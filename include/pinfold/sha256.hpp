#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace pinfold {

using Digest = std::array<uint8_t, 32>;

// Incremental SHA-256 (FIPS 180-4).
//
//   Sha256 h;
//   h.feed(node_text).feed(dep_hash);
//   Digest d = h.finish();
class Sha256 {
public:
    Sha256() { reset(); }

    Sha256& feed(std::string_view bytes);
    // Pads the message and returns its digest; the hasher starts over
    Digest finish();

private:
    void reset();
    void compress(const uint8_t* block);

    std::array<uint32_t, 8> h_;
    std::array<uint8_t, 64> pending_;
    size_t pending_len_ = 0;
    uint64_t message_len_ = 0;
};

std::string hex_digest(const Digest& digest);

// Lowercase RFC 4648 base32, most significant bit first, no padding.
// At most 52 characters, which cover all 256 bits.
std::string base32_digest(const Digest& digest, size_t chars);

std::string sha256_hex(std::string_view text);

// Content hash of a concrete spec: the first `chars` base32 characters of
// the SHA-256 of its canonical text
std::string content_hash(std::string_view text, size_t chars = 32);

} // namespace pinfold

#include <pinfold/sha256.hpp>

#include <algorithm>

namespace pinfold {

namespace {

// Round constants, FIPS 180-4 section 4.2.2
constexpr uint32_t kRound[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2,
};

// Initial state, FIPS 180-4 section 5.3.3
constexpr std::array<uint32_t, 8> kInitial = {
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
    0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19,
};

constexpr uint32_t rotr(uint32_t x, int n) {
    return (x >> n) | (x << (32 - n));
}

} // namespace

void Sha256::reset() {
    h_ = kInitial;
    pending_.fill(0);
    pending_len_ = 0;
    message_len_ = 0;
}

void Sha256::compress(const uint8_t* block) {
    // Message schedule kept as a 16-word ring
    uint32_t w[16];
    for (int i = 0; i < 16; ++i) {
        const uint8_t* p = block + 4 * i;
        w[i] = uint32_t(p[0]) << 24 | uint32_t(p[1]) << 16 | uint32_t(p[2]) << 8 | p[3];
    }

    std::array<uint32_t, 8> v = h_;
    for (int t = 0; t < 64; ++t) {
        if (t >= 16) {
            uint32_t w15 = w[(t - 15) & 15];
            uint32_t w2 = w[(t - 2) & 15];
            uint32_t s0 = rotr(w15, 7) ^ rotr(w15, 18) ^ (w15 >> 3);
            uint32_t s1 = rotr(w2, 17) ^ rotr(w2, 19) ^ (w2 >> 10);
            w[t & 15] += s0 + w[(t - 7) & 15] + s1;
        }
        uint32_t a = v[0], b = v[1], c = v[2], e = v[4], f = v[5], g = v[6];
        uint32_t t1 = v[7] + (rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25)) +
                      ((e & f) ^ (~e & g)) + kRound[t] + w[t & 15];
        uint32_t t2 = (rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22)) +
                      ((a & b) ^ (a & c) ^ (b & c));
        std::rotate(v.rbegin(), v.rbegin() + 1, v.rend());
        v[4] += t1;
        v[0] = t1 + t2;
    }

    for (size_t i = 0; i < 8; ++i) h_[i] += v[i];
}

Sha256& Sha256::feed(std::string_view bytes) {
    const auto* data = reinterpret_cast<const uint8_t*>(bytes.data());
    size_t left = bytes.size();
    message_len_ += left;

    while (left > 0) {
        if (pending_len_ == 0 && left >= 64) {
            compress(data);
            data += 64;
            left -= 64;
            continue;
        }
        size_t take = std::min(left, 64 - pending_len_);
        std::copy(data, data + take, pending_.begin() + static_cast<long>(pending_len_));
        pending_len_ += take;
        data += take;
        left -= take;
        if (pending_len_ == 64) {
            compress(pending_.data());
            pending_len_ = 0;
        }
    }
    return *this;
}

Digest Sha256::finish() {
    uint64_t bits = message_len_ * 8;

    // 0x80, zeros to 56 mod 64, then the bit length big-endian
    pending_[pending_len_++] = 0x80;
    if (pending_len_ > 56) {
        std::fill(pending_.begin() + static_cast<long>(pending_len_), pending_.end(), 0);
        compress(pending_.data());
        pending_len_ = 0;
    }
    std::fill(pending_.begin() + static_cast<long>(pending_len_), pending_.begin() + 56, 0);
    for (int i = 0; i < 8; ++i) {
        pending_[63 - i] = static_cast<uint8_t>(bits >> (8 * i));
    }
    compress(pending_.data());

    Digest out;
    for (size_t i = 0; i < 32; ++i) {
        out[i] = static_cast<uint8_t>(h_[i / 4] >> (24 - 8 * (i % 4)));
    }
    reset();
    return out;
}

// ---------------------------------------------------------------------------
// Renderings
// ---------------------------------------------------------------------------

std::string hex_digest(const Digest& digest) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(64);
    for (uint8_t byte : digest) {
        out.push_back(kHex[byte >> 4]);
        out.push_back(kHex[byte & 0xf]);
    }
    return out;
}

std::string base32_digest(const Digest& digest, size_t chars) {
    static constexpr char kAlphabet[] = "abcdefghijklmnopqrstuvwxyz234567";
    chars = std::min<size_t>(chars, 52);

    std::string out;
    out.reserve(chars);
    // Character i covers bits [5i, 5i + 5) of the digest, zero-filled past the end
    for (size_t i = 0; i < chars; ++i) {
        unsigned value = 0;
        for (size_t bit = 5 * i; bit < 5 * i + 5; ++bit) {
            unsigned set = bit < 256 ? (digest[bit / 8] >> (7 - bit % 8)) & 1u : 0u;
            value = (value << 1) | set;
        }
        out.push_back(kAlphabet[value]);
    }
    return out;
}

std::string sha256_hex(std::string_view text) {
    return hex_digest(Sha256().feed(text).finish());
}

std::string content_hash(std::string_view text, size_t chars) {
    return base32_digest(Sha256().feed(text).finish(), chars);
}

} // namespace pinfold

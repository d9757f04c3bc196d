// =============================================================================
// crypto.cpp - SHA-256 key derivation, Keccak-256 and HTLC hashlock digests
// =============================================================================

#include "fizzdex/crypto.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>
#include <utility>

namespace fizzdex {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

bool is_keccak256(const std::string& algorithm) {
    static const std::string name = HashLock::KECCAK_256;
    return algorithm.size() == name.size() &&
           std::equal(algorithm.begin(), algorithm.end(), name.begin(),
                      [](char a, char b) {
                          return std::toupper(static_cast<unsigned char>(a)) == b;
                      });
}

const EVP_MD* resolve_digest(const std::string& algorithm) {
    const EVP_MD* md = EVP_get_digestbyname(algorithm.c_str());
    if (md == nullptr) return nullptr;
    if (EVP_MD_size(md) != static_cast<int>(sizeof(Hash256))) return nullptr;
    return md;
}

// -----------------------------------------------------------------------------
// Keccak-f[1600]
// -----------------------------------------------------------------------------

constexpr uint64_t KECCAK_RC[24] = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808AULL,
    0x8000000080008000ULL, 0x000000000000808BULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008AULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000AULL,
    0x000000008000808BULL, 0x800000000000008BULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800AULL, 0x800000008000000AULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL,
};

// rho offsets and pi lane order, walked together from lane 1
constexpr int KECCAK_ROTC[24] = {
    1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14,
    27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44,
};
constexpr int KECCAK_PILN[24] = {
    10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4,
    15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1,
};

constexpr size_t KECCAK256_RATE = 136;

inline uint64_t rotl64(uint64_t x, int n) {
    return (x << n) | (x >> (64 - n));
}

void keccak_f1600(uint64_t st[25]) {
    uint64_t bc[5];
    for (int round = 0; round < 24; ++round) {
        // theta
        for (int i = 0; i < 5; ++i) {
            bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
        }
        for (int i = 0; i < 5; ++i) {
            uint64_t t = bc[(i + 4) % 5] ^ rotl64(bc[(i + 1) % 5], 1);
            for (int j = 0; j < 25; j += 5) st[j + i] ^= t;
        }

        // rho + pi
        uint64_t t = st[1];
        for (int i = 0; i < 24; ++i) {
            int j = KECCAK_PILN[i];
            uint64_t next = st[j];
            st[j] = rotl64(t, KECCAK_ROTC[i]);
            t = next;
        }

        // chi
        for (int j = 0; j < 25; j += 5) {
            for (int i = 0; i < 5; ++i) bc[i] = st[j + i];
            for (int i = 0; i < 5; ++i) {
                st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
            }
        }

        // iota
        st[0] ^= KECCAK_RC[round];
    }
}

inline void absorb_byte(uint64_t st[25], size_t pos, uint8_t byte) {
    st[pos / 8] ^= static_cast<uint64_t>(byte) << (8 * (pos % 8));
}

} // anonymous namespace

// =============================================================================
// SHA-256
// =============================================================================

Hash256 sha256(const uint8_t* data, size_t len) {
    Hash256 out{};
    SHA256(data, len, out.data());
    return out;
}

Hash256 sha256(std::string_view data) {
    return sha256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

// =============================================================================
// Keccak-256
// =============================================================================

Hash256 keccak256(const uint8_t* data, size_t len) {
    uint64_t st[25] = {};
    size_t pos = 0;
    for (size_t i = 0; i < len; ++i) {
        absorb_byte(st, pos++, data[i]);
        if (pos == KECCAK256_RATE) {
            keccak_f1600(st);
            pos = 0;
        }
    }

    absorb_byte(st, pos, 0x01);
    absorb_byte(st, KECCAK256_RATE - 1, 0x80);
    keccak_f1600(st);

    Hash256 out{};
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<uint8_t>(st[i / 8] >> (8 * (i % 8)));
    }
    return out;
}

Hash256 keccak256(std::string_view data) {
    return keccak256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

// =============================================================================
// Names
// =============================================================================

Address named_address(std::string_view name) {
    return sha256(name);
}

// =============================================================================
// KeyBuilder
// =============================================================================

KeyBuilder::KeyBuilder(std::string_view seed)
    : buf_(seed.begin(), seed.end()) {}

KeyBuilder& KeyBuilder::add(const Bytes32& part) {
    buf_.insert(buf_.end(), part.begin(), part.end());
    return *this;
}

KeyBuilder& KeyBuilder::add(int64_t value) {
    uint64_t v = static_cast<uint64_t>(value);
    for (int i = 0; i < 8; ++i) {
        buf_.push_back(static_cast<uint8_t>(v & 0xFF));
        v >>= 8;
    }
    return *this;
}

Hash256 KeyBuilder::finish() const {
    return sha256(buf_.data(), buf_.size());
}

// =============================================================================
// HashLock
// =============================================================================

HashLock::HashLock(std::string algorithm)
    : algorithm_(std::move(algorithm)) {
    if (!supported(algorithm_)) {
        throw std::invalid_argument("Unsupported hashlock digest: " + algorithm_);
    }
}

bool HashLock::supported(const std::string& algorithm) {
    return is_keccak256(algorithm) || resolve_digest(algorithm) != nullptr;
}

int32_t HashLock::digest(const uint8_t* data, size_t len, Hash256& out) const {
    if (is_keccak256(algorithm_)) {
        out = keccak256(data, len);
        return errors::OK;
    }

    const EVP_MD* md = resolve_digest(algorithm_);
    if (md == nullptr) return errors::HASH_UNAVAILABLE;

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) return errors::HASH_UNAVAILABLE;

    unsigned int written = 0;
    Hash256 result{};
    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, len) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), result.data(), &written) != 1 ||
        written != result.size()) {
        return errors::HASH_UNAVAILABLE;
    }

    out = result;
    return errors::OK;
}

} // namespace fizzdex

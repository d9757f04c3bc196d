#ifndef FIZZDEX_CRYPTO_HPP
#define FIZZDEX_CRYPTO_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace fizzdex {

// =============================================================================
// Digests (OpenSSL EVP)
// =============================================================================

Hash256 sha256(const uint8_t* data, size_t len);
Hash256 sha256(std::string_view data);

// Keccak-256 with the original 0x01 padding (the EVM hash, not SHA3-256)
Hash256 keccak256(const uint8_t* data, size_t len);
Hash256 keccak256(std::string_view data);

// Address for a human-readable name (CLI and test fixtures)
Address named_address(std::string_view name);

// =============================================================================
// KeyBuilder - deterministic record keys
//
// key = SHA256(seed || part_0 || part_1 || ...)
// Integers are appended little-endian so the layout matches the seed
// schemes used by account-model ledgers.
// =============================================================================

class KeyBuilder {
public:
    explicit KeyBuilder(std::string_view seed);

    KeyBuilder& add(const Bytes32& part);
    KeyBuilder& add(int64_t value);

    Hash256 finish() const;

private:
    std::vector<uint8_t> buf_;
};

// =============================================================================
// HashLock - 256-bit digest used for HTLC secret hashes
//
// KECCAK-256 (the default) matches keccak256(secret) on EVM chains, so one
// secret settles both legs of a cross-chain swap. Any other name is looked
// up as an OpenSSL EVP digest.
// =============================================================================

class HashLock {
public:
    static constexpr const char* KECCAK_256 = "KECCAK-256";

    // Throws std::invalid_argument if the digest is unknown to the
    // installed OpenSSL or does not produce 32 bytes.
    explicit HashLock(std::string algorithm = KECCAK_256);

    const std::string& algorithm() const { return algorithm_; }

    // Returns errors::OK or errors::HASH_UNAVAILABLE
    int32_t digest(const uint8_t* data, size_t len, Hash256& out) const;
    int32_t digest(const std::vector<uint8_t>& data, Hash256& out) const {
        return digest(data.data(), data.size(), out);
    }

    // Returns true when the digest is resolvable and 32 bytes wide
    static bool supported(const std::string& algorithm);

private:
    std::string algorithm_;
};

} // namespace fizzdex

#endif // FIZZDEX_CRYPTO_HPP

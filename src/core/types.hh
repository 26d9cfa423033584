#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <compare>

namespace dutch {

// ============================================================================
// Cryptographic Constants
// ============================================================================

// ML-DSA-65 (FIPS 204 / Dilithium Level 3), used for transaction signatures
inline constexpr std::size_t MLDSA65_PUBLIC_KEY_SIZE = 1952;
inline constexpr std::size_t MLDSA65_SECRET_KEY_SIZE = 4032;
inline constexpr std::size_t MLDSA65_SIGNATURE_SIZE = 3309;  // From liboqs OQS_SIG_ml_dsa_65_length_signature

// SHA3-256 output size
inline constexpr std::size_t HASH_SIZE = 32;

// Every ledger identity is 32 bytes
inline constexpr std::size_t ADDRESS_SIZE = HASH_SIZE;

// ============================================================================
// Derivation Limits
// ============================================================================

inline constexpr std::size_t MAX_SEED_LEN = 32;
inline constexpr std::size_t MAX_SEEDS = 16;

// ============================================================================
// Core Type Aliases
// ============================================================================

using hash_t = std::array<std::uint8_t, HASH_SIZE>;
using unix_timestamp_t = std::int64_t;
using seed_t = std::vector<std::uint8_t>;

using mldsa_public_key_t = std::array<std::uint8_t, MLDSA65_PUBLIC_KEY_SIZE>;
using mldsa_secret_key_t = std::array<std::uint8_t, MLDSA65_SECRET_KEY_SIZE>;
using mldsa_signature_t = std::array<std::uint8_t, MLDSA65_SIGNATURE_SIZE>;

// ============================================================================
// Address (32-byte ledger identity)
// ============================================================================

struct Address {
    hash_t bytes{};

    // Identity owned by an ML-DSA key: SHA3-256 of the public key
    [[nodiscard]] static Address from_public_key(const mldsa_public_key_t& pk);

    // Fixed, human-readable identity for built-in programs; zero padded
    [[nodiscard]] static constexpr Address from_label(std::string_view label) {
        Address addr;
        for (std::size_t i = 0; i < label.size() && i < ADDRESS_SIZE; ++i) {
            addr.bytes[i] = static_cast<std::uint8_t>(label[i]);
        }
        return addr;
    }

    [[nodiscard]] std::string to_hex() const;
    [[nodiscard]] static std::optional<Address> from_hex(std::string_view hex);

    [[nodiscard]] bool is_zero() const {
        for (auto b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }


    [[nodiscard]] auto begin() const { return bytes.begin(); }
    [[nodiscard]] auto end() const { return bytes.end(); }

    auto operator<=>(const Address&) const = default;
};

// ============================================================================
// Built-in Program Identities
// ============================================================================

inline constexpr Address SYSTEM_PROGRAM_ID{};
inline constexpr Address TOKEN_PROGRAM_ID = Address::from_label("dutch.token.program");
inline constexpr Address ASSOCIATED_TOKEN_PROGRAM_ID = Address::from_label("dutch.associated.token.program");

// ============================================================================
// Serialization Helpers
// ============================================================================

// Little-endian encoding
inline void encode_u16(std::uint8_t* dst, std::uint16_t val) {
    dst[0] = static_cast<std::uint8_t>(val);
    dst[1] = static_cast<std::uint8_t>(val >> 8);
}

inline void encode_u32(std::uint8_t* dst, std::uint32_t val) {
    dst[0] = static_cast<std::uint8_t>(val);
    dst[1] = static_cast<std::uint8_t>(val >> 8);
    dst[2] = static_cast<std::uint8_t>(val >> 16);
    dst[3] = static_cast<std::uint8_t>(val >> 24);
}

inline void encode_u64(std::uint8_t* dst, std::uint64_t val) {
    for (std::size_t i = 0; i < 8; ++i) {
        dst[i] = static_cast<std::uint8_t>(val >> (8 * i));
    }
}

// Two's complement, same byte layout as the unsigned form
inline void encode_i64(std::uint8_t* dst, std::int64_t val) {
    encode_u64(dst, static_cast<std::uint64_t>(val));
}

[[nodiscard]] inline std::uint16_t decode_u16(const std::uint8_t* src) {
    return static_cast<std::uint16_t>(src[0]) |
           (static_cast<std::uint16_t>(src[1]) << 8);
}

[[nodiscard]] inline std::uint32_t decode_u32(const std::uint8_t* src) {
    return static_cast<std::uint32_t>(src[0]) |
           (static_cast<std::uint32_t>(src[1]) << 8) |
           (static_cast<std::uint32_t>(src[2]) << 16) |
           (static_cast<std::uint32_t>(src[3]) << 24);
}

[[nodiscard]] inline std::uint64_t decode_u64(const std::uint8_t* src) {
    std::uint64_t val = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        val |= static_cast<std::uint64_t>(src[i]) << (8 * i);
    }
    return val;
}

[[nodiscard]] inline std::int64_t decode_i64(const std::uint8_t* src) {
    return static_cast<std::int64_t>(decode_u64(src));
}

// Appending variants for building variable-length buffers
inline void append_u16(std::vector<std::uint8_t>& out, std::uint16_t val) {
    std::array<std::uint8_t, 2> buf;
    encode_u16(buf.data(), val);
    out.insert(out.end(), buf.begin(), buf.end());
}

inline void append_u32(std::vector<std::uint8_t>& out, std::uint32_t val) {
    std::array<std::uint8_t, 4> buf;
    encode_u32(buf.data(), val);
    out.insert(out.end(), buf.begin(), buf.end());
}

inline void append_u64(std::vector<std::uint8_t>& out, std::uint64_t val) {
    std::array<std::uint8_t, 8> buf;
    encode_u64(buf.data(), val);
    out.insert(out.end(), buf.begin(), buf.end());
}

inline void append_i64(std::vector<std::uint8_t>& out, std::int64_t val) {
    append_u64(out, static_cast<std::uint64_t>(val));
}

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

[[nodiscard]] std::string bytes_to_hex(std::span<const std::uint8_t> bytes);
[[nodiscard]] std::optional<std::vector<std::uint8_t>> hex_to_bytes(std::string_view hex);

// ============================================================================
// Zero Memory (for sensitive data)
// ============================================================================

void secure_zero(void* ptr, std::size_t len);

template<typename T>
void secure_zero(T& container) {
    secure_zero(container.data(), container.size());
}

// ============================================================================
// Visitor helper for std::visit over closed variants
// ============================================================================

template<typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

template<typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace dutch

// ============================================================================
// Hash specialization for Address (enables use in unordered_map/unordered_set)
// ============================================================================

namespace std {

template<>
struct hash<dutch::Address> {
    std::size_t operator()(const dutch::Address& addr) const noexcept {
        // Addresses are hash outputs or labels; fold all bytes so labels spread too
        std::size_t result = 0xcbf29ce484222325ULL;
        for (auto b : addr.bytes) {
            result ^= b;
            result *= 0x100000001b3ULL;
        }
        return result;
    }
};

}  // namespace std

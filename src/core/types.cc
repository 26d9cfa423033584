#include "types.hh"
#include <algorithm>
#include <atomic>

namespace dutch {

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

namespace {

std::optional<std::uint8_t> hex_nibble(char c) {
    if (c >= '0' && c <= '9') return static_cast<std::uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<std::uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<std::uint8_t>(c - 'A' + 10);
    return std::nullopt;
}

}  // namespace

std::string bytes_to_hex(std::span<const std::uint8_t> bytes) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(bytes.size() * 2);
    for (auto byte : bytes) {
        result.push_back(hex_chars[byte >> 4]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

std::optional<std::vector<std::uint8_t>> hex_to_bytes(std::string_view hex) {
    // Skip optional 0x prefix
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex = hex.substr(2);
    }

    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<std::uint8_t> result;
    result.reserve(hex.size() / 2);

    for (std::size_t i = 0; i < hex.size(); i += 2) {
        auto high = hex_nibble(hex[i]);
        auto low = hex_nibble(hex[i + 1]);
        if (!high || !low) {
            return std::nullopt;
        }
        result.push_back(static_cast<std::uint8_t>((*high << 4) | *low));
    }

    return result;
}

// ============================================================================
// Secure Zero
// ============================================================================

void secure_zero(void* ptr, std::size_t len) {
    volatile std::uint8_t* p = static_cast<volatile std::uint8_t*>(ptr);
    while (len--) {
        *p++ = 0;
    }
    std::atomic_thread_fence(std::memory_order_seq_cst);
}

// ============================================================================
// Address Implementation
// ============================================================================

std::string Address::to_hex() const {
    return "0x" + bytes_to_hex(bytes);
}

std::optional<Address> Address::from_hex(std::string_view hex) {
    auto bytes_opt = hex_to_bytes(hex);
    if (!bytes_opt || bytes_opt->size() != ADDRESS_SIZE) {
        return std::nullopt;
    }
    Address addr;
    std::copy(bytes_opt->begin(), bytes_opt->end(), addr.bytes.begin());
    return addr;
}

}  // namespace dutch

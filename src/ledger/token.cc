#include "token.hh"
#include <algorithm>

namespace dutch {

namespace {

std::optional<bool> decode_flag(std::uint8_t byte) {
    switch (byte) {
        case 0: return false;
        case 1: return true;
        default: return std::nullopt;
    }
}

}  // namespace

// ============================================================================
// Mint Implementation
// ============================================================================

std::vector<std::uint8_t> Mint::serialize() const {
    std::vector<std::uint8_t> result(SERIALIZED_SIZE, 0);
    std::uint8_t* ptr = result.data();

    *ptr++ = mint_authority ? 1 : 0;
    if (mint_authority) {
        std::copy(mint_authority->begin(), mint_authority->end(), ptr);
    }
    ptr += ADDRESS_SIZE;

    encode_u64(ptr, supply);
    ptr += sizeof(std::uint64_t);

    *ptr++ = decimals;
    *ptr = is_initialized ? 1 : 0;

    return result;
}

std::optional<Mint> Mint::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() != SERIALIZED_SIZE) {
        return std::nullopt;
    }

    Mint mint;
    const std::uint8_t* ptr = data.data();

    auto has_authority = decode_flag(*ptr++);
    if (!has_authority) {
        return std::nullopt;
    }
    if (*has_authority) {
        Address authority;
        std::copy(ptr, ptr + ADDRESS_SIZE, authority.bytes.begin());
        mint.mint_authority = authority;
    }
    ptr += ADDRESS_SIZE;

    mint.supply = decode_u64(ptr);
    ptr += sizeof(std::uint64_t);

    mint.decimals = *ptr++;

    auto initialized = decode_flag(*ptr);
    if (!initialized) {
        return std::nullopt;
    }
    mint.is_initialized = *initialized;

    return mint;
}

// ============================================================================
// TokenAccount Implementation
// ============================================================================

std::vector<std::uint8_t> TokenAccount::serialize() const {
    std::vector<std::uint8_t> result(SERIALIZED_SIZE);
    std::uint8_t* ptr = result.data();

    std::copy(mint.begin(), mint.end(), ptr);
    ptr += ADDRESS_SIZE;

    std::copy(owner.begin(), owner.end(), ptr);
    ptr += ADDRESS_SIZE;

    encode_u64(ptr, amount);
    ptr += sizeof(std::uint64_t);

    *ptr = is_initialized ? 1 : 0;

    return result;
}

std::optional<TokenAccount> TokenAccount::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() != SERIALIZED_SIZE) {
        return std::nullopt;
    }

    TokenAccount account;
    const std::uint8_t* ptr = data.data();

    std::copy(ptr, ptr + ADDRESS_SIZE, account.mint.bytes.begin());
    ptr += ADDRESS_SIZE;

    std::copy(ptr, ptr + ADDRESS_SIZE, account.owner.bytes.begin());
    ptr += ADDRESS_SIZE;

    account.amount = decode_u64(ptr);
    ptr += sizeof(std::uint64_t);

    auto initialized = decode_flag(*ptr);
    if (!initialized) {
        return std::nullopt;
    }
    account.is_initialized = *initialized;

    return account;
}

}  // namespace dutch

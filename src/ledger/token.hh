#pragma once

#include "core/types.hh"
#include <optional>
#include <span>
#include <vector>

namespace dutch {

// ============================================================================
// Mint - fungible unit definition, stored in an account owned by the token program
// ============================================================================

struct Mint {
    std::optional<Address> mint_authority;
    std::uint64_t supply = 0;
    std::uint8_t decimals = 0;
    bool is_initialized = false;

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<Mint> deserialize(std::span<const std::uint8_t> data);

    static constexpr std::size_t SERIALIZED_SIZE =
        sizeof(std::uint8_t) +          // has mint_authority
        ADDRESS_SIZE +                  // mint_authority (zero when absent)
        sizeof(std::uint64_t) +         // supply
        sizeof(std::uint8_t) +          // decimals
        sizeof(std::uint8_t);           // is_initialized
};

// ============================================================================
// Token Account - balance of one mint held by one owner
// ============================================================================

struct TokenAccount {
    Address mint;
    Address owner;
    std::uint64_t amount = 0;
    bool is_initialized = false;

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<TokenAccount> deserialize(std::span<const std::uint8_t> data);

    static constexpr std::size_t SERIALIZED_SIZE =
        ADDRESS_SIZE * 2 +              // mint, owner
        sizeof(std::uint64_t) +         // amount
        sizeof(std::uint8_t);           // is_initialized
};

}  // namespace dutch

#pragma once

#include "core/types.hh"
#include <optional>
#include <span>
#include <string_view>

namespace dutch {

// Domain separator appended to every derived-address preimage. Key-owned
// identities hash a bare public key, so the two spaces never meet.
inline constexpr std::string_view PROGRAM_DERIVED_ADDRESS_MARKER = "ProgramDerivedAddress";

// ============================================================================
// Program-derived addresses
// ============================================================================

// address = SHA3-256(seed_0 || ... || seed_n || program_id || marker)
// Rejects more than MAX_SEEDS seeds or any seed longer than MAX_SEED_LEN.
[[nodiscard]] std::optional<Address> create_program_address(
    std::span<const seed_t> seeds,
    const Address& program_id);

// Seed list for a single address, e.g. the auction record that owns a vault
[[nodiscard]] seed_t address_seed(const Address& addr);

// ============================================================================
// Associated token accounts
// ============================================================================

// Canonical token account of `wallet` for `mint`:
// create_program_address([wallet, TOKEN_PROGRAM_ID, mint], ASSOCIATED_TOKEN_PROGRAM_ID)
[[nodiscard]] Address associated_token_address(const Address& wallet, const Address& mint);

}  // namespace dutch

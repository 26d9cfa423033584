#pragma once

#include "core/types.hh"
#include "ledger/program_error.hh"
#include "ledger/runtime.hh"
#include <optional>

namespace dutch {

// ============================================================================
// Vault Addresses
// ============================================================================

struct VaultAddresses {
    Address authority;   // keyless, derived from the auction record address
    Address holding;     // associated unit account of `authority`
};

// Vault authority of an auction: create_program_address([auction], program_id)
[[nodiscard]] std::optional<Address> derive_vault_authority(
    const Address& program_id,
    const Address& auction);

[[nodiscard]] std::optional<VaultAddresses> derive_vault(
    const Address& program_id,
    const Address& auction,
    const Address& unit_id);

// Capability letting the program sign for the vault authority of `auction`
[[nodiscard]] ProgramSigner vault_signer(const Address& program_id, const Address& auction);

// ============================================================================
// Validators (pure comparisons, run before any mutation)
// ============================================================================

// INVALID_VAULT_OWNER when `claimed` is not the derived vault authority
[[nodiscard]] ProgramResult validate_vault_authority(
    const Address& program_id,
    const Address& auction,
    const Address& claimed);

// INVALID_VAULT_ADDRESS when `claimed` is not the vault holding account
[[nodiscard]] ProgramResult validate_vault_account(
    const Address& vault_authority,
    const Address& unit_id,
    const Address& claimed);

// OWNER_MISMATCH when the keys differ, otherwise MISSING_REQUIRED_SIGNATURE
// when the account did not sign the transaction
[[nodiscard]] ProgramResult validate_owner(const Address& expected, const AccountInfo& account);

}  // namespace dutch

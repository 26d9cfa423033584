#include "auction/validation.hh"
#include "auction/error.hh"
#include "ledger/derivation.hh"

namespace dutch {

std::optional<Address> derive_vault_authority(const Address& program_id, const Address& auction) {
    const seed_t seeds[] = {address_seed(auction)};
    return create_program_address(seeds, program_id);
}

std::optional<VaultAddresses> derive_vault(const Address& program_id,
                                           const Address& auction,
                                           const Address& unit_id) {
    auto authority = derive_vault_authority(program_id, auction);
    if (!authority) {
        return std::nullopt;
    }
    return VaultAddresses{*authority, associated_token_address(*authority, unit_id)};
}

ProgramSigner vault_signer(const Address& program_id, const Address& auction) {
    return ProgramSigner{program_id, {address_seed(auction)}};
}

ProgramResult validate_vault_authority(const Address& program_id,
                                       const Address& auction,
                                       const Address& claimed) {
    auto expected = derive_vault_authority(program_id, auction);
    if (!expected || *expected != claimed) {
        return to_result(AuctionError::INVALID_VAULT_OWNER);
    }
    return ProgramResult::ok();
}

ProgramResult validate_vault_account(const Address& vault_authority,
                                     const Address& unit_id,
                                     const Address& claimed) {
    if (associated_token_address(vault_authority, unit_id) != claimed) {
        return to_result(AuctionError::INVALID_VAULT_ADDRESS);
    }
    return ProgramResult::ok();
}

ProgramResult validate_owner(const Address& expected, const AccountInfo& account) {
    if (account.key != expected) {
        return to_result(AuctionError::OWNER_MISMATCH);
    }
    if (!account.is_signer) {
        return ProgramResult::failure(ProgramError::MISSING_REQUIRED_SIGNATURE);
    }
    return ProgramResult::ok();
}

}  // namespace dutch

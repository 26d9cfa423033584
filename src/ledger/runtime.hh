#pragma once

#include "core/types.hh"
#include "ledger/program_error.hh"
#include <functional>
#include <optional>
#include <span>
#include <vector>

namespace dutch {

// ============================================================================
// Instruction envelope
// ============================================================================

struct AccountMeta {
    Address key;
    bool is_signer = false;
    bool is_writable = false;

    [[nodiscard]] static AccountMeta writable(const Address& key, bool is_signer = false) {
        return {key, is_signer, true};
    }
    [[nodiscard]] static AccountMeta readonly(const Address& key, bool is_signer = false) {
        return {key, is_signer, false};
    }

    bool operator==(const AccountMeta&) const = default;
};

struct Instruction {
    Address program_id;
    std::vector<AccountMeta> accounts;
    std::vector<std::uint8_t> data;

    bool operator==(const Instruction&) const = default;
};

// What a program sees for each listed account. Signer status is the
// ledger's verdict, not the flag requested in AccountMeta.
struct AccountInfo {
    Address key;
    bool is_signer = false;
    bool is_writable = false;
};

// Read-only copy of an account's stored state
struct AccountView {
    std::uint64_t balance = 0;
    Address owner;
    std::vector<std::uint8_t> data;
};

// ============================================================================
// Program signer capability
// ============================================================================

// Lets the executing program act as the keyless address derived from
// `seeds` under its own id. The runtime re-derives and compares; it is only
// honored while `program_id` is the program currently executing.
struct ProgramSigner {
    Address program_id;
    std::vector<seed_t> seeds;
};

// ============================================================================
// Runtime - ledger services available to a program during one instruction
// ============================================================================

class Runtime {
public:
    virtual ~Runtime() = default;

    // Clock
    [[nodiscard]] virtual unix_timestamp_t unix_timestamp() const = 0;

    // Rent-exempt balance for an account holding `data_len` bytes
    [[nodiscard]] virtual std::uint64_t minimum_balance(std::size_t data_len) const = 0;

    // Account storage
    [[nodiscard]] virtual std::optional<AccountView> get_account(const Address& addr) const = 0;
    virtual ProgramResult write_data(const Address& addr, std::span<const std::uint8_t> data) = 0;

    // Native currency
    virtual ProgramResult transfer(const Address& from,
                                   const Address& to,
                                   std::uint64_t amount,
                                   const ProgramSigner* signer = nullptr) = 0;

    virtual ProgramResult create_account(const Address& funder,
                                         const Address& new_account,
                                         std::uint64_t balance,
                                         std::size_t space,
                                         const Address& owner,
                                         const ProgramSigner* signer = nullptr) = 0;

    // Fungible units
    virtual ProgramResult create_associated_token_account(const Address& funder,
                                                          const Address& wallet,
                                                          const Address& mint) = 0;

    virtual ProgramResult transfer_checked(const Address& source,
                                           const Address& mint,
                                           const Address& destination,
                                           const Address& authority,
                                           std::uint64_t amount,
                                           std::uint8_t decimals,
                                           const ProgramSigner* signer = nullptr) = 0;
};

// Entry point the ledger calls for each instruction addressed to a program
using ProgramEntrypoint = std::function<ProgramResult(
    const Address& program_id,
    std::span<const AccountInfo> accounts,
    std::span<const std::uint8_t> input,
    Runtime& runtime)>;

}  // namespace dutch

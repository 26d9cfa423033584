#pragma once

#include "core/types.hh"
#include "ledger/access.hh"
#include "ledger/program_error.hh"
#include "ledger/runtime.hh"
#include "ledger/token.hh"
#include "ledger/transaction.hh"
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace dutch {

// ============================================================================
// Rent Configuration
// ============================================================================

struct RentConfig {
    static constexpr std::uint64_t ACCOUNT_STORAGE_OVERHEAD = 128;

    std::uint64_t lamports_per_byte_year = 3480;
    std::uint64_t exemption_threshold_years = 2;

    // Balance at which an account of `data_len` bytes is exempt from rent
    [[nodiscard]] std::uint64_t minimum_balance(std::size_t data_len) const {
        return (ACCOUNT_STORAGE_OVERHEAD + data_len) * lamports_per_byte_year * exemption_threshold_years;
    }
};

struct BankConfig {
    unix_timestamp_t genesis_timestamp = 0;
    RentConfig rent;
};

// ============================================================================
// Stored Account
// ============================================================================

struct Account {
    std::uint64_t balance = 0;
    Address owner;
    std::vector<std::uint8_t> data;
};

// ============================================================================
// Transaction Result
// ============================================================================

struct TransactionResult {
    ProgramResult status;
    std::optional<std::size_t> failed_instruction;   // unset for pre-execution failures

    [[nodiscard]] bool is_success() const { return status.is_success(); }
};

// ============================================================================
// Bank - in-memory reference ledger
// ============================================================================

// Executes signed transactions against registered programs. A transaction
// applies all of its instructions or none: state is snapshotted first and
// restored on any failure.
//
// Runtime methods serve only the instruction currently executing; they are
// checked against its declared accounts and fail outside a transaction.
class Bank : public Runtime {
public:
    explicit Bank(BankConfig config = {});

    // Programs
    void add_program(const Address& program_id, ProgramEntrypoint entrypoint);

    // Transactions
    [[nodiscard]] TransactionResult process_transaction(const Transaction& tx);

    // Clock
    void set_unix_timestamp(unix_timestamp_t timestamp);
    void advance_clock(unix_timestamp_t seconds);

    // Genesis-style setup, outside any transaction
    void airdrop(const Address& to, std::uint64_t amount);
    ProgramResult create_mint(const Address& mint, const Address& mint_authority, std::uint8_t decimals);
    ProgramResult create_token_account(const Address& account, const Address& mint, const Address& owner);
    ProgramResult mint_to(const Address& mint, const Address& account, std::uint64_t amount);
    ProgramResult create_program_account(const Address& address, const Address& owner, std::size_t space);

    // Queries
    [[nodiscard]] std::uint64_t balance(const Address& addr) const;
    [[nodiscard]] std::optional<std::uint64_t> token_balance(const Address& addr) const;
    [[nodiscard]] std::optional<AccountView> account(const Address& addr) const;
    [[nodiscard]] const RentConfig& rent() const { return config_.rent; }

    // Runtime
    [[nodiscard]] unix_timestamp_t unix_timestamp() const override;
    [[nodiscard]] std::uint64_t minimum_balance(std::size_t data_len) const override;
    [[nodiscard]] std::optional<AccountView> get_account(const Address& addr) const override;
    ProgramResult write_data(const Address& addr, std::span<const std::uint8_t> data) override;

    ProgramResult transfer(const Address& from,
                           const Address& to,
                           std::uint64_t amount,
                           const ProgramSigner* signer = nullptr) override;

    ProgramResult create_account(const Address& funder,
                                 const Address& new_account,
                                 std::uint64_t balance,
                                 std::size_t space,
                                 const Address& owner,
                                 const ProgramSigner* signer = nullptr) override;

    ProgramResult create_associated_token_account(const Address& funder,
                                                  const Address& wallet,
                                                  const Address& mint) override;

    ProgramResult transfer_checked(const Address& source,
                                   const Address& mint,
                                   const Address& destination,
                                   const Address& authority,
                                   std::uint64_t amount,
                                   std::uint8_t decimals,
                                   const ProgramSigner* signer = nullptr) override;

private:
    struct Invocation {
        Address program_id;
        AccessTracker* tracker;
    };

    ProgramResult execute_instruction(const Instruction& ix,
                                      const std::unordered_set<Address>& signers);

    // Signed by the transaction, or derivable by `signer` under the
    // executing program's id
    [[nodiscard]] bool is_authorized(const Address& addr, const ProgramSigner* signer) const;

    ProgramResult check_read(const Address& addr) const;
    ProgramResult check_write(const Address& addr) const;

    // Token program state, read without access checks
    ProgramResult load_mint(const Address& addr, Mint& mint) const;
    ProgramResult load_token_account(const Address& addr, TokenAccount& account) const;

    BankConfig config_;
    unix_timestamp_t now_;
    std::unordered_map<Address, Account> accounts_;
    std::unordered_map<Address, ProgramEntrypoint> programs_;
    std::optional<Invocation> current_;
    mutable std::mutex mutex_;
};

}  // namespace dutch

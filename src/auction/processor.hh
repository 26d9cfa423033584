#pragma once

#include "auction/instruction.hh"
#include "auction/state.hh"
#include "ledger/program_error.hh"
#include "ledger/runtime.hh"
#include <span>

namespace dutch {

// ============================================================================
// Program Configuration
// ============================================================================

// Identity of the deployed auction program and the programs it calls into.
// Injected once at startup; immutable afterwards.
struct ProgramConfig {
    Address program_id;
    Address system_program_id = SYSTEM_PROGRAM_ID;
    Address token_program_id = TOKEN_PROGRAM_ID;
};

// ============================================================================
// Processor - auction state machine
// ============================================================================

// Decodes one instruction and applies it through the runtime. Every check
// runs before the first runtime mutation; any failure leaves the ledger to
// discard the whole transaction.
class Processor {
public:
    explicit Processor(ProgramConfig config);

    [[nodiscard]] const ProgramConfig& config() const { return config_; }

    [[nodiscard]] ProgramResult process(const Address& program_id,
                                        std::span<const AccountInfo> accounts,
                                        std::span<const std::uint8_t> input,
                                        Runtime& runtime) const;

    // Entry point for registering this program with a ledger
    [[nodiscard]] ProgramEntrypoint entrypoint() const;

private:
    ProgramResult process_initialize(const InitializeAuction& params,
                                     std::span<const AccountInfo> accounts,
                                     Runtime& runtime) const;

    ProgramResult process_bid(const MakeBid& bid,
                              std::span<const AccountInfo> accounts,
                              Runtime& runtime) const;

    ProgramResult process_withdraw_funds(std::span<const AccountInfo> accounts,
                                         Runtime& runtime) const;

    ProgramResult process_withdraw_goods(std::span<const AccountInfo> accounts,
                                         Runtime& runtime) const;

    // Record account must be owned by this program and hold exactly one record
    ProgramResult load_record(const Runtime& runtime,
                              const AccountInfo& account,
                              AuctionRecord& record) const;

    // Record must be initialized and sell the mint at `mint`
    ProgramResult load_initialized_record(const Runtime& runtime,
                                          const AccountInfo& account,
                                          const AccountInfo& mint,
                                          AuctionRecord& record) const;

    ProgramResult read_mint_decimals(const Runtime& runtime,
                                     const Address& mint,
                                     std::uint8_t& decimals) const;

    ProgramResult read_token_amount(const Runtime& runtime,
                                    const Address& account,
                                    std::uint64_t& amount) const;

    ProgramResult check_program(const AccountInfo& account, const Address& expected) const;

    ProgramConfig config_;
};

}  // namespace dutch

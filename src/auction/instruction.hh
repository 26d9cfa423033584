#pragma once

#include "core/types.hh"
#include "ledger/runtime.hh"
#include <optional>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

namespace dutch {

// ============================================================================
// Instruction Tags (first byte on the wire)
// ============================================================================

enum class InstructionTag : std::uint8_t {
    INITIALIZE_AUCTION = 0,
    MAKE_BID = 1,
    WITHDRAW_FUNDS = 2,
    WITHDRAW_GOODS = 3,
};

// ============================================================================
// Commands
// ============================================================================

// Set auction parameters and move `token_amount` units into the vault
struct InitializeAuction {
    static constexpr InstructionTag TAG = InstructionTag::INITIALIZE_AUCTION;
    static constexpr std::size_t PAYLOAD_SIZE =
        sizeof(std::uint64_t) +         // token_amount
        sizeof(unix_timestamp_t) * 2 +  // time_start, time_step
        sizeof(std::uint64_t) * 2;      // price_start, price_step

    std::uint64_t token_amount = 0;
    unix_timestamp_t time_start = 0;
    unix_timestamp_t time_step = 0;
    std::uint64_t price_start = 0;
    std::uint64_t price_step = 0;

    bool operator==(const InitializeAuction&) const = default;
};

// Buy up to `token_amount` units at the current price
struct MakeBid {
    static constexpr InstructionTag TAG = InstructionTag::MAKE_BID;
    static constexpr std::size_t PAYLOAD_SIZE = sizeof(std::uint64_t);

    std::uint64_t token_amount = 0;

    bool operator==(const MakeBid&) const = default;
};

// Drain the vault authority's native balance once the auction finished
struct WithdrawFunds {
    static constexpr InstructionTag TAG = InstructionTag::WITHDRAW_FUNDS;
    static constexpr std::size_t PAYLOAD_SIZE = 0;

    bool operator==(const WithdrawFunds&) const = default;
};

// Drain the unsold units once the auction finished
struct WithdrawGoods {
    static constexpr InstructionTag TAG = InstructionTag::WITHDRAW_GOODS;
    static constexpr std::size_t PAYLOAD_SIZE = 0;

    bool operator==(const WithdrawGoods&) const = default;
};

using AuctionInstruction = std::variant<InitializeAuction, MakeBid, WithdrawFunds, WithdrawGoods>;

// ============================================================================
// Wire Codec
// ============================================================================

[[nodiscard]] std::vector<std::uint8_t> encode_instruction(const AuctionInstruction& instruction);

// Strict: unknown tag, short payload or trailing bytes all yield nullopt
[[nodiscard]] std::optional<AuctionInstruction> decode_instruction(std::span<const std::uint8_t> data);

[[nodiscard]] std::string_view instruction_name(const AuctionInstruction& instruction);

// ============================================================================
// Account Layouts (positions in Instruction::accounts)
// ============================================================================

namespace initialize_accounts {
enum : std::size_t {
    AUCTION = 0,          // [w] auction record
    AUTHORITY,            // []  future withdraw authority
    SYSTEM_PROGRAM,       // []
    FUNDER,               // [w, s] pays for the vault accounts
    TOKEN_PROGRAM,        // []
    MINT,                 // []  unit being sold
    TOKEN_SOURCE,         // [w] seller's unit account
    VAULT,                // [w] vault holding account
    VAULT_AUTHORITY,      // [w] derived vault authority
    SOURCE_OWNER,         // [s] owner of TOKEN_SOURCE
    COUNT,
};
}  // namespace initialize_accounts

namespace bid_accounts {
enum : std::size_t {
    AUCTION = 0,          // []
    SYSTEM_PROGRAM,       // []
    BIDDER,               // [w, s] pays native currency
    TOKEN_PROGRAM,        // []
    MINT,                 // []
    VAULT,                // [w]
    VAULT_AUTHORITY,      // [w] receives payment
    BIDDER_TOKEN,         // [w] receives units
    COUNT,
};
}  // namespace bid_accounts

namespace withdraw_funds_accounts {
enum : std::size_t {
    AUCTION = 0,          // []
    AUTHORITY,            // [s]
    SYSTEM_PROGRAM,       // []
    MINT,                 // []
    VAULT_AUTHORITY,      // [w]
    DESTINATION,          // [w]
    COUNT,
};
}  // namespace withdraw_funds_accounts

namespace withdraw_goods_accounts {
enum : std::size_t {
    AUCTION = 0,          // []
    AUTHORITY,            // [s]
    TOKEN_PROGRAM,        // []
    MINT,                 // []
    VAULT,                // [w]
    VAULT_AUTHORITY,      // []
    DESTINATION,          // [w] unit account
    COUNT,
};
}  // namespace withdraw_goods_accounts

// ============================================================================
// Instruction Builders
// ============================================================================

// Addresses shared by every auction instruction
struct AuctionAccounts {
    Address auction;
    Address mint;
    Address vault;             // associated_token_address(vault_authority, mint)
    Address vault_authority;   // create_program_address([auction], program_id)
};

[[nodiscard]] Instruction initialize_auction(
    const Address& program_id,
    const AuctionAccounts& auction,
    const Address& authority,
    const Address& funder,
    const Address& token_source,
    const Address& source_owner,
    const InitializeAuction& params);

[[nodiscard]] Instruction make_bid(
    const Address& program_id,
    const AuctionAccounts& auction,
    const Address& bidder,
    const Address& bidder_token,
    std::uint64_t token_amount);

[[nodiscard]] Instruction withdraw_funds(
    const Address& program_id,
    const AuctionAccounts& auction,
    const Address& authority,
    const Address& destination);

[[nodiscard]] Instruction withdraw_goods(
    const Address& program_id,
    const AuctionAccounts& auction,
    const Address& authority,
    const Address& destination_token);

}  // namespace dutch

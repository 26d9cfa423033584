#pragma once

#include "ledger/program_error.hh"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dutch {

// ============================================================================
// Auction Errors - reported as ProgramResult::custom(code)
// ============================================================================

enum class AuctionError : std::uint32_t {
    ALREADY_IN_USE = 0,
    INVALID_INSTRUCTION = 1,
    INVALID_INITIALIZATION_TIME = 2,
    INVALID_VAULT_OWNER = 3,
    INVALID_VAULT_ADDRESS = 4,
    NOT_STARTED = 5,
    FINISHED = 6,
    EVERYTHING_SOLD_OUT = 7,
    OWNER_MISMATCH = 8,
    NOT_FINISHED = 9,
};

inline constexpr std::uint32_t AUCTION_ERROR_MAX = static_cast<std::uint32_t>(AuctionError::NOT_FINISHED);

[[nodiscard]] constexpr std::string_view auction_error_string(AuctionError error) {
    switch (error) {
        case AuctionError::ALREADY_IN_USE: return "Already in use";
        case AuctionError::INVALID_INSTRUCTION: return "Invalid instruction";
        case AuctionError::INVALID_INITIALIZATION_TIME: return "Invalid initialization time";
        case AuctionError::INVALID_VAULT_OWNER: return "Invalid derived vault authority address";
        case AuctionError::INVALID_VAULT_ADDRESS: return "Invalid vault holding account address";
        case AuctionError::NOT_STARTED: return "Auction not started yet";
        case AuctionError::FINISHED: return "Auction finished";
        case AuctionError::EVERYTHING_SOLD_OUT: return "Everything sold out";
        case AuctionError::OWNER_MISMATCH: return "Owner does not match";
        case AuctionError::NOT_FINISHED: return "Auction not finished yet";
    }
    return "Unknown auction error";
}

[[nodiscard]] inline ProgramResult to_result(AuctionError error) {
    return ProgramResult::custom(static_cast<std::uint32_t>(error));
}

// Recover the auction error carried by a failed result, if it is one
[[nodiscard]] std::optional<AuctionError> auction_error_from(const ProgramResult& result);

// Human-readable form of any result, naming auction errors
[[nodiscard]] std::string describe_result(const ProgramResult& result);

}  // namespace dutch

#pragma once

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

namespace dutch {

// ============================================================================
// Ledger-level Errors
// ============================================================================

enum class ProgramError : std::uint8_t {
    NONE = 0,
    CUSTOM = 1,                       // Program-defined code in ProgramResult::custom_code
    INVALID_ARGUMENT = 2,
    INVALID_INSTRUCTION_DATA = 3,
    INVALID_ACCOUNT_DATA = 4,
    INSUFFICIENT_FUNDS = 5,
    INCORRECT_PROGRAM_ID = 6,
    MISSING_REQUIRED_SIGNATURE = 7,
    UNINITIALIZED_ACCOUNT = 8,
    NOT_ENOUGH_ACCOUNT_KEYS = 9,
    ACCOUNT_ALREADY_IN_USE = 10,
    ACCOUNT_NOT_FOUND = 11,
    ARITHMETIC_OVERFLOW = 12,
    READONLY_ACCOUNT_MODIFIED = 13,   // Write to an account not declared writable
    UNDECLARED_ACCOUNT = 14,          // Access to an account the instruction did not list
    INVALID_SIGNATURE = 15,
};

[[nodiscard]] std::string_view program_error_string(ProgramError error);

// ============================================================================
// Program Result
// ============================================================================

struct ProgramResult {
    ProgramError error = ProgramError::NONE;
    std::uint32_t custom_code = 0;

    [[nodiscard]] bool is_success() const { return error == ProgramError::NONE; }
    [[nodiscard]] bool is_custom() const { return error == ProgramError::CUSTOM; }

    [[nodiscard]] static ProgramResult ok() { return {}; }
    [[nodiscard]] static ProgramResult failure(ProgramError error) { return {error, 0}; }
    [[nodiscard]] static ProgramResult custom(std::uint32_t code) {
        return {ProgramError::CUSTOM, code};
    }

    // Stable numeric code for reporting across the ledger boundary:
    // 0 on success, (error << 32) | custom_code otherwise
    [[nodiscard]] std::uint64_t code() const {
        return (static_cast<std::uint64_t>(error) << 32) | custom_code;
    }

    [[nodiscard]] std::string to_string() const;

    bool operator==(const ProgramResult&) const = default;
};

}  // namespace dutch

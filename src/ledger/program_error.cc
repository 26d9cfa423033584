#include "program_error.hh"

namespace dutch {

std::string_view program_error_string(ProgramError error) {
    switch (error) {
        case ProgramError::NONE: return "success";
        case ProgramError::CUSTOM: return "custom";
        case ProgramError::INVALID_ARGUMENT: return "invalid_argument";
        case ProgramError::INVALID_INSTRUCTION_DATA: return "invalid_instruction_data";
        case ProgramError::INVALID_ACCOUNT_DATA: return "invalid_account_data";
        case ProgramError::INSUFFICIENT_FUNDS: return "insufficient_funds";
        case ProgramError::INCORRECT_PROGRAM_ID: return "incorrect_program_id";
        case ProgramError::MISSING_REQUIRED_SIGNATURE: return "missing_required_signature";
        case ProgramError::UNINITIALIZED_ACCOUNT: return "uninitialized_account";
        case ProgramError::NOT_ENOUGH_ACCOUNT_KEYS: return "not_enough_account_keys";
        case ProgramError::ACCOUNT_ALREADY_IN_USE: return "account_already_in_use";
        case ProgramError::ACCOUNT_NOT_FOUND: return "account_not_found";
        case ProgramError::ARITHMETIC_OVERFLOW: return "arithmetic_overflow";
        case ProgramError::READONLY_ACCOUNT_MODIFIED: return "readonly_account_modified";
        case ProgramError::UNDECLARED_ACCOUNT: return "undeclared_account";
        case ProgramError::INVALID_SIGNATURE: return "invalid_signature";
    }
    return "unknown";
}

std::string ProgramResult::to_string() const {
    if (error == ProgramError::CUSTOM) {
        return "custom(" + std::to_string(custom_code) + ")";
    }
    return std::string(program_error_string(error));
}

}  // namespace dutch

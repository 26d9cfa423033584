#pragma once

#include "core/types.hh"
#include "ledger/program_error.hh"
#include "ledger/runtime.hh"
#include <span>
#include <unordered_set>
#include <vector>

namespace dutch {

// ============================================================================
// Access Tracker - enforces an instruction's declared account list
// ============================================================================

// Built from the account list of one instruction. Reads of unlisted accounts
// fail UNDECLARED_ACCOUNT; writes to accounts listed read-only fail
// READONLY_ACCOUNT_MODIFIED. The first violation sticks.
class AccessTracker {
public:
    explicit AccessTracker(std::span<const AccountInfo> declared);

    ProgramError check_read(const Address& addr);
    ProgramError check_write(const Address& addr);

    // Ledger-verified signer status of a declared account
    [[nodiscard]] bool is_signer(const Address& addr) const;

    [[nodiscard]] bool has_violation() const { return violation_ != ProgramError::NONE; }
    [[nodiscard]] ProgramError violation() const { return violation_; }

    // Accounts written so far, in first-write order
    [[nodiscard]] const std::vector<Address>& actual_writes() const { return actual_writes_; }

private:
    std::unordered_set<Address> declared_reads_;
    std::unordered_set<Address> declared_writes_;
    std::unordered_set<Address> signers_;
    std::vector<Address> actual_writes_;
    ProgramError violation_ = ProgramError::NONE;
};

}  // namespace dutch

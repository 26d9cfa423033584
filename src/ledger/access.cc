#include "ledger/access.hh"
#include "core/logging.hh"
#include <algorithm>

namespace dutch {

AccessTracker::AccessTracker(std::span<const AccountInfo> declared) {
    for (const auto& info : declared) {
        declared_reads_.insert(info.key);
        if (info.is_writable) {
            declared_writes_.insert(info.key);
        }
        if (info.is_signer) {
            signers_.insert(info.key);
        }
    }
}

ProgramError AccessTracker::check_read(const Address& addr) {
    if (violation_ != ProgramError::NONE) {
        return violation_;
    }

    if (declared_reads_.find(addr) == declared_reads_.end()) {
        violation_ = ProgramError::UNDECLARED_ACCOUNT;
        DUTCH_LOG_WARN(log::bank) << "Access violation: undeclared account " << addr.to_hex();
        return violation_;
    }
    return ProgramError::NONE;
}

ProgramError AccessTracker::check_write(const Address& addr) {
    if (auto err = check_read(addr); err != ProgramError::NONE) {
        return err;
    }

    if (declared_writes_.find(addr) == declared_writes_.end()) {
        violation_ = ProgramError::READONLY_ACCOUNT_MODIFIED;
        DUTCH_LOG_WARN(log::bank) << "Access violation: write to read-only account " << addr.to_hex();
        return violation_;
    }

    if (std::find(actual_writes_.begin(), actual_writes_.end(), addr) == actual_writes_.end()) {
        actual_writes_.push_back(addr);
    }
    return ProgramError::NONE;
}

bool AccessTracker::is_signer(const Address& addr) const {
    return signers_.find(addr) != signers_.end();
}

}  // namespace dutch

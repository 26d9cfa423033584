#include <gtest/gtest.h>
#include "ledger/access.hh"

namespace dutch {
namespace {

class AccessTest : public ::testing::Test {
protected:
    void SetUp() override {
        readonly_.bytes.fill(0x11);
        writable_.bytes.fill(0x22);
        signer_.bytes.fill(0x33);
        undeclared_.bytes.fill(0x44);

        declared_ = {
            AccountInfo{readonly_, false, false},
            AccountInfo{writable_, false, true},
            AccountInfo{signer_, true, true},
        };
    }

    Address readonly_;
    Address writable_;
    Address signer_;
    Address undeclared_;
    std::vector<AccountInfo> declared_;
};

TEST_F(AccessTest, DeclaredReadsAllowed) {
    AccessTracker tracker(declared_);
    EXPECT_EQ(tracker.check_read(readonly_), ProgramError::NONE);
    EXPECT_EQ(tracker.check_read(writable_), ProgramError::NONE);
    EXPECT_EQ(tracker.check_read(signer_), ProgramError::NONE);
    EXPECT_FALSE(tracker.has_violation());
}

TEST_F(AccessTest, UndeclaredRead) {
    AccessTracker tracker(declared_);
    EXPECT_EQ(tracker.check_read(undeclared_), ProgramError::UNDECLARED_ACCOUNT);
    EXPECT_TRUE(tracker.has_violation());
    EXPECT_EQ(tracker.violation(), ProgramError::UNDECLARED_ACCOUNT);
}

TEST_F(AccessTest, WriteToReadonly) {
    AccessTracker tracker(declared_);
    EXPECT_EQ(tracker.check_write(readonly_), ProgramError::READONLY_ACCOUNT_MODIFIED);
    EXPECT_EQ(tracker.violation(), ProgramError::READONLY_ACCOUNT_MODIFIED);
}

TEST_F(AccessTest, WriteToUndeclared) {
    AccessTracker tracker(declared_);
    EXPECT_EQ(tracker.check_write(undeclared_), ProgramError::UNDECLARED_ACCOUNT);
}

TEST_F(AccessTest, ViolationSticks) {
    AccessTracker tracker(declared_);
    EXPECT_EQ(tracker.check_read(undeclared_), ProgramError::UNDECLARED_ACCOUNT);

    // Later valid accesses keep reporting the first violation
    EXPECT_EQ(tracker.check_read(readonly_), ProgramError::UNDECLARED_ACCOUNT);
    EXPECT_EQ(tracker.check_write(writable_), ProgramError::UNDECLARED_ACCOUNT);
}

TEST_F(AccessTest, ActualWritesRecordedOnce) {
    AccessTracker tracker(declared_);
    EXPECT_EQ(tracker.check_write(writable_), ProgramError::NONE);
    EXPECT_EQ(tracker.check_write(signer_), ProgramError::NONE);
    EXPECT_EQ(tracker.check_write(writable_), ProgramError::NONE);

    ASSERT_EQ(tracker.actual_writes().size(), 2u);
    EXPECT_EQ(tracker.actual_writes()[0], writable_);
    EXPECT_EQ(tracker.actual_writes()[1], signer_);
}

TEST_F(AccessTest, SignerStatus) {
    AccessTracker tracker(declared_);
    EXPECT_TRUE(tracker.is_signer(signer_));
    EXPECT_FALSE(tracker.is_signer(writable_));
    EXPECT_FALSE(tracker.is_signer(undeclared_));
}

TEST_F(AccessTest, DuplicateEntriesUnionFlags) {
    declared_.push_back(AccountInfo{readonly_, false, true});
    AccessTracker tracker(declared_);
    EXPECT_EQ(tracker.check_write(readonly_), ProgramError::NONE);
}

}  // namespace
}  // namespace dutch

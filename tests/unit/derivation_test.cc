#include <gtest/gtest.h>
#include "ledger/derivation.hh"
#include "crypto/hash.hh"
#include <algorithm>

namespace dutch {
namespace {

class DerivationTest : public ::testing::Test {
protected:
    void SetUp() override {
        program_ = Address::from_label("derivation.test.program");
        wallet_.bytes.fill(0x21);
        mint_.bytes.fill(0x42);
    }

    Address program_;
    Address wallet_;
    Address mint_;
};

TEST_F(DerivationTest, MatchesDocumentedPreimage) {
    const std::vector<seed_t> seeds = {{1, 2, 3}, {4, 5}};
    auto derived = create_program_address(seeds, program_);
    ASSERT_TRUE(derived.has_value());

    std::vector<std::uint8_t> preimage = {1, 2, 3, 4, 5};
    preimage.insert(preimage.end(), program_.begin(), program_.end());
    preimage.insert(preimage.end(), PROGRAM_DERIVED_ADDRESS_MARKER.begin(),
                    PROGRAM_DERIVED_ADDRESS_MARKER.end());

    EXPECT_EQ(derived->bytes, sha3_256(preimage));
}

TEST_F(DerivationTest, Deterministic) {
    const std::vector<seed_t> seeds = {address_seed(wallet_)};
    EXPECT_EQ(create_program_address(seeds, program_), create_program_address(seeds, program_));
}

TEST_F(DerivationTest, ProgramIdSeparatesAddresses) {
    const std::vector<seed_t> seeds = {address_seed(wallet_)};
    auto a = create_program_address(seeds, program_);
    auto b = create_program_address(seeds, Address::from_label("another.program"));
    ASSERT_TRUE(a && b);
    EXPECT_NE(*a, *b);
}

TEST_F(DerivationTest, DiffersFromKeyIdentity) {
    // A key-owned identity hashes the bare key; the marker keeps the spaces apart
    const std::vector<seed_t> seeds = {address_seed(wallet_)};
    auto derived = create_program_address(seeds, program_);
    ASSERT_TRUE(derived.has_value());
    EXPECT_NE(derived->bytes, sha3_256(wallet_.bytes));
}

TEST_F(DerivationTest, EmptySeedListAllowed) {
    EXPECT_TRUE(create_program_address({}, program_).has_value());
}

TEST_F(DerivationTest, RejectsLongSeed) {
    const std::vector<seed_t> ok = {seed_t(MAX_SEED_LEN, 0xAA)};
    const std::vector<seed_t> too_long = {seed_t(MAX_SEED_LEN + 1, 0xAA)};
    EXPECT_TRUE(create_program_address(ok, program_).has_value());
    EXPECT_FALSE(create_program_address(too_long, program_).has_value());
}

TEST_F(DerivationTest, RejectsTooManySeeds) {
    const std::vector<seed_t> ok(MAX_SEEDS, seed_t{1});
    const std::vector<seed_t> too_many(MAX_SEEDS + 1, seed_t{1});
    EXPECT_TRUE(create_program_address(ok, program_).has_value());
    EXPECT_FALSE(create_program_address(too_many, program_).has_value());
}

TEST_F(DerivationTest, AddressSeedIsRawBytes) {
    seed_t seed = address_seed(wallet_);
    ASSERT_EQ(seed.size(), ADDRESS_SIZE);
    EXPECT_TRUE(std::equal(seed.begin(), seed.end(), wallet_.begin()));
}

TEST_F(DerivationTest, AssociatedTokenAddress) {
    const std::vector<seed_t> seeds = {
        address_seed(wallet_),
        address_seed(TOKEN_PROGRAM_ID),
        address_seed(mint_),
    };
    auto expected = create_program_address(seeds, ASSOCIATED_TOKEN_PROGRAM_ID);
    ASSERT_TRUE(expected.has_value());
    EXPECT_EQ(associated_token_address(wallet_, mint_), *expected);
}

TEST_F(DerivationTest, AssociatedTokenAddressIsPerWalletAndMint) {
    Address other;
    other.bytes.fill(0x99);

    auto base = associated_token_address(wallet_, mint_);
    EXPECT_NE(base, associated_token_address(other, mint_));
    EXPECT_NE(base, associated_token_address(wallet_, other));
    EXPECT_NE(base, associated_token_address(mint_, wallet_));
}

}  // namespace
}  // namespace dutch

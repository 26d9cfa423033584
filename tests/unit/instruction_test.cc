#include <gtest/gtest.h>
#include "auction/instruction.hh"

namespace dutch {
namespace {

class InstructionCodecTest : public ::testing::Test {
protected:
    InitializeAuction sample_init() const {
        InitializeAuction cmd;
        cmd.token_amount = 100;
        cmd.time_start = 1'700'000'000;
        cmd.time_step = 60;
        cmd.price_start = 10'000'000'000;
        cmd.price_step = 1'000'000'000;
        return cmd;
    }
};

// ============================================================================
// Encoding
// ============================================================================

TEST_F(InstructionCodecTest, InitializeLayout) {
    auto bytes = encode_instruction(sample_init());
    ASSERT_EQ(bytes.size(), 1 + InitializeAuction::PAYLOAD_SIZE);
    EXPECT_EQ(InitializeAuction::PAYLOAD_SIZE, 40u);

    EXPECT_EQ(bytes[0], 0);
    EXPECT_EQ(decode_u64(bytes.data() + 1), 100u);
    EXPECT_EQ(decode_i64(bytes.data() + 9), 1'700'000'000);
    EXPECT_EQ(decode_i64(bytes.data() + 17), 60);
    EXPECT_EQ(decode_u64(bytes.data() + 25), 10'000'000'000u);
    EXPECT_EQ(decode_u64(bytes.data() + 33), 1'000'000'000u);
}

TEST_F(InstructionCodecTest, BidLayout) {
    auto bytes = encode_instruction(MakeBid{0x0102030405060708ULL});
    ASSERT_EQ(bytes.size(), 9u);
    EXPECT_EQ(bytes[0], 1);
    EXPECT_EQ(bytes[1], 0x08);  // little-endian
    EXPECT_EQ(bytes[8], 0x01);
}

TEST_F(InstructionCodecTest, WithdrawLayouts) {
    EXPECT_EQ(encode_instruction(WithdrawFunds{}), std::vector<std::uint8_t>{2});
    EXPECT_EQ(encode_instruction(WithdrawGoods{}), std::vector<std::uint8_t>{3});
}

// ============================================================================
// Decoding
// ============================================================================

TEST_F(InstructionCodecTest, RoundTripEveryVariant) {
    InitializeAuction negative_time = sample_init();
    negative_time.time_start = -5;

    const std::vector<AuctionInstruction> commands = {
        sample_init(),
        negative_time,
        MakeBid{150},
        MakeBid{0},
        WithdrawFunds{},
        WithdrawGoods{},
    };

    for (const auto& cmd : commands) {
        auto decoded = decode_instruction(encode_instruction(cmd));
        ASSERT_TRUE(decoded.has_value()) << instruction_name(cmd);
        EXPECT_EQ(*decoded, cmd) << instruction_name(cmd);
    }
}

TEST_F(InstructionCodecTest, RejectsEmptyInput) {
    EXPECT_FALSE(decode_instruction({}).has_value());
}

TEST_F(InstructionCodecTest, RejectsUnknownTag) {
    for (std::uint8_t tag : {std::uint8_t{4}, std::uint8_t{0x7F}, std::uint8_t{0xFF}}) {
        std::vector<std::uint8_t> bytes = {tag};
        EXPECT_FALSE(decode_instruction(bytes).has_value()) << int(tag);
    }
}

TEST_F(InstructionCodecTest, RejectsTruncatedPayloads) {
    auto init = encode_instruction(sample_init());
    for (std::size_t len = 1; len < init.size(); ++len) {
        std::span<const std::uint8_t> prefix(init.data(), len);
        EXPECT_FALSE(decode_instruction(prefix).has_value()) << "length " << len;
    }

    auto bid = encode_instruction(MakeBid{5});
    for (std::size_t len = 1; len < bid.size(); ++len) {
        std::span<const std::uint8_t> prefix(bid.data(), len);
        EXPECT_FALSE(decode_instruction(prefix).has_value()) << "length " << len;
    }
}

TEST_F(InstructionCodecTest, RejectsTrailingBytes) {
    const std::vector<AuctionInstruction> commands = {
        sample_init(), MakeBid{1}, WithdrawFunds{}, WithdrawGoods{},
    };
    for (const auto& cmd : commands) {
        auto bytes = encode_instruction(cmd);
        bytes.push_back(0);
        EXPECT_FALSE(decode_instruction(bytes).has_value()) << instruction_name(cmd);
    }
}

TEST_F(InstructionCodecTest, Names) {
    EXPECT_EQ(instruction_name(sample_init()), "InitializeAuction");
    EXPECT_EQ(instruction_name(MakeBid{}), "MakeBid");
    EXPECT_EQ(instruction_name(WithdrawFunds{}), "WithdrawFunds");
    EXPECT_EQ(instruction_name(WithdrawGoods{}), "WithdrawGoods");
}

// ============================================================================
// Builders
// ============================================================================

class InstructionBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        program_ = Address::from_label("builder.test.program");
        accounts_.auction.bytes.fill(0x01);
        accounts_.mint.bytes.fill(0x02);
        accounts_.vault.bytes.fill(0x03);
        accounts_.vault_authority.bytes.fill(0x04);
        authority_.bytes.fill(0x05);
        payer_.bytes.fill(0x06);
        other_.bytes.fill(0x07);
    }

    Address program_;
    AuctionAccounts accounts_;
    Address authority_;
    Address payer_;
    Address other_;
};

TEST_F(InstructionBuilderTest, InitializeAccounts) {
    InitializeAuction params{100, 10, 60, 1000, 10};
    auto ix = initialize_auction(program_, accounts_, authority_, payer_, other_, payer_, params);

    EXPECT_EQ(ix.program_id, program_);
    ASSERT_EQ(ix.accounts.size(), initialize_accounts::COUNT);
    EXPECT_EQ(ix.accounts[initialize_accounts::AUCTION], AccountMeta::writable(accounts_.auction));
    EXPECT_EQ(ix.accounts[initialize_accounts::AUTHORITY], AccountMeta::readonly(authority_));
    EXPECT_EQ(ix.accounts[initialize_accounts::SYSTEM_PROGRAM], AccountMeta::readonly(SYSTEM_PROGRAM_ID));
    EXPECT_EQ(ix.accounts[initialize_accounts::FUNDER], AccountMeta::writable(payer_, true));
    EXPECT_EQ(ix.accounts[initialize_accounts::TOKEN_PROGRAM], AccountMeta::readonly(TOKEN_PROGRAM_ID));
    EXPECT_EQ(ix.accounts[initialize_accounts::MINT], AccountMeta::readonly(accounts_.mint));
    EXPECT_EQ(ix.accounts[initialize_accounts::TOKEN_SOURCE], AccountMeta::writable(other_));
    EXPECT_EQ(ix.accounts[initialize_accounts::VAULT], AccountMeta::writable(accounts_.vault));
    EXPECT_EQ(ix.accounts[initialize_accounts::VAULT_AUTHORITY],
              AccountMeta::writable(accounts_.vault_authority));
    EXPECT_EQ(ix.accounts[initialize_accounts::SOURCE_OWNER], AccountMeta::readonly(payer_, true));

    auto decoded = decode_instruction(ix.data);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, AuctionInstruction{params});
}

TEST_F(InstructionBuilderTest, BidAccounts) {
    auto ix = make_bid(program_, accounts_, payer_, other_, 42);

    ASSERT_EQ(ix.accounts.size(), bid_accounts::COUNT);
    EXPECT_EQ(ix.accounts[bid_accounts::AUCTION], AccountMeta::readonly(accounts_.auction));
    EXPECT_EQ(ix.accounts[bid_accounts::BIDDER], AccountMeta::writable(payer_, true));
    EXPECT_EQ(ix.accounts[bid_accounts::VAULT], AccountMeta::writable(accounts_.vault));
    EXPECT_EQ(ix.accounts[bid_accounts::VAULT_AUTHORITY], AccountMeta::writable(accounts_.vault_authority));
    EXPECT_EQ(ix.accounts[bid_accounts::BIDDER_TOKEN], AccountMeta::writable(other_));

    auto decoded = decode_instruction(ix.data);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(std::get<MakeBid>(*decoded).token_amount, 42u);
}

TEST_F(InstructionBuilderTest, WithdrawFundsAccounts) {
    auto ix = withdraw_funds(program_, accounts_, authority_, other_);

    ASSERT_EQ(ix.accounts.size(), withdraw_funds_accounts::COUNT);
    EXPECT_EQ(ix.accounts[withdraw_funds_accounts::AUTHORITY], AccountMeta::readonly(authority_, true));
    EXPECT_EQ(ix.accounts[withdraw_funds_accounts::MINT], AccountMeta::readonly(accounts_.mint));
    EXPECT_EQ(ix.accounts[withdraw_funds_accounts::VAULT_AUTHORITY],
              AccountMeta::writable(accounts_.vault_authority));
    EXPECT_EQ(ix.accounts[withdraw_funds_accounts::DESTINATION], AccountMeta::writable(other_));
    EXPECT_EQ(ix.data, std::vector<std::uint8_t>{2});
}

TEST_F(InstructionBuilderTest, WithdrawGoodsAccounts) {
    auto ix = withdraw_goods(program_, accounts_, authority_, other_);

    ASSERT_EQ(ix.accounts.size(), withdraw_goods_accounts::COUNT);
    EXPECT_EQ(ix.accounts[withdraw_goods_accounts::AUTHORITY], AccountMeta::readonly(authority_, true));
    EXPECT_EQ(ix.accounts[withdraw_goods_accounts::VAULT], AccountMeta::writable(accounts_.vault));
    EXPECT_EQ(ix.accounts[withdraw_goods_accounts::VAULT_AUTHORITY],
              AccountMeta::readonly(accounts_.vault_authority));
    EXPECT_EQ(ix.accounts[withdraw_goods_accounts::DESTINATION], AccountMeta::writable(other_));
    EXPECT_EQ(ix.data, std::vector<std::uint8_t>{3});
}

}  // namespace
}  // namespace dutch

#include "auction/instruction.hh"

namespace dutch {

// ============================================================================
// Wire Codec
// ============================================================================

std::vector<std::uint8_t> encode_instruction(const AuctionInstruction& instruction) {
    std::vector<std::uint8_t> result;

    std::visit(Overloaded{
        [&](const InitializeAuction& cmd) {
            result.reserve(1 + InitializeAuction::PAYLOAD_SIZE);
            result.push_back(static_cast<std::uint8_t>(InitializeAuction::TAG));
            append_u64(result, cmd.token_amount);
            append_i64(result, cmd.time_start);
            append_i64(result, cmd.time_step);
            append_u64(result, cmd.price_start);
            append_u64(result, cmd.price_step);
        },
        [&](const MakeBid& cmd) {
            result.reserve(1 + MakeBid::PAYLOAD_SIZE);
            result.push_back(static_cast<std::uint8_t>(MakeBid::TAG));
            append_u64(result, cmd.token_amount);
        },
        [&](const WithdrawFunds&) {
            result.push_back(static_cast<std::uint8_t>(WithdrawFunds::TAG));
        },
        [&](const WithdrawGoods&) {
            result.push_back(static_cast<std::uint8_t>(WithdrawGoods::TAG));
        },
    }, instruction);

    return result;
}

std::optional<AuctionInstruction> decode_instruction(std::span<const std::uint8_t> data) {
    if (data.empty()) {
        return std::nullopt;
    }

    const auto payload = data.subspan(1);
    const std::uint8_t* ptr = payload.data();

    switch (static_cast<InstructionTag>(data[0])) {
        case InstructionTag::INITIALIZE_AUCTION: {
            if (payload.size() != InitializeAuction::PAYLOAD_SIZE) {
                return std::nullopt;
            }
            InitializeAuction cmd;
            cmd.token_amount = decode_u64(ptr);
            cmd.time_start = decode_i64(ptr + 8);
            cmd.time_step = decode_i64(ptr + 16);
            cmd.price_start = decode_u64(ptr + 24);
            cmd.price_step = decode_u64(ptr + 32);
            return cmd;
        }
        case InstructionTag::MAKE_BID: {
            if (payload.size() != MakeBid::PAYLOAD_SIZE) {
                return std::nullopt;
            }
            return MakeBid{decode_u64(ptr)};
        }
        case InstructionTag::WITHDRAW_FUNDS:
            if (!payload.empty()) {
                return std::nullopt;
            }
            return WithdrawFunds{};
        case InstructionTag::WITHDRAW_GOODS:
            if (!payload.empty()) {
                return std::nullopt;
            }
            return WithdrawGoods{};
    }

    return std::nullopt;
}

std::string_view instruction_name(const AuctionInstruction& instruction) {
    return std::visit(Overloaded{
        [](const InitializeAuction&) -> std::string_view { return "InitializeAuction"; },
        [](const MakeBid&) -> std::string_view { return "MakeBid"; },
        [](const WithdrawFunds&) -> std::string_view { return "WithdrawFunds"; },
        [](const WithdrawGoods&) -> std::string_view { return "WithdrawGoods"; },
    }, instruction);
}

// ============================================================================
// Instruction Builders
// ============================================================================

Instruction initialize_auction(
    const Address& program_id,
    const AuctionAccounts& auction,
    const Address& authority,
    const Address& funder,
    const Address& token_source,
    const Address& source_owner,
    const InitializeAuction& params) {

    Instruction ix;
    ix.program_id = program_id;
    ix.accounts = {
        AccountMeta::writable(auction.auction),
        AccountMeta::readonly(authority),
        AccountMeta::readonly(SYSTEM_PROGRAM_ID),
        AccountMeta::writable(funder, true),
        AccountMeta::readonly(TOKEN_PROGRAM_ID),
        AccountMeta::readonly(auction.mint),
        AccountMeta::writable(token_source),
        AccountMeta::writable(auction.vault),
        AccountMeta::writable(auction.vault_authority),
        AccountMeta::readonly(source_owner, true),
    };
    ix.data = encode_instruction(params);
    return ix;
}

Instruction make_bid(
    const Address& program_id,
    const AuctionAccounts& auction,
    const Address& bidder,
    const Address& bidder_token,
    std::uint64_t token_amount) {

    Instruction ix;
    ix.program_id = program_id;
    ix.accounts = {
        AccountMeta::readonly(auction.auction),
        AccountMeta::readonly(SYSTEM_PROGRAM_ID),
        AccountMeta::writable(bidder, true),
        AccountMeta::readonly(TOKEN_PROGRAM_ID),
        AccountMeta::readonly(auction.mint),
        AccountMeta::writable(auction.vault),
        AccountMeta::writable(auction.vault_authority),
        AccountMeta::writable(bidder_token),
    };
    ix.data = encode_instruction(MakeBid{token_amount});
    return ix;
}

Instruction withdraw_funds(
    const Address& program_id,
    const AuctionAccounts& auction,
    const Address& authority,
    const Address& destination) {

    Instruction ix;
    ix.program_id = program_id;
    ix.accounts = {
        AccountMeta::readonly(auction.auction),
        AccountMeta::readonly(authority, true),
        AccountMeta::readonly(SYSTEM_PROGRAM_ID),
        AccountMeta::readonly(auction.mint),
        AccountMeta::writable(auction.vault_authority),
        AccountMeta::writable(destination),
    };
    ix.data = encode_instruction(WithdrawFunds{});
    return ix;
}

Instruction withdraw_goods(
    const Address& program_id,
    const AuctionAccounts& auction,
    const Address& authority,
    const Address& destination_token) {

    Instruction ix;
    ix.program_id = program_id;
    ix.accounts = {
        AccountMeta::readonly(auction.auction),
        AccountMeta::readonly(authority, true),
        AccountMeta::readonly(TOKEN_PROGRAM_ID),
        AccountMeta::readonly(auction.mint),
        AccountMeta::writable(auction.vault),
        AccountMeta::readonly(auction.vault_authority),
        AccountMeta::writable(destination_token),
    };
    ix.data = encode_instruction(WithdrawGoods{});
    return ix;
}

}  // namespace dutch

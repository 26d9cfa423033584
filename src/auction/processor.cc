#include "auction/processor.hh"
#include "auction/error.hh"
#include "auction/pricing.hh"
#include "auction/validation.hh"
#include "core/logging.hh"
#include "ledger/token.hh"
#include <algorithm>
#include <limits>

namespace dutch {

namespace {

ProgramResult rejected(std::string_view command, const ProgramResult& result) {
    DUTCH_LOG_DEBUG(log::processor) << command << " rejected: " << describe_result(result);
    return result;
}

ProgramResult not_enough_accounts(std::string_view command, std::size_t got, std::size_t need) {
    DUTCH_LOG_DEBUG(log::processor) << command << " needs " << need << " accounts, got " << got;
    return ProgramResult::failure(ProgramError::NOT_ENOUGH_ACCOUNT_KEYS);
}

}  // namespace

// ============================================================================
// Processor Implementation
// ============================================================================

Processor::Processor(ProgramConfig config)
    : config_(std::move(config)) {}

ProgramEntrypoint Processor::entrypoint() const {
    return [processor = *this](const Address& program_id,
                               std::span<const AccountInfo> accounts,
                               std::span<const std::uint8_t> input,
                               Runtime& runtime) {
        return processor.process(program_id, accounts, input, runtime);
    };
}

ProgramResult Processor::process(const Address& program_id,
                                 std::span<const AccountInfo> accounts,
                                 std::span<const std::uint8_t> input,
                                 Runtime& runtime) const {
    if (program_id != config_.program_id) {
        DUTCH_LOG_WARN(log::processor) << "invoked as " << program_id.to_hex()
                                       << ", configured as " << config_.program_id.to_hex();
        return ProgramResult::failure(ProgramError::INCORRECT_PROGRAM_ID);
    }

    auto instruction = decode_instruction(input);
    if (!instruction) {
        return rejected("decode", to_result(AuctionError::INVALID_INSTRUCTION));
    }

    DUTCH_LOG_DEBUG(log::processor) << "dispatch " << instruction_name(*instruction)
                                    << " with " << accounts.size() << " accounts";

    return std::visit(Overloaded{
        [&](const InitializeAuction& params) {
            return process_initialize(params, accounts, runtime);
        },
        [&](const MakeBid& bid) {
            return process_bid(bid, accounts, runtime);
        },
        [&](const WithdrawFunds&) {
            return process_withdraw_funds(accounts, runtime);
        },
        [&](const WithdrawGoods&) {
            return process_withdraw_goods(accounts, runtime);
        },
    }, *instruction);
}

// ============================================================================
// InitializeAuction
// ============================================================================

ProgramResult Processor::process_initialize(const InitializeAuction& params,
                                            std::span<const AccountInfo> accounts,
                                            Runtime& runtime) const {
    namespace ia = initialize_accounts;
    constexpr std::string_view command = "InitializeAuction";

    if (accounts.size() < ia::COUNT) {
        return not_enough_accounts(command, accounts.size(), ia::COUNT);
    }

    const auto& auction = accounts[ia::AUCTION];
    const auto& authority = accounts[ia::AUTHORITY];
    const auto& funder = accounts[ia::FUNDER];
    const auto& mint = accounts[ia::MINT];
    const auto& token_source = accounts[ia::TOKEN_SOURCE];
    const auto& vault = accounts[ia::VAULT];
    const auto& vault_authority = accounts[ia::VAULT_AUTHORITY];
    const auto& source_owner = accounts[ia::SOURCE_OWNER];

    if (auto r = check_program(accounts[ia::SYSTEM_PROGRAM], config_.system_program_id); !r.is_success()) {
        return rejected(command, r);
    }
    if (auto r = check_program(accounts[ia::TOKEN_PROGRAM], config_.token_program_id); !r.is_success()) {
        return rejected(command, r);
    }

    AuctionRecord record;
    if (auto r = load_record(runtime, auction, record); !r.is_success()) {
        return rejected(command, r);
    }
    if (record.initialized) {
        return rejected(command, to_result(AuctionError::ALREADY_IN_USE));
    }

    const unix_timestamp_t now = runtime.unix_timestamp();
    if (params.time_start < now || params.time_step <= 0) {
        DUTCH_LOG_DEBUG(log::processor) << "time_start=" << params.time_start
                                        << " time_step=" << params.time_step << " now=" << now;
        return rejected(command, to_result(AuctionError::INVALID_INITIALIZATION_TIME));
    }

    if (auto r = validate_vault_authority(config_.program_id, auction.key, vault_authority.key);
        !r.is_success()) {
        return rejected(command, r);
    }
    if (auto r = validate_vault_account(vault_authority.key, mint.key, vault.key); !r.is_success()) {
        return rejected(command, r);
    }

    std::uint8_t decimals = 0;
    if (auto r = read_mint_decimals(runtime, mint.key, decimals); !r.is_success()) {
        return rejected(command, r);
    }

    // Ledger side effects; the record is written last
    const ProgramSigner signer = vault_signer(config_.program_id, auction.key);

    if (auto r = runtime.create_account(funder.key, vault_authority.key, runtime.minimum_balance(0), 0,
                                        config_.system_program_id, &signer);
        !r.is_success()) {
        return rejected(command, r);
    }
    if (auto r = runtime.create_associated_token_account(funder.key, vault_authority.key, mint.key);
        !r.is_success()) {
        return rejected(command, r);
    }
    if (auto r = runtime.transfer_checked(token_source.key, mint.key, vault.key, source_owner.key,
                                          params.token_amount, decimals);
        !r.is_success()) {
        return rejected(command, r);
    }

    record.initialized = true;
    record.authority = authority.key;
    record.unit_id = mint.key;
    record.time_start = params.time_start;
    record.time_step = params.time_step;
    record.price_start = params.price_start;
    record.price_step = params.price_step;

    if (auto r = runtime.write_data(auction.key, record.serialize()); !r.is_success()) {
        return rejected(command, r);
    }

    DUTCH_LOG_INFO(log::processor) << "auction " << auction.key.to_hex() << " initialized: "
                                   << params.token_amount << " units from " << params.price_start
                                   << " down by " << params.price_step << " every "
                                   << params.time_step << "s starting at " << params.time_start;
    return ProgramResult::ok();
}

// ============================================================================
// MakeBid
// ============================================================================

ProgramResult Processor::process_bid(const MakeBid& bid,
                                     std::span<const AccountInfo> accounts,
                                     Runtime& runtime) const {
    namespace ba = bid_accounts;
    constexpr std::string_view command = "MakeBid";

    if (accounts.size() < ba::COUNT) {
        return not_enough_accounts(command, accounts.size(), ba::COUNT);
    }

    const auto& auction = accounts[ba::AUCTION];
    const auto& bidder = accounts[ba::BIDDER];
    const auto& mint = accounts[ba::MINT];
    const auto& vault = accounts[ba::VAULT];
    const auto& vault_authority = accounts[ba::VAULT_AUTHORITY];
    const auto& bidder_token = accounts[ba::BIDDER_TOKEN];

    if (auto r = check_program(accounts[ba::SYSTEM_PROGRAM], config_.system_program_id); !r.is_success()) {
        return rejected(command, r);
    }
    if (auto r = check_program(accounts[ba::TOKEN_PROGRAM], config_.token_program_id); !r.is_success()) {
        return rejected(command, r);
    }

    AuctionRecord record;
    if (auto r = load_initialized_record(runtime, auction, mint, record); !r.is_success()) {
        return rejected(command, r);
    }

    const PriceState price = current_price(record, runtime.unix_timestamp());
    switch (price.phase) {
        case PricePhase::NOT_STARTED:
            return rejected(command, to_result(AuctionError::NOT_STARTED));
        case PricePhase::FINISHED:
            return rejected(command, to_result(AuctionError::FINISHED));
        case PricePhase::ACTIVE:
            break;
    }

    if (auto r = validate_vault_authority(config_.program_id, auction.key, vault_authority.key);
        !r.is_success()) {
        return rejected(command, r);
    }
    if (auto r = validate_vault_account(vault_authority.key, record.unit_id, vault.key); !r.is_success()) {
        return rejected(command, r);
    }

    std::uint64_t available = 0;
    if (auto r = read_token_amount(runtime, vault.key, available); !r.is_success()) {
        return rejected(command, r);
    }
    if (available == 0) {
        return rejected(command, to_result(AuctionError::EVERYTHING_SOLD_OUT));
    }

    std::uint8_t decimals = 0;
    if (auto r = read_mint_decimals(runtime, mint.key, decimals); !r.is_success()) {
        return rejected(command, r);
    }

    // Oversized bids are capped to what is left
    const std::uint64_t amount = std::min(bid.token_amount, available);
    if (amount != 0 && price.price > std::numeric_limits<std::uint64_t>::max() / amount) {
        return rejected(command, ProgramResult::failure(ProgramError::ARITHMETIC_OVERFLOW));
    }
    const std::uint64_t payment = amount * price.price;

    if (auto r = runtime.transfer(bidder.key, vault_authority.key, payment); !r.is_success()) {
        return rejected(command, r);
    }

    const ProgramSigner signer = vault_signer(config_.program_id, auction.key);
    if (auto r = runtime.transfer_checked(vault.key, mint.key, bidder_token.key, vault_authority.key,
                                          amount, decimals, &signer);
        !r.is_success()) {
        return rejected(command, r);
    }

    DUTCH_LOG_INFO(log::processor) << "auction " << auction.key.to_hex() << ": sold " << amount
                                   << " of " << bid.token_amount << " requested at " << price.price;
    return ProgramResult::ok();
}

// ============================================================================
// WithdrawFunds
// ============================================================================

ProgramResult Processor::process_withdraw_funds(std::span<const AccountInfo> accounts,
                                                Runtime& runtime) const {
    namespace wf = withdraw_funds_accounts;
    constexpr std::string_view command = "WithdrawFunds";

    if (accounts.size() < wf::COUNT) {
        return not_enough_accounts(command, accounts.size(), wf::COUNT);
    }

    const auto& auction = accounts[wf::AUCTION];
    const auto& authority = accounts[wf::AUTHORITY];
    const auto& mint = accounts[wf::MINT];
    const auto& vault_authority = accounts[wf::VAULT_AUTHORITY];
    const auto& destination = accounts[wf::DESTINATION];

    if (auto r = check_program(accounts[wf::SYSTEM_PROGRAM], config_.system_program_id); !r.is_success()) {
        return rejected(command, r);
    }

    AuctionRecord record;
    if (auto r = load_initialized_record(runtime, auction, mint, record); !r.is_success()) {
        return rejected(command, r);
    }

    if (!current_price(record, runtime.unix_timestamp()).is_finished()) {
        return rejected(command, to_result(AuctionError::NOT_FINISHED));
    }
    if (auto r = validate_owner(record.authority, authority); !r.is_success()) {
        return rejected(command, r);
    }
    if (auto r = validate_vault_authority(config_.program_id, auction.key, vault_authority.key);
        !r.is_success()) {
        return rejected(command, r);
    }

    auto vault_account = runtime.get_account(vault_authority.key);
    if (!vault_account) {
        return rejected(command, ProgramResult::failure(ProgramError::ACCOUNT_NOT_FOUND));
    }

    // Repeated withdrawals move a zero balance
    const ProgramSigner signer = vault_signer(config_.program_id, auction.key);
    if (auto r = runtime.transfer(vault_authority.key, destination.key, vault_account->balance, &signer);
        !r.is_success()) {
        return rejected(command, r);
    }

    DUTCH_LOG_INFO(log::processor) << "auction " << auction.key.to_hex() << ": withdrew "
                                   << vault_account->balance << " in funds";
    return ProgramResult::ok();
}

// ============================================================================
// WithdrawGoods
// ============================================================================

ProgramResult Processor::process_withdraw_goods(std::span<const AccountInfo> accounts,
                                                Runtime& runtime) const {
    namespace wg = withdraw_goods_accounts;
    constexpr std::string_view command = "WithdrawGoods";

    if (accounts.size() < wg::COUNT) {
        return not_enough_accounts(command, accounts.size(), wg::COUNT);
    }

    const auto& auction = accounts[wg::AUCTION];
    const auto& authority = accounts[wg::AUTHORITY];
    const auto& mint = accounts[wg::MINT];
    const auto& vault = accounts[wg::VAULT];
    const auto& vault_authority = accounts[wg::VAULT_AUTHORITY];
    const auto& destination = accounts[wg::DESTINATION];

    if (auto r = check_program(accounts[wg::TOKEN_PROGRAM], config_.token_program_id); !r.is_success()) {
        return rejected(command, r);
    }

    AuctionRecord record;
    if (auto r = load_initialized_record(runtime, auction, mint, record); !r.is_success()) {
        return rejected(command, r);
    }

    if (!current_price(record, runtime.unix_timestamp()).is_finished()) {
        return rejected(command, to_result(AuctionError::NOT_FINISHED));
    }
    if (auto r = validate_owner(record.authority, authority); !r.is_success()) {
        return rejected(command, r);
    }
    if (auto r = validate_vault_authority(config_.program_id, auction.key, vault_authority.key);
        !r.is_success()) {
        return rejected(command, r);
    }
    if (auto r = validate_vault_account(vault_authority.key, record.unit_id, vault.key); !r.is_success()) {
        return rejected(command, r);
    }

    std::uint64_t remaining = 0;
    if (auto r = read_token_amount(runtime, vault.key, remaining); !r.is_success()) {
        return rejected(command, r);
    }
    std::uint8_t decimals = 0;
    if (auto r = read_mint_decimals(runtime, mint.key, decimals); !r.is_success()) {
        return rejected(command, r);
    }

    const ProgramSigner signer = vault_signer(config_.program_id, auction.key);
    if (auto r = runtime.transfer_checked(vault.key, mint.key, destination.key, vault_authority.key,
                                          remaining, decimals, &signer);
        !r.is_success()) {
        return rejected(command, r);
    }

    DUTCH_LOG_INFO(log::processor) << "auction " << auction.key.to_hex() << ": withdrew "
                                   << remaining << " unsold units";
    return ProgramResult::ok();
}

// ============================================================================
// Account Helpers
// ============================================================================

ProgramResult Processor::load_record(const Runtime& runtime,
                                     const AccountInfo& account,
                                     AuctionRecord& record) const {
    auto view = runtime.get_account(account.key);
    if (!view) {
        return ProgramResult::failure(ProgramError::ACCOUNT_NOT_FOUND);
    }
    if (view->owner != config_.program_id) {
        return ProgramResult::failure(ProgramError::INCORRECT_PROGRAM_ID);
    }

    auto decoded = AuctionRecord::deserialize(view->data);
    if (!decoded) {
        return ProgramResult::failure(ProgramError::INVALID_ACCOUNT_DATA);
    }
    record = *decoded;
    return ProgramResult::ok();
}

ProgramResult Processor::load_initialized_record(const Runtime& runtime,
                                                 const AccountInfo& account,
                                                 const AccountInfo& mint,
                                                 AuctionRecord& record) const {
    if (auto r = load_record(runtime, account, record); !r.is_success()) {
        return r;
    }
    if (!record.initialized) {
        return ProgramResult::failure(ProgramError::UNINITIALIZED_ACCOUNT);
    }
    if (mint.key != record.unit_id) {
        return ProgramResult::failure(ProgramError::INVALID_ARGUMENT);
    }
    return ProgramResult::ok();
}

ProgramResult Processor::read_mint_decimals(const Runtime& runtime,
                                            const Address& mint,
                                            std::uint8_t& decimals) const {
    auto view = runtime.get_account(mint);
    if (!view) {
        return ProgramResult::failure(ProgramError::ACCOUNT_NOT_FOUND);
    }
    if (view->owner != config_.token_program_id) {
        return ProgramResult::failure(ProgramError::INCORRECT_PROGRAM_ID);
    }

    auto state = Mint::deserialize(view->data);
    if (!state || !state->is_initialized) {
        return ProgramResult::failure(ProgramError::INVALID_ACCOUNT_DATA);
    }
    decimals = state->decimals;
    return ProgramResult::ok();
}

ProgramResult Processor::read_token_amount(const Runtime& runtime,
                                           const Address& account,
                                           std::uint64_t& amount) const {
    auto view = runtime.get_account(account);
    if (!view) {
        return ProgramResult::failure(ProgramError::ACCOUNT_NOT_FOUND);
    }
    if (view->owner != config_.token_program_id) {
        return ProgramResult::failure(ProgramError::INCORRECT_PROGRAM_ID);
    }

    auto state = TokenAccount::deserialize(view->data);
    if (!state || !state->is_initialized) {
        return ProgramResult::failure(ProgramError::INVALID_ACCOUNT_DATA);
    }
    amount = state->amount;
    return ProgramResult::ok();
}

ProgramResult Processor::check_program(const AccountInfo& account, const Address& expected) const {
    if (account.key != expected) {
        return ProgramResult::failure(ProgramError::INCORRECT_PROGRAM_ID);
    }
    return ProgramResult::ok();
}

}  // namespace dutch

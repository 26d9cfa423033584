#include "ledger/bank.hh"
#include "core/logging.hh"
#include "ledger/derivation.hh"
#include <limits>

namespace dutch {

namespace {

// Clears the executing-instruction context on every exit path
template<typename T>
class ResetOnExit {
public:
    explicit ResetOnExit(std::optional<T>& slot) : slot_(slot) {}
    ~ResetOnExit() { slot_.reset(); }

    ResetOnExit(const ResetOnExit&) = delete;
    ResetOnExit& operator=(const ResetOnExit&) = delete;

private:
    std::optional<T>& slot_;
};

bool add_would_overflow(std::uint64_t a, std::uint64_t b) {
    return a > std::numeric_limits<std::uint64_t>::max() - b;
}

}  // namespace

// ============================================================================
// Bank Implementation
// ============================================================================

Bank::Bank(BankConfig config)
    : config_(config)
    , now_(config.genesis_timestamp) {}

void Bank::add_program(const Address& program_id, ProgramEntrypoint entrypoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    programs_[program_id] = std::move(entrypoint);
    DUTCH_LOG_DEBUG(log::bank) << "registered program " << program_id.to_hex();
}

TransactionResult Bank::process_transaction(const Transaction& tx) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!tx.is_well_formed()) {
        DUTCH_LOG_INFO(log::bank) << "rejected malformed transaction";
        return {ProgramResult::failure(ProgramError::INVALID_INSTRUCTION_DATA), std::nullopt};
    }

    auto verified = tx.verified_signers();
    if (!verified) {
        DUTCH_LOG_INFO(log::bank) << "rejected transaction with invalid signature";
        return {ProgramResult::failure(ProgramError::INVALID_SIGNATURE), std::nullopt};
    }
    const std::unordered_set<Address> signers(verified->begin(), verified->end());

    auto snapshot = accounts_;
    for (std::size_t i = 0; i < tx.instructions.size(); ++i) {
        ProgramResult result;
        try {
            result = execute_instruction(tx.instructions[i], signers);
        } catch (const std::exception& e) {
            accounts_ = std::move(snapshot);
            DUTCH_LOG_ERROR(log::bank) << "instruction " << i << " threw: " << e.what();
            throw;
        }

        if (!result.is_success()) {
            accounts_ = std::move(snapshot);
            DUTCH_LOG_INFO(log::bank) << "transaction " << bytes_to_hex(tx.message_hash())
                                      << " failed at instruction " << i << ": " << result.to_string();
            return {result, i};
        }
    }

    DUTCH_LOG_DEBUG(log::bank) << "transaction " << bytes_to_hex(tx.message_hash()) << " committed ("
                               << tx.instructions.size() << " instructions)";
    return {ProgramResult::ok(), std::nullopt};
}

ProgramResult Bank::execute_instruction(const Instruction& ix,
                                        const std::unordered_set<Address>& signers) {
    auto program = programs_.find(ix.program_id);
    if (program == programs_.end()) {
        return ProgramResult::failure(ProgramError::INCORRECT_PROGRAM_ID);
    }

    std::vector<AccountInfo> infos;
    infos.reserve(ix.accounts.size());
    for (const auto& meta : ix.accounts) {
        if (meta.is_signer && signers.find(meta.key) == signers.end()) {
            DUTCH_LOG_DEBUG(log::bank) << "missing signature for " << meta.key.to_hex();
            return ProgramResult::failure(ProgramError::MISSING_REQUIRED_SIGNATURE);
        }
        infos.push_back(AccountInfo{meta.key, meta.is_signer, meta.is_writable});
    }

    AccessTracker tracker(infos);
    current_ = Invocation{ix.program_id, &tracker};
    ResetOnExit guard(current_);

    ProgramResult result = program->second(ix.program_id, infos, ix.data, *this);

    // A violation overrides whatever the program made of the failed access
    if (tracker.has_violation()) {
        return ProgramResult::failure(tracker.violation());
    }

    if (result.is_success()) {
        DUTCH_LOG_DEBUG(log::bank) << "program " << ix.program_id.to_hex() << " wrote "
                                   << tracker.actual_writes().size() << " of "
                                   << ix.accounts.size() << " listed accounts";
    }
    return result;
}

// ============================================================================
// Clock
// ============================================================================

void Bank::set_unix_timestamp(unix_timestamp_t timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ = timestamp;
}

void Bank::advance_clock(unix_timestamp_t seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += seconds;
}

// ============================================================================
// Setup
// ============================================================================

void Bank::airdrop(const Address& to, std::uint64_t amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = accounts_.try_emplace(to);
    if (inserted) {
        it->second.owner = SYSTEM_PROGRAM_ID;
    }
    it->second.balance += amount;
}

ProgramResult Bank::create_mint(const Address& mint, const Address& mint_authority, std::uint8_t decimals) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (accounts_.count(mint)) {
        return ProgramResult::failure(ProgramError::ACCOUNT_ALREADY_IN_USE);
    }

    Mint state;
    state.mint_authority = mint_authority;
    state.decimals = decimals;
    state.is_initialized = true;

    accounts_[mint] = Account{config_.rent.minimum_balance(Mint::SERIALIZED_SIZE),
                              TOKEN_PROGRAM_ID, state.serialize()};
    return ProgramResult::ok();
}

ProgramResult Bank::create_token_account(const Address& account, const Address& mint, const Address& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (accounts_.count(account)) {
        return ProgramResult::failure(ProgramError::ACCOUNT_ALREADY_IN_USE);
    }
    Mint mint_state;
    if (auto r = load_mint(mint, mint_state); !r.is_success()) {
        return r;
    }

    TokenAccount state{mint, owner, 0, true};
    accounts_[account] = Account{config_.rent.minimum_balance(TokenAccount::SERIALIZED_SIZE),
                                 TOKEN_PROGRAM_ID, state.serialize()};
    return ProgramResult::ok();
}

ProgramResult Bank::mint_to(const Address& mint, const Address& account, std::uint64_t amount) {
    std::lock_guard<std::mutex> lock(mutex_);

    Mint mint_state;
    if (auto r = load_mint(mint, mint_state); !r.is_success()) {
        return r;
    }
    TokenAccount holder;
    if (auto r = load_token_account(account, holder); !r.is_success()) {
        return r;
    }
    if (holder.mint != mint) {
        return ProgramResult::failure(ProgramError::INVALID_ARGUMENT);
    }
    if (add_would_overflow(mint_state.supply, amount) || add_would_overflow(holder.amount, amount)) {
        return ProgramResult::failure(ProgramError::ARITHMETIC_OVERFLOW);
    }

    mint_state.supply += amount;
    holder.amount += amount;
    accounts_[mint].data = mint_state.serialize();
    accounts_[account].data = holder.serialize();
    return ProgramResult::ok();
}

ProgramResult Bank::create_program_account(const Address& address, const Address& owner, std::size_t space) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (accounts_.count(address)) {
        return ProgramResult::failure(ProgramError::ACCOUNT_ALREADY_IN_USE);
    }
    accounts_[address] = Account{config_.rent.minimum_balance(space), owner,
                                 std::vector<std::uint8_t>(space, 0)};
    return ProgramResult::ok();
}

// ============================================================================
// Queries
// ============================================================================

std::uint64_t Bank::balance(const Address& addr) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(addr);
    return it == accounts_.end() ? 0 : it->second.balance;
}

std::optional<std::uint64_t> Bank::token_balance(const Address& addr) const {
    std::lock_guard<std::mutex> lock(mutex_);
    TokenAccount holder;
    if (!load_token_account(addr, holder).is_success()) {
        return std::nullopt;
    }
    return holder.amount;
}

std::optional<AccountView> Bank::account(const Address& addr) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(addr);
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    return AccountView{it->second.balance, it->second.owner, it->second.data};
}

// ============================================================================
// Runtime: clock, rent, account storage
// ============================================================================

unix_timestamp_t Bank::unix_timestamp() const {
    return now_;
}

std::uint64_t Bank::minimum_balance(std::size_t data_len) const {
    return config_.rent.minimum_balance(data_len);
}

std::optional<AccountView> Bank::get_account(const Address& addr) const {
    if (!check_read(addr).is_success()) {
        return std::nullopt;
    }
    auto it = accounts_.find(addr);
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    return AccountView{it->second.balance, it->second.owner, it->second.data};
}

ProgramResult Bank::write_data(const Address& addr, std::span<const std::uint8_t> data) {
    if (auto r = check_write(addr); !r.is_success()) {
        return r;
    }
    auto it = accounts_.find(addr);
    if (it == accounts_.end()) {
        return ProgramResult::failure(ProgramError::ACCOUNT_NOT_FOUND);
    }
    if (it->second.owner != current_->program_id) {
        return ProgramResult::failure(ProgramError::INCORRECT_PROGRAM_ID);
    }
    // Accounts never resize after creation
    if (it->second.data.size() != data.size()) {
        return ProgramResult::failure(ProgramError::INVALID_ACCOUNT_DATA);
    }
    std::copy(data.begin(), data.end(), it->second.data.begin());
    return ProgramResult::ok();
}

// ============================================================================
// Runtime: native currency
// ============================================================================

ProgramResult Bank::transfer(const Address& from,
                             const Address& to,
                             std::uint64_t amount,
                             const ProgramSigner* signer) {
    if (auto r = check_write(from); !r.is_success()) {
        return r;
    }
    if (auto r = check_write(to); !r.is_success()) {
        return r;
    }

    auto source = accounts_.find(from);
    if (source == accounts_.end()) {
        return ProgramResult::failure(ProgramError::ACCOUNT_NOT_FOUND);
    }
    if (!is_authorized(from, signer)) {
        return ProgramResult::failure(ProgramError::MISSING_REQUIRED_SIGNATURE);
    }
    if (source->second.owner != SYSTEM_PROGRAM_ID) {
        return ProgramResult::failure(ProgramError::INCORRECT_PROGRAM_ID);
    }
    if (source->second.balance < amount) {
        return ProgramResult::failure(ProgramError::INSUFFICIENT_FUNDS);
    }
    if (from == to) {
        return ProgramResult::ok();
    }

    // References survive the rehash try_emplace may trigger; iterators do not
    Account& from_account = source->second;
    auto [dest, inserted] = accounts_.try_emplace(to);
    Account& to_account = dest->second;
    if (inserted) {
        to_account.owner = SYSTEM_PROGRAM_ID;
    }
    if (add_would_overflow(to_account.balance, amount)) {
        if (inserted) {
            accounts_.erase(to);
        }
        return ProgramResult::failure(ProgramError::ARITHMETIC_OVERFLOW);
    }

    from_account.balance -= amount;
    to_account.balance += amount;

    DUTCH_LOG_TRACE(log::bank) << "transfer " << amount << " " << from.to_hex() << " -> " << to.to_hex();
    return ProgramResult::ok();
}

ProgramResult Bank::create_account(const Address& funder,
                                   const Address& new_account,
                                   std::uint64_t balance,
                                   std::size_t space,
                                   const Address& owner,
                                   const ProgramSigner* signer) {
    if (auto r = check_write(funder); !r.is_success()) {
        return r;
    }
    if (auto r = check_write(new_account); !r.is_success()) {
        return r;
    }

    auto payer = accounts_.find(funder);
    if (payer == accounts_.end()) {
        return ProgramResult::failure(ProgramError::ACCOUNT_NOT_FOUND);
    }
    if (!is_authorized(funder, signer) || !is_authorized(new_account, signer)) {
        return ProgramResult::failure(ProgramError::MISSING_REQUIRED_SIGNATURE);
    }
    if (payer->second.owner != SYSTEM_PROGRAM_ID) {
        return ProgramResult::failure(ProgramError::INCORRECT_PROGRAM_ID);
    }

    auto existing = accounts_.find(new_account);
    if (existing != accounts_.end() &&
        (existing->second.balance != 0 || !existing->second.data.empty())) {
        return ProgramResult::failure(ProgramError::ACCOUNT_ALREADY_IN_USE);
    }
    if (payer->second.balance < balance) {
        return ProgramResult::failure(ProgramError::INSUFFICIENT_FUNDS);
    }

    payer->second.balance -= balance;
    accounts_[new_account] = Account{balance, owner, std::vector<std::uint8_t>(space, 0)};

    DUTCH_LOG_TRACE(log::bank) << "created account " << new_account.to_hex() << " (" << space
                               << " bytes) owned by " << owner.to_hex();
    return ProgramResult::ok();
}

// ============================================================================
// Runtime: fungible units
// ============================================================================

ProgramResult Bank::create_associated_token_account(const Address& funder,
                                                    const Address& wallet,
                                                    const Address& mint) {
    const Address address = associated_token_address(wallet, mint);

    if (auto r = check_write(funder); !r.is_success()) {
        return r;
    }
    if (auto r = check_write(address); !r.is_success()) {
        return r;
    }
    if (auto r = check_read(mint); !r.is_success()) {
        return r;
    }

    Mint mint_state;
    if (auto r = load_mint(mint, mint_state); !r.is_success()) {
        return r;
    }
    if (accounts_.count(address)) {
        return ProgramResult::failure(ProgramError::ACCOUNT_ALREADY_IN_USE);
    }

    auto payer = accounts_.find(funder);
    if (payer == accounts_.end()) {
        return ProgramResult::failure(ProgramError::ACCOUNT_NOT_FOUND);
    }
    if (!current_->tracker->is_signer(funder)) {
        return ProgramResult::failure(ProgramError::MISSING_REQUIRED_SIGNATURE);
    }
    const std::uint64_t rent = config_.rent.minimum_balance(TokenAccount::SERIALIZED_SIZE);
    if (payer->second.balance < rent) {
        return ProgramResult::failure(ProgramError::INSUFFICIENT_FUNDS);
    }

    payer->second.balance -= rent;
    TokenAccount state{mint, wallet, 0, true};
    accounts_[address] = Account{rent, TOKEN_PROGRAM_ID, state.serialize()};
    return ProgramResult::ok();
}

ProgramResult Bank::transfer_checked(const Address& source,
                                     const Address& mint,
                                     const Address& destination,
                                     const Address& authority,
                                     std::uint64_t amount,
                                     std::uint8_t decimals,
                                     const ProgramSigner* signer) {
    if (auto r = check_write(source); !r.is_success()) {
        return r;
    }
    if (auto r = check_write(destination); !r.is_success()) {
        return r;
    }
    if (auto r = check_read(mint); !r.is_success()) {
        return r;
    }

    Mint mint_state;
    if (auto r = load_mint(mint, mint_state); !r.is_success()) {
        return r;
    }
    if (mint_state.decimals != decimals) {
        return ProgramResult::failure(ProgramError::INVALID_ARGUMENT);
    }

    TokenAccount from;
    if (auto r = load_token_account(source, from); !r.is_success()) {
        return r;
    }
    TokenAccount to;
    if (auto r = load_token_account(destination, to); !r.is_success()) {
        return r;
    }
    if (from.mint != mint || to.mint != mint || from.owner != authority) {
        return ProgramResult::failure(ProgramError::INVALID_ARGUMENT);
    }
    if (!is_authorized(authority, signer)) {
        return ProgramResult::failure(ProgramError::MISSING_REQUIRED_SIGNATURE);
    }
    if (from.amount < amount) {
        return ProgramResult::failure(ProgramError::INSUFFICIENT_FUNDS);
    }
    if (source == destination) {
        return ProgramResult::ok();
    }
    if (add_would_overflow(to.amount, amount)) {
        return ProgramResult::failure(ProgramError::ARITHMETIC_OVERFLOW);
    }

    from.amount -= amount;
    to.amount += amount;
    accounts_[source].data = from.serialize();
    accounts_[destination].data = to.serialize();

    DUTCH_LOG_TRACE(log::bank) << "transfer_checked " << amount << " of " << mint.to_hex() << " "
                               << source.to_hex() << " -> " << destination.to_hex();
    return ProgramResult::ok();
}

// ============================================================================
// Internals
// ============================================================================

bool Bank::is_authorized(const Address& addr, const ProgramSigner* signer) const {
    if (!current_) {
        return false;
    }
    if (current_->tracker->is_signer(addr)) {
        return true;
    }
    if (signer == nullptr || signer->program_id != current_->program_id) {
        return false;
    }
    auto derived = create_program_address(signer->seeds, signer->program_id);
    return derived && *derived == addr;
}

ProgramResult Bank::check_read(const Address& addr) const {
    if (!current_) {
        return ProgramResult::failure(ProgramError::UNDECLARED_ACCOUNT);
    }
    return ProgramResult::failure(current_->tracker->check_read(addr));
}

ProgramResult Bank::check_write(const Address& addr) const {
    if (!current_) {
        return ProgramResult::failure(ProgramError::UNDECLARED_ACCOUNT);
    }
    return ProgramResult::failure(current_->tracker->check_write(addr));
}

ProgramResult Bank::load_mint(const Address& addr, Mint& mint) const {
    auto it = accounts_.find(addr);
    if (it == accounts_.end()) {
        return ProgramResult::failure(ProgramError::ACCOUNT_NOT_FOUND);
    }
    if (it->second.owner != TOKEN_PROGRAM_ID) {
        return ProgramResult::failure(ProgramError::INCORRECT_PROGRAM_ID);
    }
    auto state = Mint::deserialize(it->second.data);
    if (!state || !state->is_initialized) {
        return ProgramResult::failure(ProgramError::INVALID_ACCOUNT_DATA);
    }
    mint = *state;
    return ProgramResult::ok();
}

ProgramResult Bank::load_token_account(const Address& addr, TokenAccount& account) const {
    auto it = accounts_.find(addr);
    if (it == accounts_.end()) {
        return ProgramResult::failure(ProgramError::ACCOUNT_NOT_FOUND);
    }
    if (it->second.owner != TOKEN_PROGRAM_ID) {
        return ProgramResult::failure(ProgramError::INCORRECT_PROGRAM_ID);
    }
    auto state = TokenAccount::deserialize(it->second.data);
    if (!state || !state->is_initialized) {
        return ProgramResult::failure(ProgramError::INVALID_ACCOUNT_DATA);
    }
    account = *state;
    return ProgramResult::ok();
}

}  // namespace dutch

#include "derivation.hh"
#include "crypto/hash.hh"
#include "core/logging.hh"

namespace dutch {

std::optional<Address> create_program_address(
    std::span<const seed_t> seeds,
    const Address& program_id) {

    if (seeds.size() > MAX_SEEDS) {
        DUTCH_LOG_DEBUG(log::ledger) << "Derivation rejected: " << seeds.size() << " seeds";
        return std::nullopt;
    }

    SHA3Hasher hasher;
    for (const auto& seed : seeds) {
        if (seed.size() > MAX_SEED_LEN) {
            DUTCH_LOG_DEBUG(log::ledger) << "Derivation rejected: seed of " << seed.size() << " bytes";
            return std::nullopt;
        }
        hasher.update(seed);
    }
    hasher.update(program_id);
    hasher.update(PROGRAM_DERIVED_ADDRESS_MARKER);

    return Address{hasher.finalize()};
}

seed_t address_seed(const Address& addr) {
    return seed_t(addr.begin(), addr.end());
}

Address associated_token_address(const Address& wallet, const Address& mint) {
    const std::array<seed_t, 3> seeds = {
        address_seed(wallet),
        address_seed(TOKEN_PROGRAM_ID),
        address_seed(mint),
    };
    // Three 32-byte seeds are always within limits
    return *create_program_address(seeds, ASSOCIATED_TOKEN_PROGRAM_ID);
}

}  // namespace dutch

#include "ledger/transaction.hh"
#include "crypto/hash.hh"
#include "core/logging.hh"

namespace dutch {

std::vector<std::uint8_t> Transaction::message() const {
    std::vector<std::uint8_t> result;

    append_u16(result, static_cast<std::uint16_t>(instructions.size()));
    for (const auto& ix : instructions) {
        result.insert(result.end(), ix.program_id.begin(), ix.program_id.end());

        append_u16(result, static_cast<std::uint16_t>(ix.accounts.size()));
        for (const auto& meta : ix.accounts) {
            result.insert(result.end(), meta.key.begin(), meta.key.end());
            std::uint8_t flags = 0;
            if (meta.is_signer) flags |= ACCOUNT_SIGNER;
            if (meta.is_writable) flags |= ACCOUNT_WRITABLE;
            result.push_back(flags);
        }

        append_u32(result, static_cast<std::uint32_t>(ix.data.size()));
        result.insert(result.end(), ix.data.begin(), ix.data.end());
    }

    return result;
}

hash_t Transaction::message_hash() const {
    return sha3_256(message());
}

bool Transaction::sign(const MLDSAKeyPair& key) {
    auto signature = key.sign(message());
    if (!signature) {
        DUTCH_LOG_WARN(log::ledger) << "cannot sign transaction as " << key.address().to_hex();
        return false;
    }
    signatures.push_back(TransactionSignature{key.public_key(), *signature});
    return true;
}

std::optional<std::vector<Address>> Transaction::verified_signers() const {
    const auto msg = message();

    std::vector<Address> signers;
    signers.reserve(signatures.size());
    for (const auto& sig : signatures) {
        if (!mldsa_verify(sig.public_key, msg, sig.signature)) {
            DUTCH_LOG_DEBUG(log::ledger) << "invalid signature from " << sig.signer().to_hex();
            return std::nullopt;
        }
        signers.push_back(sig.signer());
    }
    return signers;
}

bool Transaction::is_well_formed() const {
    if (instructions.empty() || instructions.size() > MAX_INSTRUCTIONS) {
        return false;
    }
    for (const auto& ix : instructions) {
        if (ix.accounts.size() > MAX_ACCOUNTS_PER_INSTRUCTION ||
            ix.data.size() > MAX_INSTRUCTION_DATA) {
            return false;
        }
    }
    return true;
}

}  // namespace dutch

#pragma once

#include "core/types.hh"
#include "crypto/signature.hh"
#include "ledger/runtime.hh"
#include <optional>
#include <vector>

namespace dutch {

// ============================================================================
// Transaction Signature
// ============================================================================

struct TransactionSignature {
    mldsa_public_key_t public_key;
    mldsa_signature_t signature;

    // Identity that produced the signature: SHA3-256(public_key)
    [[nodiscard]] Address signer() const { return Address::from_public_key(public_key); }
};

// ============================================================================
// Transaction - ordered instructions executed atomically
// ============================================================================

struct Transaction {
    std::vector<Instruction> instructions;
    std::vector<TransactionSignature> signatures;

    // Bytes covered by every signature:
    //   u16 instruction_count
    //   per instruction: program_id, u16 account_count,
    //                    per account: key, flags (bit0 signer, bit1 writable),
    //                    u32 data_length, data
    // No nonce or recent-state field: a signed transaction stays valid and
    // executes again each time it is resubmitted.
    [[nodiscard]] std::vector<std::uint8_t> message() const;

    [[nodiscard]] hash_t message_hash() const;

    // Append a signature over message(). Fails without a secret key.
    [[nodiscard]] bool sign(const MLDSAKeyPair& key);

    // Identities with a valid signature, or nullopt if any signature is
    // invalid. Signing must happen after the last instruction is added.
    [[nodiscard]] std::optional<std::vector<Address>> verified_signers() const;

    static constexpr std::size_t MAX_INSTRUCTIONS = 64;
    static constexpr std::size_t MAX_ACCOUNTS_PER_INSTRUCTION = 64;
    static constexpr std::size_t MAX_INSTRUCTION_DATA = 1024;

    // Structural limits on the message
    [[nodiscard]] bool is_well_formed() const;
};

// Flags byte of an account entry in the signed message
enum AccountMetaFlags : std::uint8_t {
    ACCOUNT_SIGNER = 1 << 0,
    ACCOUNT_WRITABLE = 1 << 1,
};

}  // namespace dutch

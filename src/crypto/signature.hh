#pragma once

#include "core/types.hh"
#include <memory>
#include <optional>
#include <span>

namespace dutch {

// ============================================================================
// ML-DSA-65 Key Pair
// ============================================================================

class MLDSAKeyPair {
public:
    ~MLDSAKeyPair();

    MLDSAKeyPair(const MLDSAKeyPair&) = delete;
    MLDSAKeyPair& operator=(const MLDSAKeyPair&) = delete;
    MLDSAKeyPair(MLDSAKeyPair&&) noexcept;
    MLDSAKeyPair& operator=(MLDSAKeyPair&&) noexcept;

    // Generate a new random key pair
    [[nodiscard]] static std::optional<MLDSAKeyPair> generate();

    // Load from existing keys
    [[nodiscard]] static std::optional<MLDSAKeyPair> from_keys(
        const mldsa_public_key_t& pk, const mldsa_secret_key_t& sk);

    // Load public key only (for verification)
    [[nodiscard]] static MLDSAKeyPair from_public_key(const mldsa_public_key_t& pk);

    [[nodiscard]] const mldsa_public_key_t& public_key() const { return *public_key_; }
    [[nodiscard]] bool has_secret_key() const { return secret_key_ != nullptr; }

    // Sign a message (requires secret key)
    [[nodiscard]] std::optional<mldsa_signature_t> sign(std::span<const std::uint8_t> message) const;

    // Verify a signature (only requires public key)
    [[nodiscard]] bool verify(std::span<const std::uint8_t> message,
                              const mldsa_signature_t& signature) const;

    // Ledger identity owned by this key
    [[nodiscard]] Address address() const;

private:
    MLDSAKeyPair() = default;

    std::unique_ptr<mldsa_public_key_t> public_key_;
    std::unique_ptr<mldsa_secret_key_t> secret_key_;
};

// ============================================================================
// Standalone Verification
// ============================================================================

[[nodiscard]] bool mldsa_verify(
    const mldsa_public_key_t& public_key,
    std::span<const std::uint8_t> message,
    const mldsa_signature_t& signature);

}  // namespace dutch

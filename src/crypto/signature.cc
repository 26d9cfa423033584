#include "signature.hh"
#include "core/logging.hh"
#include <oqs/oqs.h>

namespace dutch {

namespace {

// Owns an OQS_SIG context for the duration of one operation
struct SigContext {
    OQS_SIG* sig = OQS_SIG_new(OQS_SIG_alg_ml_dsa_65);
    ~SigContext() {
        if (sig) {
            OQS_SIG_free(sig);
        }
    }
    SigContext() = default;
    SigContext(const SigContext&) = delete;
    SigContext& operator=(const SigContext&) = delete;
};

}  // namespace

// ============================================================================
// ML-DSA-65 Implementation
// ============================================================================

MLDSAKeyPair::~MLDSAKeyPair() {
    if (secret_key_) {
        secure_zero(*secret_key_);
    }
}

MLDSAKeyPair::MLDSAKeyPair(MLDSAKeyPair&& other) noexcept
    : public_key_(std::move(other.public_key_))
    , secret_key_(std::move(other.secret_key_)) {}

MLDSAKeyPair& MLDSAKeyPair::operator=(MLDSAKeyPair&& other) noexcept {
    if (this != &other) {
        if (secret_key_) {
            secure_zero(*secret_key_);
        }
        public_key_ = std::move(other.public_key_);
        secret_key_ = std::move(other.secret_key_);
    }
    return *this;
}

std::optional<MLDSAKeyPair> MLDSAKeyPair::generate() {
    SigContext ctx;
    if (!ctx.sig) {
        log::crypto.error("Failed to create ML-DSA-65 signature context");
        return std::nullopt;
    }

    MLDSAKeyPair keypair;
    keypair.public_key_ = std::make_unique<mldsa_public_key_t>();
    keypair.secret_key_ = std::make_unique<mldsa_secret_key_t>();

    if (OQS_SIG_keypair(ctx.sig, keypair.public_key_->data(),
                        keypair.secret_key_->data()) != OQS_SUCCESS) {
        log::crypto.error("ML-DSA-65 key generation failed");
        return std::nullopt;
    }

    DUTCH_LOG_TRACE(log::crypto) << "Generated ML-DSA-65 keypair for "
                                 << keypair.address().to_hex();
    return keypair;
}

std::optional<MLDSAKeyPair> MLDSAKeyPair::from_keys(
    const mldsa_public_key_t& pk, const mldsa_secret_key_t& sk) {
    MLDSAKeyPair keypair;
    keypair.public_key_ = std::make_unique<mldsa_public_key_t>(pk);
    keypair.secret_key_ = std::make_unique<mldsa_secret_key_t>(sk);
    return keypair;
}

MLDSAKeyPair MLDSAKeyPair::from_public_key(const mldsa_public_key_t& pk) {
    MLDSAKeyPair keypair;
    keypair.public_key_ = std::make_unique<mldsa_public_key_t>(pk);
    return keypair;
}

std::optional<mldsa_signature_t> MLDSAKeyPair::sign(
    std::span<const std::uint8_t> message) const {
    if (!secret_key_) {
        log::crypto.warn("Attempted to sign without secret key");
        return std::nullopt;
    }

    SigContext ctx;
    if (!ctx.sig) {
        log::crypto.error("Failed to create ML-DSA-65 signature context for signing");
        return std::nullopt;
    }

    mldsa_signature_t signature{};
    std::size_t sig_len = MLDSA65_SIGNATURE_SIZE;

    if (OQS_SIG_sign(ctx.sig, signature.data(), &sig_len,
                     message.data(), message.size(),
                     secret_key_->data()) != OQS_SUCCESS) {
        log::crypto.error("ML-DSA-65 signing failed");
        return std::nullopt;
    }

    DUTCH_LOG_TRACE(log::crypto) << "Signed message of " << message.size() << " bytes";
    return signature;
}

bool MLDSAKeyPair::verify(std::span<const std::uint8_t> message,
                          const mldsa_signature_t& signature) const {
    return mldsa_verify(*public_key_, message, signature);
}

Address MLDSAKeyPair::address() const {
    return Address::from_public_key(*public_key_);
}

bool mldsa_verify(const mldsa_public_key_t& public_key,
                  std::span<const std::uint8_t> message,
                  const mldsa_signature_t& signature) {
    SigContext ctx;
    if (!ctx.sig) {
        log::crypto.error("Failed to create ML-DSA-65 context for verification");
        return false;
    }

    bool result = OQS_SIG_verify(ctx.sig, message.data(), message.size(),
                                 signature.data(), MLDSA65_SIGNATURE_SIZE,
                                 public_key.data()) == OQS_SUCCESS;

    if (!result) {
        DUTCH_LOG_DEBUG(log::crypto) << "ML-DSA-65 signature verification failed";
    }
    return result;
}

}  // namespace dutch

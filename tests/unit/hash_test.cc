#include <gtest/gtest.h>
#include "crypto/hash.hh"

using namespace dutch;

// ============================================================================
// SHA3-256 Tests
// ============================================================================

TEST(SHA3Test, EmptyInput) {
    auto hash = sha3_256(std::span<const std::uint8_t>{});
    EXPECT_EQ(bytes_to_hex(hash), "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");
}

TEST(SHA3Test, KnownVectorAbc) {
    std::vector<std::uint8_t> input = {'a', 'b', 'c'};
    auto hash = sha3_256(input);
    EXPECT_EQ(bytes_to_hex(hash), "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");
}

TEST(SHA3Test, Deterministic) {
    std::vector<std::uint8_t> input = {1, 2, 3, 4, 5};
    auto hash1 = sha3_256(input);
    auto hash2 = sha3_256(input.data(), input.size());
    EXPECT_EQ(hash1, hash2);
}

TEST(SHA3Test, DifferentInputsDifferentHashes) {
    std::vector<std::uint8_t> input1 = {1, 2, 3};
    std::vector<std::uint8_t> input2 = {1, 2, 4};
    EXPECT_NE(sha3_256(input1), sha3_256(input2));
}

// ============================================================================
// SHA3Hasher Tests
// ============================================================================

TEST(SHA3HasherTest, IncrementalHashing) {
    std::vector<std::uint8_t> input = {1, 2, 3, 4, 5, 6};

    auto direct_hash = sha3_256(input);

    SHA3Hasher hasher;
    hasher.update(std::span<const std::uint8_t>(input.data(), 3));
    hasher.update(std::span<const std::uint8_t>(input.data() + 3, 3));
    auto incremental_hash = hasher.finalize();

    EXPECT_EQ(direct_hash, incremental_hash);
}

TEST(SHA3HasherTest, Reset) {
    std::vector<std::uint8_t> input = {1, 2, 3};

    SHA3Hasher hasher;
    hasher.update(input);
    auto hash1 = hasher.finalize();

    hasher.reset();
    hasher.update(input);
    auto hash2 = hasher.finalize();

    EXPECT_EQ(hash1, hash2);
}

TEST(SHA3HasherTest, StringAndAddressUpdates) {
    Address addr;
    addr.bytes.fill(0x11);

    SHA3Hasher hasher;
    hasher.update(addr);
    hasher.update(std::string_view("abc"));
    auto hash = hasher.finalize();

    std::vector<std::uint8_t> flat(addr.begin(), addr.end());
    flat.insert(flat.end(), {'a', 'b', 'c'});
    EXPECT_EQ(hash, sha3_256(flat));
}

TEST(SHA3HasherTest, MoveKeepsState) {
    std::vector<std::uint8_t> input = {9, 8, 7};

    SHA3Hasher first;
    first.update(input);
    SHA3Hasher second(std::move(first));

    EXPECT_EQ(second.finalize(), sha3_256(input));
}

// ============================================================================
// Key Identity Tests
// ============================================================================

TEST(AddressFromKeyTest, HashOfPublicKey) {
    mldsa_public_key_t pk{};
    pk[0] = 0x01;
    pk[MLDSA65_PUBLIC_KEY_SIZE - 1] = 0xFF;

    Address addr = Address::from_public_key(pk);
    EXPECT_EQ(addr.bytes, sha3_256(pk));

    pk[1] = 0x02;
    EXPECT_NE(Address::from_public_key(pk), addr);
}

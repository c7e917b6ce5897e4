#include <gtest/gtest.h>
#include <vector>
#include "crypto/keystream.hpp"
#include "crypto/keypair.hpp"

using namespace dfp::crypto;

class KeystreamTest : public ::testing::Test {
protected:
    std::vector<uint8_t> zero_seed = std::vector<uint8_t>(CounterKeystream::SEED_SIZE, 0);

    std::vector<uint8_t> seed_with(uint8_t fill) {
        return std::vector<uint8_t>(CounterKeystream::SEED_SIZE, fill);
    }
};

TEST_F(KeystreamTest, FirstBlockMatchesAesOfZeroCounter) {
    CounterKeystream stream(zero_seed);
    // AES-256 with an all-zero key applied to the all-zero block
    const std::vector<uint8_t> expected = {
        0xdc, 0x95, 0xc0, 0x78, 0xa2, 0x40, 0x89, 0x89,
        0xad, 0x48, 0xa2, 0x14, 0x92, 0x84, 0x20, 0x87
    };
    EXPECT_EQ(stream.next(16), expected);
}

TEST_F(KeystreamTest, StreamIsContinuousAcrossCalls) {
    CounterKeystream whole(seed_with(0x42));
    CounterKeystream pieces(seed_with(0x42));

    const auto expected = whole.next(100);
    std::vector<uint8_t> joined;
    for (size_t n : {1, 15, 16, 17, 51}) {
        auto part = pieces.next(n);
        joined.insert(joined.end(), part.begin(), part.end());
    }
    EXPECT_EQ(joined, expected);
    EXPECT_EQ(pieces.consumed(), 100u);
}

TEST_F(KeystreamTest, SameSeedSameBytesDifferentSeedDifferentBytes) {
    CounterKeystream first(seed_with(1));
    CounterKeystream second(seed_with(1));
    CounterKeystream third(seed_with(2));

    const auto a = first.next(64);
    EXPECT_EQ(a, second.next(64));
    EXPECT_NE(a, third.next(64));
}

TEST_F(KeystreamTest, NextByteAdvancesTheStream) {
    CounterKeystream bytes(zero_seed);
    CounterKeystream block(zero_seed);
    const auto expected = block.next(3);

    EXPECT_EQ(bytes.next_byte(), expected[0]);
    EXPECT_EQ(bytes.next_byte(), expected[1]);
    EXPECT_EQ(bytes.next_byte(), expected[2]);
    EXPECT_TRUE(bytes.next(0).empty());
    EXPECT_EQ(bytes.consumed(), 3u);
}

TEST_F(KeystreamTest, RejectsWrongSeedSize) {
    EXPECT_THROW(CounterKeystream(std::vector<uint8_t>(16, 0)), InitializationError);
    EXPECT_THROW(CounterKeystream(std::vector<uint8_t>{}), InitializationError);
}

TEST_F(KeystreamTest, SeedDerivationIsDeterministic) {
    const auto seed = derive_seed("passphrase", "salt");
    EXPECT_EQ(seed.size(), DERIVED_KEY_SIZE);
    EXPECT_EQ(seed, derive_seed("passphrase", "salt"));
    EXPECT_NE(seed, derive_seed("passphrase", "pepper"));
    EXPECT_NE(seed, derive_seed("Passphrase", "salt"));
}

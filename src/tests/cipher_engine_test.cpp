#include <gtest/gtest.h>
#include <algorithm>
#include "crypto/cipher_engine.hpp"
#include "test_utils.hpp"

using namespace dfp::crypto;
using dfp::test::TEST_PASSPHRASE;

class CipherEngineTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        dfp::test::init_logging();
    }

    CipherEngine engine{dfp::test::shared_keypair()};
    const std::string salt = CipherEngine::DEFAULT_SALT;
};

TEST_F(CipherEngineTest, KeypairIsDeterministicFor2048BitModulus) {
    const Keypair again = derive_keypair(TEST_PASSPHRASE, salt);
    const auto modulus = engine.keypair().modulus();

    ASSERT_EQ(modulus.size(), CipherEngine::CIPHERTEXT_SEGMENT_SIZE);
    EXPECT_GE(modulus[0], 0x80) << "Modulus must use the full 2048 bits";
    EXPECT_EQ(modulus, again.modulus());
    EXPECT_EQ(engine.keypair().public_pem(), again.public_pem());
    EXPECT_NE(engine.keypair().public_pem().find("BEGIN PUBLIC KEY"), std::string::npos);
}

TEST_F(CipherEngineTest, DifferentSaltGivesDifferentKeypair) {
    const Keypair other = derive_keypair(TEST_PASSPHRASE, "another salt");
    EXPECT_NE(other.modulus(), engine.keypair().modulus());
}

TEST_F(CipherEngineTest, SegmentRoundTripAtBoundaries) {
    for (size_t length : {0u, 1u, 189u, 190u, 191u, 380u, 1000u}) {
        const auto plaintext = dfp::test::pattern_bytes(length);
        const auto ciphertext = engine.encrypt_segments(plaintext);

        EXPECT_EQ(ciphertext.size(), CipherEngine::encrypted_size(length)) << "length " << length;
        EXPECT_EQ(ciphertext.size() % CipherEngine::CIPHERTEXT_SEGMENT_SIZE, 0u);
        EXPECT_EQ(engine.decrypt_segments(ciphertext), plaintext) << "length " << length;
    }
}

TEST_F(CipherEngineTest, ExpansionLaw) {
    EXPECT_EQ(CipherEngine::encrypted_size(0), 0u);
    EXPECT_EQ(CipherEngine::encrypted_size(1), 256u);
    EXPECT_EQ(CipherEngine::encrypted_size(190), 256u);
    EXPECT_EQ(CipherEngine::encrypted_size(191), 512u);
    EXPECT_EQ(CipherEngine::encrypted_size(5000007), 26317u * 256u);
}

TEST_F(CipherEngineTest, EncryptionIsRandomized) {
    const auto plaintext = dfp::test::to_bytes("1700000000.000000");
    EXPECT_NE(engine.encrypt_segments(plaintext), engine.encrypt_segments(plaintext));
}

TEST_F(CipherEngineTest, IndependentEnginesInteroperate) {
    CipherEngine other(TEST_PASSPHRASE, salt);
    const auto plaintext = dfp::test::to_bytes("report.pdf");
    EXPECT_EQ(other.decrypt_segments(engine.encrypt_segments(plaintext)), plaintext);
}

TEST_F(CipherEngineTest, RejectsBadCiphertextLength) {
    EXPECT_THROW(engine.decrypt_segments(Bytes(255, 1)), DecryptionError);
    EXPECT_THROW(engine.decrypt_segments(Bytes(257, 1)), DecryptionError);
    EXPECT_THROW(CipherEngine::parallel_decrypt(Bytes(100, 1), TEST_PASSPHRASE, salt, 2,
                                                &dfp::test::shared_cache()), DecryptionError);
}

TEST_F(CipherEngineTest, RejectsCorruptedSegment) {
    auto ciphertext = engine.encrypt_segments(dfp::test::pattern_bytes(400));
    ciphertext[CipherEngine::CIPHERTEXT_SEGMENT_SIZE + 10] ^= 0x01;
    EXPECT_THROW(engine.decrypt_segments(ciphertext), DecryptionError);
}

TEST_F(CipherEngineTest, ParallelRoundTripAcrossWorkerCounts) {
    auto& cache = dfp::test::shared_cache();
    for (size_t workers : {1u, 2u, 4u, 8u}) {
        for (size_t length : {0u, 1u, 189u, 190u, 191u, 2000u}) {
            const auto plaintext = dfp::test::pattern_bytes(length, static_cast<uint8_t>(workers));
            const auto ciphertext = CipherEngine::parallel_encrypt(plaintext, TEST_PASSPHRASE, salt, workers, &cache);

            // Every partition decrypts on its own, so the output is a concatenation of whole segments
            EXPECT_EQ(ciphertext.size() % CipherEngine::CIPHERTEXT_SEGMENT_SIZE, 0u);
            EXPECT_EQ(engine.decrypt_segments(ciphertext), plaintext)
                << "workers " << workers << ", length " << length;
            EXPECT_EQ(CipherEngine::parallel_decrypt(ciphertext, TEST_PASSPHRASE, salt, workers, &cache), plaintext)
                << "workers " << workers << ", length " << length;
        }
    }
}

TEST_F(CipherEngineTest, ParallelPartitionCountShapesCiphertext) {
    auto& cache = dfp::test::shared_cache();
    // 200 bytes over 2 workers is two 100-byte partitions, each one segment
    const auto two = CipherEngine::parallel_encrypt(dfp::test::pattern_bytes(200), TEST_PASSPHRASE, salt, 2, &cache);
    EXPECT_EQ(two.size(), 2u * CipherEngine::CIPHERTEXT_SEGMENT_SIZE);

    // More workers than bytes leaves the extra workers idle
    const auto tiny = CipherEngine::parallel_encrypt(dfp::test::pattern_bytes(3), TEST_PASSPHRASE, salt, 8, &cache);
    EXPECT_EQ(tiny.size(), 3u * CipherEngine::CIPHERTEXT_SEGMENT_SIZE);
}

TEST_F(CipherEngineTest, ParallelWithoutCacheDerivesPerWorker) {
    const auto plaintext = dfp::test::pattern_bytes(500);
    const auto ciphertext = CipherEngine::parallel_encrypt(plaintext, TEST_PASSPHRASE, salt, 2);
    EXPECT_EQ(engine.decrypt_segments(ciphertext), plaintext);
}

TEST_F(CipherEngineTest, LargeBufferParallelRoundTrip) {
    auto& cache = dfp::test::shared_cache();
    const auto plaintext = dfp::test::pattern_bytes(5000007);
    const size_t workers = std::max<size_t>(host_parallelism(), 4);

    const auto ciphertext = CipherEngine::parallel_encrypt(plaintext, TEST_PASSPHRASE, salt, workers, &cache);
    const auto recovered = CipherEngine::parallel_decrypt(ciphertext, TEST_PASSPHRASE, salt, workers, &cache);
    ASSERT_EQ(recovered.size(), plaintext.size());
    EXPECT_TRUE(recovered == plaintext);
}

TEST_F(CipherEngineTest, KeypairCacheDerivesOncePerInputs) {
    KeypairCache cache;
    EXPECT_EQ(cache.size(), 0u);

    const auto first = cache.get(TEST_PASSPHRASE, salt);
    const auto second = cache.get(TEST_PASSPHRASE, salt);
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(first->modulus(), engine.keypair().modulus());
}

TEST_F(CipherEngineTest, NullKeypairIsRejected) {
    EXPECT_THROW(CipherEngine{std::shared_ptr<const Keypair>()}, InitializationError);
    EXPECT_GE(host_parallelism(), 1u);
}

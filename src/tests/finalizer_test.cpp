#include <gtest/gtest.h>
#include <algorithm>
#include <fstream>
#include <iterator>
#include "server/finalizer.hpp"
#include "crypto/digest.hpp"
#include "store/chunk_store.hpp"
#include "test_utils.hpp"

using namespace dfp::server;
using dfp::crypto::Bytes;

class FinalizerTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        dfp::test::init_logging(boost::log::trivial::fatal);
    }

    dfp::test::TempDir output_dir{"finalizer_test"};
    std::shared_ptr<dfp::store::MemoryChunkStore> scratch;
    SessionStore sessions{[this](const std::string& id) {
        scratch = std::make_shared<dfp::store::MemoryChunkStore>(id);
        return scratch;
    }};
    CancellationToken token;

    ReconstructionSettings plain_settings() const {
        ReconstructionSettings settings;
        settings.output_dir = output_dir.path();
        return settings;
    }

    ReconstructionSettings decrypt_settings() const {
        ReconstructionSettings settings = plain_settings();
        settings.decrypt = true;
        settings.passphrase = dfp::test::TEST_PASSPHRASE;
        settings.decrypt_workers = 2;
        settings.keypair_cache = &dfp::test::shared_cache();
        return settings;
    }

    void upload(const std::string& id, uint32_t index, const Bytes& data) {
        auto store = sessions.acquire_for_chunk(id, index);
        sessions.record_chunk(id, index, store->put_chunk(index, data));
    }

    // Splits content into `parts` slices and returns them in index order
    static std::vector<Bytes> split(const Bytes& content, size_t parts) {
        std::vector<Bytes> slices;
        const size_t step = (content.size() + parts - 1) / parts;
        for (size_t offset = 0; offset < content.size(); offset += step) {
            const size_t end = std::min(content.size(), offset + step);
            slices.emplace_back(content.begin() + static_cast<std::ptrdiff_t>(offset),
                                content.begin() + static_cast<std::ptrdiff_t>(end));
        }
        return slices;
    }

    static Bytes read_file(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        return Bytes(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }

    static std::string md5_of(const Bytes& data) {
        return dfp::crypto::md5_hex(dfp::test::to_text(data));
    }
};

TEST_F(FinalizerTest, ReassemblesOutOfOrderUploadsInIndexOrder) {
    const auto content = dfp::test::pattern_bytes(3000);
    const auto slices = split(content, 3);
    const std::string id = sessions.create("report.bin", content.size(), 3, md5_of(content));
    upload(id, 2, slices[2]);
    upload(id, 0, slices[0]);
    upload(id, 1, slices[1]);

    Finalizer finalizer(sessions, plain_settings());
    const auto path = finalizer.finalize(id, token);

    EXPECT_TRUE(path.is_absolute());
    EXPECT_EQ(path, std::filesystem::absolute(output_dir.path() / "report.bin"));
    EXPECT_EQ(read_file(path), content);
    EXPECT_EQ(sessions.status(id).status, SessionStatus::completed);
    EXPECT_EQ(sessions.status(id).output_path, path);
    EXPECT_TRUE(scratch->list_indices().empty()) << "Scratch data is removed after completion";
}

TEST_F(FinalizerTest, ReportsExactlyTheMissingIndices) {
    const auto content = dfp::test::pattern_bytes(500);
    const auto slices = split(content, 5);
    const std::string id = sessions.create("partial.bin", content.size(), 5, md5_of(content));
    upload(id, 0, slices[0]);
    upload(id, 2, slices[2]);

    Finalizer finalizer(sessions, plain_settings());
    try {
        finalizer.finalize(id, token);
        FAIL() << "Expected IncompleteSessionError";
    } catch (const IncompleteSessionError& e) {
        EXPECT_EQ(e.missing(), (std::set<uint32_t>{1, 3, 4}));
        EXPECT_EQ(std::string(e.what()), "Missing chunks: {1, 3, 4}");
    }
    EXPECT_EQ(sessions.status(id).status, SessionStatus::active);
    EXPECT_FALSE(std::filesystem::exists(output_dir.path() / "partial.bin"));

    // The session stays usable and completes once the gaps are filled
    upload(id, 1, slices[1]);
    upload(id, 3, slices[3]);
    upload(id, 4, slices[4]);
    EXPECT_EQ(read_file(finalizer.finalize(id, token)), content);
}

TEST_F(FinalizerTest, HashMismatchLeavesNoFileAndSessionFinalizing) {
    const auto content = dfp::test::pattern_bytes(100);
    const std::string id = sessions.create("bad.bin", content.size(), 1, std::string(32, '0'));
    upload(id, 0, content);

    Finalizer finalizer(sessions, plain_settings());
    EXPECT_THROW(finalizer.finalize(id, token), HashMismatchError);
    EXPECT_FALSE(std::filesystem::exists(output_dir.path() / "bad.bin"));
    EXPECT_EQ(sessions.status(id).status, SessionStatus::finalizing);

    EXPECT_THROW(finalizer.finalize(id, token), SessionNotActive);
    EXPECT_THROW(sessions.acquire_for_chunk(id, 0), SessionNotActive);
}

TEST_F(FinalizerTest, HashComparisonIgnoresCase) {
    const auto content = dfp::test::to_bytes("abc");
    const std::string id = sessions.create("abc.txt", 3, 1, "900150983CD24FB0D6963F7D28E17F72");
    upload(id, 0, content);

    Finalizer finalizer(sessions, plain_settings());
    EXPECT_NO_THROW(finalizer.finalize(id, token));
}

TEST_F(FinalizerTest, EmptyExpectedHashSkipsVerification) {
    const std::string id = sessions.create("nohash.txt", 3, 1, "");
    upload(id, 0, dfp::test::to_bytes("xyz"));

    Finalizer finalizer(sessions, plain_settings());
    EXPECT_EQ(dfp::test::to_text(read_file(finalizer.finalize(id, token))), "xyz");
}

TEST_F(FinalizerTest, DecryptsEncryptedChunks) {
    const auto content = dfp::test::pattern_bytes(1000);
    const auto slices = split(content, 2);
    const std::string id = sessions.create("secret.bin", content.size(), 2, md5_of(content));
    for (uint32_t index = 0; index < slices.size(); ++index) {
        upload(id, index, dfp::crypto::CipherEngine::parallel_encrypt(
            slices[index], dfp::test::TEST_PASSPHRASE, dfp::crypto::CipherEngine::DEFAULT_SALT, 3,
            &dfp::test::shared_cache()));
    }

    Finalizer finalizer(sessions, decrypt_settings());
    EXPECT_EQ(read_file(finalizer.finalize(id, token)), content);
}

TEST_F(FinalizerTest, UndecryptableChunkRevertsToActive) {
    const std::string id = sessions.create("broken.bin", 10, 1, "");
    upload(id, 0, Bytes(300, 0x11));

    Finalizer finalizer(sessions, decrypt_settings());
    EXPECT_THROW(finalizer.finalize(id, token), dfp::crypto::DecryptionError);
    EXPECT_FALSE(std::filesystem::exists(output_dir.path() / "broken.bin"));
    EXPECT_EQ(sessions.status(id).status, SessionStatus::active);
}

TEST_F(FinalizerTest, CancelledFinalizeProducesNothing) {
    const std::string id = sessions.create("late.bin", 3, 1, "");
    upload(id, 0, dfp::test::to_bytes("abc"));
    token.cancel();

    Finalizer finalizer(sessions, plain_settings());
    EXPECT_THROW(finalizer.finalize(id, token), OperationCancelled);
    EXPECT_FALSE(std::filesystem::exists(output_dir.path() / "late.bin"));
    EXPECT_EQ(sessions.status(id).status, SessionStatus::active);
}

TEST_F(FinalizerTest, UnknownSession) {
    Finalizer finalizer(sessions, plain_settings());
    EXPECT_THROW(finalizer.finalize("nope", token), SessionNotFound);
}

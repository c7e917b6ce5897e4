#include <gtest/gtest.h>
#include <fstream>
#include <iterator>
#include <thread>
#include "client/http_transfer_api.hpp"
#include "client/upload_coordinator.hpp"
#include "server/http_server.hpp"
#include "utils/encoding.hpp"
#include "test_utils.hpp"

using namespace dfp;
using namespace std::chrono_literals;

class TransferLoopbackTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        test::init_logging(boost::log::trivial::fatal);
    }

    test::TempDir root{"loopback_test"};
    std::unique_ptr<server::HttpServer> http_server;
    crypto::CipherEngine signer{test::shared_keypair()};

    void TearDown() override {
        if (http_server) {
            http_server->stop();
        }
    }

    void start_server(bool encrypted) {
        config::ServerConfig config;
        config.host = "127.0.0.1";
        config.port = 0;
        config.output_dir = root.path() / "received";
        config.scratch_root = root.path() / "scratch";
        config.cipher.passphrase = test::TEST_PASSPHRASE;
        config.cipher.enable_encryption = encrypted;
        config.cipher.cache_keypairs = true;
        config.connection_threads = 4;
        config.task_threads = 2;

        http_server = std::make_unique<server::HttpServer>(config);
        ASSERT_TRUE(http_server->start());
        ASSERT_NE(http_server->port(), 0);
        ASSERT_TRUE(http_server->is_running());
    }

    std::string server_url() const {
        return "http://127.0.0.1:" + std::to_string(http_server->port());
    }

    config::ClientConfig client_config(bool encrypted) const {
        config::ClientConfig config;
        config.server_url = server_url();
        config.chunk_size = 1000;
        config.chunk_size_variance = 0.3;
        config.max_workers = 4;
        config.cipher.passphrase = test::TEST_PASSPHRASE;
        config.cipher.enable_encryption = encrypted;
        config.cipher.cache_keypairs = true;
        return config;
    }

    static crypto::Bytes read_file(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        return crypto::Bytes(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }
};

TEST_F(TransferLoopbackTest, PlainTransferReproducesFile) {
    start_server(false);
    const auto content = test::pattern_bytes(20000);
    const auto path = root.write_file("photo.raw", content);

    client::HttpTransferApi api(server_url());
    client::UploadCoordinator coordinator(client_config(false), api, signer);
    double last_percent = 0.0;
    const auto result = coordinator.send(path, [&](double percent, size_t, size_t) { last_percent = percent; });

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_DOUBLE_EQ(last_percent, 100.0);
    EXPECT_EQ(std::filesystem::path(result.output_path),
              std::filesystem::absolute(root.path() / "received" / "photo.raw"));
    EXPECT_EQ(read_file(result.output_path), content);
    EXPECT_FALSE(std::filesystem::exists(root.path() / "scratch" / ("file_transfer_" + result.session_id)));

    const auto status = coordinator.session_status(result.session_id);
    EXPECT_EQ(status.get<std::string>("status"), "completed");
    EXPECT_EQ(status.get<std::string>("filename"), "photo.raw");
    EXPECT_DOUBLE_EQ(status.get<double>("progress"), 100.0);
    EXPECT_EQ(status.get<std::string>("file_path"), result.output_path);
}

TEST_F(TransferLoopbackTest, EncryptedTransferReproducesFile) {
    start_server(true);
    const auto content = test::pattern_bytes(3000, 11);
    const auto path = root.write_file("secret.doc", content);

    client::HttpTransferApi api(server_url());
    client::UploadCoordinator coordinator(client_config(true), api, signer);
    const auto result = coordinator.send(path);

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(read_file(result.output_path), content);
}

TEST_F(TransferLoopbackTest, ServerErrorsSurfaceAsHttpStatusFailures) {
    start_server(false);
    client::HttpTransferApi api(server_url());

    try {
        api.session_status("0000000000000000");
        FAIL() << "Expected NetworkFailure";
    } catch (const client::NetworkFailure& e) {
        EXPECT_EQ(e.kind(), client::NetworkError::HTTP_STATUS);
        EXPECT_EQ(e.http_status(), 404u);
        EXPECT_NE(std::string(e.what()).find("Session not found"), std::string::npos) << e.what();
    }

    client::SessionRequest request;
    request.filename = utils::base64_encode(signer.encrypt_segments(test::to_bytes("a.txt")));
    request.total_size = 10;
    request.total_chunks = 1;
    request.signature = "Zm9v";
    try {
        api.create_session(request);
        FAIL() << "Expected NetworkFailure";
    } catch (const client::NetworkFailure& e) {
        EXPECT_EQ(e.http_status(), 403u);
    }

    try {
        api.upload_chunk("0000000000000000", 0, utils::base64_encode(std::string("abc")));
        FAIL() << "Expected NetworkFailure";
    } catch (const client::NetworkFailure& e) {
        EXPECT_EQ(e.http_status(), 404u);
    }
}

TEST_F(TransferLoopbackTest, StoppedServerRefusesConnections) {
    start_server(false);
    const std::string url = server_url();
    http_server->stop();
    EXPECT_FALSE(http_server->is_running());

    client::HttpTransferApi api(url, client::HttpTimeouts{2000ms, 2000ms, 2000ms});
    try {
        api.session_status("abc");
        FAIL() << "Expected NetworkFailure";
    } catch (const client::NetworkFailure& e) {
        EXPECT_EQ(e.kind(), client::NetworkError::CONNECTION_FAILED);
    }
}

TEST_F(TransferLoopbackTest, StopReleasesWaiters) {
    start_server(false);
    std::thread waiter([this] { http_server->wait(); });
    http_server->stop();
    waiter.join();
    SUCCEED();
}

class ServerUrlTest : public ::testing::Test {};

TEST_F(ServerUrlTest, ParsesHostPortAndPrefix) {
    const auto endpoint = client::parse_server_url("http://files.example:9000/api/");
    EXPECT_EQ(endpoint.host, "files.example");
    EXPECT_EQ(endpoint.port, "9000");
    EXPECT_EQ(endpoint.prefix, "/api");

    const auto bare = client::parse_server_url("http://localhost");
    EXPECT_EQ(bare.host, "localhost");
    EXPECT_EQ(bare.port, "80");
    EXPECT_EQ(bare.prefix, "");
}

TEST_F(ServerUrlTest, RejectsUnsupportedUrls) {
    for (const std::string url : {"https://localhost:8080", "localhost:8080", "http://", "http://host:port", "http://host:"}) {
        try {
            client::parse_server_url(url);
            ADD_FAILURE() << "Accepted " << url;
        } catch (const client::NetworkFailure& e) {
            EXPECT_EQ(e.kind(), client::NetworkError::INVALID_URL) << url;
        }
    }
}

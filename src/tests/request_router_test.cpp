#include <gtest/gtest.h>
#include <cstdio>
#include <boost/asio/thread_pool.hpp>
#include "server/request_router.hpp"
#include "store/chunk_store.hpp"
#include "crypto/digest.hpp"
#include "utils/encoding.hpp"
#include "utils/json.hpp"
#include "test_utils.hpp"

using namespace dfp::server;
using namespace std::chrono_literals;
namespace http = boost::beast::http;

class RequestRouterTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        dfp::test::init_logging(boost::log::trivial::fatal);
    }

    dfp::test::TempDir output_dir{"router_test"};
    dfp::crypto::CipherEngine engine{dfp::test::shared_keypair()};
    SystemClock::time_point now = SystemClock::now();
    SessionStore sessions{
        [](const std::string& id) { return std::make_shared<dfp::store::MemoryChunkStore>(id); },
        [this] { return now; }
    };
    AuthGate gate{engine, 30s, [this] { return now; }};
    ChunkReceiver receiver{sessions};
    Finalizer finalizer{sessions, settings()};
    boost::asio::thread_pool pool{2};
    RequestRouter router{sessions, gate, engine, receiver, finalizer, pool, RouterTimeouts{}};

    ReconstructionSettings settings() const {
        ReconstructionSettings result;
        result.output_dir = output_dir.path();
        return result;
    }

    void TearDown() override {
        pool.join();
    }

    std::string encrypt_b64(const std::string& text) const {
        return dfp::utils::base64_encode(engine.encrypt_segments(dfp::test::to_bytes(text)));
    }

    std::string signature() const {
        char text[64];
        std::snprintf(text, sizeof(text), "%.6f", unix_seconds(now));
        return encrypt_b64(text);
    }

    HttpResponse send(http::verb method, const std::string& target, const std::string& body = "") {
        HttpRequest request{method, target, 11};
        request.body() = body;
        request.prepare_payload();
        return router.handle(request);
    }

    HttpResponse create(const std::string& filename, const std::string& size, const std::string& chunks,
                        const std::string& hash, const std::string& sig) {
        const std::string query = dfp::utils::build_query({
            {"f", encrypt_b64(filename)}, {"s", size}, {"c", chunks}, {"h", hash}, {"g", sig}
        });
        return send(http::verb::get, "/cs?" + query);
    }

    std::string create_ok(const std::string& filename, const std::string& content, uint32_t chunks) {
        const auto response = create(filename, std::to_string(content.size()), std::to_string(chunks),
                                     dfp::crypto::md5_hex(content), signature());
        EXPECT_EQ(response.result(), http::status::ok) << response.body();
        return body_of(response).get<std::string>("session_id");
    }

    HttpResponse upload(const std::string& id, const std::string& index, const std::string& data) {
        return send(http::verb::post, "/k",
                    "{\"session_id\":\"" + id + "\",\"chunk_index\":" + index +
                    ",\"chunk_data\":\"" + dfp::utils::base64_encode(data) + "\"}");
    }

    HttpResponse complete(const std::string& id) {
        return send(http::verb::post, "/fs", "{\"session_id\":\"" + id + "\"}");
    }

    static dfp::utils::Json body_of(const HttpResponse& response) {
        return dfp::utils::parse_json(response.body());
    }

    static void expect_error(const HttpResponse& response, http::status status, const std::string& message) {
        EXPECT_EQ(response.result(), status) << response.body();
        const auto body = body_of(response);
        EXPECT_EQ(body.get<std::string>("error"), message);
        EXPECT_EQ(body.get<unsigned>("status_code"), static_cast<unsigned>(status));
        EXPECT_NE(response.body().find("\"status_code\":" + std::to_string(static_cast<unsigned>(status))),
                  std::string::npos) << "status_code must be a JSON number";
    }
};

TEST_F(RequestRouterTest, CommonHeaders) {
    const auto response = send(http::verb::get, "/status?s=missing");
    EXPECT_EQ(response[http::field::content_type], "application/json");
    EXPECT_EQ(response[http::field::access_control_allow_origin], "*");
    EXPECT_EQ(response[http::field::server], "DFP/1.0");
    EXPECT_FALSE(response.keep_alive());
}

TEST_F(RequestRouterTest, OptionsPreflight) {
    const auto response = send(http::verb::options, "/k");
    EXPECT_EQ(response.result(), http::status::no_content);
    EXPECT_EQ(response[http::field::access_control_allow_methods], "GET, POST, OPTIONS");
    EXPECT_EQ(response[http::field::access_control_allow_headers], "Content-Type");
}

TEST_F(RequestRouterTest, UnknownRoutes) {
    expect_error(send(http::verb::get, "/nowhere"), http::status::not_found, "Not Found");
    expect_error(send(http::verb::post, "/cs"), http::status::not_found, "Not Found");
    expect_error(send(http::verb::get, "/k"), http::status::not_found, "Not Found");
}

TEST_F(RequestRouterTest, CreateSession) {
    const auto response = create("notes.txt", "12", "2", "abc", signature());
    ASSERT_EQ(response.result(), http::status::ok) << response.body();

    const auto body = body_of(response);
    EXPECT_EQ(body.get<std::string>("status"), "created");
    EXPECT_EQ(body.get<std::string>("message"), "Session created successfully");
    const auto snapshot = sessions.status(body.get<std::string>("session_id"));
    EXPECT_EQ(snapshot.filename, "notes.txt");
    EXPECT_EQ(snapshot.total_chunks, 2u);
}

TEST_F(RequestRouterTest, CreateSessionRequiresValidSignature) {
    expect_error(create("a.txt", "12", "2", "", ""), http::status::forbidden, "Authentication failed");
    expect_error(create("a.txt", "12", "2", "", "Zm9v"), http::status::forbidden, "Authentication failed");

    const std::string stale = signature();
    now += 31s;
    expect_error(create("a.txt", "12", "2", "", stale), http::status::forbidden, "Authentication failed");
    EXPECT_EQ(sessions.size(), 0u);
}

TEST_F(RequestRouterTest, CreateSessionRejectsBadParameters) {
    EXPECT_EQ(create("a.txt", "", "2", "", signature()).result(), http::status::bad_request);
    EXPECT_EQ(create("a.txt", "12", "0", "", signature()).result(), http::status::bad_request);
    EXPECT_EQ(create("a.txt", "-5", "2", "", signature()).result(), http::status::bad_request);
    EXPECT_EQ(create("a.txt", "12", "two", "", signature()).result(), http::status::bad_request);
    EXPECT_EQ(create("..", "12", "2", "", signature()).result(), http::status::bad_request);

    const std::string query = dfp::utils::build_query({
        {"f", dfp::utils::base64_encode(std::string("plain name"))}, {"s", "12"}, {"c", "2"}, {"g", signature()}
    });
    EXPECT_EQ(send(http::verb::get, "/cs?" + query).result(), http::status::bad_request);
    EXPECT_EQ(sessions.size(), 0u);
}

TEST_F(RequestRouterTest, MalformedQueryEscape) {
    EXPECT_EQ(send(http::verb::get, "/status?s=%zz").result(), http::status::bad_request);
}

TEST_F(RequestRouterTest, UploadChunkValidation) {
    const std::string id = create_ok("a.txt", "abcdef", 2);

    expect_error(send(http::verb::post, "/k", ""), http::status::bad_request, "No content");
    expect_error(send(http::verb::post, "/k", "{not json"), http::status::bad_request, "Invalid JSON format");
    expect_error(send(http::verb::post, "/k", "{\"session_id\":\"" + id + "\"}"),
                 http::status::bad_request, "Missing chunk parameters");
    expect_error(upload("0000000000000000", "0", "abc"), http::status::not_found, "Session not found");
    EXPECT_EQ(upload(id, "2", "abc").result(), http::status::bad_request);
    EXPECT_EQ(upload(id, "-1", "abc").result(), http::status::bad_request);
    EXPECT_EQ(send(http::verb::post, "/k",
                   "{\"session_id\":\"" + id + "\",\"chunk_index\":0,\"chunk_data\":\"@@@@\"}").result(),
              http::status::bad_request);
    EXPECT_EQ(sessions.status(id).received_chunks, 0u);
}

TEST_F(RequestRouterTest, UploadChunk) {
    const std::string id = create_ok("a.txt", "abcdef", 2);
    const auto response = upload(id, "1", "def");
    ASSERT_EQ(response.result(), http::status::ok) << response.body();

    EXPECT_NE(response.body().find("\"chunk_index\":1"), std::string::npos) << response.body();
    const auto body = body_of(response);
    EXPECT_EQ(body.get<std::string>("status"), "success");
    EXPECT_EQ(body.get<std::string>("message"), "Chunk uploaded successfully");
    EXPECT_EQ(sessions.status(id).received_chunks, 1u);
}

TEST_F(RequestRouterTest, StatusReportsProgress) {
    expect_error(send(http::verb::get, "/status"), http::status::bad_request, "Missing session_id");
    expect_error(send(http::verb::get, "/status?s=unknown"), http::status::not_found, "Session not found");

    const std::string id = create_ok("a.txt", "abcdef", 4);
    upload(id, "0", "ab");

    const auto response = send(http::verb::get, "/status?s=" + id);
    ASSERT_EQ(response.result(), http::status::ok);
    const auto body = body_of(response);
    EXPECT_EQ(body.get<std::string>("session_id"), id);
    EXPECT_EQ(body.get<std::string>("status"), "active");
    EXPECT_EQ(body.get<std::string>("filename"), "a.txt");
    EXPECT_DOUBLE_EQ(body.get<double>("progress"), 25.0);
    EXPECT_EQ(body.get<int>("received_chunks"), 1);
    EXPECT_EQ(body.get<int>("total_chunks"), 4);
    EXPECT_FALSE(body.get_child_optional("file_path"));
    EXPECT_NE(response.body().find("\"total_chunks\":4"), std::string::npos);
}

TEST_F(RequestRouterTest, CompleteSession) {
    expect_error(send(http::verb::post, "/fs", ""), http::status::bad_request, "No content");
    expect_error(send(http::verb::post, "/fs", "[oops"), http::status::bad_request, "Invalid JSON format");
    expect_error(send(http::verb::post, "/fs", "{}"), http::status::bad_request, "Missing session_id");

    const std::string id = create_ok("done.txt", "abcdef", 2);
    upload(id, "0", "abc");
    expect_error(complete(id), http::status::internal_server_error, "Missing chunks: {1}");
    EXPECT_EQ(sessions.status(id).status, SessionStatus::active);

    upload(id, "1", "def");
    const auto response = complete(id);
    ASSERT_EQ(response.result(), http::status::ok) << response.body();
    const auto body = body_of(response);
    EXPECT_EQ(body.get<std::string>("status"), "completed");
    EXPECT_EQ(body.get<std::string>("message"), "completed successfully");
    EXPECT_EQ(std::filesystem::path(body.get<std::string>("fp")),
              std::filesystem::absolute(output_dir.path() / "done.txt"));

    const auto status = body_of(send(http::verb::get, "/status?s=" + id));
    EXPECT_EQ(status.get<std::string>("status"), "completed");
    EXPECT_EQ(status.get<std::string>("file_path"), body.get<std::string>("fp"));
    EXPECT_GE(status.get<double>("transfer_time"), 0.0);

    EXPECT_EQ(upload(id, "0", "abc").result(), http::status::bad_request);
    EXPECT_EQ(complete(id).result(), http::status::internal_server_error);
}

TEST_F(RequestRouterTest, HashMismatchIsAServerError) {
    const auto response = create("x.txt", "3", "1", std::string(32, 'f'), signature());
    const std::string id = body_of(response).get<std::string>("session_id");
    upload(id, "0", "abc");

    const auto result = complete(id);
    EXPECT_EQ(result.result(), http::status::internal_server_error);
    EXPECT_NE(body_of(result).get<std::string>("error").find("hash"), std::string::npos);
    EXPECT_EQ(sessions.status(id).status, SessionStatus::finalizing);
}

#include "filest/server/upload_server.hpp"

#include "filest/core/base64.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using filest::ServerConfig;
using filest::network::HttpMethod;
using filest::network::HttpRequest;
using filest::network::HttpResponse;
using filest::server::UploadServer;
using json = nlohmann::json;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    fs::path dir = fs::temp_directory_path() / ("filest_server_test_" + std::to_string(counter++));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return fs::canonical(dir);
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

const std::string kBoundary = "----filestBoundary7MA4YWxk";

std::string multipart_body(const std::string& directory,
                           const std::vector<std::pair<std::string, std::string>>& files) {
    std::string body;
    if (!directory.empty()) {
        body += "--" + kBoundary + "\r\n";
        body += "Content-Disposition: form-data; name=\"path\"\r\n\r\n";
        body += directory + "\r\n";
    }
    for (const auto& [name, content] : files) {
        body += "--" + kBoundary + "\r\n";
        body += "Content-Disposition: form-data; name=\"file\"; filename=\"" + name + "\"\r\n";
        body += "Content-Type: application/octet-stream\r\n\r\n";
        body += content + "\r\n";
    }
    body += "--" + kBoundary + "--\r\n";
    return body;
}

class UploadServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_ = create_temp_dir();
        ServerConfig config;
        config.root = base_ / "files";
        config.staging_dir = base_ / "staging";
        config.username = "admin";
        config.password = "secret";
        config.port = 0;
        server_ = std::make_unique<UploadServer>(config);
        root_ = server_->resolver().root();
    }

    void TearDown() override {
        server_.reset();
        std::error_code ec;
        fs::remove_all(base_, ec);
    }

    HttpRequest request(HttpMethod method, const std::string& url, const std::string& body = "",
                        const std::string& content_type = "application/json") const {
        HttpRequest req;
        req.method = method;
        req.url = url;
        req.headers["Authorization"] = "Basic " + filest::base64_encode("admin:secret");
        if (!body.empty()) {
            req.headers["Content-Type"] = content_type;
            req.body.assign(body.begin(), body.end());
        }
        return req;
    }

    HttpResponse post_json(const std::string& url, const json& body) const {
        return server_->handle(request(HttpMethod::POST, url, body.dump()));
    }

    HttpResponse post_chunk(const std::string& id, std::uint32_t index, const std::string& data) const {
        auto req = request(HttpMethod::POST,
                           "/api/upload/chunk?uploadId=" + id + "&chunkIndex=" + std::to_string(index),
                           data, "application/octet-stream");
        return server_->handle(req);
    }

    static json body_of(const HttpResponse& response) {
        return json::parse(response.body_as_string());
    }

    fs::path base_;
    fs::path root_;
    std::unique_ptr<UploadServer> server_;
};

} // namespace

TEST_F(UploadServerTest, RejectsMissingCredentialsWithChallenge) {
    HttpRequest req;
    req.method = HttpMethod::POST;
    req.url = "/api/upload/init";

    auto response = server_->handle(req);
    EXPECT_EQ(response.status_code, 401);
    EXPECT_EQ(response.body_as_string(), "Unauthorized");
    EXPECT_EQ(response.headers["WWW-Authenticate"], "Basic realm=\"File Manager\", charset=\"UTF-8\"");
}

TEST_F(UploadServerTest, RejectsWrongCredentialsWithoutChallenge) {
    auto req = request(HttpMethod::POST, "/api/upload/init", "{}");
    req.headers["Authorization"] = "Basic " + filest::base64_encode("admin:nope");

    auto response = server_->handle(req);
    EXPECT_EQ(response.status_code, 401);
    EXPECT_EQ(response.headers.count("WWW-Authenticate"), 0u);
}

TEST_F(UploadServerTest, ChunkedFlowOutOfOrder) {
    auto init = post_json("/api/upload/init",
                          {{"path", "/reports"}, {"filename", "q1.txt"}, {"totalSize", 10},
                           {"chunkSize", 5}, {"totalChunks", 2}});
    ASSERT_EQ(init.status_code, 200);
    const auto init_body = body_of(init);
    EXPECT_TRUE(init_body["success"].get<bool>());
    EXPECT_EQ(init_body["chunkSize"], 5);
    const auto id = init_body["uploadId"].get<std::string>();

    auto second = post_chunk(id, 1, "world");
    ASSERT_EQ(second.status_code, 200);
    EXPECT_EQ(body_of(second)["chunkIndex"], 1);
    EXPECT_TRUE(body_of(second)["received"].get<bool>());
    ASSERT_EQ(post_chunk(id, 0, "hello").status_code, 200);

    auto complete = post_json("/api/upload/complete", {{"uploadId", id}});
    ASSERT_EQ(complete.status_code, 200);
    const auto done = body_of(complete);
    EXPECT_EQ(done["name"], "q1.txt");
    EXPECT_EQ(done["size"], 10);
    EXPECT_EQ(done["path"], "/reports/q1.txt");
    EXPECT_EQ(read_file(root_ / "reports" / "q1.txt"), "helloworld");
}

TEST_F(UploadServerTest, ChunkMayArriveAsMultipart) {
    auto init = post_json("/api/upload/init", {{"filename", "m.bin"}, {"chunkSize", 3}, {"totalChunks", 1}});
    const auto id = body_of(init)["uploadId"].get<std::string>();

    auto req = request(HttpMethod::POST, "/api/upload/chunk?uploadId=" + id + "&chunkIndex=0",
                       multipart_body("", {{"blob", "abc"}}), "multipart/form-data; boundary=" + kBoundary);
    ASSERT_EQ(server_->handle(req).status_code, 200);

    ASSERT_EQ(post_json("/api/upload/complete", {{"uploadId", id}}).status_code, 200);
    EXPECT_EQ(read_file(root_ / "m.bin"), "abc");
}

TEST_F(UploadServerTest, CompleteReportsMissingChunks) {
    auto init = post_json("/api/upload/init", {{"filename", "x.bin"}, {"chunkSize", 1}, {"totalChunks", 3}});
    const auto id = body_of(init)["uploadId"].get<std::string>();
    ASSERT_EQ(post_chunk(id, 1, "b").status_code, 200);

    auto complete = post_json("/api/upload/complete", {{"uploadId", id}});
    EXPECT_EQ(complete.status_code, 409);
    const auto body = body_of(complete);
    EXPECT_FALSE(body["success"].get<bool>());
    EXPECT_EQ(body["code"], "MISSING_CHUNKS");
    EXPECT_EQ(body["missing"], json::array({0, 2}));
}

TEST_F(UploadServerTest, InitOutsideRootIsForbidden) {
    auto response = post_json("/api/upload/init",
                              {{"path", "../../etc"}, {"filename", "passwd"}, {"chunkSize", 1}, {"totalChunks", 1}});
    EXPECT_EQ(response.status_code, 403);
    const auto body = body_of(response);
    EXPECT_FALSE(body["success"].get<bool>());
    EXPECT_EQ(body["code"], "ACCESS_DENIED");
    EXPECT_EQ(body["error"], "Access denied: Invalid path");
}

TEST_F(UploadServerTest, InitValidatesBody) {
    EXPECT_EQ(server_->handle(request(HttpMethod::POST, "/api/upload/init", "not json")).status_code, 400);
    EXPECT_EQ(post_json("/api/upload/init", {{"filename", "a"}}).status_code, 400);
    EXPECT_EQ(post_json("/api/upload/init", {{"filename", "a"}, {"chunkSize", 1}, {"totalChunks", 0}}).status_code,
              400);
}

TEST_F(UploadServerTest, ChunkValidation) {
    auto init = post_json("/api/upload/init", {{"filename", "v.bin"}, {"chunkSize", 1}, {"totalChunks", 2}});
    const auto id = body_of(init)["uploadId"].get<std::string>();

    auto bad_index = server_->handle(
        request(HttpMethod::POST, "/api/upload/chunk?uploadId=" + id + "&chunkIndex=-1", "x", "application/octet-stream"));
    EXPECT_EQ(bad_index.status_code, 400);

    auto out_of_range = post_chunk(id, 5, "x");
    EXPECT_EQ(out_of_range.status_code, 400);
    EXPECT_EQ(body_of(out_of_range)["code"], "INVALID_INDEX");

    auto unknown = post_chunk("missing-session", 0, "x");
    EXPECT_EQ(unknown.status_code, 404);
    EXPECT_EQ(body_of(unknown)["code"], "SESSION_NOT_FOUND");
}

TEST_F(UploadServerTest, AbortIsIdempotent) {
    auto unknown = post_json("/api/upload/abort", {{"uploadId", "does-not-exist"}});
    EXPECT_EQ(unknown.status_code, 200);
    EXPECT_TRUE(body_of(unknown)["success"].get<bool>());

    auto init = post_json("/api/upload/init", {{"filename", "a.bin"}, {"chunkSize", 1}, {"totalChunks", 1}});
    const auto id = body_of(init)["uploadId"].get<std::string>();
    EXPECT_EQ(post_json("/api/upload/abort", {{"uploadId", id}}).status_code, 200);
    EXPECT_EQ(post_json("/api/upload/abort", {{"uploadId", id}}).status_code, 200);
    EXPECT_EQ(post_json("/api/upload/complete", {{"uploadId", id}}).status_code, 404);
}

TEST_F(UploadServerTest, MultipartUpload) {
    auto req = request(HttpMethod::POST, "/api/upload",
                       multipart_body("/inbox", {{"a.txt", "alpha"}, {"b.txt", "bravo!"}}),
                       "multipart/form-data; boundary=" + kBoundary);

    auto response = server_->handle(req);
    ASSERT_EQ(response.status_code, 200);
    const auto body = body_of(response);
    EXPECT_TRUE(body["success"].get<bool>());
    ASSERT_EQ(body["files"].size(), 2u);
    EXPECT_EQ(body["files"][0]["name"], "a.txt");
    EXPECT_EQ(body["files"][0]["size"], 5);
    EXPECT_EQ(body["files"][1]["path"], "/inbox/b.txt");

    EXPECT_EQ(read_file(root_ / "inbox" / "a.txt"), "alpha");
    EXPECT_EQ(read_file(root_ / "inbox" / "b.txt"), "bravo!");
    EXPECT_EQ(server_->metrics().get_stats().uploads_completed.load(), 2u);
}

TEST_F(UploadServerTest, MultipartWithoutFilesIsRejected) {
    auto req = request(HttpMethod::POST, "/api/upload", multipart_body("/inbox", {}),
                       "multipart/form-data; boundary=" + kBoundary);
    auto response = server_->handle(req);
    EXPECT_EQ(response.status_code, 400);
    EXPECT_EQ(body_of(response)["error"], "No files in request");
}

TEST_F(UploadServerTest, MultipartOutsideRootIsForbidden) {
    auto req = request(HttpMethod::POST, "/api/upload", multipart_body("/../..", {{"x", "y"}}),
                       "multipart/form-data; boundary=" + kBoundary);
    auto response = server_->handle(req);
    EXPECT_EQ(response.status_code, 403);
    EXPECT_EQ(body_of(response)["code"], "ACCESS_DENIED");
}

TEST_F(UploadServerTest, PlainGetOnWebSocketPath) {
    HttpRequest req;
    req.method = HttpMethod::GET;
    req.url = UploadServer::kWebSocketPath;
    auto response = server_->handle(req);
    EXPECT_EQ(response.status_code, 400);
}

TEST_F(UploadServerTest, UnknownRouteAndWrongMethod) {
    EXPECT_EQ(server_->handle(request(HttpMethod::GET, "/nowhere")).status_code, 404);
    EXPECT_EQ(server_->handle(request(HttpMethod::GET, "/api/upload/init")).status_code, 405);
}

TEST_F(UploadServerTest, SweepReclaimsNothingWhenFresh) {
    post_json("/api/upload/init", {{"filename", "f.bin"}, {"chunkSize", 1}, {"totalChunks", 1}});
    EXPECT_EQ(server_->sweep(), 0u);
}

TEST(ErrorResponseTest, EnvelopeCarriesMissingList) {
    auto response = filest::server::error_response(filest::Error::missing({3, 4}));
    EXPECT_EQ(response.status_code, 409);
    auto body = json::parse(response.body_as_string());
    EXPECT_EQ(body["missing"], json::array({3, 4}));
    EXPECT_EQ(response.headers["Content-Type"], "application/json");
}

TEST(UploadServerStartTest, RefusesStagingInsideRoot) {
    const auto base = create_temp_dir();
    const auto root = base / "files";
    fs::create_directories(root / "user_photos");
    std::ofstream(root / "user_photos" / "cat.jpg") << "meow";

    ServerConfig config;
    config.bind_address = "127.0.0.1";
    config.port = 0;
    config.root = root;
    config.staging_dir = root;

    UploadServer server(config);
    auto started = server.start();
    ASSERT_TRUE(started.is_error());
    EXPECT_EQ(started.error().code, filest::ErrorCode::InvalidArgument);

    fs::last_write_time(root / "user_photos", fs::file_time_type::clock::now() - std::chrono::hours(5));
    server.sweep();
    EXPECT_TRUE(fs::exists(root / "user_photos" / "cat.jpg"));

    std::error_code ec;
    fs::remove_all(base, ec);
}

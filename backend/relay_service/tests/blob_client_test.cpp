#include <gtest/gtest.h>
#include <map>
#include <mutex>
#include <thread>
#include "common/restful/http_server.hpp"
#include "infrastructure/blob_client.hpp"
#include "infrastructure/managed_identity_credential.hpp"
#include "test_support.hpp"

using namespace relay_service;
using namespace std::chrono_literals;
using relay_service::testing::TempDir;

namespace {

// Serves just enough of the blob and identity REST surface for the clients.
class FakeStorageEndpoint : public common::RestApiHandlerBase {
public:
  std::map<std::string, std::string> blobs;
  std::map<std::string, std::string> last_headers;
  std::string token_response = R"({"access_token":"good-token","expires_on":"4102444800"})";

protected:
  http::response<http::string_body> doHandleRequest(
      http::request<http::string_body, http::basic_fields<std::allocator<char>>>&& req) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [path, query] = splitTarget(std::string_view(req.target().data(), req.target().size()));
    last_headers.clear();
    for (const auto& field : req) {
      last_headers[std::string(field.name_string())] = std::string(field.value());
    }

    if (path == "/msi/token") {
      auto params = parseQueryString(query);
      if (req["X-IDENTITY-HEADER"] != "secret" || params["resource"] != "https://storage.azure.com/") {
        return createErrorResponse(http::status::bad_request, "bad identity request");
      }
      return createTextResponse(http::status::ok, token_response);
    }
    if (path == "/imds/token") {
      if (req["Metadata"] != "true") {
        return createErrorResponse(http::status::bad_request, "Required metadata header not specified");
      }
      return createTextResponse(http::status::ok, R"({"access_token":"imds-token","expires_in":"3599"})");
    }

    if (req[http::field::authorization] != "Bearer good-token") {
      auto res = createErrorResponse(http::status::forbidden, "denied");
      res.set("x-ms-error-code", "AuthorizationPermissionMismatch");
      return res;
    }
    if (req.method() == http::verb::put) {
      if (req["x-ms-blob-type"] != "BlockBlob") {
        return createErrorResponse(http::status::bad_request, "missing blob type");
      }
      blobs[path] = req.body();
      return createTextResponse(http::status::created, "");
    }
    if (path == "/acct/broken/blob") {
      auto res = createErrorResponse(http::status::service_unavailable, "ServerBusy");
      res.set("x-ms-error-code", "ServerBusy");
      return res;
    }
    auto it = blobs.find(path);
    if (it == blobs.end()) {
      auto res = createErrorResponse(http::status::not_found, "The specified blob does not exist.");
      res.set("x-ms-error-code", "BlobNotFound");
      return res;
    }
    return createTextResponse(http::status::ok, it->second);
  }

private:
  std::mutex mutex_;
};

} // namespace

class BlobClientTest : public ::testing::Test {
protected:
  void SetUp() override {
    endpoint_ = std::make_shared<FakeStorageEndpoint>();
    server_ = std::make_unique<common::HttpServer>(
      ioc_, tcp::endpoint{net::ip::make_address("127.0.0.1"), 0}, endpoint_);
    server_->run();
    thread_ = std::thread([this] { ioc_.run(); });
    base_url_ = "http://127.0.0.1:" + std::to_string(server_->port());

    client_ = std::make_unique<BlobClient>(config::StorageConfig{
      .endpoint_template = base_url_ + "/{account}",
      .api_version = "2021-08-06",
      .output_object_name = "output.mp4",
      .connect_timeout = 5s,
      .transfer_timeout = 10s
    });
  }

  void TearDown() override {
    ioc_.stop();
    thread_.join();
  }

  net::io_context ioc_;
  std::shared_ptr<FakeStorageEndpoint> endpoint_;
  std::unique_ptr<common::HttpServer> server_;
  std::thread thread_;
  std::string base_url_;
  std::unique_ptr<BlobClient> client_;
  TempDir dir_;
  AccessToken token_{"good-token", std::chrono::system_clock::now() + 1h};
};

TEST_F(BlobClientTest, BuildsBlobUrlFromTemplate) {
  BlobClient azure(config::StorageConfig{
    .endpoint_template = "https://{account}.blob.core.windows.net/",
    .api_version = "2021-08-06",
    .output_object_name = "output.mp4",
    .connect_timeout = 5s,
    .transfer_timeout = 10s
  });
  EXPECT_EQ(azure.blobUrl({"media", "videos", "a/b.mp4"}),
            "https://media.blob.core.windows.net/videos/a/b.mp4");
}

TEST_F(BlobClientTest, DownloadsWholeBody) {
  std::string body(200000, 'x');
  body[12345] = '\0';
  endpoint_->blobs["/acct/videos/in/clip.mp4"] = body;

  auto target = dir_.path() / "input.mp4";
  auto result = client_->download({"acct", "videos", "in/clip.mp4"}, token_, target);
  ASSERT_TRUE(result.has_value()) << result.error().message;
  EXPECT_EQ(relay_service::testing::readFile(target), body);
  EXPECT_EQ(endpoint_->last_headers["x-ms-version"], "2021-08-06");
  EXPECT_FALSE(endpoint_->last_headers["x-ms-date"].empty());
}

TEST_F(BlobClientTest, MissingBlobIsNotFound) {
  auto result = client_->download({"acct", "videos", "nope.mp4"}, token_, dir_.path() / "input.mp4");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, TransferError::Kind::NotFound);
  EXPECT_NE(result.error().message.find("BlobNotFound"), std::string::npos);
}

TEST_F(BlobClientTest, RejectedTokenIsAuthError) {
  endpoint_->blobs["/acct/videos/clip.mp4"] = "data";
  AccessToken bad{"bad-token", token_.expires_on};
  auto result = client_->download({"acct", "videos", "clip.mp4"}, bad, dir_.path() / "input.mp4");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, TransferError::Kind::Auth);
  EXPECT_NE(result.error().message.find("403"), std::string::npos);
  EXPECT_NE(result.error().message.find("AuthorizationPermissionMismatch"), std::string::npos);
}

TEST_F(BlobClientTest, ServerErrorIsTransportError) {
  auto result = client_->download({"acct", "broken", "blob"}, token_, dir_.path() / "input.mp4");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, TransferError::Kind::Transport);
  EXPECT_NE(result.error().message.find("503"), std::string::npos);
}

TEST_F(BlobClientTest, UnreachableEndpointIsTransportError) {
  BlobClient unreachable(config::StorageConfig{
    .endpoint_template = "http://127.0.0.1:1/{account}",
    .api_version = "2021-08-06",
    .output_object_name = "output.mp4",
    .connect_timeout = 2s,
    .transfer_timeout = 5s
  });
  auto result = unreachable.download({"acct", "videos", "clip.mp4"}, token_, dir_.path() / "input.mp4");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, TransferError::Kind::Transport);
}

TEST_F(BlobClientTest, TruncatedBodyIsTransportError) {
  // Announces 1000 bytes, sends 10, then hangs up.
  net::io_context raw_ioc;
  tcp::acceptor acceptor(raw_ioc, tcp::endpoint{net::ip::make_address("127.0.0.1"), 0});
  std::thread server([&acceptor, &raw_ioc] {
    beast::error_code ec;
    tcp::socket socket(raw_ioc);
    acceptor.accept(socket, ec);
    if (ec) {
      return;
    }
    net::streambuf request;
    net::read_until(socket, request, "\r\n\r\n", ec);
    const std::string response =
      "HTTP/1.1 200 OK\r\nContent-Length: 1000\r\nConnection: close\r\n\r\n0123456789";
    net::write(socket, net::buffer(response), ec);
    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);
  });

  BlobClient truncating(config::StorageConfig{
    .endpoint_template = "http://127.0.0.1:" + std::to_string(acceptor.local_endpoint().port()) + "/{account}",
    .api_version = "2021-08-06",
    .output_object_name = "output.mp4",
    .connect_timeout = 5s,
    .transfer_timeout = 10s
  });
  auto result = truncating.download({"acct", "videos", "clip.mp4"}, token_, dir_.path() / "input.mp4");
  server.join();

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, TransferError::Kind::Transport);
}

TEST_F(BlobClientTest, UploadOverwrites) {
  auto source = dir_.path() / "output.mp4";
  relay_service::testing::writeFile(source, "first version");
  ASSERT_TRUE(client_->upload({"acct", "processed", "output.mp4"}, token_, source).has_value());
  relay_service::testing::writeFile(source, "second");
  auto result = client_->upload({"acct", "processed", "output.mp4"}, token_, source);
  ASSERT_TRUE(result.has_value()) << result.error().message;
  EXPECT_EQ(endpoint_->blobs["/acct/processed/output.mp4"], "second");
}

TEST_F(BlobClientTest, UploadOfMissingFileFailsWithoutRequest) {
  auto result = client_->upload({"acct", "processed", "output.mp4"}, token_, dir_.path() / "absent.mp4");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, TransferError::Kind::Transport);
  EXPECT_FALSE(endpoint_->blobs.contains("/acct/processed/output.mp4"));
}

TEST_F(BlobClientTest, AppServiceIdentityEndpoint) {
  ManagedIdentityCredential credential(config::IdentityConfig{
    .identity_endpoint = base_url_ + "/msi/token",
    .identity_header = "secret",
    .imds_endpoint = base_url_ + "/imds/token",
    .resource = "https://storage.azure.com/",
    .client_id = "",
    .timeout = 5s
  });
  auto token = credential.acquire();
  ASSERT_TRUE(token.has_value()) << token.error();
  EXPECT_EQ(token->token, "good-token");
  EXPECT_EQ(std::chrono::system_clock::to_time_t(token->expires_on), 4102444800);
}

TEST_F(BlobClientTest, InstanceMetadataEndpoint) {
  ManagedIdentityCredential credential(config::IdentityConfig{
    .identity_endpoint = "",
    .identity_header = "",
    .imds_endpoint = base_url_ + "/imds/token",
    .resource = "https://storage.azure.com/",
    .client_id = "11111111-2222-3333-4444-555555555555",
    .timeout = 5s
  });
  auto token = credential.acquire();
  ASSERT_TRUE(token.has_value()) << token.error();
  EXPECT_EQ(token->token, "imds-token");
  EXPECT_GT(token->expires_on, std::chrono::system_clock::now() + 3000s);
}

TEST_F(BlobClientTest, IdentityEndpointErrorsAreReported) {
  ManagedIdentityCredential credential(config::IdentityConfig{
    .identity_endpoint = base_url_ + "/msi/token",
    .identity_header = "wrong",
    .imds_endpoint = "",
    .resource = "https://storage.azure.com/",
    .client_id = "",
    .timeout = 5s
  });
  auto token = credential.acquire();
  ASSERT_FALSE(token.has_value());
  EXPECT_NE(token.error().find("HTTP 400"), std::string::npos);
}

TEST(ManagedIdentityCredentialTest, ParsesTokenResponses) {
  auto numeric = ManagedIdentityCredential::parseTokenResponse(R"({"access_token":"t","expires_on":1700000000})");
  ASSERT_TRUE(numeric.has_value());
  EXPECT_EQ(std::chrono::system_clock::to_time_t(numeric->expires_on), 1700000000);

  EXPECT_FALSE(ManagedIdentityCredential::parseTokenResponse("not json").has_value());
  EXPECT_FALSE(ManagedIdentityCredential::parseTokenResponse(R"({"expires_on":"1"})").has_value());
  EXPECT_FALSE(ManagedIdentityCredential::parseTokenResponse(R"({"access_token":""})").has_value());
}

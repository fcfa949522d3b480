#pragma once
#include <expected>
#include <filesystem>
#include <string>
#include "common/config/config.hpp"
#include "domain/blob_transfer_service.hpp"
#include "infrastructure/curl_easy.hpp"

namespace relay_service {

// Blob REST client over libcurl. Each call uses its own easy handle so one
// instance may serve concurrent requests.
class BlobClient : public BlobTransferService {
public:
  explicit BlobClient(config::StorageConfig config);

  std::expected<void, TransferError> download(
    const StorageLocator& locator,
    const AccessToken& credential,
    const std::filesystem::path& destination
  ) override;

  std::expected<void, TransferError> upload(
    const StorageLocator& locator,
    const AccessToken& credential,
    const std::filesystem::path& source
  ) override;

  std::string blobUrl(const StorageLocator& locator) const;

private:
  struct Exchange {
    CURL* curl{nullptr};
    std::ostream* sink{nullptr};
    std::istream* source{nullptr};
    std::string error_code;
    std::string error_body;
  };

  static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata);
  static size_t readCallback(char* buffer, size_t size, size_t nitems, void* userdata);
  static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);

  CurlSlistPtr commonHeaders(const AccessToken& credential) const;
  void applyCommonOptions(CURL* curl, Exchange& exchange, char* error_buffer) const;
  std::expected<void, TransferError> classify(CURLcode res, const Exchange& exchange,
                                              const char* error_buffer) const;

  config::StorageConfig config_;
};

} // namespace relay_service

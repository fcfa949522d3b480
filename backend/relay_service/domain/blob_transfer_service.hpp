#pragma once
#include <expected>
#include <filesystem>
#include <string>
#include "domain/credential_provider.hpp"
#include "domain/storage_locator.hpp"

namespace relay_service {

struct TransferError {
  enum class Kind {
    NotFound,
    Auth,
    Transport
  };
  Kind kind;
  std::string message;
};

class BlobTransferService {
public:
  virtual ~BlobTransferService() = default;

  // Writes the whole blob body to destination. Nothing short of a complete
  // body is reported as success.
  virtual std::expected<void, TransferError> download(
    const StorageLocator& locator,
    const AccessToken& credential,
    const std::filesystem::path& destination
  ) = 0;

  // Creates or overwrites the blob with the contents of source.
  virtual std::expected<void, TransferError> upload(
    const StorageLocator& locator,
    const AccessToken& credential,
    const std::filesystem::path& source
  ) = 0;
};

} // namespace relay_service

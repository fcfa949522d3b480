#pragma once
#include <expected>
#include <string>
#include "common/config/config.hpp"
#include "domain/credential_provider.hpp"

namespace relay_service {

// Fetches a storage token from the platform identity endpoint: the App
// Service endpoint when IDENTITY_ENDPOINT/IDENTITY_HEADER are configured,
// the instance metadata service otherwise.
class ManagedIdentityCredential : public CredentialProvider {
public:
  explicit ManagedIdentityCredential(config::IdentityConfig config);

  std::expected<AccessToken, std::string> acquire() override;

  // Parses {"access_token": ..., "expires_on": ...} as returned by either endpoint.
  static std::expected<AccessToken, std::string> parseTokenResponse(const std::string& body);

private:
  bool useAppServiceEndpoint() const;

  config::IdentityConfig config_;
};

} // namespace relay_service

#pragma once
#include <chrono>
#include <expected>
#include <string>

namespace relay_service {

struct AccessToken {
  std::string token;
  std::chrono::system_clock::time_point expires_on;
};

class CredentialProvider {
public:
  virtual ~CredentialProvider() = default;
  virtual std::expected<AccessToken, std::string> acquire() = 0;
};

} // namespace relay_service

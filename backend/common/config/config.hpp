#pragma once

#include <chrono>
#include <string>

namespace config {

struct HttpServiceConfig {
  std::string host;
  unsigned int port;
  unsigned int threads;
};

struct StorageConfig {
  // "{account}" is replaced by the account name of the locator
  std::string endpoint_template;
  std::string api_version;
  std::string output_object_name;
  std::chrono::seconds connect_timeout;
  std::chrono::seconds transfer_timeout;
};

struct IdentityConfig {
  // App Service / Functions flavour, used when both are set
  std::string identity_endpoint;
  std::string identity_header;
  std::string imds_endpoint;
  std::string resource;
  std::string client_id;
  std::chrono::seconds timeout;
};

struct TranscoderConfig {
  std::string binary_name;
  std::string deployment_dir;
  std::chrono::seconds timeout;
};

class Config {
public:
static Config& getInstance() {
  static Config instance;
  return instance;
}

// Delete copy/move constructors and assign operators
Config(const Config&) = delete;
Config& operator=(const Config&) = delete;
Config(Config&&) = delete;
Config& operator=(Config&&) = delete;

// Getters
const HttpServiceConfig& getHttpService() const { return http_service_; }
const StorageConfig& getStorage() const { return storage_; }
const IdentityConfig& getIdentity() const { return identity_; }
const TranscoderConfig& getTranscoder() const { return transcoder_; }
const std::string& getWorkDir() const { return work_dir_; }
const std::string& getLogLevel() const { return log_level_; }
std::string getListenAddress() const { return http_service_.host + ":" + std::to_string(http_service_.port); }

// Overlays RELAY_* and identity variables on the current values. Invalid
// numbers and out-of-range ports are logged and leave the value unchanged.
void applyEnvironment();

private:
  Config();

  HttpServiceConfig http_service_;
  StorageConfig storage_;
  IdentityConfig identity_;
  TranscoderConfig transcoder_;
  std::string work_dir_;
  std::string log_level_;
};

} // namespace config

#include "config.hpp"
#include "common/logging/logger.hpp"
#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <format>
#include <thread>

namespace config {

namespace {

void overrideString(const char* name, std::string& target) {
  if (const char* value = std::getenv(name); value && *value) {
    target = value;
  }
}

template <typename Number>
void overrideNumber(const char* name, Number& target) {
  const char* value = std::getenv(name);
  if (!value || !*value) {
    return;
  }
  Number parsed{};
  const char* end = value + std::char_traits<char>::length(value);
  auto [ptr, ec] = std::from_chars(value, end, parsed);
  if (ec != std::errc{} || ptr != end) {
    common::Logger::warn(std::format("Ignoring invalid value '{}' for {}", value, name));
    return;
  }
  target = parsed;
}

void overrideSeconds(const char* name, std::chrono::seconds& target) {
  long long seconds = target.count();
  overrideNumber(name, seconds);
  if (seconds <= 0) {
    common::Logger::warn(std::format("Ignoring non-positive value {} for {}", seconds, name));
    return;
  }
  target = std::chrono::seconds(seconds);
}

} // namespace

Config::Config() {
  http_service_ = {
    .host = "0.0.0.0",
    .port = 7071,
    .threads = std::max(1u, std::thread::hardware_concurrency())
  };

  storage_ = {
    .endpoint_template = "https://{account}.blob.core.windows.net",
    .api_version = "2021-08-06",
    .output_object_name = "output.mp4",
    .connect_timeout = std::chrono::seconds(30),
    .transfer_timeout = std::chrono::seconds(600)
  };

  identity_ = {
    .identity_endpoint = "",
    .identity_header = "",
    .imds_endpoint = "http://169.254.169.254/metadata/identity/oauth2/token",
    .resource = "https://storage.azure.com/",
    .client_id = "",
    .timeout = std::chrono::seconds(30)
  };

  transcoder_ = {
    .binary_name = "ffmpeg",
    .deployment_dir = "/home/site/wwwroot/bin",
    .timeout = std::chrono::seconds(900)
  };

  work_dir_ = "/tmp";
  log_level_ = "INFO";

  applyEnvironment();
}

void Config::applyEnvironment() {
  overrideString("RELAY_HOST", http_service_.host);
  unsigned int port = http_service_.port;
  overrideNumber("RELAY_PORT", port);
  if (port > 65535) {
    common::Logger::warn(std::format("Ignoring out-of-range port {} for RELAY_PORT", port));
  } else {
    http_service_.port = port;
  }
  overrideNumber("RELAY_THREADS", http_service_.threads);
  if (http_service_.threads == 0) {
    http_service_.threads = 1;
  }

  overrideString("RELAY_WORK_DIR", work_dir_);
  overrideString("RELAY_LOG_LEVEL", log_level_);

  overrideString("RELAY_TRANSCODER_BINARY", transcoder_.binary_name);
  overrideString("RELAY_TRANSCODER_DEPLOY_DIR", transcoder_.deployment_dir);
  overrideSeconds("RELAY_TRANSCODER_TIMEOUT_SECONDS", transcoder_.timeout);

  overrideString("RELAY_STORAGE_ENDPOINT", storage_.endpoint_template);
  overrideString("RELAY_STORAGE_API_VERSION", storage_.api_version);
  overrideString("RELAY_OUTPUT_OBJECT_NAME", storage_.output_object_name);
  overrideSeconds("RELAY_CONNECT_TIMEOUT_SECONDS", storage_.connect_timeout);
  overrideSeconds("RELAY_TRANSFER_TIMEOUT_SECONDS", storage_.transfer_timeout);

  overrideString("IDENTITY_ENDPOINT", identity_.identity_endpoint);
  overrideString("IDENTITY_HEADER", identity_.identity_header);
  overrideString("RELAY_IMDS_ENDPOINT", identity_.imds_endpoint);
  overrideString("AZURE_CLIENT_ID", identity_.client_id);
}

} // namespace config

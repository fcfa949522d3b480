#include "managed_identity_credential.hpp"
#include "common/logging/logger.hpp"
#include "infrastructure/curl_easy.hpp"
#include <charconv>
#include <format>
#include <optional>
#include <nlohmann/json.hpp>

namespace relay_service {

namespace {

size_t collectBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
  static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
  return size * nmemb;
}

std::optional<long long> parseEpoch(const nlohmann::json& value) {
  if (value.is_number_integer()) {
    return value.get<long long>();
  }
  if (value.is_string()) {
    const auto& text = value.get_ref<const std::string&>();
    long long seconds = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), seconds);
    if (ec == std::errc{} && ptr == text.data() + text.size()) {
      return seconds;
    }
  }
  return std::nullopt;
}

} // namespace

ManagedIdentityCredential::ManagedIdentityCredential(config::IdentityConfig config)
  : config_(std::move(config)) {
  initCurlOnce();
}

bool ManagedIdentityCredential::useAppServiceEndpoint() const {
  return !config_.identity_endpoint.empty() && !config_.identity_header.empty();
}

std::expected<AccessToken, std::string> ManagedIdentityCredential::acquire() {
  std::string body;
  long http_code = 0;

  try {
    auto curl = makeCurlEasy();
    CurlSlistPtr headers;
    std::string url;

    if (useAppServiceEndpoint()) {
      url = config_.identity_endpoint + "?api-version=2019-08-01&resource=" + urlEscape(curl.get(), config_.resource);
      appendHeader(headers, "X-IDENTITY-HEADER: " + config_.identity_header);
    } else {
      url = config_.imds_endpoint + "?api-version=2018-02-01&resource=" + urlEscape(curl.get(), config_.resource);
      appendHeader(headers, "Metadata: true");
    }
    if (!config_.client_id.empty()) {
      url += "&client_id=" + urlEscape(curl.get(), config_.client_id);
    }

    char error_buffer[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, collectBody);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(config_.timeout.count()));
    // IMDS must not be reached through a proxy
    curl_easy_setopt(curl.get(), CURLOPT_NOPROXY, "*");

    auto res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
      return std::unexpected(std::format("Identity endpoint unreachable: {}",
        error_buffer[0] ? error_buffer : curl_easy_strerror(res)));
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
  } catch (const std::runtime_error& e) {
    return std::unexpected(std::string(e.what()));
  }

  if (http_code != 200) {
    return std::unexpected(std::format("Identity endpoint returned HTTP {}: {}", http_code, body.substr(0, 512)));
  }
  return parseTokenResponse(body);
}

std::expected<AccessToken, std::string> ManagedIdentityCredential::parseTokenResponse(const std::string& body) {
  auto json = nlohmann::json::parse(body, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    return std::unexpected<std::string>("Identity endpoint returned malformed JSON");
  }

  auto token = json.find("access_token");
  if (token == json.end() || !token->is_string() || token->get_ref<const std::string&>().empty()) {
    return std::unexpected<std::string>("Identity response has no access_token");
  }

  AccessToken result;
  result.token = token->get<std::string>();
  result.expires_on = std::chrono::system_clock::now();
  if (auto expires_on = json.find("expires_on"); expires_on != json.end()) {
    if (auto epoch = parseEpoch(*expires_on)) {
      result.expires_on = std::chrono::system_clock::time_point(std::chrono::seconds(*epoch));
    }
  } else if (auto expires_in = json.find("expires_in"); expires_in != json.end()) {
    if (auto seconds = parseEpoch(*expires_in)) {
      result.expires_on += std::chrono::seconds(*seconds);
    }
  }

  common::Logger::debug(std::format("Acquired storage token valid for {}s",
    std::chrono::duration_cast<std::chrono::seconds>(result.expires_on - std::chrono::system_clock::now()).count()));
  return result;
}

} // namespace relay_service

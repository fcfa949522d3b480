#include "blob_client.hpp"
#include "common/logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <format>
#include <fstream>

namespace relay_service {

namespace {

constexpr size_t kMaxErrorBody = 4096;

bool isSuccess(long status) {
  return status >= 200 && status < 300;
}

std::string httpDate() {
  auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
  return std::format("{:%a, %d %b %Y %H:%M:%S} GMT", now);
}

std::string trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
  return std::string(text);
}

} // namespace

BlobClient::BlobClient(config::StorageConfig config) : config_(std::move(config)) {
  initCurlOnce();
}

std::string BlobClient::blobUrl(const StorageLocator& locator) const {
  std::string endpoint = config_.endpoint_template;
  static constexpr std::string_view placeholder = "{account}";
  if (auto pos = endpoint.find(placeholder); pos != std::string::npos) {
    endpoint.replace(pos, placeholder.size(), locator.account);
  }
  while (!endpoint.empty() && endpoint.back() == '/') {
    endpoint.pop_back();
  }
  return endpoint + "/" + locator.container + "/" + locator.object_path;
}

std::expected<void, TransferError> BlobClient::download(
  const StorageLocator& locator,
  const AccessToken& credential,
  const std::filesystem::path& destination
) {
  std::ofstream file(destination, std::ios::binary | std::ios::trunc);
  if (!file) {
    return std::unexpected(TransferError{TransferError::Kind::Transport,
      "Failed to open output file " + destination.string()});
  }

  const auto url = blobUrl(locator);
  common::Logger::info("Accessing blob at: " + url);

  try {
    auto curl = makeCurlEasy();
    auto headers = commonHeaders(credential);
    char error_buffer[CURL_ERROR_SIZE] = {0};

    Exchange exchange;
    exchange.curl = curl.get();
    exchange.sink = &file;
    applyCommonOptions(curl.get(), exchange, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

    auto res = curl_easy_perform(curl.get());
    if (auto result = classify(res, exchange, error_buffer); !result) {
      return result;
    }
  } catch (const std::runtime_error& e) {
    return std::unexpected(TransferError{TransferError::Kind::Transport, e.what()});
  }

  file.close();
  if (!file) {
    return std::unexpected(TransferError{TransferError::Kind::Transport,
      "Failed to write " + destination.string()});
  }
  return {};
}

std::expected<void, TransferError> BlobClient::upload(
  const StorageLocator& locator,
  const AccessToken& credential,
  const std::filesystem::path& source
) {
  std::error_code ec;
  auto size = std::filesystem::file_size(source, ec);
  if (ec) {
    return std::unexpected(TransferError{TransferError::Kind::Transport,
      std::format("Cannot read {}: {}", source.string(), ec.message())});
  }
  std::ifstream file(source, std::ios::binary);
  if (!file) {
    return std::unexpected(TransferError{TransferError::Kind::Transport,
      "Failed to open " + source.string()});
  }

  const auto url = blobUrl(locator);
  common::Logger::info(std::format("Uploading {} bytes to: {}", size, url));

  try {
    auto curl = makeCurlEasy();
    auto headers = commonHeaders(credential);
    appendHeader(headers, "x-ms-blob-type: BlockBlob");
    appendHeader(headers, "Content-Type: application/octet-stream");
    // Storage never answers 100-continue
    appendHeader(headers, "Expect:");
    char error_buffer[CURL_ERROR_SIZE] = {0};

    Exchange exchange;
    exchange.curl = curl.get();
    exchange.source = &file;
    applyCommonOptions(curl.get(), exchange, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, readCallback);
    curl_easy_setopt(curl.get(), CURLOPT_READDATA, &exchange);
    curl_easy_setopt(curl.get(), CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(size));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

    auto res = curl_easy_perform(curl.get());
    return classify(res, exchange, error_buffer);
  } catch (const std::runtime_error& e) {
    return std::unexpected(TransferError{TransferError::Kind::Transport, e.what()});
  }
}

CurlSlistPtr BlobClient::commonHeaders(const AccessToken& credential) const {
  CurlSlistPtr headers;
  appendHeader(headers, "Authorization: Bearer " + credential.token);
  appendHeader(headers, "x-ms-version: " + config_.api_version);
  appendHeader(headers, "x-ms-date: " + httpDate());
  return headers;
}

void BlobClient::applyCommonOptions(CURL* curl, Exchange& exchange, char* error_buffer) const {
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &exchange);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &exchange);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(config_.connect_timeout.count()));
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(config_.transfer_timeout.count()));
}

std::expected<void, TransferError> BlobClient::classify(CURLcode res, const Exchange& exchange,
                                                        const char* error_buffer) const {
  if (res != CURLE_OK) {
    std::string detail = error_buffer[0] ? error_buffer : curl_easy_strerror(res);
    return std::unexpected(TransferError{TransferError::Kind::Transport, detail});
  }

  long http_code = 0;
  curl_easy_getinfo(exchange.curl, CURLINFO_RESPONSE_CODE, &http_code);
  if (isSuccess(http_code)) {
    return {};
  }

  std::string message = "HTTP error: " + std::to_string(http_code);
  if (!exchange.error_code.empty()) {
    message += " (" + exchange.error_code + ")";
  }
  if (!exchange.error_body.empty()) {
    message += ": " + trim(exchange.error_body);
  }

  auto kind = TransferError::Kind::Transport;
  if (http_code == 404) {
    kind = TransferError::Kind::NotFound;
  } else if (http_code == 401 || http_code == 403) {
    kind = TransferError::Kind::Auth;
  }
  return std::unexpected(TransferError{kind, message});
}

size_t BlobClient::writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* exchange = static_cast<Exchange*>(userdata);
  const size_t bytes = size * nmemb;

  long http_code = 0;
  curl_easy_getinfo(exchange->curl, CURLINFO_RESPONSE_CODE, &http_code);
  if (!isSuccess(http_code) || !exchange->sink) {
    auto room = kMaxErrorBody - std::min(kMaxErrorBody, exchange->error_body.size());
    exchange->error_body.append(ptr, std::min(room, bytes));
    return bytes;
  }

  exchange->sink->write(ptr, static_cast<std::streamsize>(bytes));
  return exchange->sink->good() ? bytes : 0;
}

size_t BlobClient::readCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
  auto* exchange = static_cast<Exchange*>(userdata);
  exchange->source->read(buffer, static_cast<std::streamsize>(size * nitems));
  if (exchange->source->bad()) {
    return CURL_READFUNC_ABORT;
  }
  return static_cast<size_t>(exchange->source->gcount());
}

size_t BlobClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
  auto* exchange = static_cast<Exchange*>(userdata);
  const size_t bytes = size * nitems;
  std::string_view line(buffer, bytes);

  static constexpr std::string_view name = "x-ms-error-code:";
  if (line.size() > name.size()) {
    std::string prefix(line.substr(0, name.size()));
    std::transform(prefix.begin(), prefix.end(), prefix.begin(),
      [](unsigned char c) { return std::tolower(c); });
    if (prefix == name) {
      exchange->error_code = trim(line.substr(name.size()));
    }
  }
  return bytes;
}

} // namespace relay_service

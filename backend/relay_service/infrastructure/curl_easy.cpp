#include "curl_easy.hpp"
#include <mutex>
#include <stdexcept>

namespace relay_service {

void initCurlOnce() {
  static std::once_flag flag;
  std::call_once(flag, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("Failed to initialize CURL");
    }
  });
}

CurlEasyPtr makeCurlEasy() {
  initCurlOnce();
  CurlEasyPtr curl(curl_easy_init());
  if (!curl) {
    throw std::runtime_error("Failed to initialize CURL");
  }
  return curl;
}

void appendHeader(CurlSlistPtr& list, const std::string& header) {
  auto* appended = curl_slist_append(list.get(), header.c_str());
  if (!appended) {
    throw std::runtime_error("Failed to append HTTP header");
  }
  list.release();
  list.reset(appended);
}

std::string urlEscape(CURL* curl, const std::string& value) {
  char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
  if (!escaped) {
    throw std::runtime_error("Failed to escape URL component");
  }
  std::string result(escaped);
  curl_free(escaped);
  return result;
}

} // namespace relay_service

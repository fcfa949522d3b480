#pragma once
#include <memory>
#include <string>
#include <curl/curl.h>

namespace relay_service {

struct CurlEasyDeleter {
  void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};
using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;

struct CurlSlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

// curl_global_init is not thread-safe; every client goes through this once.
void initCurlOnce();

// Throws std::runtime_error if libcurl cannot allocate a handle.
CurlEasyPtr makeCurlEasy();

void appendHeader(CurlSlistPtr& list, const std::string& header);

std::string urlEscape(CURL* curl, const std::string& value);

} // namespace relay_service

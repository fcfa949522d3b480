#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include "common/logging/logger.hpp"

namespace beast = boost::beast;
namespace http = beast::http;

namespace common {

class RestApiHandlerBase {
public:
  using QueryParams = std::map<std::string, std::string>;

  virtual ~RestApiHandlerBase() = default;

  template<class Body, class Allocator>
  http::response<http::string_body> handleRequest(
    http::request<Body, http::basic_fields<Allocator>>&& req) {
    
    auto addCorsHeaders = [](auto& res) {
      res.set(http::field::access_control_allow_origin, "*");
      res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
      res.set(http::field::access_control_allow_headers, "Content-Type, Authorization");
    };

    if (req.method() == http::verb::options) {
      http::response<http::string_body> res{http::status::ok, req.version()};
      addCorsHeaders(res);
      res.prepare_payload();
      return res;
    }

    const bool keep_alive = req.keep_alive();
    try {
      auto response = doHandleRequest(std::move(req));
      addCorsHeaders(response);
      response.keep_alive(keep_alive);
      return response;
    } catch (const std::exception& e) {
      Logger::error(std::string("Unhandled error while serving request: ") + e.what());
      auto response = createErrorResponse(http::status::internal_server_error, 
                                        "Internal server error: " + std::string(e.what()));
      addCorsHeaders(response);
      response.keep_alive(keep_alive);
      return response;
    }
  }

  // Splits "/path?query" into its path and raw query parts.
  static std::pair<std::string, std::string> splitTarget(std::string_view target);

  // Decodes an application/x-www-form-urlencoded query string. Later
  // duplicates of a key are ignored.
  static QueryParams parseQueryString(std::string_view query);

protected:
  virtual http::response<http::string_body> doHandleRequest(
    http::request<http::string_body, http::basic_fields<std::allocator<char>>>&& req) = 0;

  http::response<http::string_body> createTextResponse(
    http::status status, const std::string& message);
  
  http::response<http::string_body> createErrorResponse(
    http::status status, const std::string& message);
  
  // Returns std::nullopt for an empty body or one that is not valid JSON.
  std::optional<nlohmann::json> parseRequestBody(const std::string& body);
};

}

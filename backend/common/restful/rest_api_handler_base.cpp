#include "rest_api_handler_base.hpp"

namespace common {

namespace {

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string percentDecode(std::string_view encoded) {
  std::string decoded;
  decoded.reserve(encoded.size());
  for (size_t i = 0; i < encoded.size(); ++i) {
    char c = encoded[i];
    if (c == '+') {
      decoded.push_back(' ');
    } else if (c == '%' && i + 2 < encoded.size()
               && hexValue(encoded[i + 1]) >= 0 && hexValue(encoded[i + 2]) >= 0) {
      decoded.push_back(static_cast<char>(hexValue(encoded[i + 1]) * 16 + hexValue(encoded[i + 2])));
      i += 2;
    } else {
      decoded.push_back(c);
    }
  }
  return decoded;
}

} // namespace

http::response<http::string_body> RestApiHandlerBase::createTextResponse(
  http::status status, const std::string& message) {
  
  http::response<http::string_body> res{status, 11};
  res.set(http::field::content_type, "text/plain; charset=utf-8");
  res.body() = message;
  res.prepare_payload();
  return res;
}

http::response<http::string_body> RestApiHandlerBase::createErrorResponse(
  http::status status, const std::string& message) {
  return createTextResponse(status, message);
}

std::optional<nlohmann::json> RestApiHandlerBase::parseRequestBody(const std::string& body) {
  if (body.empty()) {
    return std::nullopt;
  }
  auto json = nlohmann::json::parse(body, nullptr, false);
  if (json.is_discarded()) {
    Logger::debug("Request body is not valid JSON");
    return std::nullopt;
  }
  return json;
}

std::pair<std::string, std::string> RestApiHandlerBase::splitTarget(std::string_view target) {
  auto fragment = target.find('#');
  if (fragment != std::string_view::npos) {
    target = target.substr(0, fragment);
  }
  auto question = target.find('?');
  if (question == std::string_view::npos) {
    return {std::string(target), {}};
  }
  return {std::string(target.substr(0, question)), std::string(target.substr(question + 1))};
}

RestApiHandlerBase::QueryParams RestApiHandlerBase::parseQueryString(std::string_view query) {
  QueryParams params;
  while (!query.empty()) {
    auto amp = query.find('&');
    auto pair = query.substr(0, amp);
    query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
    if (pair.empty()) {
      continue;
    }
    auto eq = pair.find('=');
    auto key = percentDecode(pair.substr(0, eq));
    auto value = eq == std::string_view::npos ? std::string{} : percentDecode(pair.substr(eq + 1));
    params.emplace(std::move(key), std::move(value));
  }
  return params;
}

}

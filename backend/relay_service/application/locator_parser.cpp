#include "locator_parser.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace relay_service {

namespace {

struct UrlParts {
  std::string host;
  std::vector<std::string> segments;
};

std::expected<UrlParts, std::string> splitUrl(std::string_view url) {
  auto scheme_end = url.find("://");
  if (scheme_end == std::string_view::npos) {
    return std::unexpected("URL has no scheme: " + std::string(url));
  }
  auto rest = url.substr(scheme_end + 3);

  auto authority_end = rest.find_first_of("/?#");
  auto authority = rest.substr(0, authority_end);
  auto path = authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);
  if (auto query = path.find_first_of("?#"); query != std::string_view::npos) {
    path = path.substr(0, query);
  }

  if (auto at = authority.rfind('@'); at != std::string_view::npos) {
    authority = authority.substr(at + 1);
  }
  if (auto colon = authority.find(':'); colon != std::string_view::npos) {
    authority = authority.substr(0, colon);
  }
  if (authority.empty()) {
    return std::unexpected("URL has no host: " + std::string(url));
  }

  UrlParts parts;
  parts.host.assign(authority);
  std::transform(parts.host.begin(), parts.host.end(), parts.host.begin(),
    [](unsigned char c) { return std::tolower(c); });

  while (!path.empty()) {
    auto slash = path.find('/');
    auto segment = path.substr(0, slash);
    if (!segment.empty()) {
      parts.segments.emplace_back(segment);
    }
    if (slash == std::string_view::npos) {
      break;
    }
    path = path.substr(slash + 1);
  }
  return parts;
}

std::string accountOf(const std::string& host) {
  return host.substr(0, host.find('.'));
}

} // namespace

std::expected<StorageLocator, std::string> parseObjectLocator(std::string_view url) {
  auto parts = splitUrl(url);
  if (!parts) {
    return std::unexpected(parts.error());
  }
  if (parts->segments.size() < 2) {
    return std::unexpected<std::string>("URL must include container name and blob path");
  }

  StorageLocator locator;
  locator.account = accountOf(parts->host);
  locator.container = parts->segments.front();
  for (size_t i = 1; i < parts->segments.size(); ++i) {
    if (i > 1) {
      locator.object_path += '/';
    }
    locator.object_path += parts->segments[i];
  }
  return locator;
}

std::expected<StorageLocator, std::string> parseContainerLocator(std::string_view url) {
  auto parts = splitUrl(url);
  if (!parts) {
    return std::unexpected(parts.error());
  }
  if (parts->segments.empty()) {
    return std::unexpected<std::string>("URL must include a container name");
  }
  return StorageLocator{accountOf(parts->host), parts->segments.front(), ""};
}

} // namespace relay_service

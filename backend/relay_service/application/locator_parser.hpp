#pragma once
#include <expected>
#include <string>
#include <string_view>
#include "domain/storage_locator.hpp"

namespace relay_service {

// https://{account}.{domain}/{container}/{object/path}
// The account is the first label of the host, lower-cased. Fails unless the
// path names both a container and an object.
std::expected<StorageLocator, std::string> parseObjectLocator(std::string_view url);

// Same as parseObjectLocator but only the container segment is required; any
// object path in the URL is dropped.
std::expected<StorageLocator, std::string> parseContainerLocator(std::string_view url);

} // namespace relay_service

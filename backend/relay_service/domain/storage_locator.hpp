#pragma once
#include <string>

namespace relay_service {

// Identifies a blob (or, with an empty object_path, a container) in a
// storage account.
struct StorageLocator {
  std::string account;
  std::string container;
  std::string object_path;
};

} // namespace relay_service

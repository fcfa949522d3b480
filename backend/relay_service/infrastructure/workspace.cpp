#include "workspace.hpp"
#include "common/logging/logger.hpp"
#include <format>
#include <system_error>
#include <uuid/uuid.h>

namespace relay_service {

namespace {

std::string newDirectoryName() {
  uuid_t uuid;
  uuid_generate_random(uuid);
  char uuid_str[37];
  uuid_unparse_lower(uuid, uuid_str);
  return std::string("relay-") + uuid_str;
}

} // namespace

std::expected<Workspace, std::string> Workspace::create(
  const std::filesystem::path& base_dir,
  const std::string& output_slot
) {
  auto slot = std::filesystem::path(output_slot).filename().string();
  if (slot.empty() || slot == kInputSlot) {
    slot = kDefaultOutputSlot;
  }

  std::error_code ec;
  std::filesystem::create_directories(base_dir, ec);
  if (ec) {
    return std::unexpected(std::format("Failed to create {}: {}", base_dir.string(), ec.message()));
  }

  auto path = base_dir / newDirectoryName();
  // create_directory reports false for an existing directory: never share one
  if (!std::filesystem::create_directory(path, ec)) {
    return std::unexpected(std::format("Failed to create working directory {}: {}",
      path.string(), ec ? ec.message() : std::string("already exists")));
  }

  std::filesystem::permissions(path, std::filesystem::perms::owner_all,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    common::Logger::warn(std::format("Could not restrict permissions of {}: {}", path.string(), ec.message()));
  }

  return Workspace(std::move(path), std::move(slot));
}

Workspace::Workspace(std::filesystem::path path, std::string output_slot)
  : path_(std::move(path)), output_slot_(std::move(output_slot)) {}

Workspace::Workspace(Workspace&& other) noexcept
  : path_(std::move(other.path_)), output_slot_(std::move(other.output_slot_)) {
  other.path_.clear();
}

Workspace& Workspace::operator=(Workspace&& other) noexcept {
  if (this != &other) {
    release();
    path_ = std::move(other.path_);
    output_slot_ = std::move(other.output_slot_);
    other.path_.clear();
  }
  return *this;
}

Workspace::~Workspace() {
  release();
}

void Workspace::release() {
  if (path_.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  if (ec) {
    common::Logger::warn(std::format("Failed to clean up temporary directory {}: {}", path_.string(), ec.message()));
  } else {
    common::Logger::info("Cleaned up temporary directory: " + path_.string());
  }
  path_.clear();
}

} // namespace relay_service

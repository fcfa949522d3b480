#include "binary_resolver.hpp"
#include <boost/process/search_path.hpp>
#include <format>
#include <system_error>

namespace relay_service {

BinaryResolver::BinaryResolver(std::vector<std::filesystem::path> candidates)
  : fixed_candidates_(std::move(candidates)) {}

BinaryResolver::BinaryResolver(std::string binary_name, std::string deployment_dir)
  : binary_name_(std::move(binary_name)), deployment_dir_(std::move(deployment_dir)) {}

BinaryResolver BinaryResolver::withDefaultCandidates(const std::string& binary_name,
                                                     const std::string& deployment_dir) {
  return BinaryResolver(binary_name, deployment_dir);
}

std::vector<std::filesystem::path> BinaryResolver::candidates() const {
  return binary_name_.empty() ? fixed_candidates_ : defaultCandidates();
}

std::vector<std::filesystem::path> BinaryResolver::defaultCandidates() const {
  std::vector<std::filesystem::path> candidates;

  std::error_code ec;
  auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / "bin" / binary_name_);
  }
  if (!deployment_dir_.empty()) {
    candidates.push_back(std::filesystem::path(deployment_dir_) / binary_name_);
  }
  // search_path returns an empty path when nothing on PATH matches
  auto on_path = boost::process::search_path(binary_name_);
  if (!on_path.empty()) {
    candidates.emplace_back(on_path.string());
  }
  candidates.push_back(std::filesystem::path("/usr/bin") / binary_name_);
  candidates.push_back(std::filesystem::path("/usr/local/bin") / binary_name_);
  return candidates;
}

std::expected<std::filesystem::path, std::string> BinaryResolver::resolve() const {
  const auto tried = candidates();
  for (const auto& candidate : tried) {
    std::error_code ec;
    auto status = std::filesystem::status(candidate, ec);
    if (ec || !std::filesystem::exists(status) || std::filesystem::is_directory(status)) {
      continue;
    }
    return candidate;
  }

  std::string listed;
  for (const auto& candidate : tried) {
    listed += (listed.empty() ? "" : ", ") + candidate.string();
  }
  return std::unexpected(std::format("Transcoder binary not found (tried: {})", listed));
}

} // namespace relay_service

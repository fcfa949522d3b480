#pragma once
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace relay_service {

class BinaryResolver {
public:
  explicit BinaryResolver(std::vector<std::filesystem::path> candidates);

  // <cwd>/bin/<name>, <deployment_dir>/<name>, PATH lookup, /usr/bin/<name>,
  // /usr/local/bin/<name>, in that order. The working directory and PATH are
  // read again on every resolve().
  static BinaryResolver withDefaultCandidates(const std::string& binary_name,
                                              const std::string& deployment_dir);

  std::expected<std::filesystem::path, std::string> resolve() const;

  std::vector<std::filesystem::path> candidates() const;

private:
  BinaryResolver(std::string binary_name, std::string deployment_dir);

  std::vector<std::filesystem::path> defaultCandidates() const;

  std::vector<std::filesystem::path> fixed_candidates_;
  std::string binary_name_;
  std::string deployment_dir_;
};

} // namespace relay_service

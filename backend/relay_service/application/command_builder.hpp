#pragma once
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace relay_service {

// POSIX shell word splitting without expansion: quotes group and are removed,
// backslash escapes outside single quotes. Fails on an unterminated quote or
// a trailing backslash.
std::expected<std::vector<std::string>, std::string> splitShellWords(std::string_view text);

// [binary, "-i", input, <instruction words>..., output]
std::expected<std::vector<std::string>, std::string> buildTranscodeCommand(
  const std::string& binary_path,
  const std::string& input_path,
  std::string_view instruction,
  const std::string& output_path
);

} // namespace relay_service

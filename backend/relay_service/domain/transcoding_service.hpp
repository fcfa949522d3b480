#pragma once
#include <expected>
#include <string>
#include <vector>

namespace relay_service {

struct ProcessResult {
  int exit_code{0};
  std::string std_out;
  std::string std_err;
};

class TranscodingService {
public:
  virtual ~TranscodingService() = default;

  // command[0] is the executable, the rest are its arguments. An unexpected
  // result means the process could not be launched or did not finish in time.
  virtual std::expected<ProcessResult, std::string> run(
    const std::vector<std::string>& command
  ) = 0;
};

} // namespace relay_service

// subprocess_transcoder.hpp
#pragma once

#include "domain/transcoding_service.hpp"

#include <chrono>
#include <expected>
#include <string>
#include <vector>

namespace relay_service {

// Runs the transcoder as a child process without a shell. stdin is closed,
// stdout and stderr are captured. A child still running when the timeout
// expires is killed.
class SubprocessTranscoder : public TranscodingService {
public:
  explicit SubprocessTranscoder(std::chrono::milliseconds timeout);

  std::expected<ProcessResult, std::string> run(
    const std::vector<std::string>& command
  ) override;

private:
  std::chrono::milliseconds timeout_;
};

} // namespace relay_service

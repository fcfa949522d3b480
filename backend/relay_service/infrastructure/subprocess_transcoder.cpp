// subprocess_transcoder.cpp
#include "subprocess_transcoder.hpp"
#include "common/logging/logger.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>
#include <format>
#include <future>
#include <system_error>

namespace bp = boost::process;

namespace relay_service {

SubprocessTranscoder::SubprocessTranscoder(std::chrono::milliseconds timeout)
    : timeout_(timeout) {}

std::expected<ProcessResult, std::string> SubprocessTranscoder::run(
    const std::vector<std::string>& command) {
  if (command.empty()) {
    return std::unexpected<std::string>("Empty transcoder command");
  }

  boost::asio::io_context ioc;
  std::future<std::string> out;
  std::future<std::string> err;
  std::error_code ec;

  bp::child child(bp::exe = command.front(),
                  bp::args = std::vector<std::string>(command.begin() + 1, command.end()),
                  bp::std_in.close(),
                  bp::std_out > out,
                  bp::std_err > err,
                  ioc,
                  ec);
  if (ec) {
    return std::unexpected(std::format("Failed to launch {}: {}", command.front(), ec.message()));
  }

  // Runs until both pipes are closed by the child, or until the deadline.
  ioc.run_for(timeout_);

  if (!ioc.stopped()) {
    common::Logger::error(std::format("Transcoder exceeded {} ms, terminating pid {}",
                                      timeout_.count(), child.id()));
    child.terminate(ec);
    if (ec) {
      common::Logger::error("Failed to terminate transcoder: " + ec.message());
    }
    // Pending pipe reads are dropped with the io_context; a grandchild still
    // holding the pipes open must not block the request.
    return std::unexpected(std::format("Transcoder timed out after {:g} seconds",
      std::chrono::duration<double>(timeout_).count()));
  }

  child.wait(ec);
  if (ec) {
    return std::unexpected("Failed waiting for transcoder: " + ec.message());
  }

  ProcessResult result;
  result.exit_code = child.exit_code();
  try {
    result.std_out = out.get();
    result.std_err = err.get();
  } catch (const std::exception& e) {
    return std::unexpected(std::string("Failed reading transcoder output: ") + e.what());
  }
  return result;
}

} // namespace relay_service

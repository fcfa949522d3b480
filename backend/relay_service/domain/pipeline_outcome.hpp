#pragma once
#include <expected>
#include <string>
#include <string_view>

namespace relay_service {

enum class ErrorKind {
  Validation,
  Workspace,
  LocatorFormat,
  SourceNotFound,
  Credential,
  Transfer,
  BinaryMissing,
  ProcessExecution,
  PostProcessLocator,
  Upload
};

constexpr unsigned int httpStatusFor(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Validation:
    case ErrorKind::LocatorFormat:
      return 400;
    case ErrorKind::SourceNotFound:
      return 404;
    default:
      return 500;
  }
}

constexpr std::string_view toString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Validation: return "ValidationError";
    case ErrorKind::Workspace: return "WorkspaceError";
    case ErrorKind::LocatorFormat: return "LocatorFormatError";
    case ErrorKind::SourceNotFound: return "SourceNotFoundError";
    case ErrorKind::Credential: return "CredentialError";
    case ErrorKind::Transfer: return "TransferError";
    case ErrorKind::BinaryMissing: return "BinaryMissingError";
    case ErrorKind::ProcessExecution: return "ProcessExecutionError";
    case ErrorKind::PostProcessLocator: return "PostProcessLocatorError";
    case ErrorKind::Upload: return "UploadError";
  }
  return "UnknownError";
}

struct PipelineError {
  ErrorKind kind;
  std::string message;
  unsigned int httpStatus() const { return httpStatusFor(kind); }
};

// Success carries the message returned to the caller.
using Outcome = std::expected<std::string, PipelineError>;

} // namespace relay_service

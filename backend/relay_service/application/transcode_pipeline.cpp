#include "transcode_pipeline.hpp"
#include "application/command_builder.hpp"
#include "application/locator_parser.hpp"
#include "common/logging/logger.hpp"
#include "infrastructure/workspace.hpp"
#include <format>

namespace relay_service {

namespace {

constexpr const char* kMissingFieldsMessage =
  "Please pass sourceObjectUrl, destinationContainerUrl, and transformInstruction in the request body";
constexpr const char* kUploadFailedPrefix = "Video processing completed but upload failed: ";

std::unexpected<PipelineError> fail(ErrorKind kind, std::string message) {
  common::Logger::error(std::format("{}: {}", toString(kind), message));
  return std::unexpected(PipelineError{kind, std::move(message)});
}

std::string joinCommand(const std::vector<std::string>& command) {
  std::string joined;
  for (const auto& part : command) {
    if (!joined.empty()) {
      joined += ' ';
    }
    joined += part;
  }
  return joined;
}

} // namespace

TranscodePipeline::TranscodePipeline(std::shared_ptr<BlobTransferService> transfer_service,
                                     std::shared_ptr<CredentialProvider> credential_provider,
                                     std::shared_ptr<TranscodingService> transcoding_service,
                                     BinaryResolver binary_resolver,
                                     PipelineOptions options)
  : transfer_service_(transfer_service),
    credential_provider_(credential_provider),
    transcoding_service_(transcoding_service),
    binary_resolver_(std::move(binary_resolver)),
    options_(std::move(options)) {}

Outcome TranscodePipeline::run(const TranscodeRequest& request) {
  if (request.source_object_url.empty() || request.destination_container_url.empty()
      || request.transform_instruction.empty()) {
    return fail(ErrorKind::Validation, kMissingFieldsMessage);
  }

  // Removed on every return path below.
  auto workspace = Workspace::create(options_.work_dir, options_.output_object_name);
  if (!workspace) {
    return fail(ErrorKind::Workspace, "Failed to create temporary directory: " + workspace.error());
  }

  common::Logger::info("Input URL: " + request.source_object_url);
  common::Logger::info("Output container: " + request.destination_container_url);
  common::Logger::info("Command: " + request.transform_instruction);
  common::Logger::info("Temp directory: " + workspace->path().string());

  auto source = parseObjectLocator(request.source_object_url);
  if (!source) {
    return fail(ErrorKind::LocatorFormat,
      "Invalid blob URL format. URL must include container name and blob path. (" + source.error() + ")");
  }
  common::Logger::info("Storage account name: " + source->account);

  auto credential = credential_provider_->acquire();
  if (!credential) {
    return fail(ErrorKind::Credential, "Failed to initialize storage credential: " + credential.error());
  }

  if (auto downloaded = transfer_service_->download(*source, *credential, workspace->inputPath()); !downloaded) {
    const auto& error = downloaded.error();
    if (error.kind == TransferError::Kind::NotFound) {
      return fail(ErrorKind::SourceNotFound,
        std::format("Input blob not found at {}/{}", source->container, source->object_path));
    }
    return fail(ErrorKind::Transfer, "Error downloading input file: " + error.message);
  }
  common::Logger::info(std::format("Successfully downloaded blob from {}/{}", source->container, source->object_path));

  auto binary = binary_resolver_.resolve();
  if (!binary) {
    return fail(ErrorKind::BinaryMissing, binary.error());
  }
  common::Logger::info("Using transcoder at: " + binary->string());

  auto command = buildTranscodeCommand(binary->string(), workspace->inputPath().string(),
                                       request.transform_instruction, workspace->outputPath().string());
  if (!command) {
    return fail(ErrorKind::ProcessExecution, "Error executing transcoder: " + command.error());
  }
  common::Logger::info("Executing command: " + joinCommand(*command));

  auto process = transcoding_service_->run(*command);
  if (!process) {
    return fail(ErrorKind::ProcessExecution, "Error executing transcoder: " + process.error());
  }
  if (process->exit_code != 0) {
    return fail(ErrorKind::ProcessExecution,
      std::format("Transcoder error (exit code {}): {}", process->exit_code, process->std_err));
  }
  common::Logger::info("Transcoder command executed successfully");

  auto destination = parseContainerLocator(request.destination_container_url);
  if (!destination) {
    return fail(ErrorKind::PostProcessLocator, kUploadFailedPrefix + destination.error());
  }
  destination->object_path = options_.output_object_name;
  common::Logger::info(std::format("Output account: {}, container: {}", destination->account, destination->container));

  if (auto uploaded = transfer_service_->upload(*destination, *credential, workspace->outputPath()); !uploaded) {
    return fail(ErrorKind::Upload, kUploadFailedPrefix + uploaded.error().message);
  }
  common::Logger::info(std::format("Successfully uploaded result to {}/{}", destination->container, destination->object_path));

  return "Video processed successfully";
}

} // namespace relay_service

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include "domain/blob_transfer_service.hpp"
#include "domain/credential_provider.hpp"
#include "domain/pipeline_outcome.hpp"
#include "domain/transcode_request.hpp"
#include "domain/transcoding_service.hpp"
#include "infrastructure/binary_resolver.hpp"

namespace relay_service {

struct PipelineOptions {
  std::filesystem::path work_dir;
  // Every result is written under this name in the destination container.
  std::string output_object_name{"output.mp4"};
};

// fetch -> transcode -> publish for a single request. Holds no per-request
// state, so one instance serves concurrent requests.
class TranscodePipeline {
public:
  TranscodePipeline(std::shared_ptr<BlobTransferService> transfer_service,
                    std::shared_ptr<CredentialProvider> credential_provider,
                    std::shared_ptr<TranscodingService> transcoding_service,
                    BinaryResolver binary_resolver,
                    PipelineOptions options);

  Outcome run(const TranscodeRequest& request);

private:
  std::shared_ptr<BlobTransferService> transfer_service_;
  std::shared_ptr<CredentialProvider> credential_provider_;
  std::shared_ptr<TranscodingService> transcoding_service_;
  BinaryResolver binary_resolver_;
  PipelineOptions options_;
};

} // namespace relay_service

#pragma once
#include "application/transcode_pipeline.hpp"
#include "common/restful/rest_api_handler_base.hpp"
#include <memory>
#include <nlohmann/json.hpp>

namespace relay_service {

class RestApiHandler : public common::RestApiHandlerBase {
public:
  static constexpr const char* kTranscodeRoute = "/api/transcode";

  explicit RestApiHandler(std::shared_ptr<TranscodePipeline> pipeline);

  // Fields come from a non-empty JSON object body; otherwise from the query
  // string. The legacy names inputBlobUrl, outputContainerName and
  // ffmpegCommand are accepted as well.
  static TranscodeRequest extractRequest(const std::optional<nlohmann::json>& body,
                                         const QueryParams& query);

protected:
  http::response<http::string_body> doHandleRequest(
      http::request<http::string_body,
                    http::basic_fields<std::allocator<char>>> &&req) override;

private:
  std::shared_ptr<TranscodePipeline> pipeline_;

  http::response<http::string_body> handleTranscode(const TranscodeRequest& request);
};

} // namespace relay_service

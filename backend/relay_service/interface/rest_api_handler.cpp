#include "rest_api_handler.hpp"
#include <string_view>

namespace relay_service {

namespace {

struct FieldNames {
  const char* name;
  const char* legacy_name;
};

constexpr FieldNames kSourceField{"sourceObjectUrl", "inputBlobUrl"};
constexpr FieldNames kDestinationField{"destinationContainerUrl", "outputContainerName"};
constexpr FieldNames kInstructionField{"transformInstruction", "ffmpegCommand"};

std::string fieldFromJson(const nlohmann::json& body, const FieldNames& field) {
  for (const char* key : {field.name, field.legacy_name}) {
    auto it = body.find(key);
    if (it != body.end() && it->is_string()) {
      return it->get<std::string>();
    }
  }
  return {};
}

std::string fieldFromQuery(const common::RestApiHandlerBase::QueryParams& query, const FieldNames& field) {
  for (const char* key : {field.name, field.legacy_name}) {
    if (auto it = query.find(key); it != query.end()) {
      return it->second;
    }
  }
  return {};
}

} // namespace

RestApiHandler::RestApiHandler(std::shared_ptr<TranscodePipeline> pipeline)
    : pipeline_(pipeline) {}

http::response<http::string_body> RestApiHandler::doHandleRequest(
    http::request<http::string_body,
                  http::basic_fields<std::allocator<char>>> &&req) {
  auto [path, query] = splitTarget(std::string_view(req.target().data(), req.target().size()));

  if (path != kTranscodeRoute) {
    return createErrorResponse(http::status::not_found, "Endpoint not found");
  }
  if (req.method() != http::verb::post && req.method() != http::verb::get) {
    return createErrorResponse(http::status::method_not_allowed, "Method not allowed");
  }

  common::Logger::info("Processing HTTP request.");
  auto body = parseRequestBody(req.body());
  return handleTranscode(extractRequest(body, parseQueryString(query)));
}

TranscodeRequest RestApiHandler::extractRequest(const std::optional<nlohmann::json>& body,
                                                const QueryParams& query) {
  TranscodeRequest request;
  if (body && body->is_object() && !body->empty()) {
    request.source_object_url = fieldFromJson(*body, kSourceField);
    request.destination_container_url = fieldFromJson(*body, kDestinationField);
    request.transform_instruction = fieldFromJson(*body, kInstructionField);
  } else {
    request.source_object_url = fieldFromQuery(query, kSourceField);
    request.destination_container_url = fieldFromQuery(query, kDestinationField);
    request.transform_instruction = fieldFromQuery(query, kInstructionField);
  }
  return request;
}

http::response<http::string_body>
RestApiHandler::handleTranscode(const TranscodeRequest& request) {
  auto outcome = pipeline_->run(request);
  if (!outcome) {
    return createErrorResponse(static_cast<http::status>(outcome.error().httpStatus()),
                               outcome.error().message);
  }
  return createTextResponse(http::status::ok, *outcome);
}

} // namespace relay_service

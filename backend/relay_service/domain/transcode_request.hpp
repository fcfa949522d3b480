#pragma once
#include <string>

namespace relay_service {

struct TranscodeRequest {
  std::string source_object_url;
  std::string destination_container_url;
  std::string transform_instruction;
};

} // namespace relay_service

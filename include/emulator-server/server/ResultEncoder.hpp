#pragma once

#include "emulator-server/types.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace emuserver {
namespace server {

/// What a handler hands back to the dispatch loop
struct OperationResult {
  OutputKind kind{OutputKind::Text};
  std::string text;
  nlohmann::json data;
  Artifact artifact;

  static OperationResult from_text(std::string text);
  static OperationResult from_json(nlohmann::json data);
  static OperationResult from_artifact(Artifact artifact);
};

/// Turn a handler result into the response `result` payload.
///
/// Binary artifacts become {"mime_type","encoding":"base64","size","data"};
/// anything over max_artifact_bytes throws ArtifactTooLargeError.
nlohmann::json encode_result(const OperationResult &result,
                             uint64_t max_artifact_bytes);

} // namespace server
} // namespace emuserver

#include "emulator-server/server/ResultEncoder.hpp"
#include "emulator-server/Base64.hpp"
#include "emulator-server/Errors.hpp"

namespace emuserver {
namespace server {

OperationResult OperationResult::from_text(std::string text) {
  OperationResult r;
  r.kind = OutputKind::Text;
  r.text = std::move(text);
  return r;
}

OperationResult OperationResult::from_json(nlohmann::json data) {
  OperationResult r;
  r.kind = OutputKind::Json;
  r.data = std::move(data);
  return r;
}

OperationResult OperationResult::from_artifact(Artifact artifact) {
  OperationResult r;
  r.kind = OutputKind::BinaryArtifact;
  r.artifact = std::move(artifact);
  return r;
}

nlohmann::json encode_result(const OperationResult &result,
                             uint64_t max_artifact_bytes) {
  switch (result.kind) {
  case OutputKind::Text:
    return result.text;
  case OutputKind::Json:
    return result.data;
  case OutputKind::BinaryArtifact: {
    const auto &artifact = result.artifact;
    if (artifact.size() > max_artifact_bytes) {
      throw ArtifactTooLargeError(artifact.size(), max_artifact_bytes);
    }
    nlohmann::json payload;
    if (!artifact.name.empty()) {
      payload["name"] = artifact.name;
    }
    payload["mime_type"] = artifact.mime_type;
    payload["encoding"] = "base64";
    payload["size"] = artifact.size();
    payload["data"] = base64_encode(artifact.bytes);
    return payload;
  }
  }
  throw InternalError("unknown output kind");
}

} // namespace server
} // namespace emuserver

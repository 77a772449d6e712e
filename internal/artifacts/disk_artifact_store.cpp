#include "internal/artifacts/disk_artifact_store.hpp"

#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/uuid.hpp"

namespace taskengine::artifacts {

DiskArtifactStore::DiskArtifactStore(std::filesystem::path root) : root_(std::move(root)) {
  std::filesystem::create_directories(root_);
}

/*
  Only canonical task ids map to a path, so an id can never name
  anything outside root_.
*/
std::filesystem::path DiskArtifactStore::ArtifactPath(const std::string& task_id) const {
  if (!util::IsCanonicalUUID(task_id)) {
    throw std::invalid_argument("artifact task id must be a canonical uuid: " + task_id);
  }
  return root_ / task_id;
}

void DiskArtifactStore::ReleaseArtifacts(const std::string& task_id) {
  const auto path = ArtifactPath(task_id);

  std::error_code ec;
  const auto      removed = std::filesystem::remove_all(path, ec);
  if (ec) {
    throw std::runtime_error("failed to release artifacts at " + path.string() + ": " + ec.message());
  }

  if (removed > 0) {
    TASKENGINE_LOG_INFO("Released task artifacts", {observability::StringField("task_id", task_id), observability::StringField("path", path.string()),
                                                    observability::UintField("entries", removed)});
  }
}

} // namespace taskengine::artifacts

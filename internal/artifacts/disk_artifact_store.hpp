#pragma once

#include <filesystem>

#include "internal/artifacts/artifact_store.hpp"

namespace taskengine::artifacts {

/*
  Artifacts kept on local disk under <root>/<task id>, either a single
  file or a directory tree.
*/
class DiskArtifactStore final : public ArtifactStore {
 public:
  explicit DiskArtifactStore(std::filesystem::path root);

  void ReleaseArtifacts(const std::string& task_id) override;

  std::filesystem::path ArtifactPath(const std::string& task_id) const;

  const std::filesystem::path& Root() const {
    return root_;
  }

 private:
  std::filesystem::path root_;
};

} // namespace taskengine::artifacts

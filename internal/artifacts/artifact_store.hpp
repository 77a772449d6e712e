#pragma once

#include <memory>
#include <string>

namespace taskengine::artifacts {

/*
  External files a task produced.

  ReleaseArtifacts is called by the sweeper after the task row is
  deleted. It must be idempotent: releasing a task that has no
  artifacts, or releasing twice, is not an error.
*/
class ArtifactStore {
 public:
  virtual ~ArtifactStore() = default;

  virtual void ReleaseArtifacts(const std::string& task_id) = 0;
};

using ArtifactStorePtr = std::shared_ptr<ArtifactStore>;

// Task kinds that produce nothing.
class NullArtifactStore final : public ArtifactStore {
 public:
  void ReleaseArtifacts(const std::string&) override {
  }
};

} // namespace taskengine::artifacts

#pragma once

#include <memory>
#include <vector>

#include "internal/cache/compression_policy.hpp"
#include "internal/pipeline/stage.hpp"

namespace chadoxml::pipeline {

/*
  Runs stages in order and stops at the first failure.

  Each stage is logged as a nested block ending in "Done." or "Failed.".
  Between stages the compression policy runs with the experiment root
  pinned.
*/
class PipelineRunner {
 public:
  explicit PipelineRunner(std::shared_ptr<cache::CompressionPolicy> policy = nullptr);

  void Add(StagePtr stage);

  bool Run(PipelineContext& ctx);

  std::size_t Size() const {
    return stages_.size();
  }

 private:
  std::shared_ptr<cache::CompressionPolicy> policy_;
  std::vector<StagePtr>                     stages_;
};

} // namespace chadoxml::pipeline

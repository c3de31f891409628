#include "pipeline_runner.hpp"

#include <stdexcept>
#include <string>

#include "internal/cache/object_cache.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace chadoxml::pipeline {

using namespace chadoxml::observability;

PipelineRunner::PipelineRunner(std::shared_ptr<cache::CompressionPolicy> policy) : policy_(std::move(policy)) {
}

void PipelineRunner::Add(StagePtr stage) {
  if (!stage) throw std::invalid_argument("stage must not be null");
  stages_.push_back(std::move(stage));
}

bool PipelineRunner::Run(PipelineContext& ctx) {
  if (policy_ && ctx.document.experiment) {
    policy_->Pin(ctx.document.experiment);
  }

  for (const auto& stage : stages_) {
    LogBegin(stage->Description());

    bool ok = false;
    try {
      ok = stage->Run(ctx);
    } catch (const util::ValidationError& e) {
      LogError(e.what(), {StringField("stage", stage->Name())});
      ok = false;
    }

    if (!ok) {
      LogEnd("Failed.", spdlog::level::err, {StringField("stage", stage->Name())});
      return false;
    }
    LogEnd("Done.");

    if (policy_) {
      const auto outcome = policy_->Apply(ctx.cache);
      LogDebug("Compression policy applied",
               {StringField("stage", stage->Name()), UintField("compressed", outcome.compressed),
                UintField("materialized", outcome.remaining)});
    }
  }

  return true;
}

} // namespace chadoxml::pipeline

#include "reference_stage.hpp"

#include <cstdint>

#include "internal/cache/graph_walk.hpp"
#include "internal/model/entity_type.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace chadoxml::pipeline {

using namespace chadoxml::observability;

bool ReferenceStage::Run(PipelineContext& ctx) {
  if (ctx.document.experiment == nullptr) {
    throw util::ValidationError("no experiment to check");
  }

  std::uint64_t missing = 0;
  std::uint64_t total   = 0;
  for (const auto* handle : cache::CollectReachable(ctx.cache, ctx.document.experiment)) {
    ++total;
    if (!handle->IsRegistered()) {
      LogError("Referenced entity was never defined",
               {StringField("type", model::ToString(handle->Type())), StringField("id", handle->Id())});
      ++missing;
    }
  }

  LogDebug("References checked", {UintField("entities", total), UintField("undefined", missing)});
  return missing == 0;
}

} // namespace chadoxml::pipeline

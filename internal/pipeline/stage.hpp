#pragma once

#include <memory>
#include <string_view>

#include "internal/pipeline/pipeline_context.hpp"

namespace chadoxml::pipeline {

/*
  One validation or transformation step over the experiment graph.

  Run returns false on a validation failure after logging the reason.
  util::ValidationError thrown from Run is treated the same way; other
  exceptions are fatal.
*/
class Stage {
 public:
  virtual ~Stage() = default;

  virtual std::string_view Name() const        = 0;
  virtual std::string_view Description() const = 0;

  virtual bool Run(PipelineContext& ctx) = 0;
};

using StagePtr = std::unique_ptr<Stage>;

} // namespace chadoxml::pipeline

#pragma once

#include "internal/pipeline/stage.hpp"

namespace chadoxml::pipeline {

// Fails when the experiment reaches an entity that was never registered.
class ReferenceStage final : public Stage {
 public:
  std::string_view Name() const override {
    return "references";
  }

  std::string_view Description() const override {
    return "Checking entity references.";
  }

  bool Run(PipelineContext& ctx) override;
};

} // namespace chadoxml::pipeline

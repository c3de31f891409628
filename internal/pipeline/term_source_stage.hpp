#pragma once

#include "internal/pipeline/stage.hpp"

namespace chadoxml::pipeline {

/*
  Resolves controlled-vocabulary terms against the declared term sources.

  Every DBXref reachable from the experiment must name a declared term
  source. Every CVTerm without a DBXref gets one, taken from the term
  source named like the term's CV with the term name as accession. The
  resulting DBXrefs are shared per (term source, accession).
*/
class TermSourceStage final : public Stage {
 public:
  std::string_view Name() const override {
    return "term_sources";
  }

  std::string_view Description() const override {
    return "Validating CVTerms and DBXrefs.";
  }

  bool Run(PipelineContext& ctx) override;
};

} // namespace chadoxml::pipeline

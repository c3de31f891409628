#pragma once

#include <string>

#include "internal/pipeline/pipeline_context.hpp"

namespace chadoxml::cache {
class ObjectCache;
}

namespace chadoxml::pipeline {

/*
  Builds the experiment graph from a YAML description and registers every
  entity in the cache.

      term_sources:  [{name, url, description}]
      features:      [{id, name, uniquename, residues, seqlen, is_analysis,
                       type, dbxrefs, locations, relationships,
                       analysisfeatures}]
      analyses:      [{id, name, program, programversion, ...}]
      protocols:     [{id, name, description, version, dbxref, attributes}]
      data:          [{id, heading, name, value, type, dbxref, attributes,
                       features}]
      experiment:    {uniquename, description, properties,
                      applied_protocols: [[{protocol, inputs, outputs}]]}

  Terms are {cv, term} with an optional {db, accession}; cross references
  are {db, accession}. Features, analyses, protocols and data refer to
  each other by id, in any order. Ids that are never declared stay
  unregistered for ReferenceStage to report.

  Malformed input raises util::ValidationError.
*/
class ExperimentLoader {
 public:
  static ExperimentDocument LoadFromYaml(const std::string& path, cache::ObjectCache& cache);
  static ExperimentDocument LoadFromString(const std::string& yaml, cache::ObjectCache& cache);
};

} // namespace chadoxml::pipeline

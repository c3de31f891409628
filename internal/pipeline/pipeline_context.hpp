#pragma once

#include <vector>

#include "internal/cache/handle.hpp"

namespace chadoxml::cache {
class ObjectCache;
}

namespace chadoxml::pipeline {

struct ExperimentDocument {
  cache::Handle*              experiment = nullptr;
  std::vector<cache::Handle*> protocols;
  std::vector<cache::Handle*> term_sources; // DB handles
};

/*
  Shared state handed to every stage. The cache is owned by the caller.
*/
struct PipelineContext {
  cache::ObjectCache& cache;
  ExperimentDocument  document;
};

} // namespace chadoxml::pipeline

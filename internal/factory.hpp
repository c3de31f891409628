#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/cache/compression_policy.hpp"
#include "internal/cache/object_cache.hpp"
#include "internal/pipeline/pipeline_runner.hpp"
#include "internal/xml/chadoxml_writer.hpp"

namespace chadoxml::factory {

/*
  Application

  Everything one conversion run needs. The cache lives until the document
  is written and is then destroyed exactly once by the caller.
*/
struct Application {
  std::shared_ptr<cache::ObjectCache>       cache;
  std::shared_ptr<cache::CompressionPolicy> policy;
  std::unique_ptr<pipeline::PipelineRunner> runner;
  xml::WriterOptions                        writer_options;
};

/*
  Build

  Composition root: the only place that knows the concrete payload store,
  the codec set and the stage order.
*/
Application Build(const chadoxml::runtime::config::RuntimeConfig& config);

} // namespace chadoxml::factory

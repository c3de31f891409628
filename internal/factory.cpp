#include "factory.hpp"

#include <memory>

#include "internal/cache/chado_codecs.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/reference_stage.hpp"
#include "internal/pipeline/term_source_stage.hpp"
#include "internal/storage/storage_factory.hpp"

namespace chadoxml::factory {

using namespace chadoxml;

/*
    Build full application dependency graph
*/
Application Build(const chadoxml::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Payload storage
  // ------------------------------------------------------------------
  auto storage = storage::StorageFactory::Build(config.cache());

  observability::LogDebug("Payload storage ready", {observability::StringField("store", storage.store->Name()),
                                                    observability::StringField("codec", storage.compressor->Name())});

  // ------------------------------------------------------------------
  // Object cache
  // ------------------------------------------------------------------
  app.cache  = std::make_shared<cache::ObjectCache>(cache::BuildChadoCodecRegistry(), storage.store, storage.compressor);
  app.policy = std::make_shared<cache::CompressionPolicy>(config.cache());

  // ------------------------------------------------------------------
  // Stages, in run order
  // ------------------------------------------------------------------
  app.runner = std::make_unique<pipeline::PipelineRunner>(app.policy);
  app.runner->Add(std::make_unique<pipeline::TermSourceStage>());
  app.runner->Add(std::make_unique<pipeline::ReferenceStage>());

  app.writer_options = xml::WriterOptions::FromConfig(config.serializer());

  return app;
}

} // namespace chadoxml::factory

#include "converter.hpp"

#include <exception>
#include <iostream>

#include "internal/observability/logging.hpp"
#include "internal/pipeline/experiment_loader.hpp"
#include "internal/util/errors.hpp"
#include "internal/xml/chadoxml_writer.hpp"

namespace chadoxml::runtime {

using namespace chadoxml::observability;

namespace {

void LogCacheStats(const cache::CacheStats& stats) {
  CHADOXML_LOG_INFO("Cache statistics", {UintField("handles", stats.handles), UintField("registered", stats.registered),
                                         UintField("materialized", stats.materialized),
                                         UintField("parked_bytes", stats.parked_bytes),
                                         UintField("compressions", stats.compressions),
                                         UintField("reconstructions", stats.reconstructions)});
}

void CloseBlocks(int depth) {
  while (NestingDepth() > depth) LogEnd("Failed.", spdlog::level::err);
}

// Destroy on a failure path; a second error is logged, the first one wins.
void ReleaseCache(cache::ObjectCache& cache) {
  if (cache.IsDestroyed()) return;
  try {
    cache.Destroy();
  } catch (const std::exception& e) {
    CHADOXML_LOG_ERROR("Failed to release object cache", {StringField("error", e.what())});
  }
}

} // namespace

int Convert(factory::Application& app, const std::string& input, const std::string& output) {
  auto&     cache = *app.cache;
  const int depth = NestingDepth();

  try {
    LogBegin("Validating submission...");

    LogBegin("Reading experiment...");
    pipeline::PipelineContext ctx{cache, {}};
    try {
      ctx.document = pipeline::ExperimentLoader::LoadFromYaml(input, cache);
    } catch (const util::ValidationError& e) {
      CHADOXML_LOG_ERROR(e.what(), {StringField("input", input)});
      CloseBlocks(depth);
      ReleaseCache(cache);
      return kExitInvalid;
    }
    LogEnd("Done.");

    if (!app.runner->Run(ctx)) {
      CloseBlocks(depth);
      ReleaseCache(cache);
      return kExitInvalid;
    }
    LogEnd("Validated successfully!");

    LogBegin("Writing ChadoXML; this may take a while...");
    xml::ChadoXmlWriter writer(cache, app.writer_options);
    if (output.empty()) {
      writer.Write(ctx.document.experiment, std::cout);
    } else {
      writer.WriteToFile(ctx.document.experiment, output);
    }
    LogEnd("Done. All tasks complete.");

    LogCacheStats(cache.Stats());
    cache.Destroy();
    return kExitOk;
  } catch (const std::exception& e) {
    CHADOXML_LOG_ERROR("Fatal error", {StringField("error", e.what()), StringField("input", input)});
    CloseBlocks(depth);
    ReleaseCache(cache);
    return kExitFatal;
  }
}

} // namespace chadoxml::runtime

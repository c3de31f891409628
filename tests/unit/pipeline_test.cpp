#include "internal/pipeline/pipeline_runner.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/cache/chado_codecs.hpp"
#include "internal/cache/compression_policy.hpp"
#include "internal/cache/object_cache.hpp"
#include "internal/model/entities.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/experiment_loader.hpp"
#include "internal/pipeline/reference_stage.hpp"
#include "internal/pipeline/term_source_stage.hpp"
#include "internal/storage/payload_compressor.hpp"
#include "internal/storage/ram/ram_payload_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/xml/chadoxml_writer.hpp"

namespace {

using chadoxml::cache::ObjectCache;
using chadoxml::model::EntityType;
using chadoxml::pipeline::ExperimentLoader;
using chadoxml::pipeline::PipelineContext;
using chadoxml::pipeline::PipelineRunner;
using chadoxml::pipeline::Stage;
namespace cfg   = chadoxml::runtime::config;
namespace model = chadoxml::model;

std::unique_ptr<ObjectCache> MakeCache() {
  return std::make_unique<ObjectCache>(chadoxml::cache::BuildChadoCodecRegistry(),
                                       std::make_shared<chadoxml::storage::RamPayloadStore>(),
                                       std::make_shared<chadoxml::storage::PayloadCompressor>());
}

// Records its name into a shared log and returns a fixed result.
class ScriptedStage final : public Stage {
 public:
  ScriptedStage(std::string name, bool result, std::vector<std::string>& log, bool throws = false)
      : name_(std::move(name)), result_(result), throws_(throws), log_(log) {
  }

  std::string_view Name() const override {
    return name_;
  }

  std::string_view Description() const override {
    return name_;
  }

  bool Run(PipelineContext&) override {
    log_.push_back(name_);
    if (throws_) throw chadoxml::util::ValidationError(name_ + " is invalid");
    return result_;
  }

 private:
  std::string               name_;
  bool                      result_;
  bool                      throws_;
  std::vector<std::string>& log_;
};

const char* kExperiment = R"(
term_sources:
  - name: SO
  - name: MO
features:
  - uniquename: F1
    type: {cv: SO, term: gene}
data:
  - id: D1
    type: {cv: MO, term: raw_data}
    features: [F1]
  - id: D2
    type: {cv: SO, term: gene}
protocols:
  - id: P1
    name: grow
experiment:
  uniquename: E1
  properties:
    - {name: Lab, type: {cv: MO, term: lab}}
  applied_protocols:
    - - {protocol: P1, outputs: [D1]}
    - - {protocol: P1, inputs: [D1], outputs: [D2]}
)";

void TestRunnerStopsAtFirstFailure() {
  auto                     cache = MakeCache();
  std::vector<std::string> log;

  PipelineRunner runner;
  runner.Add(std::make_unique<ScriptedStage>("one", true, log));
  runner.Add(std::make_unique<ScriptedStage>("two", false, log));
  runner.Add(std::make_unique<ScriptedStage>("three", true, log));

  PipelineContext ctx{*cache, {}};
  assert(!runner.Run(ctx));
  assert((log == std::vector<std::string>{"one", "two"}));
  assert(chadoxml::observability::NestingDepth() == 0);
}

void TestValidationErrorFailsTheStage() {
  auto                     cache = MakeCache();
  std::vector<std::string> log;

  PipelineRunner runner;
  runner.Add(std::make_unique<ScriptedStage>("bad", true, log, true));
  runner.Add(std::make_unique<ScriptedStage>("never", true, log));

  PipelineContext ctx{*cache, {}};
  assert(!runner.Run(ctx));
  assert(log.size() == 1);
}

void TestPolicyRunsBetweenStagesWithRootPinned() {
  auto cache = MakeCache();

  PipelineContext ctx{*cache, ExperimentLoader::LoadFromString(kExperiment, *cache)};

  cfg::CacheConfig config;
  config.set_policy(cfg::COMPRESSION_POLICY_AFTER_STAGE);
  auto policy = std::make_shared<chadoxml::cache::CompressionPolicy>(config);

  std::vector<std::string> log;
  PipelineRunner           runner(policy);
  runner.Add(std::make_unique<ScriptedStage>("noop", true, log));
  assert(runner.Run(ctx));

  for (auto* h : cache->Handles()) {
    assert(h->IsMaterialized() == (h == ctx.document.experiment));
  }
}

void TestTermSourcesAttachSharedDbxrefs() {
  auto            cache = MakeCache();
  PipelineContext ctx{*cache, ExperimentLoader::LoadFromString(kExperiment, *cache)};

  chadoxml::pipeline::TermSourceStage stage;
  assert(stage.Run(ctx));

  auto& c    = *cache;
  auto* gene = c.Find(EntityType::kCvTerm, "SO:gene");
  auto* xref = c.Materialize<model::CVTerm>(gene).dbxref;
  assert(xref != nullptr);

  const auto& resolved = c.Materialize<model::DBXref>(xref);
  assert(resolved.accession == "gene");
  assert(resolved.db == c.Find(EntityType::kDb, "SO"));

  // one DBXref per (term source, accession)
  assert(c.Find(EntityType::kDbXref, "SO:gene") == xref);
  assert(c.Materialize<model::CVTerm>(c.Find(EntityType::kCvTerm, "MO:lab")).dbxref != nullptr);

  // a second run changes nothing
  const auto handles = c.Handles().size();
  assert(stage.Run(ctx));
  assert(c.Handles().size() == handles);
}

void TestUndeclaredTermSourceFails() {
  auto            cache = MakeCache();
  PipelineContext ctx{*cache, ExperimentLoader::LoadFromString(R"(
term_sources:
  - name: SO
protocols:
  - id: P1
    name: grow
    dbxref: {db: OBI, accession: "0000001"}
experiment:
  uniquename: E1
  properties:
    - {name: Lab, type: {cv: MO, term: lab}}
  applied_protocols:
    - - {protocol: P1}
)",
                                                             *cache)};

  chadoxml::pipeline::TermSourceStage stage;
  assert(!stage.Run(ctx));
}

void TestReferenceStageReportsUndefinedEntities() {
  auto            cache = MakeCache();
  PipelineContext ctx{*cache, ExperimentLoader::LoadFromString(kExperiment, *cache)};

  chadoxml::pipeline::ReferenceStage stage;
  // term sources are declared, features and data all defined
  assert(stage.Run(ctx));

  auto& e = cache->Materialize<model::Experiment>(ctx.document.experiment);
  e.applied_protocol_slots.push_back({cache->GetOrCreate(EntityType::kAppliedProtocol, "undefined")});
  assert(!stage.Run(ctx));
}

void TestFullPipelineProducesChadoXml() {
  auto            cache = MakeCache();
  PipelineContext ctx{*cache, ExperimentLoader::LoadFromString(kExperiment, *cache)};

  cfg::CacheConfig config;
  config.set_policy(cfg::COMPRESSION_POLICY_THRESHOLD);
  config.set_max_materialized(3);

  PipelineRunner runner(std::make_shared<chadoxml::cache::CompressionPolicy>(config));
  runner.Add(std::make_unique<chadoxml::pipeline::TermSourceStage>());
  runner.Add(std::make_unique<chadoxml::pipeline::ReferenceStage>());
  assert(runner.Size() == 2);
  assert(runner.Run(ctx));

  chadoxml::xml::WriterOptions options;
  options.indent = false;
  std::ostringstream out;
  chadoxml::xml::ChadoXmlWriter(*cache, options).Write(ctx.document.experiment, out);

  const auto xml = out.str();
  assert(xml.find("<dbxref_id><dbxref id=") != std::string::npos);
  assert(xml.find("<accession>gene</accession>") != std::string::npos);
  assert(xml.find("<cvterm ref=") != std::string::npos);

  cache->Destroy();
}

} // namespace

int main() {
  TestRunnerStopsAtFirstFailure();
  TestValidationErrorFailsTheStage();
  TestPolicyRunsBetweenStagesWithRootPinned();
  TestTermSourcesAttachSharedDbxrefs();
  TestUndeclaredTermSourceFails();
  TestReferenceStageReportsUndefinedEntities();
  TestFullPipelineProducesChadoXml();

  std::cout << "chadoxml_unit_pipeline: pass\n";
  return 0;
}

#include "internal/pipeline/experiment_loader.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/cache/chado_codecs.hpp"
#include "internal/cache/object_cache.hpp"
#include "internal/model/entities.hpp"
#include "internal/storage/payload_compressor.hpp"
#include "internal/storage/ram/ram_payload_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using chadoxml::cache::ObjectCache;
using chadoxml::model::EntityType;
using chadoxml::pipeline::ExperimentLoader;
namespace model = chadoxml::model;
namespace util  = chadoxml::util;

std::unique_ptr<ObjectCache> MakeCache() {
  return std::make_unique<ObjectCache>(chadoxml::cache::BuildChadoCodecRegistry(),
                                       std::make_shared<chadoxml::storage::RamPayloadStore>(),
                                       std::make_shared<chadoxml::storage::PayloadCompressor>());
}

const char* kExperiment = R"(
term_sources:
  - name: SO
    url: http://www.sequenceontology.org/
  - name: FlyBase
analyses:
  - id: macs
    name: MACS peaks
    program: MACS
    programversion: "1.4"
features:
  - id: chr2L
    uniquename: 2L
    type: {cv: SO, term: chromosome_arm}
  - uniquename: peak_1
    type: {cv: SO, term: binding_site}
    dbxrefs:
      - {db: FlyBase, accession: FBgn0000490}
    locations:
      - {srcfeature: chr2L, fmin: 100, fmax: 250, strand: 1}
    analysisfeatures:
      - {analysis: macs, significance: 0.001}
    relationships:
      - {object: chr2L, type: {cv: relationship, term: located_in}}
protocols:
  - id: P1
    name: ChIP
    dbxref: {db: FlyBase, accession: protocol-1}
    attributes:
      - {heading: Protocol Type, value: grow, type: {cv: SO, term: protocol}}
data:
  - id: D0
    heading: Source Name
    value: embryos
  - id: D1
    heading: Result File
    value: peaks.bed
    features: [peak_1]
experiment:
  uniquename: E1
  description: dpp ChIP
  properties:
    - {name: Investigation Title, value: dpp ChIP}
    - {name: Lab, value: White}
  applied_protocols:
    - - {protocol: P1, inputs: [D0], outputs: [D1]}
    - - {protocol: P1, inputs: [D1], outputs: []}
)";

void TestDocumentIsLoadedIntoTheCache() {
  auto  cache = MakeCache();
  auto& c     = *cache;

  const auto doc = ExperimentLoader::LoadFromString(kExperiment, c);
  assert(doc.experiment != nullptr);
  assert(doc.experiment->Id() == "E1");
  assert(doc.term_sources.size() == 2);
  assert(doc.protocols.size() == 1);

  const auto& e = c.Materialize<model::Experiment>(doc.experiment);
  assert(e.description == "dpp ChIP");
  assert(e.properties.size() == 2);
  assert(c.Materialize<model::ExperimentProp>(e.properties[1]).rank == 1);
  assert(e.applied_protocol_slots.size() == 2);

  const auto& first  = c.Materialize<model::AppliedProtocol>(e.applied_protocol_slots[0][0]);
  const auto& second = c.Materialize<model::AppliedProtocol>(e.applied_protocol_slots[1][0]);
  assert(first.protocol == second.protocol);
  // D1 is output of step one and input of step two
  assert(first.output_data.front() == second.input_data.front());
  assert(second.output_data.empty());

  auto* peak = c.Find(EntityType::kFeature, "peak_1");
  assert(peak != nullptr && peak->IsRegistered());
  const auto& feature = c.Materialize<model::Feature>(peak);
  assert(feature.uniquename == "peak_1");
  assert(feature.locations.size() == 1);
  assert(c.Materialize<model::FeatureLoc>(feature.locations[0]).fmax == 250);
  assert(c.Materialize<model::AnalysisFeature>(feature.analysisfeatures[0]).feature == peak);
  assert(c.Materialize<model::AnalysisFeature>(feature.analysisfeatures[0]).significance == 0.001);

  // relationships hang off both ends
  auto* arm = c.Find(EntityType::kFeature, "chr2L");
  assert(feature.relationships.size() == 1);
  assert(c.Materialize<model::Feature>(arm).relationships == feature.relationships);
}

void TestSharedTermsAreRegisteredOnce() {
  auto  cache = MakeCache();
  auto& c     = *cache;
  (void)ExperimentLoader::LoadFromString(kExperiment, c);

  auto* so = c.Find(EntityType::kCv, "SO");
  assert(so != nullptr && so->IsRegistered());
  auto* term = c.Find(EntityType::kCvTerm, "SO:binding_site");
  assert(c.Materialize<model::CVTerm>(term).cv == so);
  assert(c.Materialize<model::CVTerm>(term).dbxref == nullptr);

  auto* xref = c.Find(EntityType::kDbXref, "FlyBase:FBgn0000490");
  assert(c.Materialize<model::DBXref>(xref).db == c.Find(EntityType::kDb, "FlyBase"));
}

void TestUndeclaredReferencesStayUnregistered() {
  auto cache = MakeCache();
  auto doc   = ExperimentLoader::LoadFromString(R"(
experiment:
  uniquename: E2
  applied_protocols:
    - - {protocol: missing, outputs: [D9]}
)",
                                                *cache);

  assert(doc.experiment != nullptr);
  assert(!cache->Find(EntityType::kProtocol, "missing")->IsRegistered());
  assert(!cache->Find(EntityType::kDatum, "D9")->IsRegistered());
}

void ExpectInvalid(const std::string& yaml) {
  auto cache = MakeCache();
  bool threw = false;
  try {
    (void)ExperimentLoader::LoadFromString(yaml, *cache);
  } catch (const util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestMalformedDocumentsAreRejected() {
  ExpectInvalid("- just a list\n");
  ExpectInvalid("term_sources: []\n");
  ExpectInvalid("experiment: {description: no name}\n");
  ExpectInvalid("experiment: {uniquename: E, applied_protocols: [{protocol: P1}]}\n");
  ExpectInvalid("experiment: {uniquename: E, applied_protocols: [[{inputs: [D1]}]]}\n");
  ExpectInvalid("data: [{heading: no id}]\nexperiment: {uniquename: E}\n");
  ExpectInvalid("features: [{uniquename: F, seqlen: many}]\nexperiment: {uniquename: E}\n");
  ExpectInvalid("experiment: {uniquename: E\n");

  // empty list entries
  ExpectInvalid("features: [{uniquename: F, dbxrefs: [~]}]\nexperiment: {uniquename: E}\n");
  ExpectInvalid("data: [{id: D1, features: [\"\"]}]\nexperiment: {uniquename: E}\n");
  ExpectInvalid("experiment: {uniquename: E, applied_protocols: [[{protocol: P1, outputs: [~]}]]}\n");
  ExpectInvalid("protocols: [{name: P1, attributes: [~]}]\nexperiment: {uniquename: E}\n");

  auto cache = MakeCache();
  bool threw = false;
  try {
    (void)ExperimentLoader::LoadFromYaml("/nonexistent/experiment.yaml", *cache);
  } catch (const util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void ExpectDuplicate(const std::string& yaml) {
  auto        cache = MakeCache();
  std::string message;
  try {
    (void)ExperimentLoader::LoadFromString(yaml, *cache);
  } catch (const util::ValidationError& e) {
    message = e.what();
  }
  assert(message.find("duplicate") != std::string::npos);
}

void TestDuplicateIdentifiersAreRejected() {
  ExpectDuplicate("features: [{uniquename: F1}, {id: F1, uniquename: other}]\nexperiment: {uniquename: E}\n");
  ExpectDuplicate("protocols: [{name: grow}, {name: grow}]\nexperiment: {uniquename: E}\n");
  ExpectDuplicate("analyses: [{name: macs}, {id: macs, name: other}]\nexperiment: {uniquename: E}\n");
  ExpectDuplicate("term_sources: [{name: SO}, {name: SO}]\nexperiment: {uniquename: E}\n");
  ExpectDuplicate("data: [{id: D1}, {id: D1}]\nexperiment: {uniquename: E}\n");

  // an explicit id must not take over one the cache generated earlier
  ExpectDuplicate(R"(
protocols:
  - name: grow
    attributes:
      - {heading: Temperature, value: "25"}
      - {id: Attribute_1, heading: Medium, value: standard}
experiment: {uniquename: E}
)");
}

} // namespace

int main() {
  TestDocumentIsLoadedIntoTheCache();
  TestSharedTermsAreRegisteredOnce();
  TestUndeclaredReferencesStayUnregistered();
  TestMalformedDocumentsAreRejected();
  TestDuplicateIdentifiersAreRejected();

  std::cout << "chadoxml_unit_experiment_loader: pass\n";
  return 0;
}

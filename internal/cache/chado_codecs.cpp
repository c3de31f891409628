#include "chado_codecs.hpp"

#include <spdlog/fmt/fmt.h>

#include <string>
#include <vector>

#include "chadoxml/cache/v1/entities.pb.h"
#include "internal/cache/object_cache.hpp"
#include "internal/model/entities.hpp"

namespace chadoxml::cache {

namespace {

namespace pb = chadoxml::cache::v1;

using RefList = google::protobuf::RepeatedPtrField<pb::Ref>;
using model::EntityType;

// ------------------------------------------------------------------
// Relationship encoding
// ------------------------------------------------------------------

void SetRef(const Handle* handle, pb::Ref* ref) {
  ref->set_id(handle->Id());
}

void SetRefs(const std::vector<Handle*>& handles, RefList* refs) {
  refs->Reserve(static_cast<int>(handles.size()));
  for (const Handle* h : handles) SetRef(h, refs->Add());
}

Handle* GetRef(bool present, const pb::Ref& ref, EntityType type, ObjectCache& cache) {
  if (!present || ref.id().empty()) return nullptr;
  return cache.GetOrCreate(type, ref.id());
}

std::vector<Handle*> GetRefs(const RefList& refs, EntityType type, ObjectCache& cache) {
  std::vector<Handle*> out;
  out.reserve(refs.size());
  for (const auto& ref : refs) out.push_back(cache.GetOrCreate(type, ref.id()));
  return out;
}

// ------------------------------------------------------------------
// Description helpers
// ------------------------------------------------------------------

void Text(EntityVisitor& v, std::string_view name, const std::string& value) {
  if (!value.empty()) v.Scalar(name, value);
}

template <typename T>
void Number(EntityVisitor& v, std::string_view name, const T& value) {
  v.Scalar(name, fmt::format("{}", value));
}

template <typename T>
void Number(EntityVisitor& v, std::string_view name, const std::optional<T>& value) {
  if (value) v.Scalar(name, fmt::format("{}", *value));
}

void Boolean(EntityVisitor& v, std::string_view name, bool value) {
  v.Scalar(name, value ? "true" : "false");
}

void ForeignKey(EntityVisitor& v, std::string_view name, Handle* target) {
  if (target != nullptr) v.Reference(name, target);
}

// One link-table row per target: <table><column>target</column></table>.
void Links(EntityVisitor& v, std::string_view table, std::string_view column, const std::vector<Handle*>& targets) {
  for (Handle* target : targets) {
    v.BeginGroup(table);
    v.Reference(column, target);
    v.EndGroup();
  }
}

void Children(EntityVisitor& v, const std::vector<Handle*>& children) {
  for (Handle* child : children) v.Child(child);
}

// ------------------------------------------------------------------
// DB / DBXref / CV / CVTerm
// ------------------------------------------------------------------

void ToProto(const model::DB& e, pb::DB* m) {
  m->set_name(e.name);
  m->set_url(e.url);
  m->set_description(e.description);
}

model::DB FromProto(const pb::DB& m, ObjectCache&) {
  model::DB e;
  e.name        = m.name();
  e.url         = m.url();
  e.description = m.description();
  return e;
}

void Describe(const model::DB& e, EntityVisitor& v) {
  Text(v, "name", e.name);
  Text(v, "url", e.url);
  Text(v, "description", e.description);
}

void ToProto(const model::DBXref& e, pb::DBXref* m) {
  m->set_accession(e.accession);
  m->set_version(e.version);
  m->set_description(e.description);
  if (e.db != nullptr) SetRef(e.db, m->mutable_db());
}

model::DBXref FromProto(const pb::DBXref& m, ObjectCache& cache) {
  model::DBXref e;
  e.accession   = m.accession();
  e.version     = m.version();
  e.description = m.description();
  e.db          = GetRef(m.has_db(), m.db(), EntityType::kDb, cache);
  return e;
}

void Describe(const model::DBXref& e, EntityVisitor& v) {
  Text(v, "accession", e.accession);
  Text(v, "version", e.version);
  Text(v, "description", e.description);
  ForeignKey(v, "db_id", e.db);
}

void ToProto(const model::CV& e, pb::CV* m) {
  m->set_name(e.name);
  m->set_definition(e.definition);
}

model::CV FromProto(const pb::CV& m, ObjectCache&) {
  model::CV e;
  e.name       = m.name();
  e.definition = m.definition();
  return e;
}

void Describe(const model::CV& e, EntityVisitor& v) {
  Text(v, "name", e.name);
  Text(v, "definition", e.definition);
}

void ToProto(const model::CVTerm& e, pb::CVTerm* m) {
  m->set_name(e.name);
  m->set_definition(e.definition);
  m->set_is_obsolete(e.is_obsolete);
  if (e.cv != nullptr) SetRef(e.cv, m->mutable_cv());
  if (e.dbxref != nullptr) SetRef(e.dbxref, m->mutable_dbxref());
}

model::CVTerm FromProto(const pb::CVTerm& m, ObjectCache& cache) {
  model::CVTerm e;
  e.name        = m.name();
  e.definition  = m.definition();
  e.is_obsolete = m.is_obsolete();
  e.cv          = GetRef(m.has_cv(), m.cv(), EntityType::kCv, cache);
  e.dbxref      = GetRef(m.has_dbxref(), m.dbxref(), EntityType::kDbXref, cache);
  return e;
}

void Describe(const model::CVTerm& e, EntityVisitor& v) {
  Text(v, "name", e.name);
  Text(v, "definition", e.definition);
  // integer column in Chado
  Number(v, "is_obsolete", e.is_obsolete ? 1 : 0);
  ForeignKey(v, "cv_id", e.cv);
  ForeignKey(v, "dbxref_id", e.dbxref);
}

// ------------------------------------------------------------------
// Analysis / Feature and its rows
// ------------------------------------------------------------------

void ToProto(const model::Analysis& e, pb::Analysis* m) {
  m->set_name(e.name);
  m->set_description(e.description);
  m->set_program(e.program);
  m->set_programversion(e.programversion);
  m->set_algorithm(e.algorithm);
  m->set_sourcename(e.sourcename);
  m->set_sourceversion(e.sourceversion);
  m->set_sourceuri(e.sourceuri);
}

model::Analysis FromProto(const pb::Analysis& m, ObjectCache&) {
  model::Analysis e;
  e.name           = m.name();
  e.description    = m.description();
  e.program        = m.program();
  e.programversion = m.programversion();
  e.algorithm      = m.algorithm();
  e.sourcename     = m.sourcename();
  e.sourceversion  = m.sourceversion();
  e.sourceuri      = m.sourceuri();
  return e;
}

void Describe(const model::Analysis& e, EntityVisitor& v) {
  Text(v, "name", e.name);
  Text(v, "description", e.description);
  Text(v, "program", e.program);
  Text(v, "programversion", e.programversion);
  Text(v, "algorithm", e.algorithm);
  Text(v, "sourcename", e.sourcename);
  Text(v, "sourceversion", e.sourceversion);
  Text(v, "sourceuri", e.sourceuri);
}

void ToProto(const model::Feature& e, pb::Feature* m) {
  m->set_name(e.name);
  m->set_uniquename(e.uniquename);
  m->set_residues(e.residues);
  if (e.seqlen) m->set_seqlen(*e.seqlen);
  m->set_is_analysis(e.is_analysis);
  if (e.type != nullptr) SetRef(e.type, m->mutable_type());
  SetRefs(e.dbxrefs, m->mutable_dbxrefs());
  SetRefs(e.locations, m->mutable_locations());
  SetRefs(e.relationships, m->mutable_relationships());
  SetRefs(e.analysisfeatures, m->mutable_analysisfeatures());
}

model::Feature FromProto(const pb::Feature& m, ObjectCache& cache) {
  model::Feature e;
  e.name       = m.name();
  e.uniquename = m.uniquename();
  e.residues   = m.residues();
  if (m.has_seqlen()) e.seqlen = m.seqlen();
  e.is_analysis      = m.is_analysis();
  e.type             = GetRef(m.has_type(), m.type(), EntityType::kCvTerm, cache);
  e.dbxrefs          = GetRefs(m.dbxrefs(), EntityType::kDbXref, cache);
  e.locations        = GetRefs(m.locations(), EntityType::kFeatureLoc, cache);
  e.relationships    = GetRefs(m.relationships(), EntityType::kFeatureRelationship, cache);
  e.analysisfeatures = GetRefs(m.analysisfeatures(), EntityType::kAnalysisFeature, cache);
  return e;
}

void Describe(const model::Feature& e, EntityVisitor& v) {
  Text(v, "name", e.name);
  Text(v, "uniquename", e.uniquename);
  Text(v, "residues", e.residues);
  Number(v, "seqlen", e.seqlen);
  Boolean(v, "is_analysis", e.is_analysis);
  ForeignKey(v, "type_id", e.type);
  Links(v, "feature_dbxref", "dbxref_id", e.dbxrefs);
  Children(v, e.locations);
  Children(v, e.relationships);
  Children(v, e.analysisfeatures);
}

void ToProto(const model::FeatureLoc& e, pb::FeatureLoc* m) {
  if (e.fmin) m->set_fmin(*e.fmin);
  if (e.fmax) m->set_fmax(*e.fmax);
  if (e.strand) m->set_strand(*e.strand);
  if (e.phase) m->set_phase(*e.phase);
  m->set_rank(e.rank);
  if (e.srcfeature != nullptr) SetRef(e.srcfeature, m->mutable_srcfeature());
}

model::FeatureLoc FromProto(const pb::FeatureLoc& m, ObjectCache& cache) {
  model::FeatureLoc e;
  if (m.has_fmin()) e.fmin = m.fmin();
  if (m.has_fmax()) e.fmax = m.fmax();
  if (m.has_strand()) e.strand = m.strand();
  if (m.has_phase()) e.phase = m.phase();
  e.rank       = m.rank();
  e.srcfeature = GetRef(m.has_srcfeature(), m.srcfeature(), EntityType::kFeature, cache);
  return e;
}

void Describe(const model::FeatureLoc& e, EntityVisitor& v) {
  Number(v, "fmin", e.fmin);
  Number(v, "fmax", e.fmax);
  Number(v, "strand", e.strand);
  Number(v, "phase", e.phase);
  Number(v, "rank", e.rank);
  ForeignKey(v, "srcfeature_id", e.srcfeature);
}

void ToProto(const model::FeatureRelationship& e, pb::FeatureRelationship* m) {
  m->set_rank(e.rank);
  if (e.type != nullptr) SetRef(e.type, m->mutable_type());
  if (e.subject != nullptr) SetRef(e.subject, m->mutable_subject());
  if (e.object != nullptr) SetRef(e.object, m->mutable_object());
}

model::FeatureRelationship FromProto(const pb::FeatureRelationship& m, ObjectCache& cache) {
  model::FeatureRelationship e;
  e.rank    = m.rank();
  e.type    = GetRef(m.has_type(), m.type(), EntityType::kCvTerm, cache);
  e.subject = GetRef(m.has_subject(), m.subject(), EntityType::kFeature, cache);
  e.object  = GetRef(m.has_object(), m.object(), EntityType::kFeature, cache);
  return e;
}

void Describe(const model::FeatureRelationship& e, EntityVisitor& v) {
  Number(v, "rank", e.rank);
  ForeignKey(v, "type_id", e.type);
  ForeignKey(v, "subject_id", e.subject);
  ForeignKey(v, "object_id", e.object);
}

void ToProto(const model::AnalysisFeature& e, pb::AnalysisFeature* m) {
  if (e.rawscore) m->set_rawscore(*e.rawscore);
  if (e.normscore) m->set_normscore(*e.normscore);
  if (e.significance) m->set_significance(*e.significance);
  if (e.identity) m->set_identity(*e.identity);
  if (e.feature != nullptr) SetRef(e.feature, m->mutable_feature());
  if (e.analysis != nullptr) SetRef(e.analysis, m->mutable_analysis());
}

model::AnalysisFeature FromProto(const pb::AnalysisFeature& m, ObjectCache& cache) {
  model::AnalysisFeature e;
  if (m.has_rawscore()) e.rawscore = m.rawscore();
  if (m.has_normscore()) e.normscore = m.normscore();
  if (m.has_significance()) e.significance = m.significance();
  if (m.has_identity()) e.identity = m.identity();
  e.feature  = GetRef(m.has_feature(), m.feature(), EntityType::kFeature, cache);
  e.analysis = GetRef(m.has_analysis(), m.analysis(), EntityType::kAnalysis, cache);
  return e;
}

void Describe(const model::AnalysisFeature& e, EntityVisitor& v) {
  Number(v, "rawscore", e.rawscore);
  Number(v, "normscore", e.normscore);
  Number(v, "significance", e.significance);
  Number(v, "identity", e.identity);
  ForeignKey(v, "feature_id", e.feature);
  ForeignKey(v, "analysis_id", e.analysis);
}

// ------------------------------------------------------------------
// Experiment side: Attribute / Datum / Protocol / AppliedProtocol
// ------------------------------------------------------------------

void ToProto(const model::Attribute& e, pb::Attribute* m) {
  m->set_heading(e.heading);
  m->set_name(e.name);
  m->set_value(e.value);
  m->set_rank(e.rank);
  if (e.type != nullptr) SetRef(e.type, m->mutable_type());
  if (e.dbxref != nullptr) SetRef(e.dbxref, m->mutable_dbxref());
}

model::Attribute FromProto(const pb::Attribute& m, ObjectCache& cache) {
  model::Attribute e;
  e.heading = m.heading();
  e.name    = m.name();
  e.value   = m.value();
  e.rank    = m.rank();
  e.type    = GetRef(m.has_type(), m.type(), EntityType::kCvTerm, cache);
  e.dbxref  = GetRef(m.has_dbxref(), m.dbxref(), EntityType::kDbXref, cache);
  return e;
}

void Describe(const model::Attribute& e, EntityVisitor& v) {
  Text(v, "heading", e.heading);
  Text(v, "name", e.name);
  Text(v, "value", e.value);
  Number(v, "rank", e.rank);
  ForeignKey(v, "type_id", e.type);
  ForeignKey(v, "dbxref_id", e.dbxref);
}

void ToProto(const model::Datum& e, pb::Datum* m) {
  m->set_heading(e.heading);
  m->set_name(e.name);
  m->set_value(e.value);
  if (e.type != nullptr) SetRef(e.type, m->mutable_type());
  if (e.dbxref != nullptr) SetRef(e.dbxref, m->mutable_dbxref());
  SetRefs(e.attributes, m->mutable_attributes());
  SetRefs(e.features, m->mutable_features());
}

model::Datum FromProto(const pb::Datum& m, ObjectCache& cache) {
  model::Datum e;
  e.heading    = m.heading();
  e.name       = m.name();
  e.value      = m.value();
  e.type       = GetRef(m.has_type(), m.type(), EntityType::kCvTerm, cache);
  e.dbxref     = GetRef(m.has_dbxref(), m.dbxref(), EntityType::kDbXref, cache);
  e.attributes = GetRefs(m.attributes(), EntityType::kAttribute, cache);
  e.features   = GetRefs(m.features(), EntityType::kFeature, cache);
  return e;
}

void Describe(const model::Datum& e, EntityVisitor& v) {
  Text(v, "heading", e.heading);
  Text(v, "name", e.name);
  Text(v, "value", e.value);
  ForeignKey(v, "type_id", e.type);
  ForeignKey(v, "dbxref_id", e.dbxref);
  Links(v, "data_attribute", "attribute_id", e.attributes);
  Links(v, "data_feature", "feature_id", e.features);
}

void ToProto(const model::Protocol& e, pb::Protocol* m) {
  m->set_name(e.name);
  m->set_description(e.description);
  m->set_version(e.version);
  if (e.dbxref != nullptr) SetRef(e.dbxref, m->mutable_dbxref());
  SetRefs(e.attributes, m->mutable_attributes());
}

model::Protocol FromProto(const pb::Protocol& m, ObjectCache& cache) {
  model::Protocol e;
  e.name        = m.name();
  e.description = m.description();
  e.version     = m.version();
  e.dbxref      = GetRef(m.has_dbxref(), m.dbxref(), EntityType::kDbXref, cache);
  e.attributes  = GetRefs(m.attributes(), EntityType::kAttribute, cache);
  return e;
}

void Describe(const model::Protocol& e, EntityVisitor& v) {
  Text(v, "name", e.name);
  Text(v, "description", e.description);
  Text(v, "version", e.version);
  ForeignKey(v, "dbxref_id", e.dbxref);
  Links(v, "protocol_attribute", "attribute_id", e.attributes);
}

void ToProto(const model::AppliedProtocol& e, pb::AppliedProtocol* m) {
  if (e.protocol != nullptr) SetRef(e.protocol, m->mutable_protocol());
  SetRefs(e.input_data, m->mutable_input_data());
  SetRefs(e.output_data, m->mutable_output_data());
}

model::AppliedProtocol FromProto(const pb::AppliedProtocol& m, ObjectCache& cache) {
  model::AppliedProtocol e;
  e.protocol    = GetRef(m.has_protocol(), m.protocol(), EntityType::kProtocol, cache);
  e.input_data  = GetRefs(m.input_data(), EntityType::kDatum, cache);
  e.output_data = GetRefs(m.output_data(), EntityType::kDatum, cache);
  return e;
}

void AppliedProtocolData(EntityVisitor& v, std::string_view direction, const std::vector<Handle*>& data) {
  for (Handle* datum : data) {
    v.BeginGroup("applied_protocol_data");
    v.Scalar("direction", direction);
    v.Reference("data_id", datum);
    v.EndGroup();
  }
}

void Describe(const model::AppliedProtocol& e, EntityVisitor& v) {
  ForeignKey(v, "protocol_id", e.protocol);
  AppliedProtocolData(v, "input", e.input_data);
  AppliedProtocolData(v, "output", e.output_data);
}

// ------------------------------------------------------------------
// ExperimentProp / Experiment
// ------------------------------------------------------------------

void ToProto(const model::ExperimentProp& e, pb::ExperimentProp* m) {
  m->set_name(e.name);
  m->set_value(e.value);
  m->set_rank(e.rank);
  if (e.type != nullptr) SetRef(e.type, m->mutable_type());
  if (e.dbxref != nullptr) SetRef(e.dbxref, m->mutable_dbxref());
}

model::ExperimentProp FromProto(const pb::ExperimentProp& m, ObjectCache& cache) {
  model::ExperimentProp e;
  e.name   = m.name();
  e.value  = m.value();
  e.rank   = m.rank();
  e.type   = GetRef(m.has_type(), m.type(), EntityType::kCvTerm, cache);
  e.dbxref = GetRef(m.has_dbxref(), m.dbxref(), EntityType::kDbXref, cache);
  return e;
}

void Describe(const model::ExperimentProp& e, EntityVisitor& v) {
  Text(v, "name", e.name);
  Text(v, "value", e.value);
  Number(v, "rank", e.rank);
  ForeignKey(v, "type_id", e.type);
  ForeignKey(v, "dbxref_id", e.dbxref);
}

void ToProto(const model::Experiment& e, pb::Experiment* m) {
  m->set_uniquename(e.uniquename);
  m->set_description(e.description);
  SetRefs(e.properties, m->mutable_properties());
  for (const auto& slot : e.applied_protocol_slots) {
    SetRefs(slot, m->add_slots()->mutable_steps());
  }
}

model::Experiment FromProto(const pb::Experiment& m, ObjectCache& cache) {
  model::Experiment e;
  e.uniquename  = m.uniquename();
  e.description = m.description();
  e.properties  = GetRefs(m.properties(), EntityType::kExperimentProp, cache);
  e.applied_protocol_slots.reserve(m.slots_size());
  for (const auto& slot : m.slots()) {
    e.applied_protocol_slots.push_back(GetRefs(slot.steps(), EntityType::kAppliedProtocol, cache));
  }
  return e;
}

void Describe(const model::Experiment& e, EntityVisitor& v) {
  Text(v, "uniquename", e.uniquename);
  Text(v, "description", e.description);
  Children(v, e.properties);

  for (std::size_t slot = 0; slot < e.applied_protocol_slots.size(); ++slot) {
    for (Handle* step : e.applied_protocol_slots[slot]) {
      v.BeginGroup("experiment_applied_protocol");
      Number(v, "slot", slot);
      v.Reference("applied_protocol_id", step);
      v.EndGroup();
    }
  }
}

// ------------------------------------------------------------------

template <typename Entity, typename Message>
void Register(CodecRegistry& registry) {
  using Codec = ProtoCodec<Entity, Message>;
  registry.Register(std::make_shared<Codec>(static_cast<typename Codec::ToProtoFn>(&ToProto),
                                            static_cast<typename Codec::FromProtoFn>(&FromProto),
                                            static_cast<typename Codec::DescribeFn>(&Describe)));
}

} // namespace

std::shared_ptr<CodecRegistry> BuildChadoCodecRegistry() {
  auto registry = std::make_shared<CodecRegistry>();

  Register<model::DB, pb::DB>(*registry);
  Register<model::DBXref, pb::DBXref>(*registry);
  Register<model::CV, pb::CV>(*registry);
  Register<model::CVTerm, pb::CVTerm>(*registry);
  Register<model::Analysis, pb::Analysis>(*registry);
  Register<model::Feature, pb::Feature>(*registry);
  Register<model::FeatureLoc, pb::FeatureLoc>(*registry);
  Register<model::FeatureRelationship, pb::FeatureRelationship>(*registry);
  Register<model::AnalysisFeature, pb::AnalysisFeature>(*registry);
  Register<model::Attribute, pb::Attribute>(*registry);
  Register<model::Datum, pb::Datum>(*registry);
  Register<model::Protocol, pb::Protocol>(*registry);
  Register<model::AppliedProtocol, pb::AppliedProtocol>(*registry);
  Register<model::ExperimentProp, pb::ExperimentProp>(*registry);
  Register<model::Experiment, pb::Experiment>(*registry);

  return registry;
}

} // namespace chadoxml::cache

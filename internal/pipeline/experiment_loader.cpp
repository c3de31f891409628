#include "experiment_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/cache/object_cache.hpp"
#include "internal/model/entities.hpp"
#include "internal/util/errors.hpp"

namespace chadoxml::pipeline {

namespace {

using cache::Handle;
using model::EntityType;

std::string Str(const YAML::Node& node, const char* key) {
  const auto value = node[key];
  if (!value || value.IsNull()) return {};
  if (!value.IsScalar()) throw util::ValidationError(std::string("'") + key + "' must be a scalar");
  return value.Scalar();
}

template <typename T>
std::optional<T> Opt(const YAML::Node& node, const char* key) {
  const auto value = node[key];
  if (!value || value.IsNull()) return std::nullopt;
  return value.as<T>();
}

template <typename T>
T Num(const YAML::Node& node, const char* key, T fallback) {
  return Opt<T>(node, key).value_or(fallback);
}

YAML::Node Seq(const YAML::Node& node, const char* key) {
  auto value = node[key];
  if (!value || value.IsNull()) return YAML::Node(YAML::NodeType::Sequence);
  if (!value.IsSequence()) throw util::ValidationError(std::string("'") + key + "' must be a list");
  return value;
}

std::string Required(const YAML::Node& node, const char* key, const char* what) {
  auto value = Str(node, key);
  if (value.empty()) throw util::ValidationError(std::string(what) + " is missing '" + key + "'");
  return value;
}

/*
  Turns YAML nodes into cached entities. Shared rows (CV, CVTerm, DBXref)
  are registered once per natural key.
*/
class GraphBuilder {
 public:
  explicit GraphBuilder(cache::ObjectCache& cache) : cache_(cache) {
  }

  Handle* Cv(const std::string& name) {
    if (auto* h = Registered(EntityType::kCv, name)) return h;
    model::CV cv;
    cv.name = name;
    return cache_.Put(name, std::move(cv));
  }

  // {db, accession[, version, description]}
  Handle* Xref(const YAML::Node& node) {
    if (!node || node.IsNull()) return nullptr;
    if (!node.IsMap()) throw util::ValidationError("dbxref must be a mapping");

    const auto db        = Required(node, "db", "dbxref");
    const auto accession = Required(node, "accession", "dbxref");
    const auto version   = Str(node, "version");

    std::string id = db + ":" + accession;
    if (!version.empty()) id += ":" + version;
    if (auto* h = Registered(EntityType::kDbXref, id)) return h;

    model::DBXref xref;
    xref.accession   = accession;
    xref.version     = version;
    xref.description = Str(node, "description");
    xref.db          = cache_.GetOrCreate(EntityType::kDb, db);
    return cache_.Put(id, std::move(xref));
  }

  // Xref for a list entry, where an empty entry is an error.
  Handle* XrefItem(const YAML::Node& node) {
    if (!node || node.IsNull()) throw util::ValidationError("dbxref list entries must not be empty");
    return Xref(node);
  }

  // {cv, term[, definition, db, accession]}
  Handle* Term(const YAML::Node& node) {
    if (!node || node.IsNull()) return nullptr;
    if (!node.IsMap()) throw util::ValidationError("term must be a mapping");

    const auto cv_name = Required(node, "cv", "term");
    const auto name    = Required(node, "term", "term");
    const auto id      = cv_name + ":" + name;
    if (auto* h = Registered(EntityType::kCvTerm, id)) return h;

    model::CVTerm term;
    term.name       = name;
    term.definition = Str(node, "definition");
    term.cv         = Cv(cv_name);
    if (node["db"]) term.dbxref = Xref(node);
    return cache_.Put(id, std::move(term));
  }

  Handle* Attribute(const YAML::Node& node, std::int32_t default_rank) {
    if (!node.IsMap()) throw util::ValidationError("attribute must be a mapping");

    model::Attribute attribute;
    attribute.heading = Str(node, "heading");
    attribute.name    = Str(node, "name");
    attribute.value   = Str(node, "value");
    attribute.rank    = Num<std::int32_t>(node, "rank", default_rank);
    attribute.type    = Term(node["type"]);
    attribute.dbxref  = Xref(node["dbxref"]);
    return Define(Str(node, "id"), std::move(attribute));
  }

  std::vector<Handle*> Attributes(const YAML::Node& node) {
    std::vector<Handle*> out;
    std::int32_t         rank = 0;
    for (const auto& item : Seq(node, "attributes")) out.push_back(Attribute(item, rank++));
    return out;
  }

  std::vector<Handle*> Refs(const YAML::Node& node, const char* key, EntityType type) {
    std::vector<Handle*> out;
    for (const auto& item : Seq(node, key)) {
      if (!item.IsScalar() || item.Scalar().empty()) {
        throw util::ValidationError(std::string("'") + key + "' entries must be non-empty identifiers");
      }
      out.push_back(cache_.GetOrCreate(type, item.Scalar()));
    }
    return out;
  }

  Handle* Ref(const YAML::Node& node, const char* key, EntityType type) {
    const auto id = Str(node, key);
    return id.empty() ? nullptr : cache_.GetOrCreate(type, id);
  }

  // Registers a declared row. An empty id is generated; an explicit one
  // must not already belong to a registered row of the same type.
  template <typename T>
  Handle* Define(std::string id, T entity) {
    if (!id.empty() && Registered(T::kType, id) != nullptr) {
      throw util::ValidationError("duplicate " + std::string(model::ToString(T::kType)) + " id '" + id + "'");
    }
    return cache_.Put(std::move(id), std::move(entity));
  }

  cache::ObjectCache& Cache() {
    return cache_;
  }

 private:
  Handle* Registered(EntityType type, const std::string& id) {
    auto* h = cache_.Find(type, id);
    return h != nullptr && h->IsRegistered() ? h : nullptr;
  }

  cache::ObjectCache& cache_;
};

// ------------------------------------------------------------------
// Sections
// ------------------------------------------------------------------

std::vector<Handle*> LoadTermSources(GraphBuilder& b, const YAML::Node& root) {
  std::vector<Handle*> out;
  for (const auto& node : Seq(root, "term_sources")) {
    model::DB db;
    db.name        = Required(node, "name", "term source");
    db.url         = Str(node, "url");
    db.description = Str(node, "description");

    auto id = db.name;
    out.push_back(b.Define(std::move(id), std::move(db)));
  }
  return out;
}

void LoadAnalyses(GraphBuilder& b, const YAML::Node& root) {
  for (const auto& node : Seq(root, "analyses")) {
    model::Analysis analysis;
    analysis.name           = Str(node, "name");
    analysis.description    = Str(node, "description");
    analysis.program        = Str(node, "program");
    analysis.programversion = Str(node, "programversion");
    analysis.algorithm      = Str(node, "algorithm");
    analysis.sourcename     = Str(node, "sourcename");
    analysis.sourceversion  = Str(node, "sourceversion");
    analysis.sourceuri      = Str(node, "sourceuri");

    auto id = Str(node, "id");
    if (id.empty()) id = analysis.name;
    b.Define(std::move(id), std::move(analysis));
  }
}

std::string FeatureId(const YAML::Node& node) {
  auto id = Str(node, "id");
  if (id.empty()) id = Required(node, "uniquename", "feature");
  return id;
}

void LoadFeatures(GraphBuilder& b, const YAML::Node& root) {
  const auto features = Seq(root, "features");

  // rows owned by the feature
  for (const auto& node : features) {
    const auto id = FeatureId(node);

    model::Feature feature;
    feature.name        = Str(node, "name");
    feature.uniquename  = Str(node, "uniquename");
    feature.residues    = Str(node, "residues");
    feature.seqlen      = Opt<std::int64_t>(node, "seqlen");
    feature.is_analysis = Num<bool>(node, "is_analysis", false);
    feature.type        = b.Term(node["type"]);
    if (feature.uniquename.empty()) feature.uniquename = id;

    for (const auto& xref : Seq(node, "dbxrefs")) feature.dbxrefs.push_back(b.XrefItem(xref));

    std::int32_t rank = 0;
    for (const auto& loc_node : Seq(node, "locations")) {
      model::FeatureLoc loc;
      loc.fmin       = Opt<std::int64_t>(loc_node, "fmin");
      loc.fmax       = Opt<std::int64_t>(loc_node, "fmax");
      loc.strand     = Opt<std::int32_t>(loc_node, "strand");
      loc.phase      = Opt<std::int32_t>(loc_node, "phase");
      loc.rank       = Num<std::int32_t>(loc_node, "rank", rank++);
      loc.srcfeature = b.Ref(loc_node, "srcfeature", EntityType::kFeature);
      feature.locations.push_back(b.Cache().Put(std::string(), std::move(loc)));
    }

    auto* self = b.Cache().GetOrCreate(EntityType::kFeature, id);
    for (const auto& af_node : Seq(node, "analysisfeatures")) {
      model::AnalysisFeature af;
      af.rawscore     = Opt<double>(af_node, "rawscore");
      af.normscore    = Opt<double>(af_node, "normscore");
      af.significance = Opt<double>(af_node, "significance");
      af.identity     = Opt<double>(af_node, "identity");
      af.feature      = self;
      af.analysis     = b.Ref(af_node, "analysis", EntityType::kAnalysis);
      feature.analysisfeatures.push_back(b.Cache().Put(std::string(), std::move(af)));
    }

    b.Define(id, std::move(feature));
  }

  // relationships, once every feature exists; linked from both ends
  for (const auto& node : features) {
    auto*        subject = b.Cache().GetOrCreate(EntityType::kFeature, FeatureId(node));
    std::int32_t rank    = 0;
    for (const auto& rel_node : Seq(node, "relationships")) {
      model::FeatureRelationship rel;
      rel.rank    = Num<std::int32_t>(rel_node, "rank", rank++);
      rel.type    = b.Term(rel_node["type"]);
      rel.subject = subject;
      rel.object  = b.Ref(rel_node, "object", EntityType::kFeature);
      if (rel.object == nullptr) throw util::ValidationError("feature relationship is missing 'object'");

      auto* object = rel.object;
      auto* handle = b.Cache().Put(std::string(), std::move(rel));

      b.Cache().Materialize<model::Feature>(subject).relationships.push_back(handle);
      if (object != subject && object->IsRegistered()) {
        b.Cache().Materialize<model::Feature>(object).relationships.push_back(handle);
      }
    }
  }
}

std::vector<Handle*> LoadProtocols(GraphBuilder& b, const YAML::Node& root) {
  std::vector<Handle*> out;
  for (const auto& node : Seq(root, "protocols")) {
    model::Protocol protocol;
    protocol.name        = Required(node, "name", "protocol");
    protocol.description = Str(node, "description");
    protocol.version     = Str(node, "version");
    protocol.dbxref      = b.Xref(node["dbxref"]);
    protocol.attributes  = b.Attributes(node);

    auto id = Str(node, "id");
    if (id.empty()) id = protocol.name;
    out.push_back(b.Define(std::move(id), std::move(protocol)));
  }
  return out;
}

void LoadData(GraphBuilder& b, const YAML::Node& root) {
  for (const auto& node : Seq(root, "data")) {
    model::Datum datum;
    datum.heading    = Str(node, "heading");
    datum.name       = Str(node, "name");
    datum.value      = Str(node, "value");
    datum.type       = b.Term(node["type"]);
    datum.dbxref     = b.Xref(node["dbxref"]);
    datum.attributes = b.Attributes(node);
    datum.features   = b.Refs(node, "features", EntityType::kFeature);

    b.Define(Required(node, "id", "datum"), std::move(datum));
  }
}

Handle* LoadExperiment(GraphBuilder& b, const YAML::Node& root) {
  const auto node = root["experiment"];
  if (!node || !node.IsMap()) throw util::ValidationError("document has no 'experiment' mapping");

  model::Experiment experiment;
  experiment.uniquename  = Required(node, "uniquename", "experiment");
  experiment.description = Str(node, "description");

  std::int32_t rank = 0;
  for (const auto& prop_node : Seq(node, "properties")) {
    model::ExperimentProp prop;
    prop.name   = Required(prop_node, "name", "experiment property");
    prop.value  = Str(prop_node, "value");
    prop.rank   = Num<std::int32_t>(prop_node, "rank", rank++);
    prop.type   = b.Term(prop_node["type"]);
    prop.dbxref = b.Xref(prop_node["dbxref"]);
    experiment.properties.push_back(b.Cache().Put(std::string(), std::move(prop)));
  }

  for (const auto& slot_node : Seq(node, "applied_protocols")) {
    if (!slot_node.IsSequence()) throw util::ValidationError("each applied protocol slot must be a list of steps");

    std::vector<Handle*> slot;
    for (const auto& step_node : slot_node) {
      model::AppliedProtocol step;
      step.protocol = b.Ref(step_node, "protocol", EntityType::kProtocol);
      if (step.protocol == nullptr) throw util::ValidationError("applied protocol step is missing 'protocol'");
      step.input_data  = b.Refs(step_node, "inputs", EntityType::kDatum);
      step.output_data = b.Refs(step_node, "outputs", EntityType::kDatum);
      slot.push_back(b.Cache().Put(std::string(), std::move(step)));
    }
    experiment.applied_protocol_slots.push_back(std::move(slot));
  }

  auto id = experiment.uniquename;
  return b.Define(std::move(id), std::move(experiment));
}

ExperimentDocument Load(const YAML::Node& root, cache::ObjectCache& cache) {
  if (!root.IsMap()) throw util::ValidationError("experiment document must be a mapping");

  GraphBuilder       builder(cache);
  ExperimentDocument doc;

  doc.term_sources = LoadTermSources(builder, root);
  LoadAnalyses(builder, root);
  LoadFeatures(builder, root);
  doc.protocols = LoadProtocols(builder, root);
  LoadData(builder, root);
  doc.experiment = LoadExperiment(builder, root);
  return doc;
}

} // namespace

ExperimentDocument ExperimentLoader::LoadFromYaml(const std::string& path, cache::ObjectCache& cache) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw util::ValidationError("failed to read " + path + ": " + e.what());
  }

  try {
    return Load(root, cache);
  } catch (const YAML::Exception& e) {
    throw util::ValidationError(path + ": " + e.what());
  }
}

ExperimentDocument ExperimentLoader::LoadFromString(const std::string& yaml, cache::ObjectCache& cache) {
  try {
    return Load(YAML::Load(yaml), cache);
  } catch (const YAML::Exception& e) {
    throw util::ValidationError(std::string("invalid experiment document: ") + e.what());
  }
}

} // namespace chadoxml::pipeline

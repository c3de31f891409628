#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/entity_type.hpp"

namespace chadoxml::cache {
class Handle;
}

namespace chadoxml::model {

/*
  Simplified Chado rows.

  Relationships are non-owning cache handles; the ObjectCache owns every
  handle and outlives all entities. Defaulted equality compares handles by
  identity, which is exactly graph identity.
*/

using cache::Handle;

struct DB {
  static constexpr EntityType kType = EntityType::kDb;

  std::string name;
  std::string url;
  std::string description;

  bool operator==(const DB&) const = default;
};

struct DBXref {
  static constexpr EntityType kType = EntityType::kDbXref;

  std::string accession;
  std::string version;
  std::string description;

  Handle* db = nullptr;

  bool operator==(const DBXref&) const = default;
};

struct CV {
  static constexpr EntityType kType = EntityType::kCv;

  std::string name;
  std::string definition;

  bool operator==(const CV&) const = default;
};

struct CVTerm {
  static constexpr EntityType kType = EntityType::kCvTerm;

  std::string name;
  std::string definition;
  bool        is_obsolete = false;

  Handle* cv     = nullptr;
  Handle* dbxref = nullptr;

  bool operator==(const CVTerm&) const = default;
};

struct Analysis {
  static constexpr EntityType kType = EntityType::kAnalysis;

  std::string name;
  std::string description;
  std::string program;
  std::string programversion;
  std::string algorithm;
  std::string sourcename;
  std::string sourceversion;
  std::string sourceuri;

  bool operator==(const Analysis&) const = default;
};

struct Feature {
  static constexpr EntityType kType = EntityType::kFeature;

  std::string                 name;
  std::string                 uniquename;
  std::string                 residues;
  std::optional<std::int64_t> seqlen;
  bool                        is_analysis = false;

  Handle*              type = nullptr;
  std::vector<Handle*> dbxrefs;
  std::vector<Handle*> locations;        // FeatureLoc
  std::vector<Handle*> relationships;    // FeatureRelationship, as subject or object
  std::vector<Handle*> analysisfeatures; // AnalysisFeature

  bool operator==(const Feature&) const = default;
};

struct FeatureLoc {
  static constexpr EntityType kType = EntityType::kFeatureLoc;

  std::optional<std::int64_t> fmin;
  std::optional<std::int64_t> fmax;
  std::optional<std::int32_t> strand;
  std::optional<std::int32_t> phase;
  std::int32_t                rank = 0;

  Handle* srcfeature = nullptr;

  bool operator==(const FeatureLoc&) const = default;
};

struct FeatureRelationship {
  static constexpr EntityType kType = EntityType::kFeatureRelationship;

  std::int32_t rank = 0;

  Handle* type    = nullptr;
  Handle* subject = nullptr;
  Handle* object  = nullptr;

  bool operator==(const FeatureRelationship&) const = default;
};

struct AnalysisFeature {
  static constexpr EntityType kType = EntityType::kAnalysisFeature;

  std::optional<double> rawscore;
  std::optional<double> normscore;
  std::optional<double> significance;
  std::optional<double> identity;

  Handle* feature  = nullptr;
  Handle* analysis = nullptr;

  bool operator==(const AnalysisFeature&) const = default;
};

struct Attribute {
  static constexpr EntityType kType = EntityType::kAttribute;

  std::string  heading;
  std::string  name;
  std::string  value;
  std::int32_t rank = 0;

  Handle* type   = nullptr;
  Handle* dbxref = nullptr;

  bool operator==(const Attribute&) const = default;
};

// "data" in BIR-TAB Chado.
struct Datum {
  static constexpr EntityType kType = EntityType::kDatum;

  std::string heading;
  std::string name;
  std::string value;

  Handle*              type   = nullptr;
  Handle*              dbxref = nullptr;
  std::vector<Handle*> attributes;
  std::vector<Handle*> features;

  bool operator==(const Datum&) const = default;
};

struct Protocol {
  static constexpr EntityType kType = EntityType::kProtocol;

  std::string name;
  std::string description;
  std::string version;

  Handle*              dbxref = nullptr;
  std::vector<Handle*> attributes;

  bool operator==(const Protocol&) const = default;
};

struct AppliedProtocol {
  static constexpr EntityType kType = EntityType::kAppliedProtocol;

  Handle*              protocol = nullptr;
  std::vector<Handle*> input_data;
  std::vector<Handle*> output_data;

  bool operator==(const AppliedProtocol&) const = default;
};

struct ExperimentProp {
  static constexpr EntityType kType = EntityType::kExperimentProp;

  std::string  name;
  std::string  value;
  std::int32_t rank = 0;

  Handle* type   = nullptr;
  Handle* dbxref = nullptr;

  bool operator==(const ExperimentProp&) const = default;
};

struct Experiment {
  static constexpr EntityType kType = EntityType::kExperiment;

  std::string uniquename;
  std::string description;

  std::vector<Handle*>              properties;
  std::vector<std::vector<Handle*>> applied_protocol_slots;

  bool operator==(const Experiment&) const = default;
};

} // namespace chadoxml::model

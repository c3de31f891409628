#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace chadoxml::model {

enum class EntityType : std::uint8_t {
  kDb = 0,
  kDbXref,
  kCv,
  kCvTerm,
  kAnalysis,
  kFeature,
  kFeatureLoc,
  kFeatureRelationship,
  kAnalysisFeature,
  kAttribute,
  kDatum,
  kProtocol,
  kAppliedProtocol,
  kExperimentProp,
  kExperiment,
};

inline constexpr std::array<EntityType, 15> kAllEntityTypes = {
    EntityType::kDb,          EntityType::kDbXref,         EntityType::kCv,
    EntityType::kCvTerm,      EntityType::kAnalysis,       EntityType::kFeature,
    EntityType::kFeatureLoc,  EntityType::kFeatureRelationship,
    EntityType::kAnalysisFeature,
    EntityType::kAttribute,   EntityType::kDatum,          EntityType::kProtocol,
    EntityType::kAppliedProtocol,
    EntityType::kExperimentProp,
    EntityType::kExperiment,
};

// Name used for generated identifiers and macro ids, e.g. "Feature_12".
constexpr std::string_view ToString(EntityType type) {
  switch (type) {
    case EntityType::kDb:
      return "DB";
    case EntityType::kDbXref:
      return "DBXref";
    case EntityType::kCv:
      return "CV";
    case EntityType::kCvTerm:
      return "CVTerm";
    case EntityType::kAnalysis:
      return "Analysis";
    case EntityType::kFeature:
      return "Feature";
    case EntityType::kFeatureLoc:
      return "FeatureLoc";
    case EntityType::kFeatureRelationship:
      return "FeatureRelationship";
    case EntityType::kAnalysisFeature:
      return "AnalysisFeature";
    case EntityType::kAttribute:
      return "Attribute";
    case EntityType::kDatum:
      return "Datum";
    case EntityType::kProtocol:
      return "Protocol";
    case EntityType::kAppliedProtocol:
      return "AppliedProtocol";
    case EntityType::kExperimentProp:
      return "ExperimentProp";
    case EntityType::kExperiment:
    default:
      return "Experiment";
  }
}

// Chado table name; doubles as the XML element name.
constexpr std::string_view ElementName(EntityType type) {
  switch (type) {
    case EntityType::kDb:
      return "db";
    case EntityType::kDbXref:
      return "dbxref";
    case EntityType::kCv:
      return "cv";
    case EntityType::kCvTerm:
      return "cvterm";
    case EntityType::kAnalysis:
      return "analysis";
    case EntityType::kFeature:
      return "feature";
    case EntityType::kFeatureLoc:
      return "featureloc";
    case EntityType::kFeatureRelationship:
      return "feature_relationship";
    case EntityType::kAnalysisFeature:
      return "analysisfeature";
    case EntityType::kAttribute:
      return "attribute";
    case EntityType::kDatum:
      return "data";
    case EntityType::kProtocol:
      return "protocol";
    case EntityType::kAppliedProtocol:
      return "applied_protocol";
    case EntityType::kExperimentProp:
      return "experiment_prop";
    case EntityType::kExperiment:
    default:
      return "experiment";
  }
}

} // namespace chadoxml::model

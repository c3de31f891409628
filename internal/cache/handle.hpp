#pragma once

#include <any>
#include <cstdint>
#include <string>
#include <string_view>

#include "internal/model/entity_type.hpp"

namespace chadoxml::cache {

enum class HandleState : std::uint8_t {
  kCompressed   = 0,
  kMaterialized = 1,
};

constexpr std::string_view ToString(HandleState state) {
  return state == HandleState::kMaterialized ? "materialized" : "compressed";
}

/*
  The single proxy for one (type, identifier) pair.

  Handles are created and owned by the ObjectCache; everyone else holds
  Handle* and compares them by address. The entity itself is only reachable
  through ObjectCache::Materialize, which keeps every state transition in
  one place.
*/
class Handle {
 public:
  Handle(model::EntityType type, std::string id);

  Handle(const Handle&)            = delete;
  Handle& operator=(const Handle&) = delete;

  model::EntityType Type() const {
    return type_;
  }

  const std::string& Id() const {
    return id_;
  }

  // Payload store key, e.g. "Feature:F1".
  const std::string& Key() const {
    return key_;
  }

  HandleState State() const {
    return state_;
  }

  bool IsMaterialized() const {
    return state_ == HandleState::kMaterialized;
  }

  // True once an entity has been Put under this handle.
  bool IsRegistered() const {
    return registered_;
  }

  // True while a compressed payload is parked in the payload store.
  bool HasPayload() const {
    return parked_;
  }

  // Cache clock value of the last Put or Materialize.
  std::uint64_t LastTouch() const {
    return last_touch_;
  }

  static std::string MakeKey(model::EntityType type, std::string_view id);

 private:
  friend class ObjectCache;

  model::EntityType type_;
  std::string       id_;
  std::string       key_;

  HandleState   state_      = HandleState::kCompressed;
  bool          registered_ = false;
  bool          parked_     = false;
  std::uint64_t last_touch_ = 0;

  std::any entity_;
};

} // namespace chadoxml::cache

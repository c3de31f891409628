#pragma once

#include <any>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

#include "internal/model/entity_type.hpp"
#include "internal/util/errors.hpp"

namespace chadoxml::cache {

class Handle;
class ObjectCache;

/*
  Receives an entity's fields in schema order.

    Scalar      a named text value
    Reference   a foreign key: <name> wrapping the target entity
    Child       an owned row nested directly under the entity
    BeginGroup  a link-table row without its own identity
*/
class EntityVisitor {
 public:
  virtual ~EntityVisitor() = default;

  virtual void Scalar(std::string_view name, std::string_view value) = 0;
  virtual void Reference(std::string_view name, Handle* target)      = 0;
  virtual void Child(Handle* target)                                 = 0;
  virtual void BeginGroup(std::string_view name)                     = 0;
  virtual void EndGroup()                                            = 0;
};

/*
  Per entity type compression strategy.

  Compress captures every field, storing referenced entities by identifier.
  Materialize rebuilds the entity and turns identifiers back into handles
  via ObjectCache::GetOrCreate, so neighbours stay compressed.
*/
class EntityCodec {
 public:
  virtual ~EntityCodec() = default;

  virtual model::EntityType Type() const = 0;

  virtual std::string Compress(const std::any& entity) const = 0;

  // Throws util::CacheConsistencyError when the payload does not parse.
  virtual std::any Materialize(std::string_view payload, ObjectCache& cache) const = 0;

  virtual void Describe(const std::any& entity, EntityVisitor& visitor) const = 0;
};

using EntityCodecPtr = std::shared_ptr<const EntityCodec>;

/*
  Type tag → codec dispatch table, filled once at startup.
*/
class CodecRegistry {
 public:
  void Register(EntityCodecPtr codec);

  bool Contains(model::EntityType type) const {
    return codecs_.count(type) > 0;
  }

  const EntityCodec& Get(model::EntityType type) const;

 private:
  std::unordered_map<model::EntityType, EntityCodecPtr> codecs_;
};

/*
  Codec over a protobuf message: the Message is the compressed form.
*/
template <typename Entity, typename Message>
class ProtoCodec final : public EntityCodec {
 public:
  using ToProtoFn   = void (*)(const Entity&, Message*);
  using FromProtoFn = Entity (*)(const Message&, ObjectCache&);
  using DescribeFn  = void (*)(const Entity&, EntityVisitor&);

  ProtoCodec(ToProtoFn to_proto, FromProtoFn from_proto, DescribeFn describe)
      : to_proto_(to_proto), from_proto_(from_proto), describe_(describe) {
  }

  model::EntityType Type() const override {
    return Entity::kType;
  }

  std::string Compress(const std::any& entity) const override {
    Message message;
    to_proto_(std::any_cast<const Entity&>(entity), &message);

    std::string bytes;
    if (!message.SerializeToString(&bytes)) {
      throw util::CacheConsistencyError("failed to encode " + std::string(model::ToString(Entity::kType)));
    }
    return bytes;
  }

  std::any Materialize(std::string_view payload, ObjectCache& cache) const override {
    Message message;
    if (!message.ParseFromArray(payload.data(), static_cast<int>(payload.size()))) {
      throw util::CacheConsistencyError("corrupt " + std::string(model::ToString(Entity::kType)) + " payload");
    }
    return std::any(from_proto_(message, cache));
  }

  void Describe(const std::any& entity, EntityVisitor& visitor) const override {
    describe_(std::any_cast<const Entity&>(entity), visitor);
  }

 private:
  ToProtoFn   to_proto_;
  FromProtoFn from_proto_;
  DescribeFn  describe_;
};

} // namespace chadoxml::cache

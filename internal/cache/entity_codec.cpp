#include "entity_codec.hpp"

#include <stdexcept>

namespace chadoxml::cache {

void CodecRegistry::Register(EntityCodecPtr codec) {
  if (!codec) throw std::invalid_argument("codec must not be null");

  const auto type = codec->Type();
  if (!codecs_.emplace(type, std::move(codec)).second) {
    throw std::invalid_argument("codec already registered for " + std::string(model::ToString(type)));
  }
}

const EntityCodec& CodecRegistry::Get(model::EntityType type) const {
  auto it = codecs_.find(type);
  if (it == codecs_.end()) {
    throw util::CacheConsistencyError("no codec registered for " + std::string(model::ToString(type)));
  }
  return *it->second;
}

} // namespace chadoxml::cache

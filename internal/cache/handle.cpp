#include "handle.hpp"

namespace chadoxml::cache {

Handle::Handle(model::EntityType type, std::string id) : type_(type), id_(std::move(id)), key_(MakeKey(type_, id_)) {
}

std::string Handle::MakeKey(model::EntityType type, std::string_view id) {
  std::string key(model::ToString(type));
  key.push_back(':');
  key.append(id);
  return key;
}

} // namespace chadoxml::cache

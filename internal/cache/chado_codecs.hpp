#pragma once

#include <memory>

#include "internal/cache/entity_codec.hpp"

namespace chadoxml::cache {

// Registry holding a codec for every entity type in model::kAllEntityTypes.
std::shared_ptr<CodecRegistry> BuildChadoCodecRegistry();

} // namespace chadoxml::cache

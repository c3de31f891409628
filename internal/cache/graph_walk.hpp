#pragma once

#include <vector>

#include "internal/cache/handle.hpp"

namespace chadoxml::cache {

class ObjectCache;

/*
  Every handle reachable from root, root first, breadth-first in schema
  order. Each handle appears once however many paths lead to it; cycles
  terminate. Visited handles are left materialized.
*/
std::vector<Handle*> CollectReachable(ObjectCache& cache, Handle* root);

} // namespace chadoxml::cache

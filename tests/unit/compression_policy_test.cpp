#include "internal/cache/compression_policy.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/cache/chado_codecs.hpp"
#include "internal/cache/object_cache.hpp"
#include "internal/model/entities.hpp"
#include "internal/storage/payload_compressor.hpp"
#include "internal/storage/ram/ram_payload_store.hpp"

namespace {

using chadoxml::cache::CompressionPolicy;
using chadoxml::cache::Handle;
using chadoxml::cache::ObjectCache;
namespace cfg   = chadoxml::runtime::config;
namespace model = chadoxml::model;

std::unique_ptr<ObjectCache> MakeCache() {
  return std::make_unique<ObjectCache>(chadoxml::cache::BuildChadoCodecRegistry(),
                                       std::make_shared<chadoxml::storage::RamPayloadStore>(),
                                       std::make_shared<chadoxml::storage::PayloadCompressor>());
}

std::vector<Handle*> PutData(ObjectCache& cache, int n) {
  std::vector<Handle*> out;
  for (int i = 0; i < n; ++i) {
    model::Datum d;
    d.name = "datum " + std::to_string(i);
    out.push_back(cache.Put("D" + std::to_string(i), d));
  }
  return out;
}

cfg::CacheConfig Config(cfg::CompressionPolicy policy, std::uint64_t max_materialized = 0) {
  cfg::CacheConfig config;
  config.set_policy(policy);
  config.set_max_materialized(max_materialized);
  return config;
}

std::size_t Materialized(ObjectCache& cache) {
  std::size_t n = 0;
  for (auto* h : cache.Handles()) n += h->IsMaterialized() ? 1 : 0;
  return n;
}

void TestNeverKeepsEverything() {
  auto cache = MakeCache();
  PutData(*cache, 5);

  CompressionPolicy policy(Config(cfg::COMPRESSION_POLICY_NEVER));
  const auto outcome = policy.Apply(*cache);
  assert(outcome.compressed == 0);
  assert(outcome.remaining == 5);
  assert(Materialized(*cache) == 5);
}

void TestUnspecifiedMeansNever() {
  auto cache = MakeCache();
  PutData(*cache, 2);

  CompressionPolicy policy(cfg::CacheConfig{});
  assert(policy.Mode() == cfg::COMPRESSION_POLICY_NEVER);
  assert(policy.Apply(*cache).compressed == 0);
}

void TestAfterStageCompressesAllButPinned() {
  auto cache = MakeCache();
  auto data  = PutData(*cache, 5);

  CompressionPolicy policy(Config(cfg::COMPRESSION_POLICY_AFTER_STAGE));
  policy.Pin(data[0]);

  const auto outcome = policy.Apply(*cache);
  assert(outcome.compressed == 4);
  assert(outcome.remaining == 1);
  assert(data[0]->IsMaterialized());
  for (std::size_t i = 1; i < data.size(); ++i) assert(!data[i]->IsMaterialized());

  policy.Unpin(data[0]);
  assert(policy.Apply(*cache).compressed == 1);
}

void TestThresholdEvictsLeastRecentlyTouched() {
  auto cache = MakeCache();
  auto data  = PutData(*cache, 5);

  // touch D1 and D3 so they become most recent
  (void)cache->Materialize<model::Datum>(data[1]);
  (void)cache->Materialize<model::Datum>(data[3]);

  CompressionPolicy policy(Config(cfg::COMPRESSION_POLICY_THRESHOLD, 2));
  const auto        outcome = policy.Apply(*cache);
  assert(outcome.compressed == 3);
  assert(outcome.remaining == 2);
  assert(data[1]->IsMaterialized());
  assert(data[3]->IsMaterialized());
  assert(!data[0]->IsMaterialized());

  // compressed entities come back intact
  assert(cache->Materialize<model::Datum>(data[0]).name == "datum 0");
}

void TestThresholdCountsPinnedHandles() {
  auto cache = MakeCache();
  auto data  = PutData(*cache, 4);

  CompressionPolicy policy(Config(cfg::COMPRESSION_POLICY_THRESHOLD, 2));
  policy.Pin(data[0]);

  const auto outcome = policy.Apply(*cache);
  assert(outcome.remaining == 2);
  assert(outcome.compressed == 2);
  assert(data[0]->IsMaterialized());
  assert(data[3]->IsMaterialized());
}

} // namespace

int main() {
  TestNeverKeepsEverything();
  TestUnspecifiedMeansNever();
  TestAfterStageCompressesAllButPinned();
  TestThresholdEvictsLeastRecentlyTouched();
  TestThresholdCountsPinnedHandles();

  std::cout << "chadoxml_unit_compression_policy: pass\n";
  return 0;
}

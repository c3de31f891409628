#include "internal/storage/payload_store.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "config/config.pb.h"
#include "internal/storage/ram/ram_payload_store.hpp"
#include "internal/storage/sqlite/sqlite_payload_store.hpp"
#include "internal/storage/storage_factory.hpp"

namespace {

using chadoxml::storage::PayloadStore;

std::filesystem::path SpillPath(const std::string& name) {
  const auto base_dir = std::filesystem::temp_directory_path() / "chadoxml_payload_store_tests";
  std::filesystem::create_directories(base_dir);
  return base_dir / (name + ".sqlite");
}

void ExerciseStore(PayloadStore& store) {
  assert(!store.Contains("Feature:F1"));
  assert(store.BytesStored() == 0);

  store.Write("Feature:F1", arrow::Buffer::FromString("abcdef"));
  store.Write("Datum:D1", arrow::Buffer::FromString("xyz"));
  assert(store.Contains("Feature:F1"));
  assert(store.BytesStored() == 9);
  assert(store.Read("Feature:F1")->ToString() == "abcdef");

  // replace adjusts the byte count
  store.Write("Feature:F1", arrow::Buffer::FromString("ab"));
  assert(store.Read("Feature:F1")->ToString() == "ab");
  assert(store.BytesStored() == 5);

  store.Remove("Feature:F1");
  store.Remove("Feature:absent");
  assert(!store.Contains("Feature:F1"));
  assert(store.BytesStored() == 3);

  bool threw = false;
  try {
    (void)store.Read("Feature:F1");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  // empty payloads are legal
  store.Write("CV:empty", arrow::Buffer::FromString(""));
  assert(store.Contains("CV:empty"));
  assert(store.Read("CV:empty")->size() == 0);
}

void TestRamStore() {
  chadoxml::storage::RamPayloadStore store;
  assert(store.Name() == "ram");
  ExerciseStore(store);
}

void TestSqliteStore() {
  auto path = SpillPath("sqlite_store");
  auto db   = std::make_shared<chadoxml::storage::sqlite::SqliteDB>(path.string());

  chadoxml::storage::SqlitePayloadStore store(db);
  assert(store.Name() == "sqlite");
  ExerciseStore(store);
}

void TestSqliteStoreStartsEmpty() {
  auto path = SpillPath("reopened");
  {
    chadoxml::storage::SqlitePayloadStore store(std::make_shared<chadoxml::storage::sqlite::SqliteDB>(path.string()));
    store.Write("Feature:F1", arrow::Buffer::FromString("stale"));
  }

  chadoxml::storage::SqlitePayloadStore store(std::make_shared<chadoxml::storage::sqlite::SqliteDB>(path.string()));
  assert(!store.Contains("Feature:F1"));
  assert(store.BytesStored() == 0);
}

void TestFactorySelectsBackendFromConfig() {
  chadoxml::runtime::config::CacheConfig cfg;
  auto ram = chadoxml::storage::StorageFactory::Build(cfg);
  assert(ram.store->Name() == "ram");
  assert(ram.compressor);

  cfg.mutable_spill()->set_sqlite_path(SpillPath("factory").string());
  auto spill = chadoxml::storage::StorageFactory::Build(cfg);
  assert(spill.store->Name() == "sqlite");

  using chadoxml::storage::StorageFactory;
  assert(StorageFactory::ResolveCompression(chadoxml::runtime::config::PAYLOAD_CODEC_NONE) ==
         arrow::Compression::UNCOMPRESSED);
  assert(StorageFactory::ResolveCompression(chadoxml::runtime::config::PAYLOAD_CODEC_LZ4) ==
         arrow::Compression::LZ4_FRAME);
  assert(StorageFactory::ResolveCompression(chadoxml::runtime::config::PAYLOAD_CODEC_ZSTD) == arrow::Compression::ZSTD);
}

} // namespace

int main() {
  TestRamStore();
  TestSqliteStore();
  TestSqliteStoreStartsEmpty();
  TestFactorySelectsBackendFromConfig();

  std::cout << "chadoxml_unit_payload_store: pass\n";
  return 0;
}

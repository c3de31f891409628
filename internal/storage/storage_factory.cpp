#include "storage_factory.hpp"

#include "internal/storage/ram/ram_payload_store.hpp"
#include "internal/storage/sqlite/sqlite_payload_store.hpp"

namespace chadoxml::storage {

using chadoxml::runtime::config::PayloadCodec;

arrow::Compression::type StorageFactory::ResolveCompression(PayloadCodec codec) {
  switch (codec) {
    case chadoxml::runtime::config::PAYLOAD_CODEC_LZ4:
      return arrow::Compression::LZ4_FRAME;
    case chadoxml::runtime::config::PAYLOAD_CODEC_ZSTD:
      return arrow::Compression::ZSTD;
    case chadoxml::runtime::config::PAYLOAD_CODEC_NONE:
    case chadoxml::runtime::config::PAYLOAD_CODEC_UNSPECIFIED:
    default:
      return arrow::Compression::UNCOMPRESSED;
  }
}

PayloadStorage StorageFactory::Build(const chadoxml::runtime::config::CacheConfig& cfg) {
  PayloadStorage storage;
  storage.compressor = std::make_shared<PayloadCompressor>(ResolveCompression(cfg.codec()));

  if (!cfg.spill().sqlite_path().empty()) {
    auto db       = std::make_shared<sqlite::SqliteDB>(cfg.spill().sqlite_path());
    storage.store = std::make_shared<SqlitePayloadStore>(std::move(db));
  } else {
    storage.store = std::make_shared<RamPayloadStore>();
  }

  return storage;
}

} // namespace chadoxml::storage

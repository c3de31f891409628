#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/storage/payload_compressor.hpp"
#include "internal/storage/payload_store.hpp"

namespace chadoxml::storage {

/*
  Builds the payload store and compressor from configuration.

  Core uses this as:

      auto storage = StorageFactory::Build(config.cache());
      ObjectCache cache(codecs, storage.store, storage.compressor);
*/

struct PayloadStorage {
  PayloadStorePtr                    store;
  std::shared_ptr<PayloadCompressor> compressor;
};

class StorageFactory {
 public:
  static PayloadStorage Build(const chadoxml::runtime::config::CacheConfig& cfg);

  static arrow::Compression::type ResolveCompression(chadoxml::runtime::config::PayloadCodec codec);
};

} // namespace chadoxml::storage

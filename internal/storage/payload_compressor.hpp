#pragma once

#include <arrow/buffer.h>
#include <arrow/util/compression.h>

#include <memory>
#include <string>
#include <string_view>

namespace chadoxml::storage {

/*
  Block compression for entity payloads.

  Compressed frames carry the raw length up front because Arrow codecs need
  the output size to decompress:

      [uint64 little-endian raw length][codec bytes]

  UNCOMPRESSED passes bytes through without a frame.
*/
class PayloadCompressor {
 public:
  explicit PayloadCompressor(arrow::Compression::type type = arrow::Compression::UNCOMPRESSED);

  std::shared_ptr<arrow::Buffer> Compress(std::string_view raw) const;

  // Throws std::runtime_error on a truncated or undecodable frame.
  std::string Decompress(const arrow::Buffer& frame) const;

  std::string Name() const;

 private:
  arrow::Compression::type            type_;
  std::unique_ptr<arrow::util::Codec> codec_;
};

} // namespace chadoxml::storage

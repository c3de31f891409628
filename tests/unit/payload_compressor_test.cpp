#include "internal/storage/payload_compressor.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/storage/common/arrow_utils.hpp"

namespace {

using chadoxml::storage::PayloadCompressor;

std::string SamplePayload() {
  std::string raw;
  for (int i = 0; i < 200; ++i) raw += "FeatureLoc fmin=" + std::to_string(i * 100) + ";";
  return raw;
}

void TestUncompressedPassesBytesThrough() {
  PayloadCompressor compressor;
  const auto        raw   = SamplePayload();
  const auto        frame = compressor.Compress(raw);
  assert(frame->ToString() == raw);
  assert(compressor.Decompress(*frame) == raw);
  assert(compressor.Decompress(*compressor.Compress("")).empty());
}

void TestCodecRoundTrip(arrow::Compression::type type) {
  if (!arrow::util::Codec::IsAvailable(type)) {
    std::cout << "skipping unavailable codec " << arrow::util::Codec::GetCodecAsString(type) << "\n";
    return;
  }

  PayloadCompressor compressor(type);
  const auto        raw   = SamplePayload();
  const auto        frame = compressor.Compress(raw);

  assert(frame->size() < static_cast<std::int64_t>(raw.size()));
  assert(compressor.Decompress(*frame) == raw);
  assert(compressor.Decompress(*compressor.Compress("")).empty());

  bool threw = false;
  try {
    (void)compressor.Decompress(*arrow::Buffer::FromString("abc"));
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "truncated frames must be rejected");
}

void TestUnwrapMovesOrThrows() {
  using chadoxml::storage::common::Unwrap;

  auto owned = Unwrap(arrow::Result<std::unique_ptr<int>>(std::make_unique<int>(7)));
  assert(owned != nullptr && *owned == 7);

  std::shared_ptr<arrow::Buffer> buffer = Unwrap(arrow::AllocateBuffer(16));
  assert(buffer->size() == 16);

  bool threw = false;
  try {
    (void)Unwrap(arrow::Result<std::unique_ptr<int>>(arrow::Status::Invalid("no codec")));
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("no codec") != std::string::npos;
  }
  assert(threw);

  threw = false;
  try {
    Unwrap(arrow::Status::IOError("disk gone"));
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestUnwrapMovesOrThrows();
  TestUncompressedPassesBytesThrough();
  TestCodecRoundTrip(arrow::Compression::LZ4_FRAME);
  TestCodecRoundTrip(arrow::Compression::ZSTD);

  std::cout << "chadoxml_unit_payload_compressor: pass\n";
  return 0;
}

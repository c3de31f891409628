#include "payload_compressor.hpp"

#include <cstdint>
#include <cstring>
#include <stdexcept>

#include "internal/storage/common/arrow_utils.hpp"

namespace chadoxml::storage {

using common::Unwrap;

namespace {

constexpr std::int64_t kHeaderBytes = 8;

void PutLength(std::uint8_t* out, std::uint64_t value) {
  for (int i = 0; i < kHeaderBytes; ++i) {
    out[i] = static_cast<std::uint8_t>(value >> (8 * i));
  }
}

std::uint64_t GetLength(const std::uint8_t* in) {
  std::uint64_t value = 0;
  for (int i = 0; i < kHeaderBytes; ++i) {
    value |= static_cast<std::uint64_t>(in[i]) << (8 * i);
  }
  return value;
}

} // namespace

PayloadCompressor::PayloadCompressor(arrow::Compression::type type) : type_(type) {
  if (type_ != arrow::Compression::UNCOMPRESSED) {
    codec_ = Unwrap(arrow::util::Codec::Create(type_));
  }
}

std::shared_ptr<arrow::Buffer> PayloadCompressor::Compress(std::string_view raw) const {
  const auto* input     = reinterpret_cast<const std::uint8_t*>(raw.data());
  const auto  input_len = static_cast<std::int64_t>(raw.size());

  if (!codec_) {
    return arrow::Buffer::FromString(std::string(raw));
  }

  const std::int64_t max_len = codec_->MaxCompressedLen(input_len, input);
  std::shared_ptr<arrow::ResizableBuffer> frame = Unwrap(arrow::AllocateResizableBuffer(kHeaderBytes + max_len));

  PutLength(frame->mutable_data(), static_cast<std::uint64_t>(input_len));
  const std::int64_t written = Unwrap(codec_->Compress(input_len, input, max_len, frame->mutable_data() + kHeaderBytes));
  Unwrap(frame->Resize(kHeaderBytes + written, /*shrink_to_fit=*/true));
  return frame;
}

std::string PayloadCompressor::Decompress(const arrow::Buffer& frame) const {
  if (!codec_) {
    return frame.ToString();
  }

  if (frame.size() < kHeaderBytes) {
    throw std::runtime_error("compressed payload is truncated");
  }

  const std::uint64_t raw_len = GetLength(frame.data());
  std::string         raw(static_cast<size_t>(raw_len), '\0');
  if (raw_len == 0) return raw;

  const std::int64_t produced = Unwrap(codec_->Decompress(frame.size() - kHeaderBytes, frame.data() + kHeaderBytes,
                                                          static_cast<std::int64_t>(raw_len), reinterpret_cast<std::uint8_t*>(raw.data())));
  if (static_cast<std::uint64_t>(produced) != raw_len) {
    throw std::runtime_error("compressed payload length mismatch");
  }
  return raw;
}

std::string PayloadCompressor::Name() const {
  return arrow::util::Codec::GetCodecAsString(type_);
}

} // namespace chadoxml::storage

#pragma once

#include <arrow/result.h>
#include <arrow/status.h>

#include <stdexcept>
#include <utility>

namespace chadoxml::storage::common {

/*
  Unwrap an Arrow Result<T> or throw std::runtime_error.

  Arrow allocators and codec factories hand back Result<std::unique_ptr<...>>,
  so the rvalue overload moves the value out instead of copying it.
*/
template <typename T>
T Unwrap(arrow::Result<T>&& result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return std::move(result).ValueUnsafe();
}

template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw std::runtime_error(status.ToString());
}

} // namespace chadoxml::storage::common

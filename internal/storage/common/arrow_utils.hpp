#pragma once

#include <arrow/result.h>

#include <stdexcept>

namespace fetchgate::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return *result;
}

} // namespace fetchgate::storage::common

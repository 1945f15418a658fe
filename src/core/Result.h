#pragma once

#include <type_traits>
#include <utility>

#include "ReaderFailure.h"

namespace quire {

// Value-or-failure returned by every reader operation.
// Check ok() before touching value; err is FailureKind::None on success.
template <typename T>
struct Result {
  T value{};
  ReaderFailure err;

  bool ok() const { return err.kind == FailureKind::None; }
};

template <>
struct Result<void> {
  ReaderFailure err;

  bool ok() const { return err.kind == FailureKind::None; }
};

inline Result<void> Ok() { return Result<void>{}; }

template <typename T>
Result<typename std::decay<T>::type> Ok(T&& value) {
  Result<typename std::decay<T>::type> result;
  result.value = std::forward<T>(value);
  return result;
}

template <typename T>
Result<T> Err(ReaderFailure failure) {
  Result<T> result;
  result.err = std::move(failure);
  return result;
}

inline Result<void> ErrVoid(ReaderFailure failure) {
  Result<void> result;
  result.err = std::move(failure);
  return result;
}

}  // namespace quire

#pragma once

#include "escrow/domain/escrow_error.hpp"

#include <utility>
#include <variant>

namespace escrow {

// -----------------------------------------------------------------------------
// Result<T>: value-or-error return type for engine and ledger operations
// -----------------------------------------------------------------------------
//
// @brief  Holds exactly one of: a T on success, or an EscrowError on failure.
//
// @details
// Domain failures (wrong caller, wrong status, insufficient funds) are normal
// outcomes of a lifecycle call, not exceptional ones, so the engine reports
// them through the return value. Both constructors are implicit so an
// operation can simply `return id;` or `return EscrowError::NotFound;`.
//
// Backed by std::variant<T, EscrowError>. T must not itself be EscrowError.
//
// Accessing value() on an error (or error() on a success) throws
// std::bad_variant_access. Check ok() first.
//
// Thread model:
//   Value type. Safe to copy and move between threads.
// -----------------------------------------------------------------------------
template <typename T>
class Result {
 public:
  Result(T value) : storage_(std::in_place_index<0>, std::move(value)) {}
  Result(EscrowError error) : storage_(std::in_place_index<1>, error) {}

  bool ok() const { return storage_.index() == 0; }
  explicit operator bool() const { return ok(); }

  const T& value() const { return std::get<0>(storage_); }
  T& value() { return std::get<0>(storage_); }

  EscrowError error() const { return std::get<1>(storage_); }

 private:
  std::variant<T, EscrowError> storage_;
};

}  // namespace escrow

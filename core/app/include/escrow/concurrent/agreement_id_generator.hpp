#pragma once

#include "escrow/domain/agreement.hpp"

namespace escrow {

// -----------------------------------------------------------------------------
// AgreementIdGenerator: dense, monotonically increasing agreement ID source
// -----------------------------------------------------------------------------
//
// @brief  Hands out agreement IDs 1, 2, 3, ... with no gaps and no reuse.
//
// @details
// Allocation is split in two steps so a failed creation never consumes an ID:
//
//   peek()    returns the ID the next agreement will receive.
//   commit()  advances the counter once the agreement has been stored.
//
// The EscrowEngine calls peek(), runs its checks, writes the record and only
// then calls commit(). If any check fails in between, the counter is left
// untouched and the next create sees the same ID again.
//
// ID 0 is reserved as an "unset" sentinel and is never returned.
//
// Why not a singleton:
//   The counter is part of one engine's state. It is owned as a value member
//   by EscrowEngine so two engines (e.g. two tests) never share a sequence.
//
// Thread model:
//   Not synchronized. The owning engine is single-threaded; its host
//   serializes calls.
// -----------------------------------------------------------------------------
class AgreementIdGenerator {
 public:
  AgreementIdGenerator() = default;

  // Non-copyable, non-movable: a copied generator would produce duplicate IDs.
  AgreementIdGenerator(const AgreementIdGenerator&) = delete;
  AgreementIdGenerator& operator=(const AgreementIdGenerator&) = delete;
  AgreementIdGenerator(AgreementIdGenerator&&) = delete;
  AgreementIdGenerator& operator=(AgreementIdGenerator&&) = delete;

  // -------------------------------------------------------------------------
  // peek()
  // -------------------------------------------------------------------------
  // @brief  Returns the ID the next committed agreement will receive.
  //
  // @details
  // Pure read. Calling peek() any number of times without commit() returns
  // the same value.
  // -------------------------------------------------------------------------
  domain::AgreementId peek() const { return next_id_; }

  // -------------------------------------------------------------------------
  // commit()
  // -------------------------------------------------------------------------
  // @brief  Marks the peeked ID as used and returns it.
  //
  // @return The ID that was current before the call (== previous peek()).
  //
  // Side-effects: The next peek() returns the committed ID + 1.
  // -------------------------------------------------------------------------
  domain::AgreementId commit() { return next_id_++; }

 private:
  domain::AgreementId next_id_{1};
};

}  // namespace escrow

/**
 * @file chunk_store.hpp
 * @brief ChunkStore — ordinal-keyed holding area for out-of-order (parallel) uploads.
 *
 * @details
 * The store is the parallel-mode half of an upload. Chunks land here keyed by
 * their ordinal in whatever order the transport delivers them; nothing is
 * concatenated until the Assembler consolidates.
 *
 * Rules:
 * - Re-inserting an ordinal overwrites the previous chunk (last write wins).
 *   Retries are therefore idempotent.
 * - There is no size or count limit here; the caller's message ceiling is the limit.
 * - Iteration is always in ascending ordinal order (`std::map`), so every
 *   listing and every concatenation is deterministic.
 *
 * All operations are total: there are no failure modes.
 */
#ifndef LARGEOBJ_CHUNK_STORE_HPP
#define LARGEOBJ_CHUNK_STORE_HPP

#include "types.hpp"
#include <map>

namespace largeobj {

class ChunkStore {
public:
  using Map = std::map<Ordinal, Bytes>;

  /// Insert or overwrite the chunk at `ordinal`.
  void insert(Ordinal ordinal, const Bytes& bytes);

  /// Move-in overload; avoids copying large chunk payloads.
  void insert(Ordinal ordinal, Bytes&& bytes);

  /**
   * @brief Remove a single chunk.
   * @return true if a chunk was present and removed; false otherwise.
   */
  bool remove(Ordinal ordinal);

  /// Remove every chunk.
  void clear() { chunks_.clear(); }

  bool contains(Ordinal ordinal) const { return chunks_.count(ordinal) != 0; }

  /// Pointer to the stored bytes, or nullptr if `ordinal` is absent.
  const Bytes* find(Ordinal ordinal) const;

  /**
   * @brief Every ordinal in [0, expected_count) that is not stored, ascending.
   * @details An empty result means the range is complete. `expected_count == 0`
   *          always yields an empty list.
   */
  OrdinalList missing(uint32_t expected_count) const;

  /// Stored ordinals that are >= `limit`, ascending.
  OrdinalList ordinals_at_or_above(uint32_t limit) const;

  /// All stored ordinals, ascending.
  OrdinalList ordinals() const;

  /// Number of stored chunks.
  size_t count() const { return chunks_.size(); }

  bool empty() const { return chunks_.empty(); }

  /// Sum of all stored chunk lengths.
  size_t total_bytes() const;

  /// Read-only access for consolidation and serialization (ascending order).
  const Map& chunks() const { return chunks_; }

  /// Swap contents with another store (used for all-or-nothing restore).
  void swap(ChunkStore& other) { chunks_.swap(other.chunks_); }

private:
  Map chunks_;  ///< ordinal -> raw chunk bytes
};

} // namespace largeobj

#endif // LARGEOBJ_CHUNK_STORE_HPP

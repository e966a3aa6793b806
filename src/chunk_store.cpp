// -----------------------------------------------------------------------------
// chunk_store.cpp — ordinal-keyed chunk map for parallel uploads.
//
// API & contracts: see include/largeobj/chunk_store.hpp
// -----------------------------------------------------------------------------
#include "largeobj/chunk_store.hpp"

namespace largeobj {

void ChunkStore::insert(Ordinal ordinal, const Bytes& bytes) {
  chunks_[ordinal] = bytes;           // overwrite on retry: last write wins
}

void ChunkStore::insert(Ordinal ordinal, Bytes&& bytes) {
  chunks_[ordinal] = std::move(bytes);
}

bool ChunkStore::remove(Ordinal ordinal) {
  return chunks_.erase(ordinal) != 0;
}

const Bytes* ChunkStore::find(Ordinal ordinal) const {
  auto it = chunks_.find(ordinal);
  if (it == chunks_.end()) return nullptr;
  return &it->second;
}

// missing() — walk the requested range once, in step with the sorted map.
// POLICY:
//   - Never assume chunks start at 0 or are contiguous; every ordinal in
//     [0, expected_count) is checked.
//   - Ordinals >= expected_count are ignored here (see ordinals_at_or_above()).
// OUT:
//   - Ascending list of absent ordinals; empty when complete.
OrdinalList ChunkStore::missing(uint32_t expected_count) const {
  OrdinalList out;
  auto it = chunks_.begin();
  for (uint32_t i = 0; i < expected_count; ++i) {
    // keys are sorted and unique, so the cursor is always at the first key >= i
    if (it != chunks_.end() && it->first == i) {
      ++it;                           // present
    } else {
      out.push_back(i);               // gap
    }
  }
  return out;
}

OrdinalList ChunkStore::ordinals_at_or_above(uint32_t limit) const {
  OrdinalList out;
  for (auto it = chunks_.lower_bound(limit); it != chunks_.end(); ++it) {
    out.push_back(it->first);
  }
  return out;
}

OrdinalList ChunkStore::ordinals() const {
  OrdinalList out;
  out.reserve(chunks_.size());
  for (const auto& kv : chunks_) out.push_back(kv.first);
  return out;
}

size_t ChunkStore::total_bytes() const {
  size_t total = 0;
  for (const auto& kv : chunks_) total += kv.second.size();
  return total;
}

} // namespace largeobj

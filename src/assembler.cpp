// -----------------------------------------------------------------------------
// assembler.cpp — Implementation of the largeobj Assembler
//
// This file contains the *implementation details* for the Assembler class
// declared in `assembler.hpp`.
//
// API & field descriptions:
//   see include/largeobj/assembler.hpp
//
// Usage tests:
//   see tests/test_assembler_sequential.cpp, tests/test_assembler_parallel.cpp
// -----------------------------------------------------------------------------
#include "largeobj/assembler.hpp"
#include "largeobj/state_codec.hpp"

#include <sstream>

namespace largeobj {

// ---------- status rendering ----------

std::string to_string(const Status& st) {
  std::ostringstream os;
  os << "Sequential buffer: " << st.buffered_byte_count << " bytes\n"
     << "Parallel chunks: " << st.pending_chunk_count << " chunks, "
     << st.pending_byte_count << " bytes total\n"
     << "Chunk IDs: [";
  for (size_t i = 0; i < st.pending_ordinals.size(); ++i) {
    if (i) os << ", ";
    os << st.pending_ordinals[i];
  }
  os << "]";
  return os.str();
}

// ---------- public ----------

Assembler::Assembler(EventSink* sink)
: sink_(sink) {}

// ---------- sequential ----------

void Assembler::append_chunk(const Bytes& bytes) {
  buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

void Assembler::append_chunk(Bytes&& bytes) {
  if (buffer_.empty()) {              // first chunk: adopt storage instead of copying
    buffer_ = std::move(bytes);
    return;
  }
  buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

// finalize() — hand out the buffer and leave an empty one behind.
// POLICY:
//   - swap, not copy: the returned object owns the storage, the engine keeps
//     a fresh empty vector. A stale object cannot be returned twice.
Bytes Assembler::finalize() {
  Bytes out;
  out.swap(buffer_);

  Event ev(EventLevel::Info, "finalize", "finalized ");
  ev.append_number(out.size()).append(" bytes");
  ev.value = static_cast<int64_t>(out.size());
  emit(sink_, ev);
  return out;
}

// ---------- parallel ----------

void Assembler::append_parallel_chunk(Ordinal ordinal, const Bytes& bytes) {
  chunks_.insert(ordinal, bytes);
}

void Assembler::append_parallel_chunk(Ordinal ordinal, Bytes&& bytes) {
  chunks_.insert(ordinal, std::move(bytes));
}

bool Assembler::remove_parallel_chunk(Ordinal ordinal) {
  return chunks_.remove(ordinal);
}

// -----------------------------------------------------------------------------
// consolidate() — bridge parallel chunks into the buffer.
// PRE:
//   - Every ordinal in [0, expected_count) present (else IncompleteUpload).
//   - No ordinal >= expected_count present (else UnexpectedChunks).
// POLICY:
//   - Assemble into a scratch vector first; the buffer and store are touched
//     only after assembly finished, so a failure is a strict no-op.
//   - The buffer is replaced, never appended to. Mixing sequential output with
//     a parallel upload is not a supported workflow.
//   - Re-running consolidate() for a second upload on the same engine is
//     allowed; each success overwrites the buffer.
// OUT:
//   - byte_count on success; missing/unexpected lists on failure.
// -----------------------------------------------------------------------------
ConsolidateResult Assembler::consolidate(uint32_t expected_count) {
  ConsolidateResult res;
  res.error = check_parallel(expected_count, res.missing, res.unexpected);

  if (!res.ok()) {
    Event ev(EventLevel::Warn, "consolidate.fail", to_string(res.error));
    if (res.error == AssemblyError::IncompleteUpload) {
      ev.append(": missing ").append_number(res.missing.size());
      ev.value = static_cast<int64_t>(res.missing.size());
    } else {
      ev.append(": stray ").append_number(res.unexpected.size());
      ev.value = static_cast<int64_t>(res.unexpected.size());
    }
    ev.append(" of ").append_number(expected_count);
    emit(sink_, ev);
    return res;
  }

  Bytes assembled;
  concatenate(assembled);

  // Commit: replace buffer, drain store.
  buffer_.swap(assembled);
  chunks_.clear();
  res.byte_count = buffer_.size();

  Event ev(EventLevel::Info, "consolidate.ok", "consolidated ");
  ev.append_number(expected_count).append(" chunks, ")
    .append_number(res.byte_count).append(" bytes");
  ev.value = static_cast<int64_t>(res.byte_count);
  emit(sink_, ev);
  return res;
}

AssemblyError Assembler::peek_parallel(uint32_t expected_count, Bytes& out) const {
  OrdinalList missing_list, unexpected_list;
  AssemblyError err = check_parallel(expected_count, missing_list, unexpected_list);
  if (!ok(err)) return err;

  Bytes assembled;
  concatenate(assembled);
  out.swap(assembled);
  return AssemblyError::None;
}

// ---------- status / reset ----------

Status Assembler::status() const {
  Status st;
  st.buffered_byte_count = buffer_.size();
  st.pending_chunk_count = chunks_.count();
  st.pending_byte_count  = chunks_.total_bytes();
  st.pending_ordinals    = chunks_.ordinals();
  return st;
}

void Assembler::reset() {
  size_t dropped_bytes = buffer_.size() + chunks_.total_bytes();
  buffer_.clear();
  chunks_.clear();

  Event ev(EventLevel::Info, "reset", "reset, discarded ");
  ev.append_number(dropped_bytes).append(" bytes");
  ev.value = static_cast<int64_t>(dropped_bytes);
  emit(sink_, ev);
}

// ---------- restart boundary ----------

Bytes Assembler::export_state() const {
  if (!state_encodable(buffer_, chunks_)) {
    Event ev(EventLevel::Error, "export.oversize", "state too large to export (");
    ev.append_number(buffer_.size() + chunks_.total_bytes()).append(" bytes)");
    ev.value = static_cast<int64_t>(buffer_.size() + chunks_.total_bytes());
    emit(sink_, ev);
    return Bytes();
  }
  return encode_state(buffer_, chunks_);
}

// import_state() — all-or-nothing restore.
// POLICY:
//   - decode_state() writes its outputs only on success, and it writes into
//     scratch objects here; the live state is swapped in as the last step.
AssemblyError Assembler::import_state(const Bytes& blob) {
  Bytes      buffer;
  ChunkStore chunks;
  AssemblyError err = decode_state(blob, buffer, chunks);

  if (!ok(err)) {
    Event ev(EventLevel::Error, "import.fail", "state blob rejected (");
    ev.append_number(blob.size()).append(" bytes), state kept");
    ev.value = static_cast<int64_t>(blob.size());
    emit(sink_, ev);
    return err;
  }

  buffer_.swap(buffer);
  chunks_.swap(chunks);

  Event ev(EventLevel::Info, "import.ok", "restored ");
  ev.append_number(buffer_.size()).append(" buffered bytes, ")
    .append_number(chunks_.count()).append(" pending chunks");
  ev.value = static_cast<int64_t>(blob.size());
  emit(sink_, ev);
  return AssemblyError::None;
}

// ---------- private ----------

AssemblyError Assembler::check_parallel(uint32_t expected_count,
                                        OrdinalList& missing_out,
                                        OrdinalList& unexpected_out) const {
  missing_out = chunks_.missing(expected_count);
  if (!missing_out.empty()) return AssemblyError::IncompleteUpload;

  unexpected_out = chunks_.ordinals_at_or_above(expected_count);
  if (!unexpected_out.empty()) return AssemblyError::UnexpectedChunks;

  return AssemblyError::None;
}

// concatenate() — ascending ordinal order, no separators.
// PRE: check_parallel() passed, so the store holds exactly 0..expected_count-1
// and walking the sorted map is walking the object front to back.
void Assembler::concatenate(Bytes& out) const {
  out.clear();
  out.reserve(chunks_.total_bytes());
  for (const auto& kv : chunks_.chunks()) {
    out.insert(out.end(), kv.second.begin(), kv.second.end());
  }
}

} // namespace largeobj

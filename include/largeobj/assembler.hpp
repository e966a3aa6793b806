/**
 * @file assembler.hpp
 * @brief largeobj Assembler — the chunked large-object assembly engine.
 *
 * @details
 * ## Field Brief
 * A compute unit that accepts messages of bounded size still has to receive
 * objects far larger than one message. The **Assembler** is where those objects
 * are put back together. It does not know transports, callers or storage. It
 * only knows **chunks in**, **one buffer out**, and **state that survives a restart**.
 *
 * ---
 *
 * @par Two Modes, One State
 * - **Sequential:** the caller guarantees order. Each `append_chunk()` grows the
 *   buffer directly.
 * - **Parallel:** chunks arrive keyed by ordinal, in any order, possibly with
 *   gaps. They wait in the ChunkStore until `consolidate(n)` finds ordinals
 *   `0..n-1` all present, then they are concatenated into the buffer.
 *
 * ```
 *   append_chunk(bytes) ───────────────────────────────► buffer ──► finalize()
 *                                                          ▲        (read + clear)
 *   append_parallel_chunk(ord, bytes) ──► ChunkStore ──────┘
 *                          missing(n) / is_complete(n)   consolidate(n)
 * ```
 *
 * ---
 *
 * @par Invariants
 * - Sequential mode writes only the buffer; parallel mode writes only the store.
 *   `consolidate()` is the only bridge, and it leaves the store empty.
 * - A failed `consolidate()` changes nothing: not the buffer, not the store.
 * - `finalize()` returns the buffer and empties it in one step. An object can
 *   never be handed out twice.
 * - Re-sending an ordinal overwrites it (last write wins).
 *
 * ---
 *
 * @par Failure Model
 * - **Gaps:** `consolidate(n)` returns `IncompleteUpload` with the full missing
 *   list, so the caller can re-request exactly those ordinals.
 * - **Stray ordinals:** chunks at or above `n` make `consolidate(n)` return
 *   `UnexpectedChunks` with the offending ordinals. They are never dropped silently.
 * - **Corrupt restore:** `import_state()` returns `DeserializationError` and the
 *   engine keeps whatever state it had before the call.
 * - **Abandoned uploads:** nothing expires on its own. Partial state stays until
 *   the caller runs `reset()`, `clear_chunks()`, or a later consolidation overwrites it.
 *
 * ---
 *
 * @par Restart Boundary
 * `export_state()` turns the whole engine (buffer + pending chunks) into one
 * versioned blob (see state_codec.hpp); `import_state()` brings it back. The host
 * parks the blob in its key-value store between the two.
 *
 * ---
 *
 * @par Threading
 * One call at a time, start to finish. No locks, no suspension points. One
 * Assembler holds one in-flight object; run several (keyed by object id, see
 * UploadService) for concurrent uploads.
 *
 * @par Minimal Usage Example
 * @code
 * largeobj::EventLog log;
 * largeobj::Assembler asmb(&log);
 *
 * asmb.append_parallel_chunk(2, {'l','o'});
 * asmb.append_parallel_chunk(0, {'H','e','l'});
 * asmb.append_parallel_chunk(1, {'l'});
 *
 * auto res = asmb.consolidate(3);     // res.ok(), res.byte_count == 6
 * largeobj::Bytes object = asmb.finalize();
 * @endcode
 */
#ifndef LARGEOBJ_ASSEMBLER_HPP
#define LARGEOBJ_ASSEMBLER_HPP

#include <string>
#include "types.hpp"
#include "chunk_store.hpp"
#include "events.hpp"

namespace largeobj {

/**
 * @brief Live snapshot of engine occupancy, for caller-side progress reporting.
 *
 * Always computed on demand from the current state; never cached.
 */
struct Status {
  size_t      buffered_byte_count = 0;  ///< Bytes in the output buffer.
  size_t      pending_chunk_count = 0;  ///< Chunks waiting in the store.
  size_t      pending_byte_count  = 0;  ///< Sum of pending chunk sizes.
  OrdinalList pending_ordinals;         ///< Pending ordinals, ascending.
};

/// Multi-line human-readable rendering of a Status.
std::string to_string(const Status& st);

/**
 * @brief Outcome of `Assembler::consolidate()`.
 *
 * On success `error == None` and `byte_count` is the size written to the
 * buffer. On `IncompleteUpload`, `missing` lists every absent ordinal. On
 * `UnexpectedChunks`, `unexpected` lists ordinals at or above the expected count.
 */
struct ConsolidateResult {
  AssemblyError error = AssemblyError::None;
  size_t        byte_count = 0;
  OrdinalList   missing;
  OrdinalList   unexpected;

  bool ok() const { return error == AssemblyError::None; }
};

/**
 * @class Assembler
 * @brief Owns one object's assembly state: the output buffer and the chunk store.
 *
 * @details
 * The Assembler is an ordinary value owned by its caller. There is no global
 * instance: tests build as many as they like, and UploadService keeps one per
 * object id.
 *
 * The optional `EventSink` receives telemetry for consolidations, restores,
 * finalizations and resets. It is not owned and may be null.
 */
class Assembler {
public:
  /**
   * @brief Construct an empty engine.
   * @param sink Telemetry sink (not owned; may be nullptr).
   */
  explicit Assembler(EventSink* sink = nullptr);

  /// Replace the telemetry sink (not owned; may be nullptr).
  void set_event_sink(EventSink* sink) { sink_ = sink; }

  /// @name Sequential mode
  ///@{

  /**
   * @brief Append bytes to the end of the buffer.
   *
   * @details
   * Always succeeds; bounded only by host memory. Used when the caller
   * guarantees chunk order.
   */
  void append_chunk(const Bytes& bytes);

  /// Move-in overload for large chunks.
  void append_chunk(Bytes&& bytes);

  /**
   * @brief Read the buffer and reset it to empty, as one operation.
   *
   * @details
   * This is the finalize step for both modes. A second call without new data
   * returns an empty sequence.
   *
   * @return The buffer contents prior to the call.
   */
  Bytes finalize();

  /// Current buffer length in bytes.
  size_t buffer_size() const { return buffer_.size(); }

  /// Read-only view of the buffer (does not clear it).
  const Bytes& buffer() const { return buffer_; }

  /// Discard the buffer without reading it.
  void clear_buffer() { buffer_.clear(); }

  /// Replace the buffer wholesale (e.g. to seed it from previously stored data).
  void load_buffer(Bytes bytes) { buffer_ = std::move(bytes); }
  ///@}

  /// @name Parallel mode
  ///@{

  /**
   * @brief Store a chunk under its ordinal.
   *
   * @details
   * Any order, any gaps. Re-sending an ordinal overwrites the previous chunk,
   * which makes transport retries idempotent.
   */
  void append_parallel_chunk(Ordinal ordinal, const Bytes& bytes);

  /// Move-in overload for large chunks.
  void append_parallel_chunk(Ordinal ordinal, Bytes&& bytes);

  /**
   * @brief Drop one pending chunk (e.g. before a corrected re-send).
   * @return true if the ordinal was pending.
   */
  bool remove_parallel_chunk(Ordinal ordinal);

  /// Drop every pending chunk; the buffer is untouched.
  void clear_chunks() { chunks_.clear(); }

  /// Ordinals in [0, expected_count) not yet received, ascending.
  OrdinalList missing(uint32_t expected_count) const { return chunks_.missing(expected_count); }

  /**
   * @brief True when the store holds exactly the ordinals [0, expected_count).
   * @details A true answer means consolidate(expected_count) will succeed: no
   *          ordinal is missing and none sits at or above the count.
   * @note `expected_count == 0` is vacuously complete on an empty store.
   */
  bool is_complete(uint32_t expected_count) const {
    return chunks_.count() == expected_count && missing(expected_count).empty();
  }

  /**
   * @brief Merge chunks 0..expected_count-1 into the buffer and empty the store.
   *
   * @details
   * PRE: every ordinal below `expected_count` is present and none at or above it.
   * On success the buffer is *replaced* (not appended to) by the ascending
   * concatenation of the chunks and the store is cleared. On failure nothing
   * changes. Safe to call repeatedly while chunks are still arriving.
   *
   * @param expected_count Total chunk count declared by the caller.
   * @return Result with byte count, or the error with missing/unexpected ordinals.
   */
  ConsolidateResult consolidate(uint32_t expected_count);

  /**
   * @brief Assemble the pending chunks into `out` without consuming them.
   *
   * @details
   * Same preconditions and byte layout as consolidate(), but neither the buffer
   * nor the store is modified. Useful to checksum an object before committing.
   *
   * @retval AssemblyError::None             `out` holds the assembled bytes.
   * @retval AssemblyError::IncompleteUpload an ordinal is missing; `out` untouched.
   * @retval AssemblyError::UnexpectedChunks stray ordinals present; `out` untouched.
   */
  AssemblyError peek_parallel(uint32_t expected_count, Bytes& out) const;

  /// Read-only access to the pending chunks.
  const ChunkStore& chunks() const { return chunks_; }
  ///@}

  /// Live occupancy snapshot.
  Status status() const;

  /// Explicit reset entry point: clears both buffer and chunk store.
  void reset();

  /// @name Restart boundary
  ///@{

  /**
   * @brief Serialize buffer + pending chunks into one versioned blob.
   * @details Returns an empty blob and records an `export.oversize` error event
   *          when a length does not fit the blob's u32 fields (see state_codec.hpp).
   */
  Bytes export_state() const;

  /**
   * @brief Restore state from a blob produced by export_state().
   *
   * @details
   * All-or-nothing: on `DeserializationError` the current state is kept exactly
   * as it was. On success the current state is replaced entirely.
   */
  AssemblyError import_state(const Bytes& blob);
  ///@}

private:
  /**
   * @brief Shared precondition check for consolidate() and peek_parallel().
   * @param expected_count Declared chunk count.
   * @param missing_out    Filled with absent ordinals.
   * @param unexpected_out Filled with ordinals >= expected_count.
   */
  AssemblyError check_parallel(uint32_t expected_count,
                               OrdinalList& missing_out,
                               OrdinalList& unexpected_out) const;

  /// Concatenate every pending chunk, ascending, into `out` (preconditions already checked).
  void concatenate(Bytes& out) const;

private:
  Bytes       buffer_;            ///< Sequential / consolidated output.
  ChunkStore  chunks_;            ///< Pending parallel chunks.
  EventSink*  sink_{nullptr};     ///< Telemetry (not owned).
};

} // namespace largeobj

#endif // LARGEOBJ_ASSEMBLER_HPP

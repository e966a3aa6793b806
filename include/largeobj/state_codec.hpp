/**
 * @file state_codec.hpp
 * @brief Versioned binary encoding of assembler state for the restart boundary.
 *
 * @details
 * PURPOSE
 * -------
 * Before a restart the host exports the assembler state into one opaque blob and
 * parks it in the key-value store; after the restart it hands the blob back. This
 * file defines that blob. It is small, explicit and owned by this project, so the
 * restore contract does not depend on any serialization library's wire format.
 *
 * LAYOUT (all integers little-endian)
 * -----------------------------------
 * ```
 *   header : 'L' 'O' 'B' 'J' | version u8 | record_count u32
 *   record : tag u8 | length u32 | value[length]
 *
 *   TAG_BUFFER  value = sequential buffer bytes            exactly one record
 *   TAG_CHUNK   value = ordinal u32 | chunk bytes          zero or more, ascending
 * ```
 * Records are TLVs in the same spirit as a command frame: a tag says what the
 * field is, a length says how far to skip. Lengths are 32-bit because chunk and
 * buffer payloads are far larger than a radio frame.
 *
 * VALIDATION
 * ----------
 * `decode_state()` refuses anything it cannot account for byte-for-byte:
 *   - header shorter than 9 bytes, wrong magic, unknown version;
 *   - a record whose length runs past the end of the blob;
 *   - an unknown tag, a missing or repeated buffer record;
 *   - a chunk record shorter than its 4-byte ordinal, or a repeated ordinal;
 *   - a record count that does not match, or bytes left over at the end.
 *
 * MAINTENANCE
 * -----------
 * - Tags are part of the persisted contract; never renumber them.
 * - Record lengths are u32: a buffer above STATE_RECORD_MAX bytes, or a chunk
 *   above STATE_CHUNK_MAX bytes, cannot be encoded. `encode_state()` returns an
 *   empty blob for such state instead of truncating a length.
 * - Add fields with new tags and bump STATE_VERSION; keep decoding old versions.
 */
#ifndef LARGEOBJ_STATE_CODEC_HPP
#define LARGEOBJ_STATE_CODEC_HPP

#include "types.hpp"
#include "chunk_store.hpp"

namespace largeobj {

/// Current blob version written by encode_state().
static constexpr uint8_t STATE_VERSION = 1;

/// Size of the fixed header: magic(4) + version(1) + record_count(4).
static constexpr size_t STATE_HEADER_SIZE = 9;

/// Record tags. Persisted: never renumber.
/// Largest record value a u32 length can describe (4 GiB - 1).
static constexpr size_t STATE_RECORD_MAX = 0xFFFFFFFFu;

/// Largest chunk payload: the record also carries the 4-byte ordinal.
static constexpr size_t STATE_CHUNK_MAX = STATE_RECORD_MAX - 4;

enum : uint8_t {
    TAG_BUFFER = 0x01,  /**< sequential buffer bytes */
    TAG_CHUNK  = 0x02   /**< ordinal u32 followed by chunk bytes */
};

/**
 * @brief Serialize the buffer and every pending chunk into one blob.
 * @param buffer Sequential/consolidated output buffer.
 * @param chunks Pending parallel chunks (written in ascending ordinal order).
 * @return Self-describing blob of at least STATE_HEADER_SIZE bytes, or an empty
 *         blob when state_encodable() is false.
 */
Bytes encode_state(const Bytes& buffer, const ChunkStore& chunks);

/// True when every length (and the record count) fits the u32 fields.
bool state_encodable(const Bytes& buffer, const ChunkStore& chunks);

/// Length checks behind state_encodable(), usable without allocating the payload.
inline bool buffer_len_encodable(size_t len) { return len <= STATE_RECORD_MAX; }
inline bool chunk_len_encodable(size_t len)  { return len <= STATE_CHUNK_MAX; }

/**
 * @brief Parse a blob produced by encode_state().
 * @param blob       Input bytes.
 * @param buffer_out Receives the buffer on success.
 * @param chunks_out Receives the chunks on success.
 * @return AssemblyError::None on success; DeserializationError otherwise.
 *
 * On failure neither output is modified.
 */
AssemblyError decode_state(const Bytes& blob, Bytes& buffer_out, ChunkStore& chunks_out);

} // namespace largeobj

#endif // LARGEOBJ_STATE_CODEC_HPP

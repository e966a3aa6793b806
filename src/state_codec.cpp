#include "largeobj/state_codec.hpp"   // blob layout, tags, and encode/decode API

#include <string.h>                   // memcmp for the magic check

namespace largeobj {
// ============================================================================
// Low-level helpers
// ============================================================================
// Everything is little-endian, byte by byte, so the blob is identical on every
// host regardless of native endianness.

static const uint8_t STATE_MAGIC[4] = { 'L', 'O', 'B', 'J' };

static inline void put_u8(Bytes& b, uint8_t v) {
    b.push_back(v);
}

static inline void put_u32(Bytes& b, uint32_t v) {
    b.push_back(static_cast<uint8_t>(v & 0xFF));
    b.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    b.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    b.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

// Record header only; the caller appends the value bytes.
static inline void put_record_header(Bytes& b, uint8_t tag, uint32_t len) {
    put_u8(b, tag);
    put_u32(b, len);
}

// ---------------------------------------------------------------------------
// Bounds-checked cursor over the input blob. Every read reports success; the
// decoder bails out on the first short read.
// ---------------------------------------------------------------------------
struct Reader {
    const uint8_t* p;
    size_t         len;
    size_t         pos;

    size_t remaining() const { return len - pos; }

    bool u8(uint8_t& v) {
        if (remaining() < 1) return false;
        v = p[pos++];
        return true;
    }

    bool u32(uint32_t& v) {
        if (remaining() < 4) return false;
        v = static_cast<uint32_t>(p[pos])
          | (static_cast<uint32_t>(p[pos + 1]) << 8)
          | (static_cast<uint32_t>(p[pos + 2]) << 16)
          | (static_cast<uint32_t>(p[pos + 3]) << 24);
        pos += 4;
        return true;
    }

    bool bytes(size_t n, const uint8_t*& out) {
        if (remaining() < n) return false;
        out = p + pos;
        pos += n;
        return true;
    }
};

// ============================================================================
// encode_state()
// ---------------------------------------------------------------------------
// Phases: header, buffer record, one record per chunk (map order = ascending).
// The record count is known up front, so nothing is backfilled.
// Oversized state yields an empty blob (see state_encodable()).
// ============================================================================
bool state_encodable(const Bytes& buffer, const ChunkStore& chunks) {
    if (!buffer_len_encodable(buffer.size())) return false;
    if (chunks.count() >= STATE_RECORD_MAX) return false;   // 1 + count must fit u32
    for (const auto& kv : chunks.chunks()) {
        if (!chunk_len_encodable(kv.second.size())) return false;
    }
    return true;
}

Bytes encode_state(const Bytes& buffer, const ChunkStore& chunks) {
    if (!state_encodable(buffer, chunks)) return Bytes();   // never truncate a length

    size_t total = STATE_HEADER_SIZE + 5 + buffer.size();
    for (const auto& kv : chunks.chunks()) total += 5 + 4 + kv.second.size();

    Bytes b;
    b.reserve(total);                                   // one allocation for the whole blob

    // Phase: header
    b.insert(b.end(), STATE_MAGIC, STATE_MAGIC + 4);
    put_u8(b, STATE_VERSION);
    put_u32(b, static_cast<uint32_t>(1 + chunks.count()));

    // Phase: buffer record
    put_record_header(b, TAG_BUFFER, static_cast<uint32_t>(buffer.size()));
    b.insert(b.end(), buffer.begin(), buffer.end());

    // Phase: chunk records
    for (const auto& kv : chunks.chunks()) {
        put_record_header(b, TAG_CHUNK, static_cast<uint32_t>(4 + kv.second.size()));
        put_u32(b, kv.first);
        b.insert(b.end(), kv.second.begin(), kv.second.end());
    }
    return b;
}

// ============================================================================
// decode_state()
// ---------------------------------------------------------------------------
// PRE:   blob is untrusted.
// POLICY:
//   - Parse into locals; outputs are only touched after the whole blob has
//     been accepted (all-or-nothing).
//   - Any inconsistency is a DeserializationError; no partial recovery.
// OUT:
//   - buffer_out / chunks_out replaced on success.
// ============================================================================
AssemblyError decode_state(const Bytes& blob, Bytes& buffer_out, ChunkStore& chunks_out) {
    Reader r{ blob.data(), blob.size(), 0 };

    // Phase: header
    const uint8_t* magic = nullptr;
    uint8_t  version = 0;
    uint32_t record_count = 0;
    if (!r.bytes(4, magic) || memcmp(magic, STATE_MAGIC, 4) != 0) return AssemblyError::DeserializationError;
    if (!r.u8(version) || version != STATE_VERSION)               return AssemblyError::DeserializationError;
    if (!r.u32(record_count))                                     return AssemblyError::DeserializationError;

    // Phase: records
    Bytes      buffer;
    ChunkStore chunks;
    bool       have_buffer = false;

    for (uint32_t i = 0; i < record_count; ++i) {
        uint8_t  tag = 0;
        uint32_t len = 0;
        const uint8_t* value = nullptr;
        if (!r.u8(tag) || !r.u32(len) || !r.bytes(len, value)) {
            return AssemblyError::DeserializationError;     // truncated record
        }

        switch (tag) {
            case TAG_BUFFER:
                if (have_buffer) return AssemblyError::DeserializationError;
                buffer.assign(value, value + len);
                have_buffer = true;
                break;

            case TAG_CHUNK: {
                Reader v{ value, len, 0 };
                uint32_t ordinal = 0;
                if (!v.u32(ordinal))           return AssemblyError::DeserializationError;
                if (chunks.contains(ordinal))  return AssemblyError::DeserializationError;
                chunks.insert(ordinal, Bytes(value + 4, value + len));
                break;
            }

            default:
                return AssemblyError::DeserializationError; // unknown tag
        }
    }

    if (!have_buffer)       return AssemblyError::DeserializationError;
    if (r.remaining() != 0) return AssemblyError::DeserializationError; // trailing garbage

    // Commit
    buffer_out.swap(buffer);
    chunks_out.swap(chunks);
    return AssemblyError::None;
}

} // namespace largeobj

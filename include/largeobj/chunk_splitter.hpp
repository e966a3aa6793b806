/**
 * @file chunk_splitter.hpp
 * @brief ChunkSplitter — cut a large payload into fixed-size, ordinal-numbered chunks.
 *
 * ---
 *
 * ## Purpose
 *
 * The assembler consumes chunks; something on the sending side has to produce
 * them. `ChunkSplitter` is that something: it walks a byte payload and yields
 * consecutive `chunk_size` slices, each tagged with its ordinal, without copying
 * the source. The last chunk carries the remainder and may be shorter.
 *
 * It is used by the CLI (`largeobj-cli upload`) and by the tests to drive both
 * sequential and parallel uploads from a single source buffer.
 *
 * ---
 *
 * ## Usage
 *
 * ```cpp
 * ChunkSplitter splitter(payload, 1024);
 * ChunkView view;
 * while (splitter.next(view)) {
 *     service.append_parallel_chunk(view.ordinal, view.to_bytes());
 * }
 * // expected count for consolidation:
 * uint32_t n = splitter.count();
 * ```
 *
 * ---
 *
 * ## Error Flags
 *
 * | Code | Meaning                    |
 * |------|----------------------------|
 * | 0    | OK                         |
 * | 1    | chunk_size is zero         |
 * | 2    | Empty or not initialized   |
 *
 * ---
 *
 * The splitter borrows the source: the payload must outlive it.
 */
#ifndef LARGEOBJ_CHUNK_SPLITTER_HPP
#define LARGEOBJ_CHUNK_SPLITTER_HPP

#include "types.hpp"

namespace largeobj {

/// Default chunk size: 1 MiB, comfortably under a 2 MiB single-message ceiling.
static constexpr size_t CHUNK_SIZE_DEFAULT = 1024 * 1024;

/// Non-owning slice of the source payload.
struct ChunkView {
    Ordinal        ordinal = 0;
    const uint8_t* data    = nullptr;
    size_t         size    = 0;

    /// Copy the slice out as an owned chunk.
    Bytes to_bytes() const { return Bytes(data, data + size); }
};

struct ChunkSplitter {
    /// Start of the borrowed payload.
    const uint8_t* src = nullptr;

    /// Payload length in bytes.
    size_t src_len = 0;

    /// Bytes per chunk (last chunk may be shorter).
    size_t chunk_size = CHUNK_SIZE_DEFAULT;

    /// Ordinal that next() will return.
    Ordinal iter_idx = 0;

    /// Error state: 0 ok, 1 zero chunk size, 2 empty, 3 more than UINT32_MAX chunks.
    uint8_t error = 2;

    /// Default constructor. Creates empty (error=2).
    ChunkSplitter() = default;

    ChunkSplitter(const Bytes& payload, size_t size = CHUNK_SIZE_DEFAULT);

    /// Point at a new payload and reset iteration.
    void set(const uint8_t* data, size_t len, size_t size = CHUNK_SIZE_DEFAULT);

    void set(const Bytes& payload, size_t size = CHUNK_SIZE_DEFAULT) {
        set(payload.data(), payload.size(), size);
    }

    /// Rewind next() to ordinal 0.
    void reset() { iter_idx = 0; }

    /**
     * @brief Yield the next chunk.
     * @return false once every chunk has been produced (or on error).
     */
    bool next(ChunkView& out);

    /// Total chunk count for the payload (the expected count for consolidation).
    uint32_t count() const;

private:
    size_t chunk_total() const;
};

/// Split `payload` into owned chunks of `chunk_size`. Empty result on error or empty input.
std::vector<Bytes> split_into_chunks(const Bytes& payload, size_t chunk_size = CHUNK_SIZE_DEFAULT);

} // namespace largeobj

#endif // LARGEOBJ_CHUNK_SPLITTER_HPP

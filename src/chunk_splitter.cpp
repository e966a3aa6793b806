/**
 * @file chunk_splitter.cpp
 * @brief ChunkSplitter implementation (borrowed payload, fixed-size slices).
 *
 * Refer to chunk_splitter.hpp for full code-level documentation.
 */
#include "largeobj/chunk_splitter.hpp"

namespace largeobj {

ChunkSplitter::ChunkSplitter(const Bytes& payload, size_t size) {
    set(payload, size);
}

// set(): Attach a payload and validate the chunk size
// ---------------------------------------------------
// Flags:
// - error = 0: ready to iterate
// - error = 1: chunk_size of zero (would never terminate)
// - error = 2: empty payload (zero chunks)
// - error = 3: more chunks than a u32 count can declare
void ChunkSplitter::set(const uint8_t* data, size_t len, size_t size) {
    src = data;
    src_len = len;
    chunk_size = size;
    iter_idx = 0;

    if (chunk_size == 0) {
        error = 1;
        return;
    }
    if (len == 0) {
        error = 2;
        return;
    }
    error = (chunk_total() > UINT32_MAX) ? 3 : 0;
}

// chunk_total(): ceil(src_len / chunk_size) without forming src_len + chunk_size.
size_t ChunkSplitter::chunk_total() const {
    return src_len / chunk_size + (src_len % chunk_size != 0 ? 1 : 0);
}

// count(): ceil(src_len / chunk_size), or 0 when not usable.
uint32_t ChunkSplitter::count() const {
    if (error != 0) return 0;
    return static_cast<uint32_t>(chunk_total());
}

// next(): Returns the slice for iter_idx and advances.
// The slice points into the borrowed payload; nothing is copied.
bool ChunkSplitter::next(ChunkView& out) {
    if (error != 0) return false;

    if (iter_idx >= count()) return false;        // all chunks produced
    size_t offset = static_cast<size_t>(iter_idx) * chunk_size;

    size_t remaining = src_len - offset;
    out.ordinal = iter_idx++;
    out.data    = src + offset;
    out.size    = (remaining > chunk_size) ? chunk_size : remaining;
    return true;
}

std::vector<Bytes> split_into_chunks(const Bytes& payload, size_t chunk_size) {
    std::vector<Bytes> out;
    ChunkSplitter splitter(payload, chunk_size);
    out.reserve(splitter.count());

    ChunkView view;
    while (splitter.next(view)) out.push_back(view.to_bytes());
    return out;
}

} // namespace largeobj

/**
 * @file types.hpp
 * @brief Shared vocabulary for largeobj: byte buffers, ordinals, and error codes.
 *
 * @details
 * Every component in largeobj speaks in the same three terms:
 *  - `Bytes`   : an owned, contiguous byte sequence (chunk payloads, the output buffer,
 *                exported state blobs).
 *  - `Ordinal` : the zero-based position of a chunk inside the final object.
 *  - `AssemblyError` : the single status code returned by any operation that can fail.
 *
 * Library code never throws. Operations that can fail return an `AssemblyError`
 * (or a result struct carrying one); `AssemblyError::None` means success.
 */
#ifndef LARGEOBJ_TYPES_HPP
#define LARGEOBJ_TYPES_HPP

#include <stdint.h>
#include <stddef.h>
#include <vector>

namespace largeobj {

/// Owned byte sequence used for chunk payloads, the output buffer and state blobs.
using Bytes = std::vector<uint8_t>;

/// Zero-based chunk position within the reassembled object.
using Ordinal = uint32_t;

/// Ascending list of ordinals (missing chunks, pending chunks, stray chunks).
using OrdinalList = std::vector<Ordinal>;

/**
 * @brief Status codes for every fallible largeobj operation.
 *
 * | Code                 | Meaning                                                      |
 * |----------------------|--------------------------------------------------------------|
 * | None                 | Success                                                      |
 * | IncompleteUpload     | Consolidation attempted with ordinals still missing          |
 * | UnexpectedChunks     | Store holds ordinals at or above the declared expected count |
 * | DeserializationError | Persisted state blob is corrupt; nothing was restored        |
 * | Unauthorized         | The guard predicate rejected the caller                      |
 * | UnknownObject        | No engine exists for the requested object id                 |
 * | ObjectCapacity       | Too many objects in flight; new object refused               |
 */
enum class AssemblyError : uint8_t {
    None                 = 0,
    IncompleteUpload     = 1,
    UnexpectedChunks     = 2,
    DeserializationError = 3,
    Unauthorized         = 4,
    UnknownObject        = 5,
    ObjectCapacity       = 6
};

/// Stable lowercase name for logs and CLI output (e.g. "incomplete_upload").
const char* to_string(AssemblyError err);

/// Convenience check used throughout: true when `err` is `AssemblyError::None`.
inline bool ok(AssemblyError err) { return err == AssemblyError::None; }

} // namespace largeobj

#endif // LARGEOBJ_TYPES_HPP

#include "largeobj/types.hpp"

namespace largeobj {

const char* to_string(AssemblyError err) {
    switch (err) {
        case AssemblyError::None:                 return "ok";
        case AssemblyError::IncompleteUpload:     return "incomplete_upload";
        case AssemblyError::UnexpectedChunks:     return "unexpected_chunks";
        case AssemblyError::DeserializationError: return "deserialization_error";
        case AssemblyError::Unauthorized:         return "unauthorized";
        case AssemblyError::UnknownObject:        return "unknown_object";
        case AssemblyError::ObjectCapacity:       return "object_capacity";
    }
    return "unknown";
}

} // namespace largeobj

/**
 * @file upload_service.hpp
 * @brief UploadService — entry-point layer: guard, one Assembler per object, upgrade hooks.
 *
 * @details
 * ## What This Is
 * The Assembler knows how to rebuild one object. A running service needs a bit
 * more around it, and that is what this class provides:
 *
 * - **Guard:** every caller-facing entry point asks a single predicate "is this
 *   caller authorized?" first. A `false` answer returns `Unauthorized` and
 *   records a warn event; no state is touched.
 * - **Objects:** independent uploads are keyed by an object id. Each id owns its
 *   own Assembler. The empty id is the default object and always exists.
 * - **Restart boundary:** `pre_upgrade()` exports every engine into the
 *   key-value registry; `post_upgrade()` brings them all back, or none of them.
 *
 * ```
 *   caller ── guard() ──► UploadService ──► engines_[id] : Assembler
 *                              │
 *        pre_upgrade(reg) ─────┤ export_state() → reg["largeobj.engine[/id]"]
 *       post_upgrade(reg) ─────┘ reg[...] → import_state()
 * ```
 *
 * ## Object Lifecycle
 * - A mutation (`append_chunk`, `append_parallel_chunk`) on a new id creates its
 *   engine, as long as fewer than `objects_cap()` engines exist; otherwise it
 *   fails with `ObjectCapacity`.
 * - Every other entry point on an id with no engine fails with `UnknownObject`.
 * - A named object whose engine is empty after `finalize()` or `reset()` is
 *   dropped, giving its slot back. The default object is reset in place.
 *
 * ## Keys in the Registry
 * | Key                          | Value                                          |
 * |------------------------------|------------------------------------------------|
 * | `largeobj.engine`            | default object state blob                      |
 * | `largeobj.engine/<id>`       | named object state blob                        |
 * | `largeobj.index`             | newline-separated named object ids             |
 */
#ifndef LARGEOBJ_UPLOAD_SERVICE_HPP
#define LARGEOBJ_UPLOAD_SERVICE_HPP

#include <functional>
#include <map>
#include <string>
#include <vector>
#include "etl/string.h"
#include "assembler.hpp"
#include "events.hpp"
#include "registry.hpp"

namespace largeobj {

/// Maximum object id length (keeps registry keys within KEY_MAX).
static constexpr size_t OBJECT_ID_MAX = 32;

/// Object id; empty means the default object.
using ObjectId = etl::string<OBJECT_ID_MAX>;

/// Authorization predicate supplied by the host. Empty means "allow all".
using Guard = std::function<bool()>;

class UploadService {
public:
  /// Default maximum number of objects in flight (default object included).
  static constexpr size_t OBJECTS_CAP = 16;

  /// Registry key for the default object's state.
  static constexpr const char* STATE_KEY = "largeobj.engine";

  /// Registry key for the list of named objects.
  static constexpr const char* INDEX_KEY = "largeobj.index";

  /**
   * @param guard Authorization predicate (empty = allow all).
   * @param sink  Telemetry sink shared with every engine (not owned; may be null).
   */
  explicit UploadService(Guard guard = Guard(), EventSink* sink = nullptr);

  /// @name Sequential entry points
  ///@{
  AssemblyError append_chunk(const ObjectId& id, const Bytes& bytes);

  /**
   * @brief Read-and-clear the object's buffer into `out`.
   * @details `out` is untouched on error.
   */
  AssemblyError finalize(const ObjectId& id, Bytes& out);
  ///@}

  /// @name Parallel entry points
  ///@{
  AssemblyError append_parallel_chunk(const ObjectId& id, Ordinal ordinal, const Bytes& bytes);
  AssemblyError remove_parallel_chunk(const ObjectId& id, Ordinal ordinal, bool& removed);
  AssemblyError is_complete(const ObjectId& id, uint32_t expected_count, bool& complete);
  AssemblyError missing(const ObjectId& id, uint32_t expected_count, OrdinalList& out);
  ConsolidateResult consolidate(const ObjectId& id, uint32_t expected_count);
  ///@}

  AssemblyError status(const ObjectId& id, Status& out);

  /// Discard all state for `id` (explicit cleanup for abandoned uploads).
  AssemblyError reset(const ObjectId& id);

  /// Ids with a live engine, ascending; the default object ("") comes first.
  std::vector<ObjectId> objects() const;

  /// Engine for `id`, or nullptr. Read-only; bypasses the guard (host use only).
  const Assembler* find(const ObjectId& id) const;

  /// @name Restart boundary (host hooks, not guarded)
  ///@{

  /**
   * @brief Export every engine into `reg` and refresh the index.
   * @details Keys of named objects that no longer exist are removed.
   */
  void pre_upgrade(StorageRegistry& reg);

  /**
   * @brief Restore every engine from `reg`.
   *
   * @details
   * - No index and no default key: fresh empty state.
   * - A corrupt blob fails the whole restore with `DeserializationError`; the
   *   service keeps its current engines.
   * - With `discard_corrupt`, a corrupt blob is logged and that object starts
   *   empty (or, for a named object, is skipped) instead.
   * - Restored objects are not subject to `objects_cap()`.
   */
  AssemblyError post_upgrade(const StorageRegistry& reg, bool discard_corrupt = false);
  ///@}

  size_t objects_cap() const { return objects_cap_; }
  void set_objects_cap(size_t v) { objects_cap_ = v; }

  /// Registry key holding the state of `id`.
  static RegistryKey state_key(const ObjectId& id);

private:
  /// Consult the guard; log a denial under `op`.
  bool authorized(const char* op);

  /// Engine for `id`, or nullptr.
  Assembler* engine(const ObjectId& id);

  /// Engine for `id`, creating it if capacity allows (err set on failure).
  Assembler* engine_or_create(const ObjectId& id, AssemblyError& err);

  /// Drop a named object's engine once it holds nothing.
  void release_if_empty(const ObjectId& id);

  /// Parse the newline-separated index blob.
  static std::vector<ObjectId> parse_index(const Bytes& blob);

private:
  Guard                            guard_;
  EventSink*                       sink_{nullptr};
  size_t                           objects_cap_{OBJECTS_CAP};
  std::map<std::string, Assembler> engines_;   ///< keyed by object id; "" = default
};

} // namespace largeobj

#endif // LARGEOBJ_UPLOAD_SERVICE_HPP

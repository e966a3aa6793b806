#pragma once
/**
 * @file registry.hpp
 * @brief Key-value persistence seam: where exported assembler state waits out a restart.
 *
 * @details
 * PURPOSE
 * -------
 * The assembler turns its state into a blob; something has to keep that blob
 * while the process is gone. This header defines that something as a tiny
 * interface (`StorageRegistry`: insert / get / remove over bounded keys) plus two
 * stock implementations:
 *
 *   - `MemoryRegistry`: a std::map. Tests, and hosts that already own stable
 *     memory and only need an adapter.
 *   - `FileRegistry`: one JSON document on disk (values hex-encoded), written
 *     atomically via tmp + rename. Used by the CLI so every invocation is a real
 *     restart boundary.
 *
 * The free helpers (`save_bytes`, `load_bytes`, ...) are what callers use; they
 * add telemetry so every persisted write is visible in the event log.
 *
 * KEYS
 * ----
 * Keys are fixed-capacity `etl::string<KEY_MAX>`. Longer input is truncated at
 * capacity, so callers keep their ids short (object ids are capped well below).
 *
 * FILE FORMAT
 * -----------
 * @code
 *   {
 *     "version": 1,
 *     "entries": { "largeobj.engine": "4c4f424a01...", ... }
 *   }
 * @endcode
 * Human-inspectable, diff-able, and editable by hand in an emergency.
 */

#include <map>
#include <optional>
#include <string>
#include "etl/string.h"
#include "types.hpp"
#include "events.hpp"

namespace largeobj {

/// Maximum registry key length.
static constexpr size_t KEY_MAX = 64;

/// Bounded registry key.
using RegistryKey = etl::string<KEY_MAX>;

/**
 * @brief Key-value persistence collaborator.
 *
 * Implementations own their storage; the assembler never touches it directly.
 */
class StorageRegistry {
public:
    virtual ~StorageRegistry() = default;

    /// Insert or overwrite `key`.
    virtual void insert(const RegistryKey& key, const Bytes& value) = 0;

    /// Value for `key`, or std::nullopt if absent.
    virtual std::optional<Bytes> get(const RegistryKey& key) const = 0;

    /// Remove `key`. @return true if it existed.
    virtual bool remove(const RegistryKey& key) = 0;
};

/// In-process registry backed by std::map.
class MemoryRegistry : public StorageRegistry {
public:
    void insert(const RegistryKey& key, const Bytes& value) override;
    std::optional<Bytes> get(const RegistryKey& key) const override;
    bool remove(const RegistryKey& key) override;

    size_t size() const { return entries_.size(); }

private:
    std::map<std::string, Bytes> entries_;
};

/**
 * @brief Registry persisted as a single JSON file.
 *
 * Mutations stay in memory until `flush()`. `load()` replaces the in-memory
 * view with the file contents; a missing file loads as empty.
 */
class FileRegistry : public StorageRegistry {
public:
    explicit FileRegistry(std::string path) : path_(std::move(path)) {}

    /**
     * @brief Read the file.
     * @retval true  loaded (or file absent → empty registry).
     * @retval false unreadable or malformed; in-memory view unchanged.
     */
    bool load();

    /**
     * @brief Write the file atomically (tmp + rename), creating parent dirs.
     * @return false on any I/O failure; the previous file stays intact.
     */
    bool flush() const;

    void insert(const RegistryKey& key, const Bytes& value) override;
    std::optional<Bytes> get(const RegistryKey& key) const override;
    bool remove(const RegistryKey& key) override;

    const std::string& path() const { return path_; }
    size_t size() const { return entries_.size(); }

private:
    std::string path_;
    std::map<std::string, Bytes> entries_;
};

/// Lowercase hex rendering of `bytes` ("" for empty).
std::string to_hex(const Bytes& bytes);

/**
 * @brief Parse lowercase/uppercase hex.
 * @return false on odd length or a non-hex digit; `out` untouched on failure.
 */
bool from_hex(const std::string& hex, Bytes& out);

// ---------------------------------------------------------------------------
// Helpers (with telemetry)
// ---------------------------------------------------------------------------

/// Store raw bytes under `key`.
void save_bytes(StorageRegistry& reg, const RegistryKey& key, const Bytes& bytes,
                EventSink* sink = nullptr);

/// Load raw bytes from `key`.
std::optional<Bytes> load_bytes(const StorageRegistry& reg, const RegistryKey& key);

/// Delete `key`. @return true if it existed.
bool remove_key(StorageRegistry& reg, const RegistryKey& key, EventSink* sink = nullptr);

/// True if `key` holds a value.
bool exists(const StorageRegistry& reg, const RegistryKey& key);

/// Stored size in bytes, or std::nullopt if absent.
std::optional<size_t> stored_size(const StorageRegistry& reg, const RegistryKey& key);

} // namespace largeobj

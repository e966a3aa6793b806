// ============================================================================
// registry.cpp — implementation for registry.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "largeobj/registry.hpp"  // StorageRegistry, MemoryRegistry, FileRegistry, helpers

#include <filesystem>             // parent dir creation, rename for atomic writes
#include <fstream>                // read/write the JSON document
#include <system_error>           // std::error_code for non-throwing filesystem ops

#include "nlohmann/json.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace largeobj {

// Registry file layout version (see registry.hpp FILE FORMAT).
static constexpr int REGISTRY_FILE_VERSION = 1;

// -------- hex --------

std::string to_hex(const Bytes& bytes) {
    static const char* DIGITS = "0123456789abcdef";
    std::string s;
    s.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        s.push_back(DIGITS[b >> 4]);
        s.push_back(DIGITS[b & 0x0F]);
    }
    return s;
}

static int hex_nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool from_hex(const std::string& hex, Bytes& out) {
    if (hex.size() % 2 != 0) return false;
    Bytes tmp;
    tmp.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_nibble(hex[i]);
        int lo = hex_nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) return false;
        tmp.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    out.swap(tmp);
    return true;
}

// -------- MemoryRegistry --------

void MemoryRegistry::insert(const RegistryKey& key, const Bytes& value) {
    entries_[key.c_str()] = value;
}

std::optional<Bytes> MemoryRegistry::get(const RegistryKey& key) const {
    auto it = entries_.find(key.c_str());
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

bool MemoryRegistry::remove(const RegistryKey& key) {
    return entries_.erase(key.c_str()) != 0;
}

// -------- FileRegistry --------

void FileRegistry::insert(const RegistryKey& key, const Bytes& value) {
    entries_[key.c_str()] = value;
}

std::optional<Bytes> FileRegistry::get(const RegistryKey& key) const {
    auto it = entries_.find(key.c_str());
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

bool FileRegistry::remove(const RegistryKey& key) {
    return entries_.erase(key.c_str()) != 0;
}

/*
 * load()
 * ------
 * Phases:
 *   1) absent file → empty registry (first run is not an error),
 *   2) parse JSON and check the version,
 *   3) decode every hex value into a scratch map,
 *   4) swap the scratch map in.
 * Any failure in 2–3 leaves the in-memory view untouched.
 */
bool FileRegistry::load() {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        if (ec) return false;
        entries_.clear();
        return true;
    }

    std::ifstream in(path_);
    if (!in) return false;

    json doc = json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) return false;
    if (!doc.contains("version") || !doc["version"].is_number_integer()) return false;
    if (doc["version"].get<int>() != REGISTRY_FILE_VERSION) return false;
    if (!doc.contains("entries") || !doc["entries"].is_object()) return false;

    std::map<std::string, Bytes> scratch;
    for (auto it = doc["entries"].begin(); it != doc["entries"].end(); ++it) {
        if (!it.value().is_string()) return false;
        Bytes value;
        if (!from_hex(it.value().get<std::string>(), value)) return false;
        scratch[it.key()] = std::move(value);
    }

    entries_.swap(scratch);
    return true;
}

/*
 * flush()
 * -------
 * Write-to-temp then rename, so a crash mid-write never leaves a torn file:
 * readers see either the old document or the new one.
 */
bool FileRegistry::flush() const {
    json entries = json::object();
    for (const auto& kv : entries_) entries[kv.first] = to_hex(kv.second);

    json doc;
    doc["version"] = REGISTRY_FILE_VERSION;
    doc["entries"] = entries;

    std::error_code ec;
    fs::path p(path_);
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path(), ec);
        if (ec) return false;
    }

    fs::path tmp = p;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) return false;
        out << doc.dump(2, ' ', false, json::error_handler_t::replace);
        out.flush();
        if (!out) return false;
    }

    fs::rename(tmp, p, ec);
    return !ec;
}

// -------- helpers --------

void save_bytes(StorageRegistry& reg, const RegistryKey& key, const Bytes& bytes, EventSink* sink) {
    reg.insert(key, bytes);

    Event ev(EventLevel::Info, "storage.save", "saved ");
    ev.append_number(bytes.size()).append(" bytes: ").append(key.c_str());
    ev.value = static_cast<int64_t>(bytes.size());
    emit(sink, ev);
}

std::optional<Bytes> load_bytes(const StorageRegistry& reg, const RegistryKey& key) {
    return reg.get(key);
}

bool remove_key(StorageRegistry& reg, const RegistryKey& key, EventSink* sink) {
    bool removed = reg.remove(key);
    if (removed) {
        Event ev(EventLevel::Info, "storage.delete", "deleted: ");
        ev.append(key.c_str());
        emit(sink, ev);
    }
    return removed;
}

bool exists(const StorageRegistry& reg, const RegistryKey& key) {
    return reg.get(key).has_value();
}

std::optional<size_t> stored_size(const StorageRegistry& reg, const RegistryKey& key) {
    auto v = reg.get(key);
    if (!v) return std::nullopt;
    return v->size();
}

} // namespace largeobj

// -----------------------------------------------------------------------------
// upload_service.cpp — Implementation of the largeobj UploadService
//
// API & contracts:
//   see include/largeobj/upload_service.hpp
//
// Usage tests:
//   see tests/test_upload_service.cpp
// -----------------------------------------------------------------------------
#include "largeobj/upload_service.hpp"

namespace largeobj {

// ---------- public ----------

UploadService::UploadService(Guard guard, EventSink* sink)
: guard_(std::move(guard)), sink_(sink) {
  engines_.emplace(std::string(), Assembler(sink_));   // default object always exists
}

RegistryKey UploadService::state_key(const ObjectId& id) {
  RegistryKey key(STATE_KEY);
  if (!id.empty()) {
    key += '/';
    key += id.c_str();
  }
  return key;
}

AssemblyError UploadService::append_chunk(const ObjectId& id, const Bytes& bytes) {
  if (!authorized("append_chunk")) return AssemblyError::Unauthorized;

  AssemblyError err = AssemblyError::None;
  Assembler* a = engine_or_create(id, err);
  if (!a) return err;

  a->append_chunk(bytes);
  return AssemblyError::None;
}

AssemblyError UploadService::finalize(const ObjectId& id, Bytes& out) {
  if (!authorized("finalize")) return AssemblyError::Unauthorized;

  Assembler* a = engine(id);
  if (!a) return AssemblyError::UnknownObject;

  out = a->finalize();
  release_if_empty(id);
  return AssemblyError::None;
}

AssemblyError UploadService::append_parallel_chunk(const ObjectId& id, Ordinal ordinal, const Bytes& bytes) {
  if (!authorized("append_parallel_chunk")) return AssemblyError::Unauthorized;

  AssemblyError err = AssemblyError::None;
  Assembler* a = engine_or_create(id, err);
  if (!a) return err;

  a->append_parallel_chunk(ordinal, bytes);
  return AssemblyError::None;
}

AssemblyError UploadService::remove_parallel_chunk(const ObjectId& id, Ordinal ordinal, bool& removed) {
  if (!authorized("remove_parallel_chunk")) return AssemblyError::Unauthorized;

  Assembler* a = engine(id);
  if (!a) return AssemblyError::UnknownObject;

  removed = a->remove_parallel_chunk(ordinal);
  return AssemblyError::None;
}

AssemblyError UploadService::is_complete(const ObjectId& id, uint32_t expected_count, bool& complete) {
  if (!authorized("is_complete")) return AssemblyError::Unauthorized;

  Assembler* a = engine(id);
  if (!a) return AssemblyError::UnknownObject;

  complete = a->is_complete(expected_count);
  return AssemblyError::None;
}

AssemblyError UploadService::missing(const ObjectId& id, uint32_t expected_count, OrdinalList& out) {
  if (!authorized("missing")) return AssemblyError::Unauthorized;

  Assembler* a = engine(id);
  if (!a) return AssemblyError::UnknownObject;

  out = a->missing(expected_count);
  return AssemblyError::None;
}

ConsolidateResult UploadService::consolidate(const ObjectId& id, uint32_t expected_count) {
  ConsolidateResult res;
  if (!authorized("consolidate")) {
    res.error = AssemblyError::Unauthorized;
    return res;
  }

  Assembler* a = engine(id);
  if (!a) {
    res.error = AssemblyError::UnknownObject;
    return res;
  }
  return a->consolidate(expected_count);
}

AssemblyError UploadService::status(const ObjectId& id, Status& out) {
  if (!authorized("status")) return AssemblyError::Unauthorized;

  Assembler* a = engine(id);
  if (!a) return AssemblyError::UnknownObject;

  out = a->status();
  return AssemblyError::None;
}

AssemblyError UploadService::reset(const ObjectId& id) {
  if (!authorized("reset")) return AssemblyError::Unauthorized;

  Assembler* a = engine(id);
  if (!a) return AssemblyError::UnknownObject;

  a->reset();
  release_if_empty(id);
  return AssemblyError::None;
}

std::vector<ObjectId> UploadService::objects() const {
  std::vector<ObjectId> out;
  out.reserve(engines_.size());
  for (const auto& kv : engines_) out.emplace_back(kv.first.c_str());  // map order: "" first
  return out;
}

const Assembler* UploadService::find(const ObjectId& id) const {
  auto it = engines_.find(id.c_str());
  if (it == engines_.end()) return nullptr;
  return &it->second;
}

// -----------------------------------------------------------------------------
// pre_upgrade() — export every engine, then rewrite the index.
// POLICY:
//   - Default object goes under STATE_KEY, named ones under STATE_KEY/<id>.
//   - Named objects listed in the previous index but gone now get their keys
//     removed, so a later restore cannot resurrect them.
//   - State too large for the blob format is not written; its previous
//     blob (if any) is left untouched.
// -----------------------------------------------------------------------------
void UploadService::pre_upgrade(StorageRegistry& reg) {
  // Stale keys from the previous index
  if (auto old_index = load_bytes(reg, RegistryKey(INDEX_KEY))) {
    for (const auto& old_id : parse_index(*old_index)) {
      if (engines_.count(old_id.c_str()) == 0) remove_key(reg, state_key(old_id), sink_);
    }
  }

  Bytes index;
  for (const auto& kv : engines_) {
    ObjectId id(kv.first.c_str());
    if (!id.empty()) {
      index.insert(index.end(), kv.first.begin(), kv.first.end());
      index.push_back('\n');
    }

    // Empty blob = oversize (export.oversize already recorded); the last saved
    // blob under this key stays in place.
    Bytes blob = kv.second.export_state();
    if (!blob.empty()) save_bytes(reg, state_key(id), blob, sink_);
  }
  save_bytes(reg, RegistryKey(INDEX_KEY), index, sink_);

  Event ev(EventLevel::Info, "upgrade.pre", "exported ");
  ev.append_number(engines_.size()).append(" objects");
  ev.value = static_cast<int64_t>(engines_.size());
  emit(sink_, ev);
}

// -----------------------------------------------------------------------------
// post_upgrade() — restore all engines or none.
// PRE:   reg holds what a previous pre_upgrade() wrote (or nothing at all).
// POLICY:
//   - Build the complete engine map in scratch; swap it in only at the end.
//   - Absent keys mean "never exported": that object starts empty.
//   - Corrupt blobs fail the restore unless discard_corrupt is set.
// -----------------------------------------------------------------------------
AssemblyError UploadService::post_upgrade(const StorageRegistry& reg, bool discard_corrupt) {
  std::map<std::string, Assembler> scratch;

  std::vector<ObjectId> ids;
  ids.emplace_back();                                  // default object first
  if (auto index = load_bytes(reg, RegistryKey(INDEX_KEY))) {
    for (const auto& id : parse_index(*index)) ids.push_back(id);
  }

  for (const auto& id : ids) {
    Assembler a(sink_);
    auto blob = load_bytes(reg, state_key(id));

    if (blob) {
      AssemblyError err = a.import_state(*blob);
      if (!ok(err)) {
        if (!discard_corrupt) {
          Event ev(EventLevel::Error, "upgrade.post.fail", "corrupt state for object '");
          ev.append(id.c_str()).append("', restore aborted");
          emit(sink_, ev);
          return err;
        }

        Event ev(EventLevel::Warn, "upgrade.post.discard", "discarded corrupt state for object '");
        ev.append(id.c_str()).append("'");
        emit(sink_, ev);
        if (!id.empty()) continue;                     // named object: drop it
        a = Assembler(sink_);                          // default object: start empty
      }
    } else if (!id.empty()) {
      continue;                                        // listed but never exported
    }

    scratch[id.c_str()] = std::move(a);
  }

  engines_.swap(scratch);

  Event ev(EventLevel::Info, "upgrade.post", "restored ");
  ev.append_number(engines_.size()).append(" objects");
  ev.value = static_cast<int64_t>(engines_.size());
  emit(sink_, ev);
  return AssemblyError::None;
}

// ---------- private ----------

bool UploadService::authorized(const char* op) {
  if (!guard_ || guard_()) return true;

  Event ev(EventLevel::Warn, "auth.denied", "unauthorized call: ");
  ev.append(op);
  emit(sink_, ev);
  return false;
}

Assembler* UploadService::engine(const ObjectId& id) {
  auto it = engines_.find(id.c_str());
  if (it == engines_.end()) return nullptr;
  return &it->second;
}

Assembler* UploadService::engine_or_create(const ObjectId& id, AssemblyError& err) {
  if (Assembler* a = engine(id)) return a;

  if (engines_.size() >= objects_cap_) {
    err = AssemblyError::ObjectCapacity;
    Event ev(EventLevel::Warn, "objects.full", "refused new object '");
    ev.append(id.c_str()).append("'");
    ev.value = static_cast<int64_t>(engines_.size());
    emit(sink_, ev);
    return nullptr;
  }

  auto res = engines_.emplace(std::string(id.c_str()), Assembler(sink_));
  return &res.first->second;
}

void UploadService::release_if_empty(const ObjectId& id) {
  if (id.empty()) return;                              // default object is permanent
  auto it = engines_.find(id.c_str());
  if (it == engines_.end()) return;

  const Assembler& a = it->second;
  if (a.buffer_size() == 0 && a.chunks().empty()) engines_.erase(it);
}

std::vector<ObjectId> UploadService::parse_index(const Bytes& blob) {
  std::vector<ObjectId> out;
  std::string cur;
  for (uint8_t c : blob) {
    if (c == '\n') {
      if (!cur.empty() && cur.size() <= OBJECT_ID_MAX) out.emplace_back(cur.c_str());
      cur.clear();
    } else {
      cur.push_back(static_cast<char>(c));
    }
  }
  if (!cur.empty() && cur.size() <= OBJECT_ID_MAX) out.emplace_back(cur.c_str());
  return out;
}

} // namespace largeobj

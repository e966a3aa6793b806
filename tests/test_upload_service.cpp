#include <doctest/doctest.h>
#include "largeobj/upload_service.hpp"
#include "largeobj/registry.hpp"
#include "largeobj/events.hpp"

using namespace largeobj;

static Bytes B(const char* s) {
    Bytes b;
    while (*s) b.push_back(static_cast<uint8_t>(*s++));
    return b;
}

static const ObjectId DEFAULT_OBJ("");

// Drain `log` and report whether an event named `name` was recorded.
static bool saw_event(EventLog& log, const char* name) {
    bool found = false;
    Event ev;
    while (log.get_event(ev)) {
        if (ev.name == EventName(name)) found = true;
    }
    return found;
}

TEST_CASE("Default object exists from the start") {
    UploadService svc;
    auto ids = svc.objects();
    REQUIRE(ids.size() == 1);
    CHECK(ids[0].empty());
    CHECK(svc.find(DEFAULT_OBJ) != nullptr);

    Status st;
    REQUIRE(svc.status(DEFAULT_OBJ, st) == AssemblyError::None);
    CHECK(st.buffered_byte_count == 0);
}

TEST_CASE("Sequential and parallel flows through the service") {
    UploadService svc;
    REQUIRE(svc.append_chunk(DEFAULT_OBJ, B("ab")) == AssemblyError::None);
    REQUIRE(svc.append_chunk(DEFAULT_OBJ, B("cd")) == AssemblyError::None);

    Bytes out;
    REQUIRE(svc.finalize(DEFAULT_OBJ, out) == AssemblyError::None);
    CHECK(out == B("abcd"));

    ObjectId id("video");
    REQUIRE(svc.append_parallel_chunk(id, 1, B("B")) == AssemblyError::None);

    bool complete = true;
    REQUIRE(svc.is_complete(id, 2, complete) == AssemblyError::None);
    CHECK_FALSE(complete);

    OrdinalList missing;
    REQUIRE(svc.missing(id, 2, missing) == AssemblyError::None);
    CHECK(missing == OrdinalList{0});

    ConsolidateResult res = svc.consolidate(id, 2);
    CHECK(res.error == AssemblyError::IncompleteUpload);
    CHECK(res.missing == OrdinalList{0});

    REQUIRE(svc.append_parallel_chunk(id, 0, B("A")) == AssemblyError::None);
    REQUIRE(svc.consolidate(id, 2).ok());
    REQUIRE(svc.finalize(id, out) == AssemblyError::None);
    CHECK(out == B("AB"));
}

TEST_CASE("Objects are independent") {
    UploadService svc;
    ObjectId a("a"), b("b");
    svc.append_parallel_chunk(a, 0, B("from-a"));
    svc.append_parallel_chunk(b, 0, B("from-b"));

    REQUIRE(svc.consolidate(a, 1).ok());
    Bytes out;
    REQUIRE(svc.finalize(a, out) == AssemblyError::None);
    CHECK(out == B("from-a"));

    REQUIRE(svc.find(b) != nullptr);
    CHECK(svc.find(b)->chunks().count() == 1);
}

TEST_CASE("Unknown objects: reads fail, mutations create") {
    UploadService svc;
    ObjectId id("ghost");

    Bytes out = B("untouched");
    CHECK(svc.finalize(id, out) == AssemblyError::UnknownObject);
    CHECK(out == B("untouched"));

    bool flag = false;
    CHECK(svc.is_complete(id, 1, flag) == AssemblyError::UnknownObject);
    CHECK(svc.remove_parallel_chunk(id, 0, flag) == AssemblyError::UnknownObject);
    OrdinalList list;
    CHECK(svc.missing(id, 1, list) == AssemblyError::UnknownObject);
    CHECK(svc.consolidate(id, 1).error == AssemblyError::UnknownObject);
    Status st;
    CHECK(svc.status(id, st) == AssemblyError::UnknownObject);
    CHECK(svc.reset(id) == AssemblyError::UnknownObject);
    CHECK(svc.find(id) == nullptr);

    CHECK(svc.append_chunk(id, B("x")) == AssemblyError::None);
    CHECK(svc.find(id) != nullptr);
}

TEST_CASE("Named objects are released once emptied; default stays") {
    UploadService svc;
    ObjectId id("tmp");
    svc.append_chunk(id, B("data"));
    CHECK(svc.objects().size() == 2);

    Bytes out;
    REQUIRE(svc.finalize(id, out) == AssemblyError::None);
    CHECK(svc.find(id) == nullptr);
    CHECK(svc.objects().size() == 1);

    svc.append_parallel_chunk(id, 3, B("x"));
    REQUIRE(svc.reset(id) == AssemblyError::None);
    CHECK(svc.find(id) == nullptr);

    REQUIRE(svc.finalize(DEFAULT_OBJ, out) == AssemblyError::None);
    REQUIRE(svc.reset(DEFAULT_OBJ) == AssemblyError::None);
    CHECK(svc.find(DEFAULT_OBJ) != nullptr);
}

TEST_CASE("Finalize keeps a named object that still has pending chunks") {
    UploadService svc;
    ObjectId id("mixed");
    svc.append_chunk(id, B("seq"));
    svc.append_parallel_chunk(id, 0, B("par"));

    Bytes out;
    REQUIRE(svc.finalize(id, out) == AssemblyError::None);
    CHECK(out == B("seq"));
    CHECK(svc.find(id) != nullptr);
}

TEST_CASE("Object capacity bounds new objects only") {
    EventLog log;
    UploadService svc(Guard(), &log);
    svc.set_objects_cap(3);
    CHECK(svc.objects_cap() == 3);

    CHECK(svc.append_chunk(ObjectId("one"), B("1")) == AssemblyError::None);
    CHECK(svc.append_chunk(ObjectId("two"), B("2")) == AssemblyError::None);
    CHECK(svc.append_chunk(ObjectId("three"), B("3")) == AssemblyError::ObjectCapacity);
    CHECK(svc.append_parallel_chunk(ObjectId("three"), 0, B("3")) == AssemblyError::ObjectCapacity);
    CHECK(saw_event(log, "objects.full"));

    // existing objects keep accepting data
    CHECK(svc.append_chunk(ObjectId("one"), B("1")) == AssemblyError::None);

    Bytes out;
    REQUIRE(svc.finalize(ObjectId("two"), out) == AssemblyError::None);
    CHECK(svc.append_chunk(ObjectId("three"), B("3")) == AssemblyError::None);
}

TEST_CASE("Guard rejection is an error with no side effects") {
    bool allow = false;
    EventLog log;
    UploadService svc([&allow]{ return allow; }, &log);
    ObjectId id("x");

    CHECK(svc.append_chunk(DEFAULT_OBJ, B("no")) == AssemblyError::Unauthorized);
    CHECK(svc.append_parallel_chunk(id, 0, B("no")) == AssemblyError::Unauthorized);
    CHECK(svc.consolidate(DEFAULT_OBJ, 0).error == AssemblyError::Unauthorized);
    Bytes out;
    CHECK(svc.finalize(DEFAULT_OBJ, out) == AssemblyError::Unauthorized);
    Status st;
    CHECK(svc.status(DEFAULT_OBJ, st) == AssemblyError::Unauthorized);
    CHECK(svc.reset(DEFAULT_OBJ) == AssemblyError::Unauthorized);

    CHECK(svc.find(id) == nullptr);
    CHECK(svc.find(DEFAULT_OBJ)->buffer_size() == 0);

    Event ev;
    REQUIRE(log.get_event(ev));
    CHECK(ev.level == EventLevel::Warn);
    CHECK(ev.name == EventName("auth.denied"));
    CHECK(ev.text == EventText("unauthorized call: append_chunk"));

    allow = true;
    CHECK(svc.append_chunk(DEFAULT_OBJ, B("yes")) == AssemblyError::None);
}

TEST_CASE("State keys follow the object id") {
    CHECK(UploadService::state_key(ObjectId()) == RegistryKey("largeobj.engine"));
    CHECK(UploadService::state_key(ObjectId("doc")) == RegistryKey("largeobj.engine/doc"));
}

TEST_CASE("Upgrade cycle restores every object") {
    MemoryRegistry reg;
    {
        UploadService before;
        before.append_chunk(DEFAULT_OBJ, B("default-bytes"));
        before.append_parallel_chunk(ObjectId("img"), 2, B("c"));
        before.append_parallel_chunk(ObjectId("img"), 0, B("a"));
        before.append_chunk(ObjectId("log"), B("line"));
        before.pre_upgrade(reg);
    }

    CHECK(exists(reg, RegistryKey("largeobj.engine")));
    CHECK(exists(reg, RegistryKey("largeobj.engine/img")));
    CHECK(exists(reg, RegistryKey("largeobj.engine/log")));
    CHECK(*load_bytes(reg, RegistryKey("largeobj.index")) == B("img\nlog\n"));

    UploadService after;
    REQUIRE(after.post_upgrade(reg) == AssemblyError::None);
    REQUIRE(after.objects().size() == 3);

    CHECK(after.find(DEFAULT_OBJ)->buffer() == B("default-bytes"));
    CHECK(after.find(ObjectId("log"))->buffer() == B("line"));

    OrdinalList missing;
    REQUIRE(after.missing(ObjectId("img"), 3, missing) == AssemblyError::None);
    CHECK(missing == OrdinalList{1});

    after.append_parallel_chunk(ObjectId("img"), 1, B("b"));
    REQUIRE(after.consolidate(ObjectId("img"), 3).ok());
    Bytes out;
    REQUIRE(after.finalize(ObjectId("img"), out) == AssemblyError::None);
    CHECK(out == B("abc"));
}

TEST_CASE("Restore from an empty registry gives fresh state") {
    MemoryRegistry reg;
    UploadService svc;
    svc.append_chunk(ObjectId("pending"), B("x"));

    REQUIRE(svc.post_upgrade(reg) == AssemblyError::None);
    REQUIRE(svc.objects().size() == 1);
    CHECK(svc.find(DEFAULT_OBJ)->buffer_size() == 0);
}

TEST_CASE("Released objects leave no stale keys behind") {
    MemoryRegistry reg;
    UploadService svc;
    svc.append_chunk(ObjectId("gone"), B("x"));
    svc.pre_upgrade(reg);
    CHECK(exists(reg, RegistryKey("largeobj.engine/gone")));

    Bytes out;
    REQUIRE(svc.finalize(ObjectId("gone"), out) == AssemblyError::None);
    svc.pre_upgrade(reg);
    CHECK_FALSE(exists(reg, RegistryKey("largeobj.engine/gone")));
    CHECK(load_bytes(reg, RegistryKey("largeobj.index"))->empty());

    UploadService after;
    REQUIRE(after.post_upgrade(reg) == AssemblyError::None);
    CHECK(after.find(ObjectId("gone")) == nullptr);
}

TEST_CASE("Corrupt saved state fails the restore unless discarded") {
    MemoryRegistry reg;
    {
        UploadService before;
        before.append_chunk(DEFAULT_OBJ, B("good"));
        before.append_chunk(ObjectId("bad"), B("soon corrupt"));
        before.append_chunk(ObjectId("fine"), B("ok"));
        before.pre_upgrade(reg);
    }
    reg.insert(RegistryKey("largeobj.engine/bad"), B("garbage"));

    EventLog log;
    UploadService svc(Guard(), &log);
    svc.append_chunk(DEFAULT_OBJ, B("live"));

    CHECK(svc.post_upgrade(reg) == AssemblyError::DeserializationError);
    CHECK(svc.find(DEFAULT_OBJ)->buffer() == B("live"));    // nothing applied
    CHECK(svc.objects().size() == 1);
    CHECK(saw_event(log, "upgrade.post.fail"));

    REQUIRE(svc.post_upgrade(reg, true) == AssemblyError::None);
    CHECK(svc.find(ObjectId("bad")) == nullptr);
    CHECK(svc.find(ObjectId("fine"))->buffer() == B("ok"));
    CHECK(svc.find(DEFAULT_OBJ)->buffer() == B("good"));
    CHECK(saw_event(log, "upgrade.post.discard"));
}

TEST_CASE("Corrupt default object is reinitialised when discarding") {
    MemoryRegistry reg;
    reg.insert(RegistryKey("largeobj.engine"), B("LOBJ"));

    UploadService svc;
    CHECK(svc.post_upgrade(reg) == AssemblyError::DeserializationError);
    REQUIRE(svc.post_upgrade(reg, true) == AssemblyError::None);
    REQUIRE(svc.find(DEFAULT_OBJ) != nullptr);
    CHECK(svc.find(DEFAULT_OBJ)->buffer_size() == 0);
}

TEST_CASE("Restore ignores the object cap") {
    MemoryRegistry reg;
    {
        UploadService before;
        before.append_chunk(ObjectId("a"), B("1"));
        before.append_chunk(ObjectId("b"), B("2"));
        before.append_chunk(ObjectId("c"), B("3"));
        before.pre_upgrade(reg);
    }

    UploadService svc;
    svc.set_objects_cap(2);
    REQUIRE(svc.post_upgrade(reg) == AssemblyError::None);
    CHECK(svc.objects().size() == 4);
    CHECK(svc.append_chunk(ObjectId("d"), B("4")) == AssemblyError::ObjectCapacity);
}

#include <doctest/doctest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include "largeobj/registry.hpp"
#include "largeobj/events.hpp"

using namespace largeobj;
namespace fs = std::filesystem;

static Bytes B(const char* s) {
    Bytes b;
    while (*s) b.push_back(static_cast<uint8_t>(*s++));
    return b;
}

// Fresh scratch directory per test case, removed on scope exit.
struct TempDir {
    fs::path path;

    explicit TempDir(const char* tag) {
        path = fs::temp_directory_path() /
               ("largeobj-test-" + std::string(tag) + "-" + std::to_string(::getpid()));
        fs::remove_all(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

TEST_CASE("Hex encoding round-trips and rejects bad input") {
    Bytes raw{0x00, 0x0F, 0xA0, 0xFF};
    CHECK(to_hex(raw) == "000fa0ff");
    CHECK(to_hex(Bytes{}) == "");

    Bytes out;
    REQUIRE(from_hex("000FA0ff", out));
    CHECK(out == raw);

    Bytes keep = B("keep");
    CHECK_FALSE(from_hex("abc", keep));     // odd length
    CHECK_FALSE(from_hex("zz", keep));      // not hex
    CHECK(keep == B("keep"));
}

TEST_CASE("MemoryRegistry insert, overwrite, get, remove") {
    MemoryRegistry reg;
    CHECK_FALSE(reg.get(RegistryKey("k")).has_value());

    reg.insert(RegistryKey("k"), B("v1"));
    reg.insert(RegistryKey("k"), B("v2"));
    REQUIRE(reg.get(RegistryKey("k")).has_value());
    CHECK(*reg.get(RegistryKey("k")) == B("v2"));
    CHECK(reg.size() == 1);

    CHECK(reg.remove(RegistryKey("k")) == true);
    CHECK(reg.remove(RegistryKey("k")) == false);
    CHECK(reg.size() == 0);
}

TEST_CASE("Storage helpers report through the event sink") {
    MemoryRegistry reg;
    EventLog log;

    save_bytes(reg, RegistryKey("obj"), B("12345"), &log);
    CHECK(exists(reg, RegistryKey("obj")));
    REQUIRE(stored_size(reg, RegistryKey("obj")).has_value());
    CHECK(*stored_size(reg, RegistryKey("obj")) == 5);
    CHECK(*load_bytes(reg, RegistryKey("obj")) == B("12345"));

    Event ev;
    REQUIRE(log.get_event(ev));
    CHECK(ev.name == EventName("storage.save"));
    CHECK(ev.value == 5);

    CHECK(remove_key(reg, RegistryKey("obj"), &log));
    REQUIRE(log.get_event(ev));
    CHECK(ev.name == EventName("storage.delete"));

    CHECK_FALSE(remove_key(reg, RegistryKey("obj"), &log));
    CHECK(log.empty());                     // nothing deleted, nothing recorded
    CHECK_FALSE(exists(reg, RegistryKey("obj")));
    CHECK_FALSE(stored_size(reg, RegistryKey("obj")).has_value());
}

TEST_CASE("FileRegistry: absent file loads empty") {
    TempDir dir("absent");
    FileRegistry reg((dir.path / "state.json").string());
    CHECK(reg.load());
    CHECK(reg.size() == 0);
}

TEST_CASE("FileRegistry: flush then load in a new instance") {
    TempDir dir("roundtrip");
    std::string file = (dir.path / "nested" / "state.json").string();

    {
        FileRegistry reg(file);
        reg.insert(RegistryKey("a"), Bytes{0x00, 0xFF, 0x10});
        reg.insert(RegistryKey("b"), Bytes{});
        REQUIRE(reg.flush());             // creates nested/
    }

    CHECK(fs::exists(file));
    CHECK_FALSE(fs::exists(file + ".tmp"));

    FileRegistry again(file);
    REQUIRE(again.load());
    CHECK(again.size() == 2);
    CHECK(*again.get(RegistryKey("a")) == Bytes{0x00, 0xFF, 0x10});
    CHECK(again.get(RegistryKey("b"))->empty());
}

TEST_CASE("FileRegistry: malformed files are rejected, view kept") {
    TempDir dir("malformed");
    fs::create_directories(dir.path);
    std::string file = (dir.path / "state.json").string();

    FileRegistry reg(file);
    reg.insert(RegistryKey("live"), B("x"));

    const char* docs[] = {
        "not json at all",
        "[1, 2, 3]",
        "{\"version\": 2, \"entries\": {}}",
        "{\"version\": 1}",
        "{\"version\": 1, \"entries\": {\"k\": 5}}",
        "{\"version\": 1, \"entries\": {\"k\": \"abc\"}}",
    };

    for (const char* doc : docs) {
        CAPTURE(doc);
        {
            std::ofstream out(file, std::ios::trunc);
            out << doc;
        }
        CHECK_FALSE(reg.load());
        CHECK(reg.size() == 1);
        CHECK(*reg.get(RegistryKey("live")) == B("x"));
    }
}

#include <doctest/doctest.h>
#include <stdint.h>
#include "largeobj/chunk_splitter.hpp"
#include "largeobj/assembler.hpp"

using namespace largeobj;

static Bytes make_payload(size_t n) {
    Bytes b(n);
    for (size_t i = 0; i < n; ++i) b[i] = static_cast<uint8_t>(i * 31 + 7);
    return b;
}

TEST_CASE("Splitter yields fixed-size slices with a short tail") {
    Bytes payload = make_payload(10);
    ChunkSplitter s(payload, 4);
    REQUIRE(s.error == 0);
    CHECK(s.count() == 3);

    ChunkView v;
    REQUIRE(s.next(v));
    CHECK(v.ordinal == 0);
    CHECK(v.size == 4);
    CHECK(v.data == payload.data());

    REQUIRE(s.next(v));
    CHECK(v.ordinal == 1);
    CHECK(v.size == 4);

    REQUIRE(s.next(v));
    CHECK(v.ordinal == 2);
    CHECK(v.size == 2);
    CHECK(v.to_bytes() == Bytes(payload.begin() + 8, payload.end()));

    CHECK_FALSE(s.next(v));

    s.reset();
    REQUIRE(s.next(v));
    CHECK(v.ordinal == 0);
}

TEST_CASE("Exact multiple has no empty trailing chunk") {
    Bytes payload = make_payload(8);
    auto chunks = split_into_chunks(payload, 4);
    REQUIRE(chunks.size() == 2);
    CHECK(chunks[1].size() == 4);
}

TEST_CASE("Empty payload and zero chunk size produce nothing") {
    ChunkSplitter empty(Bytes{}, 4);
    CHECK(empty.error == 2);
    CHECK(empty.count() == 0);
    ChunkView v;
    CHECK_FALSE(empty.next(v));

    Bytes payload = make_payload(3);
    ChunkSplitter zero(payload, 0);
    CHECK(zero.error == 1);
    CHECK(zero.count() == 0);
    CHECK_FALSE(zero.next(v));
    CHECK(split_into_chunks(payload, 0).empty());
}

TEST_CASE("Chunk size larger than the payload gives one chunk, even at SIZE_MAX") {
    Bytes payload = make_payload(10);

    ChunkSplitter s(payload, SIZE_MAX);
    REQUIRE(s.error == 0);
    CHECK(s.count() == 1);

    uint32_t yielded = 0;
    ChunkView v;
    while (s.next(v)) {
        CHECK(v.size == 10);
        ++yielded;
    }
    CHECK(yielded == s.count());

    auto chunks = split_into_chunks(payload, SIZE_MAX - 3);
    REQUIRE(chunks.size() == 1);
    CHECK(chunks[0] == payload);
}

TEST_CASE("Payloads needing more than UINT32_MAX chunks are refused") {
    if (sizeof(size_t) <= 4) return;   // such lengths cannot exist on 32-bit hosts

    uint8_t byte = 0;
    ChunkSplitter s;
    s.set(&byte, static_cast<size_t>(UINT32_MAX) + 1, 1);   // length only; never read
    CHECK(s.error == 3);
    CHECK(s.count() == 0);
    ChunkView v;
    CHECK_FALSE(s.next(v));

    s.set(&byte, static_cast<size_t>(UINT32_MAX), 1);
    CHECK(s.error == 0);
    CHECK(s.count() == UINT32_MAX);
}

TEST_CASE("Default chunk size keeps a small payload in one chunk") {
    Bytes payload = make_payload(1000);
    auto chunks = split_into_chunks(payload);
    REQUIRE(chunks.size() == 1);
    CHECK(chunks[0] == payload);
}

TEST_CASE("Split chunks submitted last-first reassemble the payload") {
    Bytes payload = make_payload(1001);
    auto chunks = split_into_chunks(payload, 64);
    REQUIRE(chunks.size() == 16);

    Assembler a;
    for (size_t i = chunks.size(); i-- > 0;) {
        a.append_parallel_chunk(static_cast<Ordinal>(i), chunks[i]);
    }
    ConsolidateResult res = a.consolidate(static_cast<uint32_t>(chunks.size()));
    REQUIRE(res.ok());
    CHECK(res.byte_count == payload.size());
    CHECK(a.finalize() == payload);
}

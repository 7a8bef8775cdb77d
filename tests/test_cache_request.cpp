#include <catch2/catch_test_macros.hpp>

#include "upd/cache_request.hpp"
#include "upd/entries.hpp"
#include "peer/contact.hpp"
#include "fundamentals/bytes.hpp"

#include <vector>

using namespace upd;

namespace {

CacheSourceRef entry(uint64_t seq, std::string_view who)
{
    auto ct = peer::Contact::from_string(who);
    REQUIRE(ct.has_value());
    return CacheSourceRef{.seq_counter = seq, .source = *ct};
}

std::vector<CacheSourceRef> sample_entries()
{
    return {
        entry(10, "DL1ABC@10.0.0.1"),
        entry(0x0102, "OE3XYZ@10.0.0.2"),
        entry(UINT64_MAX, "K1AB@192.168.1.20"),
    };
}

// Each "CALL@a.b.c.d" entry with a 6-char callsign takes 8 + 11 bytes
constexpr size_t six_char_entry = 8 + 1 + 6 + 4;

} // namespace

TEST_CASE("empty cache request encodes to a bare count")
{
    auto wire = encode_cache_request({});

    REQUIRE(wire.size() == 4);
    CHECK(bytes::get_le<uint32_t>(wire) == 0);

    auto req = decode_cache_request(wire);
    CHECK(req.value.entries.empty());
    CHECK(req.value.declared_count == 0);
    CHECK(req.clean());
}

TEST_CASE("cache request roundtrip preserves entry order")
{
    auto entries = sample_entries();
    auto wire = encode_cache_request(entries);

    auto req = decode_cache_request(wire);

    CHECK(req.clean());
    CHECK(req.value.declared_count == 3);
    CHECK(req.value.entries == entries);
}

TEST_CASE("cache request entry wire layout")
{
    std::vector<CacheSourceRef> one{entry(0x0102, "DL1ABC@10.0.0.1")};
    auto wire = encode_cache_request(one);

    REQUIRE(wire.size() == 4 + six_char_entry);
    CHECK(bytes::get_le<uint32_t>(wire) == 1);
    CHECK(wire[4] == std::byte{0x02});
    CHECK(wire[5] == std::byte{0x01});
    CHECK(wire[11] == std::byte{0x00});
    CHECK(wire[12] == std::byte{6});
    CHECK(one[0].serialize().size() == six_char_entry);
}

TEST_CASE("cache request count larger than the buffer stops early")
{
    std::vector<CacheSourceRef> two{entry(1, "DL1ABC@10.0.0.1"), entry(2, "DL2ABC@10.0.0.2")};
    auto wire = encode_cache_request(two);
    bytes::put_le(std::span{wire}, uint32_t{5});

    auto req = decode_cache_request(wire);

    CHECK(req.value.declared_count == 5);
    REQUIRE(req.value.recovered_count() == 2);
    CHECK(req.value.entries == two);
    REQUIRE(req.diagnostics.size() == 1);
    CHECK(req.diagnostics[0] == Diagnostic{SkipReason::missing_entries, 2, wire.size()});
}

TEST_CASE("corrupted contact ends the cache request decode")
{
    auto entries = std::vector<CacheSourceRef>{
        entry(1, "DL1ABC@10.0.0.1"),
        entry(2, "DL2ABC@10.0.0.2"),
        entry(3, "DL3ABC@10.0.0.3"),
    };
    auto wire = encode_cache_request(entries);

    size_t second = 4 + six_char_entry;
    wire[second + 8] = std::byte{0};   // callsign length

    auto req = decode_cache_request(wire);

    REQUIRE(req.value.recovered_count() == 1);
    CHECK(req.value.entries[0] == entries[0]);
    REQUIRE(req.diagnostics.size() == 1);
    CHECK(req.diagnostics[0] == Diagnostic{SkipReason::corrupt_contact, 1, second});
}

TEST_CASE("cache request with a truncated header decodes to nothing")
{
    bytes::buffer_t wire{std::byte{0x01}, std::byte{0x00}, std::byte{0x00}};

    auto req = decode_cache_request(wire);

    CHECK(req.value.entries.empty());
    REQUIRE(req.diagnostics.size() == 1);
    CHECK(req.diagnostics[0].reason == SkipReason::truncated_count);
}

TEST_CASE("cache request with a truncated trailing entry keeps the complete ones")
{
    std::vector<CacheSourceRef> two{entry(1, "DL1ABC@10.0.0.1"), entry(2, "DL2ABC@10.0.0.2")};
    auto wire = encode_cache_request(two);
    wire.resize(wire.size() - 10);

    auto req = decode_cache_request(wire);

    REQUIRE(req.value.recovered_count() == 1);
    CHECK(req.value.entries[0] == two[0]);
    REQUIRE(req.diagnostics.size() == 1);
    CHECK(req.diagnostics[0].reason == SkipReason::truncated_entry);
    CHECK(req.diagnostics[0].index == 1);
}

TEST_CASE("parse_cache_entry only advances past a complete entry")
{
    auto wire = entry(9, "DL1ABC@10.0.0.1").serialize();
    wire.push_back(std::byte{0x55});
    bytes::ByteCursor cur(wire);

    auto step = parse_cache_entry(cur);
    REQUIRE(step.value.has_value());
    CHECK(step.synced);
    CHECK(step.value->seq_counter == 9);
    CHECK(cur.remaining() == 1);

    auto tail = parse_cache_entry(cur);
    CHECK(!tail.value.has_value());
    CHECK(!tail.synced);
    CHECK(tail.skipped == SkipReason::truncated_entry);
    CHECK(cur.remaining() == 1);
}

TEST_CASE("cache request entry cut off inside its contact is a truncation")
{
    std::vector<CacheSourceRef> two{entry(1, "DL1ABC@10.0.0.1"), entry(2, "DL2ABC@10.0.0.2")};
    auto wire = encode_cache_request(two);
    wire.resize(wire.size() - 3);   // 16 of the second entry's 19 bytes remain

    auto req = decode_cache_request(wire);

    REQUIRE(req.value.recovered_count() == 1);
    CHECK(req.value.entries[0] == two[0]);
    REQUIRE(req.diagnostics.size() == 1);
    CHECK(req.diagnostics[0] == Diagnostic{SkipReason::truncated_entry, 1, 4 + six_char_entry});
}

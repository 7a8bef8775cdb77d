#include <catch2/catch_test_macros.hpp>

#include "peer/contact.hpp"
#include "peer/message.hpp"
#include "fundamentals/bytes.hpp"
#include "fundamentals/cursor.hpp"

#include <string>
#include <vector>

using namespace peer;

namespace {

Contact contact(std::string_view text)
{
    auto ct = Contact::from_string(text);
    REQUIRE(ct.has_value());
    return *ct;
}

Message text_message(uint64_t seq, std::string_view body)
{
    auto msg = Message::make(MessageType::Text, seq, contact("DL1ABC@10.0.0.1"), bytes::to_bytes(body));
    REQUIRE(msg.has_value());
    return *msg;
}

} // namespace

TEST_CASE("Contact::from_string parses callsign and address")
{
    auto ct = contact("DL1ABC@10.0.0.1");

    CHECK(ct.callsign() == "DL1ABC");
    CHECK(ct.address() == ip::make_address_v4("10.0.0.1"));
    CHECK(ct.to_string() == "DL1ABC@10.0.0.1");
}

TEST_CASE("Contact rejects malformed identities")
{
    auto addr = ip::make_address_v4("10.0.0.1");

    CHECK(Contact::make("", addr).error() == Contact::errc::callsign_err);
    CHECK(Contact::make("ABCDEFGHIJKLMNOPQ", addr).error() == Contact::errc::callsign_err);
    CHECK(Contact::make("DL 1", addr).error() == Contact::errc::callsign_err);
    CHECK(Contact::make("OE3XYZ/P", addr).has_value());

    CHECK(Contact::from_string("DL1ABC").error() == Contact::errc::format_err);
    CHECK(Contact::from_string("DL1ABC@999.1.1.1").error() == Contact::errc::address_err);
}

TEST_CASE("Contact::serialize produces correct wire format")
{
    auto wire = contact("DL1ABC@10.0.0.1").serialize();

    REQUIRE(wire.size() == 11);
    CHECK(wire[0] == std::byte{6});
    CHECK(bytes::to_string(std::span{wire}.subspan(1, 6)) == "DL1ABC");
    CHECK(wire[7] == std::byte{10});
    CHECK(wire[8] == std::byte{0});
    CHECK(wire[9] == std::byte{0});
    CHECK(wire[10] == std::byte{1});
}

TEST_CASE("Contact::parse returns the remaining buffer")
{
    auto ct = contact("DL1ABC@10.0.0.1");
    auto wire = ct.serialize();
    wire.push_back(std::byte{0xEE});
    wire.push_back(std::byte{0xFF});

    auto [parsed, rest] = Contact::parse(wire);

    REQUIRE(parsed.has_value());
    CHECK(*parsed == ct);
    REQUIRE(rest.size() == 2);
    CHECK(rest[0] == std::byte{0xEE});
}

TEST_CASE("Contact::parse leaves the cursor alone on failure")
{
    SECTION("zero length callsign")
    {
        bytes::buffer_t wire{std::byte{0}, std::byte{10}, std::byte{0}, std::byte{0}, std::byte{1}};
        bytes::ByteCursor cur(wire);
        CHECK(!Contact::parse(cur).has_value());
        CHECK(cur.offset() == 0);
    }

    SECTION("truncated address")
    {
        auto wire = contact("DL1ABC@10.0.0.1").serialize();
        wire.pop_back();
        bytes::ByteCursor cur(wire);
        CHECK(!Contact::parse(cur).has_value());
        CHECK(cur.offset() == 0);
    }

    SECTION("invalid callsign characters")
    {
        auto wire = contact("DL1ABC@10.0.0.1").serialize();
        wire[2] = std::byte{' '};
        bytes::ByteCursor cur(wire);
        CHECK(!Contact::parse(cur).has_value());
    }
}

TEST_CASE("Message::make validates type and payload size")
{
    auto src = contact("DL1ABC@10.0.0.1");

    auto bad_type = Message::make(static_cast<MessageType>(9), 1, src, {});
    REQUIRE(!bad_type.has_value());
    CHECK(bad_type.error() == Message::errc::type_err);

    std::vector<std::byte> oversized(Message::max_payload + 1);
    auto too_big = Message::make(MessageType::Beacon, 1, src, oversized);
    REQUIRE(!too_big.has_value());
    CHECK(too_big.error() == Message::errc::size_err);
}

TEST_CASE("Message roundtrip preserves all fields")
{
    auto msg = text_message(42, "hello cache");
    auto wire = msg.serialize();

    CHECK(wire.size() == msg.wire_size());
    CHECK(wire[0] == std::byte{Message::wire_version});
    CHECK(wire[1] == std::byte{0x01});

    auto parsed = Message::parse(wire);
    REQUIRE(parsed.has_value());
    CHECK(*parsed == msg);
    CHECK(parsed->seq_counter() == 42);
    CHECK(bytes::to_string(parsed->payload()) == "hello cache");
}

TEST_CASE("Message::parse rejects corrupted input")
{
    auto wire = text_message(7, "abc").serialize();

    SECTION("wrong version")
    {
        wire[0] = std::byte{2};
        CHECK(!Message::parse(wire).has_value());
    }

    SECTION("unknown type")
    {
        wire[1] = std::byte{0x7F};
        CHECK(!Message::parse(wire).has_value());
    }

    SECTION("payload shorter than declared")
    {
        wire.pop_back();
        CHECK(!Message::parse(wire).has_value());
    }

    SECTION("garbage")
    {
        std::vector<std::byte> garbage(wire.size(), std::byte{0xFF});
        CHECK(!Message::parse(garbage).has_value());
    }

    SECTION("empty")
    {
        CHECK(!Message::parse({}).has_value());
    }
}

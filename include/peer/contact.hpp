#pragma once
#include "fundamentals/bytes.hpp"
#include "fundamentals/cursor.hpp"

#include <boost/asio/ip/address_v4.hpp>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <span>

namespace peer
{

namespace ip = boost::asio::ip;

// Wire layout: [1 callsign length][callsign][4 IPv4, network order]
class Contact
{
public:
    enum class errc
    {
        OK = 0,
        callsign_err = 1,
        address_err = 2,
        format_err = 3
    };

    static constexpr size_t max_callsign = 16;
    static constexpr size_t min_wire_size = 1 + 1 + 4;

    [[nodiscard]] static std::expected<Contact, errc> make(std::string_view callsign, ip::address_v4 address);
    [[nodiscard]] static std::expected<Contact, errc> from_string(std::string_view text); // "CALL@a.b.c.d"

    // Leaves the cursor untouched on failure
    static std::optional<Contact> parse(bytes::ByteCursor& cur);
    static std::pair<std::optional<Contact>, std::span<const std::byte>> parse(std::span<const std::byte> data);

    bytes::buffer_t serialize() const;
    void write(bytes::buffer_t& out) const;
    size_t wire_size() const { return 1 + call.size() + 4; }

    std::string to_string() const;

    const std::string& callsign() const { return call; }
    ip::address_v4 address() const { return addr; }

    bool operator==(const Contact&) const = default;

private:
    Contact(std::string callsign, ip::address_v4 address) : call(std::move(callsign)), addr(address) {}

    std::string call;
    ip::address_v4 addr;
};

bool valid_callsign(std::string_view callsign);

} // namespace peer

#include "peer/contact.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace peer
{

bool valid_callsign(std::string_view callsign)
{
    if (callsign.empty() || callsign.size() > Contact::max_callsign)
    {
        return false;
    }
    return std::ranges::all_of(callsign, [](char ch)
    {
        return std::isalnum(static_cast<unsigned char>(ch)) || ch == '-' || ch == '/';
    });
}

std::expected<Contact, Contact::errc> Contact::make(std::string_view callsign, ip::address_v4 address)
{
    if (!valid_callsign(callsign))
    {
        return std::unexpected(errc::callsign_err);
    }
    return Contact(std::string(callsign), address);
}

std::expected<Contact, Contact::errc> Contact::from_string(std::string_view text)
{
    auto at = text.find('@');
    if (at == std::string_view::npos)
    {
        return std::unexpected(errc::format_err);
    }

    boost::system::error_code ec;
    auto address = ip::make_address_v4(std::string(text.substr(at + 1)), ec);
    if (ec)
    {
        return std::unexpected(errc::address_err);
    }

    return make(text.substr(0, at), address);
}

std::optional<Contact> Contact::parse(bytes::ByteCursor& cur)
{
    auto probe = cur;

    auto len = probe.read<uint8_t>();
    if (!len || *len == 0 || *len > max_callsign)
    {
        return std::nullopt;
    }

    auto name = probe.take(*len);
    auto raw_addr = probe.take(4);
    if (!name || !raw_addr)
    {
        return std::nullopt;
    }

    auto callsign = bytes::to_string(*name);
    if (!valid_callsign(callsign))
    {
        return std::nullopt;
    }

    ip::address_v4::bytes_type octets;
    std::ranges::transform(*raw_addr, octets.begin(),
                           [](std::byte b){ return std::to_integer<unsigned char>(b); });

    cur = probe;
    return Contact(std::move(callsign), ip::address_v4(octets));
}

std::pair<std::optional<Contact>, std::span<const std::byte>> Contact::parse(std::span<const std::byte> data)
{
    bytes::ByteCursor cur(data);
    auto ct = parse(cur);
    return {std::move(ct), cur.rest()};
}

void Contact::write(bytes::buffer_t& out) const
{
    out.push_back(bytes::int2byte(static_cast<uint8_t>(call.size())));
    bytes::append(out, bytes::to_bytes(call));
    for (auto octet : addr.to_bytes())
    {
        out.push_back(bytes::int2byte(octet));
    }
}

bytes::buffer_t Contact::serialize() const
{
    bytes::buffer_t ret;
    ret.reserve(wire_size());
    write(ret);
    return ret;
}

std::string Contact::to_string() const
{
    return std::format("{}@{}", call, addr.to_string());
}

} // namespace peer

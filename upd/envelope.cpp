#include "upd/envelope.hpp"
#include "fundamentals/cursor.hpp"

#include <ranges>
#include <algorithm>

namespace upd
{

std::expected<Envelope, Envelope::errc> Envelope::make(Operation op, std::span<const std::byte> data)
{
    if (data.size() > max_data)
    {
        return std::unexpected(errc::size_err);
    }
    return Envelope{.operation = op, .data = std::ranges::to<payload_t>(data)};
}

std::expected<Envelope, Envelope::errc> Envelope::parse(std::span<const std::byte> data)
{
    bytes::ByteCursor cur(data);

    auto op = cur.read<uint8_t>();
    auto len = cur.read<uint16_t>();
    if (!op || !len)
    {
        return std::unexpected(errc::header_err);
    }

    auto body = cur.take(*len);
    if (!body)
    {
        return std::unexpected(errc::len_verify_err);
    }

    return Envelope{.operation = static_cast<Operation>(*op), .data = std::ranges::to<payload_t>(*body)};
}

std::expected<Envelope::payload_t, Envelope::errc> Envelope::serialize() const
{
    if (data.size() > max_data)
    {
        return std::unexpected(errc::size_err);
    }

    payload_t ret(header_len + data.size(), std::byte{});

    ret[0] = static_cast<std::byte>(operation);
    bytes::put_le(std::span{ret}.subspan(1), static_cast<uint16_t>(data.size()));

    std::ranges::copy(data, ret.data() + header_len);
    return ret;
}

std::string_view describe(Envelope::errc ec)
{
    switch (ec)
    {
        case Envelope::errc::OK:             return "ok";
        case Envelope::errc::header_err:     return "envelope header incomplete";
        case Envelope::errc::len_verify_err: return "envelope data length exceeds buffer";
        case Envelope::errc::size_err:       return "envelope data too large";
    }
    return "unknown";
}

std::expected<bytes::buffer_t, Envelope::errc> encode_envelope(Operation op, std::span<const std::byte> data)
{
    return Envelope::make(op, data).and_then([](const Envelope& env){ return env.serialize(); });
}

std::expected<Envelope, Envelope::errc> decode_envelope(std::span<const std::byte> data)
{
    return Envelope::parse(data);
}

} // namespace upd

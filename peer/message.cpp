#include "peer/message.hpp"
#include "fundamentals/cursor.hpp"

#include <ranges>

namespace peer
{

std::expected<Message, Message::errc> Message::make(MessageType type, uint64_t seq_counter,
                                                    Contact source, std::span<const std::byte> payload)
{
    if (!is_known(type))
    {
        return std::unexpected(errc::type_err);
    }
    if (payload.size() > max_payload)
    {
        return std::unexpected(errc::size_err);
    }
    return Message(type, seq_counter, std::move(source), std::ranges::to<payload_t>(payload));
}

std::optional<Message> Message::parse(std::span<const std::byte> data)
{
    bytes::ByteCursor cur(data);

    auto version = cur.read<uint8_t>();
    auto raw_type = cur.read<uint8_t>();
    if (!version || *version != wire_version || !raw_type)
    {
        return std::nullopt;
    }

    auto type = static_cast<MessageType>(*raw_type);
    if (!is_known(type))
    {
        return std::nullopt;
    }

    auto seq = cur.read<uint64_t>();
    if (!seq)
    {
        return std::nullopt;
    }

    auto source = Contact::parse(cur);
    if (!source)
    {
        return std::nullopt;
    }

    auto len = cur.read<uint16_t>();
    if (!len)
    {
        return std::nullopt;
    }

    auto payload = cur.take(*len);
    if (!payload)
    {
        return std::nullopt;
    }

    return Message(type, *seq, std::move(*source), std::ranges::to<payload_t>(*payload));
}

bytes::buffer_t Message::serialize() const
{
    bytes::buffer_t ret;
    ret.reserve(wire_size());

    ret.push_back(bytes::int2byte(wire_version));
    ret.push_back(static_cast<std::byte>(ty));
    bytes::append_le(ret, seq);
    src.write(ret);
    bytes::append_le(ret, static_cast<uint16_t>(body.size()));
    bytes::append(ret, body);
    return ret;
}

} // namespace peer

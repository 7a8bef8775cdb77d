#include "upd/cache_response.hpp"

#include <ranges>

namespace upd
{

std::vector<peer::Message> CacheResponse::messages() const
{
    return entries |
        std::views::transform([](const FramedMessage& e){ return e.message; }) |
        std::ranges::to<std::vector<peer::Message>>();
}

bytes::buffer_t encode_cache_response(std::span<const FramedMessage> entries)
{
    size_t total = 4;
    for (const auto& e : entries)
    {
        total += 4 + e.message.wire_size();
    }

    bytes::buffer_t ret;
    ret.reserve(total);

    bytes::append_le(ret, static_cast<uint32_t>(entries.size()));
    for (const auto& e : entries)
    {
        e.write(ret);
    }
    return ret;
}

bytes::buffer_t encode_cache_response(std::span<const peer::Message> messages)
{
    return pack_cache_response(messages, SIZE_MAX).data;
}

PackedResponse pack_cache_response(std::span<const peer::Message> messages, size_t max_bytes)
{
    PackedResponse ret{.data = {}, .packed = 0};
    bytes::append_le(ret.data, uint32_t{0});

    for (const auto& msg : messages)
    {
        auto msb = msg.serialize();
        if (ret.data.size() + 4 + msb.size() > max_bytes)
        {
            break;
        }
        bytes::append_le(ret.data, static_cast<uint32_t>(msb.size()));
        bytes::append(ret.data, msb);
        ++ret.packed;
    }

    bytes::put_le(std::span{ret.data}, static_cast<uint32_t>(ret.packed));
    return ret;
}

Decoded<CacheResponse> decode_cache_response(std::span<const std::byte> data)
{
    Decoded<CacheResponse> ret;
    ret.value.declared_count = decode_entries(data, parse_payload_entry, ret.value.entries, ret.diagnostics);
    return ret;
}

} // namespace upd

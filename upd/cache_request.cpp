#include "upd/cache_request.hpp"

namespace upd
{

bytes::buffer_t encode_cache_request(std::span<const CacheSourceRef> entries)
{
    size_t total = 4;
    for (const auto& e : entries)
    {
        total += 8 + e.source.wire_size();
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

Decoded<CacheRequest> decode_cache_request(std::span<const std::byte> data)
{
    Decoded<CacheRequest> ret;
    ret.value.declared_count = decode_entries(data, parse_cache_entry, ret.value.entries, ret.diagnostics);
    return ret;
}

} // namespace upd

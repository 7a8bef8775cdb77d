#pragma once
#include "upd/entries.hpp"
#include "upd/diagnostics.hpp"
#include "fundamentals/bytes.hpp"

#include <vector>
#include <cstdint>
#include <span>

namespace upd
{

// Sent by a node to learn which cached messages it is missing
struct CacheRequest
{
    uint32_t declared_count = 0;   // advisory, may exceed entries.size()
    std::vector<CacheSourceRef> entries;

    [[nodiscard]] size_t recovered_count() const { return entries.size(); }
};

// Payload: [4 entry count][8 seq counter | Contact]...
bytes::buffer_t encode_cache_request(std::span<const CacheSourceRef> entries);

// Never fails. A corrupted contact ends the decode since nothing marks where
// the next entry begins.
Decoded<CacheRequest> decode_cache_request(std::span<const std::byte> data);

} // namespace upd

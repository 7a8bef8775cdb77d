#pragma once
#include "upd/entries.hpp"
#include "upd/diagnostics.hpp"
#include "peer/message.hpp"
#include "fundamentals/bytes.hpp"

#include <vector>
#include <cstdint>
#include <span>

namespace upd
{

// Answer to a cache request, carrying the messages the requester lacks
struct CacheResponse
{
    uint32_t declared_count = 0;   // advisory, corrupted entries are dropped
    std::vector<FramedMessage> entries;

    [[nodiscard]] size_t recovered_count() const { return entries.size(); }
    std::vector<peer::Message> messages() const;
};

struct PackedResponse
{
    bytes::buffer_t data;
    size_t packed;   // leading messages that fit
};

// Payload: [4 entry count][4 message length L | L message bytes]...
bytes::buffer_t encode_cache_response(std::span<const FramedMessage> entries);
bytes::buffer_t encode_cache_response(std::span<const peer::Message> messages);

// Encodes the longest prefix of `messages` whose payload fits in max_bytes
PackedResponse pack_cache_response(std::span<const peer::Message> messages, size_t max_bytes);

// Never fails. Unparseable messages are skipped by their declared length.
Decoded<CacheResponse> decode_cache_response(std::span<const std::byte> data);

} // namespace upd

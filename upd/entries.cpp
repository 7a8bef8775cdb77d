#include "upd/entries.hpp"

namespace upd
{

void CacheSourceRef::write(bytes::buffer_t& out) const
{
    bytes::append_le(out, seq_counter);
    source.write(out);
}

bytes::buffer_t CacheSourceRef::serialize() const
{
    bytes::buffer_t ret;
    ret.reserve(8 + source.wire_size());
    write(ret);
    return ret;
}

FramedMessage FramedMessage::wrap(peer::Message msg)
{
    auto len = static_cast<uint32_t>(msg.wire_size());
    return FramedMessage{.length = len, .message = std::move(msg)};
}

void FramedMessage::write(bytes::buffer_t& out) const
{
    auto msb = message.serialize();
    bytes::append_le(out, static_cast<uint32_t>(msb.size()));
    bytes::append(out, msb);
}

bytes::buffer_t FramedMessage::serialize() const
{
    bytes::buffer_t ret;
    ret.reserve(4 + message.wire_size());
    write(ret);
    return ret;
}

EntryStep<CacheSourceRef> parse_cache_entry(bytes::ByteCursor& cur)
{
    if (cur.remaining() < 8 + peer::Contact::min_wire_size)
    {
        return {.value = std::nullopt, .skipped = SkipReason::truncated_entry, .synced = false};
    }

    auto probe = cur;
    auto seq = probe.read<uint64_t>();

    // A valid callsign length that runs past the buffer is a cut-off entry
    auto peek = probe;
    auto name_len = peek.read<uint8_t>();
    if (name_len && *name_len > 0 && *name_len <= peer::Contact::max_callsign
        && peek.remaining() < size_t{*name_len} + 4)
    {
        return {.value = std::nullopt, .skipped = SkipReason::truncated_entry, .synced = false};
    }

    // No length prefix here: a bad contact leaves no known next boundary
    auto source = peer::Contact::parse(probe);
    if (!seq || !source)
    {
        return {.value = std::nullopt, .skipped = SkipReason::corrupt_contact, .synced = false};
    }

    cur = probe;
    return {.value = CacheSourceRef{.seq_counter = *seq, .source = std::move(*source)},
            .skipped = std::nullopt,
            .synced = true};
}

std::expected<std::span<const std::byte>, SkipReason> read_framed(bytes::ByteCursor& cur)
{
    auto probe = cur;

    auto len = probe.read<uint32_t>();
    if (!len)
    {
        return std::unexpected(SkipReason::truncated_entry);
    }

    auto region = probe.take(*len);
    if (!region)
    {
        return std::unexpected(SkipReason::length_out_of_bounds);
    }

    cur = probe;
    return *region;
}

EntryStep<FramedMessage> parse_payload_entry(bytes::ByteCursor& cur)
{
    auto region = read_framed(cur);
    if (!region)
    {
        return {.value = std::nullopt, .skipped = region.error(), .synced = false};
    }

    // The cursor already sits past the frame, whether or not the message parses
    auto msg = peer::Message::parse(*region);
    if (!msg)
    {
        return {.value = std::nullopt, .skipped = SkipReason::corrupt_message, .synced = true};
    }

    return {.value = FramedMessage{.length = static_cast<uint32_t>(region->size()), .message = std::move(*msg)},
            .skipped = std::nullopt,
            .synced = true};
}

} // namespace upd

#pragma once
#include "upd/diagnostics.hpp"
#include "peer/contact.hpp"
#include "peer/message.hpp"
#include "fundamentals/bytes.hpp"
#include "fundamentals/cursor.hpp"

#include <concepts>
#include <expected>
#include <functional>
#include <optional>
#include <vector>
#include <cstdint>
#include <span>

namespace upd
{

// Cache request element: "I hold messages from `source` up to `seq_counter`"
struct CacheSourceRef
{
    uint64_t seq_counter;
    peer::Contact source;

    bytes::buffer_t serialize() const;
    void write(bytes::buffer_t& out) const;

    bool operator==(const CacheSourceRef&) const = default;
};

// Cache response element. The length prefix lets a reader step over a
// message it cannot parse without losing the following entries.
struct FramedMessage
{
    uint32_t length;   // declared on the wire; wrap() fills it for outgoing entries
    peer::Message message;

    static FramedMessage wrap(peer::Message msg);

    bytes::buffer_t serialize() const;
    void write(bytes::buffer_t& out) const;

    bool operator==(const FramedMessage&) const = default;
};

// One entry decode step. `synced` is false when the cursor no longer sits on
// a trustworthy entry boundary and the list decode has to stop.
template<class T>
struct EntryStep
{
    std::optional<T> value;
    std::optional<SkipReason> skipped;
    bool synced;
};

EntryStep<CacheSourceRef> parse_cache_entry(bytes::ByteCursor& cur);
EntryStep<FramedMessage> parse_payload_entry(bytes::ByteCursor& cur);

// Reads a u32 length prefix and returns exactly that many following bytes,
// moving the cursor past them. The cursor is left alone on failure.
std::expected<std::span<const std::byte>, SkipReason> read_framed(bytes::ByteCursor& cur);

/**
 * Count-bounded loop shared by the list payloads.
 * The declared count only bounds the loop: decoding also stops once the
 * buffer is exhausted or an entry loses sync. Returns the declared count.
 */
template<class T, std::invocable<bytes::ByteCursor&> Parse>
uint32_t decode_entries(std::span<const std::byte> data, Parse&& parse,
                        std::vector<T>& out, std::vector<Diagnostic>& diags)
{
    bytes::ByteCursor cur(data);

    auto count = cur.read<uint32_t>();
    if (!count)
    {
        diags.push_back({SkipReason::truncated_count, 0, 0});
        return 0;
    }

    for (uint32_t i = 0; i < *count; ++i)
    {
        if (cur.empty())
        {
            diags.push_back({SkipReason::missing_entries, i, cur.offset()});
            break;
        }

        size_t at = cur.offset();
        EntryStep<T> step = std::invoke(parse, cur);
        if (step.value)
        {
            out.push_back(std::move(*step.value));
        }
        else
        {
            diags.push_back({step.skipped.value_or(SkipReason::truncated_entry), i, at});
        }

        if (!step.synced)
        {
            break;
        }
    }

    return *count;
}

} // namespace upd

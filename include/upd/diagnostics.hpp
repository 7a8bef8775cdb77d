#pragma once
#include <cstdint>
#include <cstddef>
#include <format>
#include <string_view>
#include <vector>

namespace upd
{

// Why a list decoder dropped an entry or stopped early
enum class SkipReason : uint8_t
{
    truncated_count,       // fewer than 4 bytes for the entry count
    missing_entries,       // buffer ended on an entry boundary before the declared count
    truncated_entry,       // buffer ended inside an entry
    length_out_of_bounds,  // declared entry length runs past the buffer
    corrupt_message,       // framed message unparseable, skipped by its declared length
    corrupt_contact,       // contact unparseable, no later boundary is known
};

constexpr std::string_view describe(SkipReason reason)
{
    switch (reason)
    {
        case SkipReason::truncated_count:      return "entry count truncated";
        case SkipReason::missing_entries:      return "buffer exhausted before declared count";
        case SkipReason::truncated_entry:      return "entry truncated";
        case SkipReason::length_out_of_bounds: return "entry length exceeds buffer";
        case SkipReason::corrupt_message:      return "corrupted message skipped";
        case SkipReason::corrupt_contact:      return "corrupted contact, remaining entries dropped";
    }
    return "unknown";
}

struct Diagnostic
{
    SkipReason reason;
    uint32_t index;   // entry position in the declared list
    size_t offset;    // byte offset of the entry in the payload

    bool operator==(const Diagnostic&) const = default;
};

// Result of a list decode: whatever was salvaged plus a note per problem
template<class T>
struct Decoded
{
    T value;
    std::vector<Diagnostic> diagnostics;

    [[nodiscard]] bool clean() const { return diagnostics.empty(); }
};

} // namespace upd

template<>
struct std::formatter<upd::Diagnostic>
{
    constexpr auto parse(std::format_parse_context& fpc)
    {
        return fpc.begin();
    }

    auto format(const upd::Diagnostic& d, std::format_context& fc) const
    {
        return std::format_to(fc.out(), "entry {} at offset {}: {}", d.index, d.offset, upd::describe(d.reason));
    }
};

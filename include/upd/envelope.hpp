#pragma once
#include "fundamentals/bytes.hpp"

#include <expected>
#include <string_view>
#include <cstdint>
#include <span>

namespace upd
{

enum class Operation : uint8_t
{
    CacheRequest  = 0x00,
    CacheResponse = 0x01,
};

constexpr bool is_known(Operation op)
{
    return op == Operation::CacheRequest || op == Operation::CacheResponse;
}

/**
 * Outermost UPD frame: [1 operation][2 data length][data].
 * Unlike the list payloads, a malformed envelope is a hard failure since
 * there is no later boundary to resynchronize on.
 */
struct Envelope
{
    using payload_t = bytes::buffer_t;

    enum class errc
    {
        OK = 0,
        header_err = 1,
        len_verify_err = 2,
        size_err = 3
    };

    static constexpr size_t header_len = 3;
    static constexpr size_t max_data = 0xFFFF;

    Operation operation;
    payload_t data;

    static std::expected<Envelope, errc> make(Operation op, std::span<const std::byte> data);
    static std::expected<Envelope, errc> parse(std::span<const std::byte> data);
    // Fails with size_err when data was set past max_data without make()
    std::expected<payload_t, errc> serialize() const;

    bool operator==(const Envelope&) const = default;
};

std::string_view describe(Envelope::errc ec);

std::expected<bytes::buffer_t, Envelope::errc> encode_envelope(Operation op, std::span<const std::byte> data);
std::expected<Envelope, Envelope::errc> decode_envelope(std::span<const std::byte> data);

} // namespace upd

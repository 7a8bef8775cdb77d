#pragma once
#include "peer/contact.hpp"
#include "fundamentals/bytes.hpp"

#include <expected>
#include <optional>
#include <cstdint>
#include <span>

namespace peer
{

enum class MessageType : uint8_t
{
    Text     = 0x01,
    Beacon   = 0x02,
    Position = 0x03,
};

constexpr bool is_known(MessageType type)
{
    return type == MessageType::Text || type == MessageType::Beacon || type == MessageType::Position;
}

/**
 * Application message carried between caches.
 * Wire layout: [1 version][1 type][8 seq counter][Contact source][2 payload length][payload]
 */
class Message
{
public:
    using payload_t = std::vector<std::byte>;

    enum class errc
    {
        OK = 0,
        type_err = 1,
        size_err = 2
    };

    static constexpr uint8_t wire_version = 1;
    static constexpr size_t max_payload = 0xFFFF;

    [[nodiscard]] static std::expected<Message, errc> make(MessageType type, uint64_t seq_counter,
                                                           Contact source, std::span<const std::byte> payload);

    // Bytes past the encoded message are ignored
    static std::optional<Message> parse(std::span<const std::byte> data);

    bytes::buffer_t serialize() const;
    size_t wire_size() const { return 2 + 8 + src.wire_size() + 2 + body.size(); }

    MessageType type() const { return ty; }
    uint64_t seq_counter() const { return seq; }
    const Contact& source() const { return src; }
    const payload_t& payload() const { return body; }

    bool operator==(const Message&) const = default;

private:
    Message(MessageType type, uint64_t seq_counter, Contact source, payload_t payload)
        : ty(type), seq(seq_counter), src(std::move(source)), body(std::move(payload)) {}

    MessageType ty;
    uint64_t seq;
    Contact src;
    payload_t body;
};

} // namespace peer

#pragma once
#include "fundamentals/bytes.hpp"

#include <optional>
#include <span>
#include <cstddef>

namespace bytes
{

/**
 * Read position over a borrowed buffer.
 * Every read either succeeds and advances, or fails and leaves the offset
 * untouched, so a copy of the cursor works as a checkpoint.
 */
class ByteCursor
{
public:
    explicit ByteCursor(std::span<const std::byte> data) : buf(data) {}

    [[nodiscard]] size_t offset() const { return off; }
    [[nodiscard]] size_t remaining() const { return buf.size() - off; }
    [[nodiscard]] bool empty() const { return off == buf.size(); }
    [[nodiscard]] std::span<const std::byte> rest() const { return buf.subspan(off); }

    template<std::integral Ty>
    std::optional<Ty> read()
    {
        if (remaining() < sizeof(Ty))
        {
            return std::nullopt;
        }
        Ty val = get_le<Ty>(rest());
        off += sizeof(Ty);
        return val;
    }

    std::optional<std::span<const std::byte>> take(size_t n)
    {
        if (remaining() < n)
        {
            return std::nullopt;
        }
        auto region = buf.subspan(off, n);
        off += n;
        return region;
    }

    bool skip(size_t n)
    {
        if (remaining() < n)
        {
            return false;
        }
        off += n;
        return true;
    }

private:
    std::span<const std::byte> buf;
    size_t off = 0;
};

} // namespace bytes

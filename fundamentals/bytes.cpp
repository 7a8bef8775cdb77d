#include "fundamentals/bytes.hpp"

#include <cctype>
#include <charconv>
#include <format>

namespace bytes
{

bool valid_utf8(std::span<const std::byte> data)
{
    size_t i = 0;
    while (i < data.size())
    {
        auto lead = std::to_integer<uint8_t>(data[i]);
        if (lead < 0x80)
        {
            ++i;
            continue;
        }

        size_t extra = 0;
        uint32_t cp = 0;
        uint32_t min_cp = 0;
        if ((lead & 0xE0) == 0xC0)      { extra = 1; cp = lead & 0x1F; min_cp = 0x80; }
        else if ((lead & 0xF0) == 0xE0) { extra = 2; cp = lead & 0x0F; min_cp = 0x800; }
        else if ((lead & 0xF8) == 0xF0) { extra = 3; cp = lead & 0x07; min_cp = 0x10000; }
        else
        {
            return false;
        }

        if (data.size() - i <= extra)
        {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k)
        {
            auto cont = std::to_integer<uint8_t>(data[i + k]);
            if ((cont & 0xC0) != 0x80)
            {
                return false;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }

        if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

std::string to_hex(std::span<const std::byte> data)
{
    std::string ret;
    ret.reserve(data.size() * 2);
    for (auto b : data)
    {
        ret += std::format("{:02x}", std::to_integer<uint8_t>(b));
    }
    return ret;
}

std::expected<buffer_t, std::string> from_hex(std::string_view text)
{
    std::string digits;
    digits.reserve(text.size());
    for (char ch : text)
    {
        if (std::isspace(static_cast<unsigned char>(ch)))
        {
            continue;
        }
        if (!std::isxdigit(static_cast<unsigned char>(ch)))
        {
            return std::unexpected(std::format("invalid hex character '{}'", ch));
        }
        digits += ch;
    }

    if (digits.size() % 2 != 0)
    {
        return std::unexpected("odd number of hex digits");
    }

    buffer_t ret;
    ret.reserve(digits.size() / 2);
    for (size_t i = 0; i < digits.size(); i += 2)
    {
        uint8_t val = 0;
        auto [ptr, ec] = std::from_chars(digits.data() + i, digits.data() + i + 2, val, 16);
        if (ec != std::errc{})
        {
            return std::unexpected(std::format("invalid hex pair at {}", i));
        }
        ret.push_back(int2byte(val));
    }
    return ret;
}

} // namespace bytes

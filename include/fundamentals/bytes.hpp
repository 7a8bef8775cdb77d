#pragma once
#include <concepts>
#include <bit>
#include <span>
#include <vector>
#include <cstring>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <ranges>
#include <expected>

namespace bytes
{

using buffer_t = std::vector<std::byte>;

inline std::byte int2byte(uint8_t i)
{
    return static_cast<std::byte>(i);
}

// Wire integers are little-endian
constexpr auto endify(std::integral auto i)
{
    if constexpr(std::endian::native == std::endian::big)
    {
        return std::byteswap(i);
    }
    else
    {
        return i;
    }
}

template<std::integral Ty = uint32_t>
Ty get_le(std::span<const std::byte> from)
{
    Ty ret = 0;
    std::memcpy(std::addressof(ret), from.data(), sizeof(Ty));
    return endify(ret);
}

template<std::integral Ty>
void put_le(std::span<std::byte> to, Ty val)
{
    val = endify(val);
    std::memcpy(to.data(), std::addressof(val), sizeof(Ty));
}

template<std::integral Ty>
void append_le(buffer_t& out, Ty val)
{
    auto pos = out.size();
    out.resize(pos + sizeof(Ty));
    put_le(std::span{out}.subspan(pos), val);
}

inline void append(buffer_t& out, std::span<const std::byte> src)
{
    out.insert(out.end(), src.begin(), src.end());
}

inline buffer_t to_bytes(std::string_view sv)
{
    return sv |
        std::views::transform([](char ch){ return int2byte(static_cast<uint8_t>(ch)); }) |
        std::ranges::to<buffer_t>();
}

inline std::string to_string(std::span<const std::byte> data)
{
    return data |
        std::views::transform([](std::byte b){ return static_cast<char>(b); }) |
        std::ranges::to<std::string>();
}

// Rejects overlong forms, surrogates and code points past U+10FFFF
bool valid_utf8(std::span<const std::byte> data);

std::string to_hex(std::span<const std::byte> data);

// Whitespace between digit pairs is tolerated
std::expected<buffer_t, std::string> from_hex(std::string_view text);

} // namespace bytes

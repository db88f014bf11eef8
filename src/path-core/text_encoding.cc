#include "text_encoding.hh"

#include <path-core/assert.hh>

namespace
{
constexpr pc::u32 invalid_code_point = 0xFFFFFFFFu;

constexpr bool is_high_surrogate(pc::u32 u)
{
    return 0xD800 <= u && u <= 0xDBFF;
}

constexpr bool is_low_surrogate(pc::u32 u)
{
    return 0xDC00 <= u && u <= 0xDFFF;
}

constexpr bool is_continuation(char b)
{
    return (pc::u8(b) & 0xC0) == 0x80;
}

constexpr pc::isize utf8_length_of_code_point(pc::u32 cp)
{
    if (cp < 0x80)
        return 1;
    if (cp < 0x800)
        return 2;
    if (cp < 0x10000)
        return 3;
    return 4;
}
} // namespace

pc::code_point_decode pc::decode_utf16(std::u16string_view text)
{
    PC_ASSERT(!text.empty(), "cannot decode empty text");

    u32 const u0 = text[0];
    if (is_high_surrogate(u0))
    {
        if (text.size() >= 2 && is_low_surrogate(text[1]))
            return {0x10000 + ((u0 - 0xD800) << 10) + (u32(text[1]) - 0xDC00), 2};
        return {invalid_code_point, 1};
    }
    if (is_low_surrogate(u0))
        return {invalid_code_point, 1};

    return {u0, 1};
}

pc::code_point_decode pc::decode_utf8(string_view bytes)
{
    PC_ASSERT(!bytes.empty(), "cannot decode empty bytes");

    auto const b0 = u8(bytes[0]);
    if (b0 < 0x80)
        return {b0, 1};

    isize length = 0;
    u32 cp = 0;
    u32 min_cp = 0;
    if ((b0 & 0xE0) == 0xC0)
    {
        length = 2;
        cp = b0 & 0x1F;
        min_cp = 0x80;
    }
    else if ((b0 & 0xF0) == 0xE0)
    {
        length = 3;
        cp = b0 & 0x0F;
        min_cp = 0x800;
    }
    else if ((b0 & 0xF8) == 0xF0)
    {
        length = 4;
        cp = b0 & 0x07;
        min_cp = 0x10000;
    }
    else
    {
        return {replacement_character, 1};
    }

    if (bytes.size() < length)
        return {replacement_character, 1};

    for (isize i = 1; i < length; ++i)
    {
        if (!is_continuation(bytes[i]))
            return {replacement_character, 1};
        cp = (cp << 6) | (u8(bytes[i]) & 0x3F);
    }

    // overlong, surrogate or beyond the unicode range
    if (cp < min_cp || cp > 0x10FFFF || (0xD800 <= cp && cp <= 0xDFFF))
        return {replacement_character, 1};

    return {cp, length};
}

pc::isize pc::utf8_length_of(std::u16string_view text)
{
    isize length = 0;
    while (!text.empty())
    {
        auto const d = decode_utf16(text);
        if (d.code_point == invalid_code_point)
            return -1;

        length += utf8_length_of_code_point(d.code_point);
        text.remove_prefix(size_t(d.length));
    }
    return length;
}

void pc::encode_utf8(std::u16string_view text, char* out)
{
    while (!text.empty())
    {
        auto const d = decode_utf16(text);
        PC_ASSERT(d.code_point != invalid_code_point, "text must not contain unpaired surrogates");

        auto const cp = d.code_point;
        switch (utf8_length_of_code_point(cp))
        {
        case 1:
            *out++ = char(cp);
            break;
        case 2:
            *out++ = char(0xC0 | (cp >> 6));
            *out++ = char(0x80 | (cp & 0x3F));
            break;
        case 3:
            *out++ = char(0xE0 | (cp >> 12));
            *out++ = char(0x80 | ((cp >> 6) & 0x3F));
            *out++ = char(0x80 | (cp & 0x3F));
            break;
        default:
            *out++ = char(0xF0 | (cp >> 18));
            *out++ = char(0x80 | ((cp >> 12) & 0x3F));
            *out++ = char(0x80 | ((cp >> 6) & 0x3F));
            *out++ = char(0x80 | (cp & 0x3F));
            break;
        }

        text.remove_prefix(size_t(d.length));
    }
}

std::u16string pc::decode_utf8_to_utf16(string_view bytes)
{
    std::u16string result;
    result.reserve(size_t(bytes.size()));

    while (!bytes.empty())
    {
        auto const d = decode_utf8(bytes);
        if (d.code_point < 0x10000)
        {
            result.push_back(char16_t(d.code_point));
        }
        else
        {
            auto const supp = d.code_point - 0x10000;
            result.push_back(char16_t(0xD800 + (supp >> 10)));
            result.push_back(char16_t(0xDC00 + (supp & 0x3FF)));
        }
        bytes = bytes.subview(d.length);
    }

    return result;
}

#pragma once

#include <path-core/fwd.hh>
#include <path-core/string_view.hh>

#include <string>
#include <string_view>

// Conversion between UTF-16 platform text and the UTF-8 bytes stored in byte_string.
//
//   utf8_length_of(text)        - UTF-8 byte count of the text, or -1 if it has an unpaired surrogate
//   encode_utf8(text, out)      - writes exactly utf8_length_of(text) bytes
//   decode_utf8_to_utf16(bytes) - lenient decode, malformed sequences become U+FFFD
//
// The UTF-8 length equals the UTF-16 length exactly when every code unit is ASCII.

namespace pc
{
/// U+FFFD, substituted for undecodable input
inline constexpr char16_t replacement_character = 0xFFFD;

/// One decoded code point and the number of code units it consumed
struct code_point_decode
{
    u32 code_point = 0;
    isize length = 0;
};

/// Decodes the code point at the start of `text` (surrogate pairs are combined).
/// An unpaired surrogate is reported as code point 0xFFFFFFFF with length 1.
/// Precondition: !text.empty()
[[nodiscard]] code_point_decode decode_utf16(std::u16string_view text);

/// Decodes the code point at the start of `bytes`.
/// Malformed, overlong or surrogate encodings are reported as U+FFFD with length 1.
/// Precondition: !bytes.empty()
[[nodiscard]] code_point_decode decode_utf8(string_view bytes);

[[nodiscard]] isize utf8_length_of(std::u16string_view text);

/// Precondition: utf8_length_of(text) >= 0 and `out` has room for that many bytes
void encode_utf8(std::u16string_view text, char* out);

[[nodiscard]] std::u16string decode_utf8_to_utf16(string_view bytes);
} // namespace pc

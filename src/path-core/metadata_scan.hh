#pragma once

#include <path-core/fwd.hh>
#include <path-core/string_view.hh>
#include <path-core/tri_state.hh>

// =========================================================================================================
// Metadata scanner
// =========================================================================================================
//
// One forward pass over a byte range gathers any subset of the facts a byte_string caches:
//
//   metadata::ci_crc32     - CRC32 over ASCII-lowercased bytes (the case-insensitive hash)
//   metadata::crc32        - CRC32 over the raw bytes
//   metadata::ascii_lower  - every byte equals its ASCII lowercase fold
//   metadata::ascii        - every byte is below 0x80
//
// The pass always yields the scanned length. scan_metadata stops early at a zero byte,
// scan_range covers an exact range that may contain zero bytes.
// Each of the 16 requested sets runs its own specialization, so a request never pays for a fact
// it did not ask for, and never walks the bytes twice for facts it did ask for.
//
// CRC32 uses the reflected polynomial 0xEDB88320, initial register 0xFFFFFFFF and a final inversion.
//
// Usage:
//   auto r = pc::scan_metadata(ptr, 4096, pc::metadata::ci_crc32 | pc::metadata::ascii);
//   // r.length, r.terminated, r.ci_crc32, r.is_ascii are valid

namespace pc
{
/// Bit set of facts requested from (or produced by) the scanner
enum class metadata : u8
{
    none = 0,
    ci_crc32 = 1 << 0,
    crc32 = 1 << 1,
    ascii_lower = 1 << 2,
    ascii = 1 << 3,
    all = ci_crc32 | crc32 | ascii_lower | ascii,
};

[[nodiscard]] constexpr metadata operator|(metadata a, metadata b)
{
    return metadata(u8(a) | u8(b));
}
[[nodiscard]] constexpr metadata operator&(metadata a, metadata b)
{
    return metadata(u8(a) & u8(b));
}
/// True if any fact of `query` is in `set`
[[nodiscard]] constexpr bool has_any(metadata set, metadata query)
{
    return (u8(set) & u8(query)) != 0;
}

/// Result of one scanner pass
/// Facts that were not requested are `unknown` and their hash is 0.
struct scan_result
{
    /// Bytes scanned before the terminator or the bound
    isize length = 0;
    /// A zero byte was found at `length` (within the bound)
    bool terminated = false;

    u32 ci_crc32 = 0;
    u32 crc32 = 0;
    tri_state is_ascii_lower = tri_state::unknown;
    tri_state is_ascii = tri_state::unknown;

    /// The facts that are valid in this result
    metadata computed = metadata::none;
};

/// Scans forward from `ptr` until a zero byte or `max_length` bytes, whichever comes first.
/// Computes exactly the `requested` facts in that single pass.
/// Precondition: ptr != nullptr || max_length == 0, max_length >= 0.
[[nodiscard]] scan_result scan_metadata(char const* ptr, isize max_length, metadata requested);

/// Same facts as scan_metadata over exactly `bytes`: zero bytes are content, terminated is always false.
[[nodiscard]] scan_result scan_range(string_view bytes, metadata requested);

/// CRC32 of a byte range (no terminator handling, zero bytes are hashed)
[[nodiscard]] u32 crc32(string_view bytes);

/// CRC32 of the ASCII-lowercased byte range
[[nodiscard]] u32 crc32_ci(string_view bytes);

namespace impl
{
struct crc32_table_data
{
    u32 entries[256];
};

/// Builds the reflected CRC32 lookup table (polynomial 0xEDB88320)
[[nodiscard]] constexpr crc32_table_data make_crc32_table()
{
    crc32_table_data t{};
    for (u32 i = 0; i < 256; ++i)
    {
        auto c = i;
        for (auto k = 0; k < 8; ++k)
            c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
        t.entries[i] = c;
    }
    return t;
}

inline constexpr crc32_table_data crc32_table = make_crc32_table();

/// One table step of the reflected CRC32 register
[[nodiscard]] inline u32 crc32_step(u32 crc, char b)
{
    return crc32_table.entries[u8(crc ^ u8(b))] ^ (crc >> 8);
}
} // namespace impl
} // namespace pc

#pragma once

#include <path-core/char_predicates.hh>
#include <path-core/fwd.hh>

#include <cstring>

// =========================================================================================================
// Raw byte primitives
// =========================================================================================================
//
//   mem_copy(dst, src, n)            - copy n bytes (ranges must not overlap)
//   mem_fill(dst, value, n)          - set n bytes to value
//   mem_compare(a, b, n)             - three-way compare, bytes as unsigned (memcmp semantics)
//   mem_compare_ci(a, b, n)          - three-way compare of ASCII-lowercased bytes, unsigned
//   mem_equal_ci(a, b, n)            - ASCII case-insensitive equality
//   ascii_to_lower_in_place(p, n)    - fold 'A'..'Z' to 'a'..'z'
//
// All of them accept n == 0 with any (even null) pointers.

namespace pc
{
inline void mem_copy(char* dst, char const* src, isize n)
{
    if (n > 0)
        std::memcpy(dst, src, size_t(n));
}

inline void mem_fill(char* dst, char value, isize n)
{
    if (n > 0)
        std::memset(dst, value, size_t(n));
}

[[nodiscard]] inline int mem_compare(char const* a, char const* b, isize n)
{
    return n > 0 ? std::memcmp(a, b, size_t(n)) : 0;
}

[[nodiscard]] inline int mem_compare_ci(char const* a, char const* b, isize n)
{
    for (isize i = 0; i < n; ++i)
    {
        auto const r = compare_ascii_case_insensitive{}(a[i], b[i]);
        if (r != 0)
            return r;
    }
    return 0;
}

[[nodiscard]] inline bool mem_equal_ci(char const* a, char const* b, isize n)
{
    for (isize i = 0; i < n; ++i)
        if (to_lower(a[i]) != to_lower(b[i]))
            return false;
    return true;
}

inline void ascii_to_lower_in_place(char* p, isize n)
{
    for (isize i = 0; i < n; ++i)
        p[i] = to_lower(p[i]);
}
} // namespace pc

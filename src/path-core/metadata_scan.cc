#include "metadata_scan.hh"

#include <path-core/assert.hh>
#include <path-core/char_predicates.hh>
#include <path-core/macros.hh>
#include <path-core/utility.hh>

#include <array>
#include <cstddef>
#include <utility>

namespace
{
constexpr pc::u32 crc32_initial = 0xFFFFFFFFu;

static_assert(pc::impl::crc32_table.entries[1] == 0x77073096u);
static_assert(pc::impl::crc32_table.entries[255] == 0x2D02EF8Du);

// One specialization per requested fact set and termination mode.
// `if constexpr` removes the work for every fact outside Mask, so e.g. scan_impl<0, true> only measures length.
template <pc::u8 Mask, bool StopAtZero>
PC_HOT_FUNC pc::scan_result scan_impl(char const* ptr, pc::isize max_length)
{
    constexpr bool want_ci_crc = (Mask & pc::u8(pc::metadata::ci_crc32)) != 0;
    constexpr bool want_crc = (Mask & pc::u8(pc::metadata::crc32)) != 0;
    constexpr bool want_lower = (Mask & pc::u8(pc::metadata::ascii_lower)) != 0;
    constexpr bool want_ascii = (Mask & pc::u8(pc::metadata::ascii)) != 0;

    auto ci_crc = crc32_initial;
    auto crc = crc32_initial;
    auto lower = true;
    auto ascii = true;

    pc::isize i = 0;
    for (; i < max_length; ++i)
    {
        char const b = ptr[i];
        if constexpr (StopAtZero)
            if (b == '\0')
                break;

        if constexpr (want_ci_crc)
            ci_crc = pc::impl::crc32_step(ci_crc, pc::to_lower(b));
        if constexpr (want_crc)
            crc = pc::impl::crc32_step(crc, b);
        if constexpr (want_lower)
            lower = lower && pc::is_lower_invariant(b);
        if constexpr (want_ascii)
            ascii = ascii && pc::is_ascii(b);
    }

    pc::scan_result r;
    r.length = i;
    if constexpr (StopAtZero)
        r.terminated = i < max_length;
    r.computed = pc::metadata(Mask);
    if constexpr (want_ci_crc)
        r.ci_crc32 = ~ci_crc;
    if constexpr (want_crc)
        r.crc32 = ~crc;
    if constexpr (want_lower)
        r.is_ascii_lower = pc::to_tri_state(lower);
    if constexpr (want_ascii)
        r.is_ascii = pc::to_tri_state(ascii);
    return r;
}

using scan_fn = pc::function_ptr<pc::scan_result(char const*, pc::isize)>;

template <bool StopAtZero, std::size_t... I>
constexpr std::array<scan_fn, sizeof...(I)> make_scanners(std::index_sequence<I...>)
{
    return {{&scan_impl<pc::u8(I), StopAtZero>...}};
}

constexpr auto scanner_count = std::size_t(pc::metadata::all) + 1;
constexpr auto g_terminated_scanners = make_scanners<true>(std::make_index_sequence<scanner_count>());
constexpr auto g_range_scanners = make_scanners<false>(std::make_index_sequence<scanner_count>());
} // namespace

pc::scan_result pc::scan_metadata(char const* ptr, isize max_length, metadata requested)
{
    PC_ASSERT(max_length >= 0, "max_length must be non-negative");
    PC_ASSERT(ptr != nullptr || max_length == 0, "null pointer only allowed for an empty scan");

    return g_terminated_scanners[u8(requested & metadata::all)](ptr, max_length);
}

pc::scan_result pc::scan_range(string_view bytes, metadata requested)
{
    return g_range_scanners[u8(requested & metadata::all)](bytes.data(), bytes.size());
}

pc::u32 pc::crc32(string_view bytes)
{
    auto crc = crc32_initial;
    for (auto const b : bytes)
        crc = impl::crc32_step(crc, b);
    return ~crc;
}

pc::u32 pc::crc32_ci(string_view bytes)
{
    auto crc = crc32_initial;
    for (auto const b : bytes)
        crc = impl::crc32_step(crc, to_lower(b));
    return ~crc;
}

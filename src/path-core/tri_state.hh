#pragma once

#include <path-core/fwd.hh>

namespace pc
{
/// A cached boolean fact that may not have been evaluated yet.
/// The zero value is `unknown` so that zero-initialized cache slots start out unevaluated.
enum class tri_state : u8
{
    unknown = 0,
    known_false = 1,
    known_true = 2,
};

[[nodiscard]] constexpr tri_state to_tri_state(bool value)
{
    return value ? tri_state::known_true : tri_state::known_false;
}

[[nodiscard]] constexpr bool is_known(tri_state s)
{
    return s != tri_state::unknown;
}

/// Combines the facts of two pieces that end up in one string (join, concat).
///   - both known and equal -> that value
///   - either known_false   -> known_false
///   - otherwise            -> unknown
/// known_false dominates unconditionally while known_true requires unanimity.
/// NOTE: this is not a tri-state AND: combine(known_true, unknown) is unknown.
[[nodiscard]] constexpr tri_state combine(tri_state a, tri_state b)
{
    if (a == b)
        return a;
    if (a == tri_state::known_false || b == tri_state::known_false)
        return tri_state::known_false;
    return tri_state::unknown;
}
} // namespace pc

#pragma once

#include <path-core/fwd.hh>
#include <path-core/string_view.hh>

namespace pc
{
/// ASCII case-insensitive glob match of `text` against `pattern`.
/// '*' matches any run of bytes (including none); every other pattern byte matches itself modulo case.
/// The whole text must be consumed.
///
/// Usage:
///   pc::wildcard_match_ci("chara/*.MDL", "chara/body.mdl") // true
///   pc::wildcard_match_ci("a*c", "abd")                   // false
[[nodiscard]] bool wildcard_match_ci(string_view pattern, string_view text);
} // namespace pc

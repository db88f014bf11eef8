#include "wildcard.hh"

#include <path-core/char_predicates.hh>

bool pc::wildcard_match_ci(string_view pattern, string_view text)
{
    isize p = 0;
    isize t = 0;
    isize star = -1; // pattern index of the last '*' seen
    isize resume = 0; // text index the last '*' currently absorbs up to

    while (t < text.size())
    {
        if (p < pattern.size() && pattern[p] == '*')
        {
            star = p++;
            resume = t;
        }
        else if (p < pattern.size() && equal_case_insensitive{}(pattern[p], text[t]))
        {
            ++p;
            ++t;
        }
        else if (star >= 0)
        {
            // let the last star swallow one more byte and retry
            p = star + 1;
            t = ++resume;
        }
        else
        {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == '*')
        ++p;

    return p == pattern.size();
}

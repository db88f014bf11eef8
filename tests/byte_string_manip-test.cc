#include <path-core/byte_string.hh>

#include <nexus/test.hh>

#include <vector>

namespace
{
pc::byte_string bs(char const* s, pc::metadata requested = pc::metadata::none)
{
    return pc::byte_string::create_from_pointer(s, requested);
}
} // namespace

TEST("byte_string manip - substring shares the source bytes")
{
    auto const s = bs("chara/equipment/e0001", pc::metadata::all);

    SECTION("tail")
    {
        auto const t = s.substring(6);
        CHECK(!t.is_owned());
        CHECK(t.data() == s.data() + 6);
        CHECK(t.bytes() == "equipment/e0001");
        CHECK(t.is_terminated());
    }

    SECTION("range")
    {
        auto const t = s.substring(6, 9);
        CHECK(t.data() == s.data() + 6);
        CHECK(t.bytes() == "equipment");
        CHECK(!t.is_terminated());
    }

    SECTION("range reaching the end is a tail")
    {
        auto const t = s.substring(16, 100);
        CHECK(t.bytes() == "e0001");
        CHECK(t.is_terminated());
    }

    SECTION("the whole string is a view")
    {
        auto const t = s.substring(0);
        CHECK(t.data() == s.data());
        CHECK(t.size() == s.size());
        CHECK(t.has_cached_ci_crc32());

        auto const u = s.substring(0, s.size());
        CHECK(u.data() == s.data());
        CHECK(u.has_cached_crc32());
    }

    SECTION("out of range yields the empty string")
    {
        CHECK(s.substring(-1).empty());
        CHECK(s.substring(s.size()).empty());
        CHECK(s.substring(100).empty());
        CHECK(s.substring(3, 0).empty());
        CHECK(s.substring(3, -2).empty());
        CHECK(s.substring(-1, 3).empty());
        CHECK(s.substring(s.size(), 1).empty());
        CHECK(s.substring(100).data() == pc::impl::empty_terminator);
    }

    SECTION("hashes are dropped, known-true flags survive")
    {
        auto const t = s.substring(6, 9);
        CHECK(!t.has_cached_ci_crc32());
        CHECK(!t.has_cached_crc32());
        CHECK(t.cached_is_ascii_lower() == pc::tri_state::known_true);
        CHECK(t.cached_is_ascii() == pc::tri_state::known_true);
        CHECK(t.ci_crc32() == pc::crc32_ci("equipment"));
    }

    SECTION("known-false flags become unknown")
    {
        auto const mixed = bs("Chara/equipment", pc::metadata::ascii_lower);
        REQUIRE(mixed.cached_is_ascii_lower() == pc::tri_state::known_false);

        auto const t = mixed.substring(6);
        CHECK(t.cached_is_ascii_lower() == pc::tri_state::unknown);
        CHECK(t.is_ascii_lower());
    }
}

TEST("byte_string manip - trimming")
{
    auto const s = bs(" \t chara/human \r\n", pc::metadata::ascii_lower);

    SECTION("front")
    {
        auto const t = s.trim_front();
        CHECK(t.data() == s.data() + 3);
        CHECK(t.bytes() == "chara/human \r\n");
        CHECK(t.is_terminated());
        CHECK(t.cached_is_ascii_lower() == pc::tri_state::known_true);
    }

    SECTION("end")
    {
        auto const t = s.trim_end();
        CHECK(t.data() == s.data());
        CHECK(t.bytes() == " \t chara/human");
        CHECK(!t.is_terminated());
    }

    SECTION("both")
    {
        auto const t = s.trim();
        CHECK(t.data() == s.data() + 3);
        CHECK(t.bytes() == "chara/human");
    }

    SECTION("nothing to trim returns a view")
    {
        auto const clean = bs("chara");
        CHECK(clean.trim().data() == clean.data());
        CHECK(clean.trim().size() == clean.size());
        CHECK(clean.trim().is_terminated());
    }

    SECTION("only whitespace")
    {
        auto const blank = bs(" \t\n ");
        CHECK(blank.trim_front().empty());
        CHECK(blank.trim_end().empty());
        CHECK(blank.trim().empty());
    }

    SECTION("single character")
    {
        CHECK(bs("a ").trim_end().bytes() == "a");
        CHECK(bs(" a").trim_front().bytes() == "a");
    }
}

TEST("byte_string manip - lowercasing")
{
    auto const s = bs("Chara/Equipment/E0001.MDL");

    auto const lower = s.to_ascii_lower();
    CHECK(lower.is_owned());
    CHECK(lower.bytes() == "chara/equipment/e0001.mdl");
    CHECK(lower.cached_is_ascii_lower() == pc::tri_state::known_true);
    CHECK(lower.is_terminated());
    CHECK(lower == s);

    SECTION("second application returns the same bytes")
    {
        auto const again = lower.to_ascii_lower();
        CHECK(!again.is_owned());
        CHECK(again.data() == lower.data());
        CHECK(again.bytes() == lower.bytes());
    }

    SECTION("clone always copies")
    {
        auto const c = lower.to_ascii_lower_clone();
        CHECK(c.is_owned());
        CHECK(c.data() != lower.data());
        CHECK(c.bytes() == lower.bytes());
    }

    SECTION("non-ASCII bytes are untouched")
    {
        auto const t = bs("\xC3\x89T\xC3\x89", pc::metadata::ascii).to_ascii_lower();
        CHECK(t.bytes() == "\xC3\x89t\xC3\x89");
        CHECK(t.cached_is_ascii() == pc::tri_state::known_false);
    }

    SECTION("case-insensitive hash is preserved")
    {
        CHECK(lower.ci_crc32() == s.ci_crc32());
        CHECK(lower.crc32() != s.crc32());
    }
}

TEST("byte_string manip - assigning a view of itself keeps the bytes")
{
    SECTION("lowercase of a known-lowercase owned string")
    {
        auto s = bs("Chara/Human/C0101.mdl").to_ascii_lower();
        REQUIRE(s.is_owned());
        REQUIRE(s.cached_is_ascii_lower() == pc::tri_state::known_true);

        s = s.to_ascii_lower();
        CHECK(s.is_owned());
        CHECK(s.bytes() == "chara/human/c0101.mdl");
        CHECK(s[0] == 'c');
        CHECK(s.cached_is_ascii_lower() == pc::tri_state::known_true);
    }

    SECTION("trim of an owned string")
    {
        auto t = bs("  chara/human  ").clone();
        t = t.trim();
        CHECK(t.is_owned());
        CHECK(t.bytes() == "chara/human");
        CHECK(t.is_terminated());
    }

    SECTION("substring of an owned string")
    {
        auto u = bs("chara/human/c0101.mdl").clone();
        u = u.substring(6);
        CHECK(u.bytes() == "human/c0101.mdl");
        CHECK(u == bs("HUMAN/C0101.MDL"));
    }

    SECTION("views of other strings are still borrowed")
    {
        auto const other = bs("vfx/common.avfx").clone();
        auto v = bs("chara").clone();
        v = other.view();
        CHECK(!v.is_owned());
        CHECK(v.data() == other.data());
    }
}

TEST("byte_string manip - to_ascii_mixed")
{
    auto const s = bs("hello big\tworld", pc::metadata::ci_crc32);
    auto const mixed = s.to_ascii_mixed();

    CHECK(mixed.is_owned());
    CHECK(mixed.bytes() == "Hello Big\tWorld");
    CHECK(mixed.cached_is_ascii_lower() == pc::tri_state::unknown);
    CHECK(!mixed.is_ascii_lower());
    CHECK(mixed.has_cached_ci_crc32());
    CHECK(mixed.ci_crc32() == s.ci_crc32());

    // only word starts change
    CHECK(bs("hELLO wORLD").to_ascii_mixed().bytes() == "HELLO WORLD");
    CHECK(bs("  a").to_ascii_mixed().bytes() == "  A");
    CHECK(bs("1st place").to_ascii_mixed().bytes() == "1st Place");
    CHECK(pc::byte_string().to_ascii_mixed().empty());
}

TEST("byte_string manip - replace")
{
    SECTION("separators")
    {
        auto const s = bs("chara\\equipment\\e0001", pc::metadata::all);
        auto const r = s.replace('\\', '/');
        CHECK(r.is_owned());
        CHECK(r.bytes() == "chara/equipment/e0001");
        CHECK(r.cached_is_ascii_lower() == pc::tri_state::known_true);
        CHECK(r.cached_is_ascii() == pc::tri_state::known_true);
        CHECK(!r.has_cached_ci_crc32());
    }

    SECTION("nothing replaced keeps every fact")
    {
        auto const s = bs("chara/human", pc::metadata::all);
        auto const r = s.replace('\\', '/');
        CHECK(r.is_owned());
        CHECK(r.data() != s.data());
        CHECK(r.has_cached_ci_crc32());
        CHECK(r.ci_crc32() == s.ci_crc32());
        CHECK(r.cached_is_ascii_lower() == pc::tri_state::known_true);
    }

    SECTION("introducing an uppercase letter")
    {
        auto const r = bs("a_b", pc::metadata::ascii_lower).replace('_', 'X');
        CHECK(r.bytes() == "aXb");
        CHECK(r.cached_is_ascii_lower() == pc::tri_state::known_false);
    }

    SECTION("removing an uppercase letter")
    {
        auto const s = bs("aXb", pc::metadata::ascii_lower);
        REQUIRE(s.cached_is_ascii_lower() == pc::tri_state::known_false);
        auto const r = s.replace('X', '_');
        CHECK(r.cached_is_ascii_lower() == pc::tri_state::unknown);
        CHECK(r.is_ascii_lower());

        auto const still_upper = bs("aXbY", pc::metadata::ascii_lower).replace('X', '_');
        CHECK(!still_upper.is_ascii_lower());
    }

    SECTION("non-ASCII replacement bytes")
    {
        auto const r = bs("a_b", pc::metadata::ascii).replace('_', '\xE9');
        CHECK(r.cached_is_ascii() == pc::tri_state::known_false);

        auto const back = r.replace('\xE9', '_');
        CHECK(back.cached_is_ascii() == pc::tri_state::unknown);
        CHECK(back.is_ascii());
    }
}

TEST("byte_string manip - split")
{
    auto const s = bs("chara/equipment//e0001/");

    SECTION("empty parts removed")
    {
        auto const parts = s.split('/');
        REQUIRE(parts.size() == 3);
        CHECK(parts[0].bytes() == "chara");
        CHECK(parts[1].bytes() == "equipment");
        CHECK(parts[2].bytes() == "e0001");
        CHECK(parts[1].data() == s.data() + 6);
        CHECK(!parts[1].is_owned());
    }

    SECTION("empty parts kept")
    {
        auto const parts = s.split('/', pc::byte_string::max_scan_length, false);
        REQUIRE(parts.size() == 5);
        CHECK(parts[2].empty());
        CHECK(parts[3].bytes() == "e0001");
        CHECK(parts[4].empty());
    }

    SECTION("limited number of parts")
    {
        auto const parts = s.split('/', 2);
        REQUIRE(parts.size() == 2);
        CHECK(parts[0].bytes() == "chara");
        CHECK(parts[1].bytes() == "equipment//e0001/");
    }

    SECTION("no separator")
    {
        auto const parts = bs("chara").split('/');
        REQUIRE(parts.size() == 1);
        CHECK(parts[0].bytes() == "chara");
    }

    SECTION("leading separator and empty input")
    {
        auto const parts = bs("/chara").split('/');
        REQUIRE(parts.size() == 1);
        CHECK(parts[0].bytes() == "chara");

        CHECK(pc::byte_string().split('/').empty());
        CHECK(pc::byte_string().split('/', 4, false).size() == 1);
    }
}

TEST("byte_string manip - join and concat")
{
    auto const lower_a = bs("chara", pc::metadata::ascii_lower);
    auto const lower_b = bs("human", pc::metadata::ascii_lower);
    auto const not_lower = bs("Human", pc::metadata::ascii_lower);
    auto const unknown = bs("human");

    SECTION("content")
    {
        pc::byte_string const parts[] = {lower_a.view(), lower_b.view(), bs("c0101")};
        auto const j = pc::byte_string::join('/', parts);
        CHECK(j.is_owned());
        CHECK(j.is_terminated());
        CHECK(j.bytes() == "chara/human/c0101");

        auto const c = pc::byte_string::concat(parts);
        CHECK(c.bytes() == "charahumanc0101");
    }

    SECTION("known lowercase parts give a known lowercase result")
    {
        auto const j = pc::byte_string::join('/', {lower_a.view(), lower_b.view()});
        CHECK(j.cached_is_ascii_lower() == pc::tri_state::known_true);
    }

    SECTION("one unknown part makes the result unknown")
    {
        auto const j = pc::byte_string::join('/', {lower_a.view(), unknown.view()});
        CHECK(j.cached_is_ascii_lower() == pc::tri_state::unknown);
    }

    SECTION("one known non-lowercase part wins")
    {
        auto const j = pc::byte_string::join('/', {lower_a.view(), not_lower.view()});
        CHECK(j.cached_is_ascii_lower() == pc::tri_state::known_false);

        auto const k = pc::byte_string::join('/', {unknown.view(), not_lower.view()});
        CHECK(k.cached_is_ascii_lower() == pc::tri_state::known_false);
    }

    SECTION("the separator counts too")
    {
        auto const j = pc::byte_string::join('X', {lower_a.view(), lower_b.view()});
        CHECK(j.bytes() == "charaXhuman");
        CHECK(j.cached_is_ascii_lower() == pc::tri_state::known_false);
    }

    SECTION("from a vector")
    {
        std::vector<pc::byte_string> parts;
        parts.push_back(bs("bg"));
        parts.push_back(bs("ffxiv"));
        auto const j = pc::byte_string::join('/', pc::span<pc::byte_string const>(parts));
        CHECK(j.bytes() == "bg/ffxiv");
    }

    SECTION("nothing to join")
    {
        CHECK(pc::byte_string::join('/', {}).empty());
        CHECK(pc::byte_string::concat({}).empty());
        CHECK(pc::byte_string::concat({pc::byte_string(), pc::byte_string()}).empty());
        CHECK(pc::byte_string::join('/', {pc::byte_string(), pc::byte_string()}).bytes() == "/");
    }
}

#include <path-core/byte_string.hh>
#include <path-core/metadata_scan.hh>
#include <path-core/string_memory.hh>
#include <path-core/utility.hh>

#include <nexus/test.hh>

#include <string>
#include <thread>
#include <type_traits>
#include <unordered_set>
#include <vector>

static_assert(!std::is_copy_constructible_v<pc::byte_string>, "byte_string copies must be explicit");
static_assert(std::is_nothrow_move_constructible_v<pc::byte_string>);
static_assert(std::is_nothrow_move_assignable_v<pc::byte_string>);

namespace
{
void check_canonical_empty(pc::byte_string const& s)
{
    CHECK(s.empty());
    CHECK(s.size() == 0);
    CHECK(!s.is_owned());
    CHECK(s.is_terminated());
    CHECK(s.data() == pc::impl::empty_terminator);
    CHECK(s.cached_is_ascii() == pc::tri_state::known_true);
    CHECK(s.cached_is_ascii_lower() == pc::tri_state::known_true);
    CHECK(s.has_cached_ci_crc32());
    CHECK(s.has_cached_crc32());
    CHECK(s.ci_crc32() == 0);
}
} // namespace

TEST("byte_string - canonical empty string")
{
    SECTION("default construction")
    {
        check_canonical_empty(pc::byte_string());
    }

    SECTION("all empty inputs produce it")
    {
        check_canonical_empty(pc::byte_string::create_from_pointer(nullptr));
        check_canonical_empty(pc::byte_string::create_from_pointer(""));
        check_canonical_empty(pc::byte_string::create_from_range(pc::string_view()));
        check_canonical_empty(pc::byte_string::create_from_trusted(nullptr, 0, true));
        check_canonical_empty(pc::byte_string().clone());
    }

    SECTION("c_str of the empty string")
    {
        auto const s = pc::byte_string();
        CHECK(s.c_str()[0] == '\0');
    }
}

TEST("byte_string - create_from_pointer")
{
    char const text[] = "chara/Human/c0101";

    SECTION("borrows without copying")
    {
        auto const s = pc::byte_string::create_from_pointer(text);
        CHECK(s.data() == text);
        CHECK(s.size() == 17);
        CHECK(!s.is_owned());
        CHECK(s.is_terminated());
        CHECK(s.c_str() == text);
    }

    SECTION("requested facts are known right away")
    {
        auto const s = pc::byte_string::create_from_pointer(text, pc::metadata::all);
        CHECK(s.has_cached_ci_crc32());
        CHECK(s.has_cached_crc32());
        CHECK(s.cached_is_ascii() == pc::tri_state::known_true);
        CHECK(s.cached_is_ascii_lower() == pc::tri_state::known_false);
        CHECK(s.ci_crc32() == pc::crc32_ci("chara/human/c0101"));
        CHECK(s.crc32() == pc::crc32("chara/Human/c0101"));
    }

    SECTION("unrequested facts are evaluated lazily and cached")
    {
        auto const s = pc::byte_string::create_from_pointer(text);
        CHECK(!s.has_cached_ci_crc32());
        CHECK(!s.has_cached_crc32());
        CHECK(s.cached_is_ascii() == pc::tri_state::unknown);
        CHECK(s.cached_is_ascii_lower() == pc::tri_state::unknown);

        CHECK(s.ci_crc32() == pc::crc32_ci(text));
        CHECK(s.has_cached_ci_crc32());
        CHECK(!s.has_cached_crc32());

        CHECK(!s.is_ascii_lower());
        // both flags come from the same pass
        CHECK(s.cached_is_ascii_lower() == pc::tri_state::known_false);
        CHECK(s.cached_is_ascii() == pc::tri_state::known_true);
    }

    SECTION("bounded scan")
    {
        auto const s = pc::byte_string::create_from_pointer(text, pc::metadata::none, 5);
        CHECK(s.size() == 5);
        CHECK(!s.is_terminated());
        CHECK(s.bytes() == "chara");
    }
}

TEST("byte_string - create_from_range")
{
    std::string const storage = "vfx/common/eff";

    auto const s = pc::byte_string::create_from_range(storage, pc::metadata::ascii_lower);
    CHECK(s.data() == storage.data());
    CHECK(s.size() == 14);
    CHECK(s.cached_is_ascii_lower() == pc::tri_state::known_true);

    SECTION("an embedded zero byte ends the string")
    {
        auto const z = std::string("abc\0def", 7);
        auto const t = pc::byte_string::create_from_range(z);
        CHECK(t.size() == 3);
        CHECK(t.is_terminated());
    }

    SECTION("sub-range of a larger buffer")
    {
        auto const t = pc::byte_string::create_from_range(pc::string_view(storage.data(), 3));
        CHECK(t.size() == 3);
        CHECK(!t.is_terminated());
        CHECK(t.bytes() == "vfx");
    }
}

TEST("byte_string - create_from_trusted keeps the hints")
{
    char const text[] = "ui/uld/icon";
    auto const s = pc::byte_string::create_from_trusted(text, 11, true, pc::tri_state::known_true, pc::tri_state::known_true);

    CHECK(s.data() == text);
    CHECK(s.size() == 11);
    CHECK(s.is_terminated());
    CHECK(s.cached_is_ascii_lower() == pc::tri_state::known_true);
    CHECK(s.cached_is_ascii() == pc::tri_state::known_true);
    CHECK(!s.has_cached_ci_crc32());
}

TEST("byte_string - platform text")
{
    SECTION("ASCII round trip")
    {
        pc::byte_string s;
        REQUIRE(pc::byte_string::try_create_from_platform_text(u"chara/Monster/m0001", s));
        CHECK(s.is_owned());
        CHECK(s.is_terminated());
        CHECK(s.bytes() == "chara/Monster/m0001");
        CHECK(s.has_cached_ci_crc32());
        CHECK(s.cached_is_ascii() == pc::tri_state::known_true);
        CHECK(s.to_platform_text() == u"chara/Monster/m0001");
    }

    SECTION("non-ASCII round trip")
    {
        std::u16string const text = u"ui/loadingimage/-nowloading_Base25_Été_テスト";
        pc::byte_string s;
        REQUIRE(pc::byte_string::try_create_from_platform_text(text, s, pc::metadata::all));
        CHECK(s.cached_is_ascii() == pc::tri_state::known_false);
        CHECK(s.cached_is_ascii_lower() == pc::tri_state::known_false);
        CHECK(s.size() > pc::isize(text.size()));
        CHECK(s.to_platform_text() == text);
    }

    SECTION("lowercasing on the way in")
    {
        pc::byte_string s;
        REQUIRE(pc::byte_string::try_create_from_platform_text(u"Chara/ÉTÉ", s, pc::metadata::ci_crc32, true));
        CHECK(s.cached_is_ascii_lower() == pc::tri_state::known_true);
        // only ASCII letters fold
        CHECK(s.bytes() == "chara/\xC3\x89t\xC3\x89");
    }

    SECTION("empty text")
    {
        pc::byte_string s = pc::byte_string::create_from_range("previous");
        REQUIRE(pc::byte_string::try_create_from_platform_text(u"", s));
        check_canonical_empty(s);
    }

    SECTION("unpaired surrogate fails with the empty string")
    {
        char16_t const bad[] = {u'a', char16_t(0xDC00)};
        pc::byte_string s = pc::byte_string::create_from_range("previous");
        CHECK(!pc::byte_string::try_create_from_platform_text(std::u16string_view(bad, 2), s));
        check_canonical_empty(s);
    }

    SECTION("decoding malformed bytes never fails")
    {
        auto const s = pc::byte_string::create_from_range("bad\xFF");
        CHECK(s.to_platform_text() == u"bad�");
    }
}

TEST("byte_string - clone and view")
{
    char const text[] = "sound/voice/vo_line";
    auto const original = pc::byte_string::create_from_pointer(text, pc::metadata::all);

    SECTION("clone copies bytes and facts")
    {
        auto const c = original.clone();
        CHECK(c.is_owned());
        CHECK(c.data() != original.data());
        CHECK(c.bytes() == original.bytes());
        CHECK(c.is_terminated());
        CHECK(c.c_str()[c.size()] == '\0');
        CHECK(c.has_cached_ci_crc32());
        CHECK(c.ci_crc32() == original.ci_crc32());
        CHECK(c.cached_is_ascii_lower() == original.cached_is_ascii_lower());
        CHECK(c == original);
    }

    SECTION("view aliases the bytes")
    {
        auto const owned = original.clone();
        auto const v = owned.view();
        CHECK(!v.is_owned());
        CHECK(v.data() == owned.data());
        CHECK(v.size() == owned.size());
        CHECK(v.has_cached_crc32());
    }
}

TEST("byte_string - move and dispose")
{
    auto const before = pc::string_memory_snapshot();

    SECTION("move transfers ownership")
    {
        auto a = pc::byte_string::create_from_range("chara/xls").clone();
        auto const* p = a.data();

        auto b = pc::move(a);
        CHECK(b.is_owned());
        CHECK(b.data() == p);
        check_canonical_empty(a);

        pc::byte_string c;
        c = pc::move(b);
        CHECK(c.data() == p);
        check_canonical_empty(b);
    }

    SECTION("move assignment frees the previous buffer")
    {
        auto a = pc::byte_string::create_from_range("first").clone();
        auto b = pc::byte_string::create_from_range("second").clone();
        a = pc::move(b);
        CHECK(a.bytes() == "second");
    }

    SECTION("disposing twice is harmless")
    {
        auto s = pc::byte_string::create_from_range("bgcommon/world").clone();
        s.dispose();
        check_canonical_empty(s);
        s.dispose();
        check_canonical_empty(s);
    }

    SECTION("disposing a borrowed string only resets it")
    {
        char const text[] = "common/font";
        auto s = pc::byte_string::create_from_pointer(text);
        s.dispose();
        check_canonical_empty(s);
        CHECK(text[0] == 'c');
    }

    if (pc::string_memory_telemetry_enabled())
    {
        auto const after = pc::string_memory_snapshot();
        CHECK(after.current_strings() == before.current_strings());
    }
}

TEST("byte_string - lazy facts from several threads")
{
    auto const s = pc::byte_string::create_from_range("chara/equipment/e0001/model/C0101E0001_TOP.mdl").clone();
    REQUIRE(!s.has_cached_ci_crc32());
    REQUIRE(!s.has_cached_crc32());
    REQUIRE(s.cached_is_ascii() == pc::tri_state::unknown);
    REQUIRE(s.cached_is_ascii_lower() == pc::tri_state::unknown);

    auto const expected = pc::scan_range(s.bytes(), pc::metadata::all);

    struct observed
    {
        pc::u32 ci_crc32 = 0;
        pc::u32 crc32 = 0;
        bool ascii = false;
        bool ascii_lower = true;
    };

    constexpr int thread_count = 8;
    std::vector<observed> results(thread_count);
    std::vector<std::thread> threads;
    for (auto t = 0; t < thread_count; ++t)
        threads.emplace_back(
            [&s, &r = results[t]]
            {
                r.ci_crc32 = s.ci_crc32();
                r.crc32 = s.crc32();
                r.ascii = s.is_ascii();
                r.ascii_lower = s.is_ascii_lower();
            });
    for (auto& t : threads)
        t.join();

    for (auto const& r : results)
    {
        CHECK(r.ci_crc32 == expected.ci_crc32);
        CHECK(r.crc32 == expected.crc32);
        CHECK(r.ascii == (expected.is_ascii == pc::tri_state::known_true));
        CHECK(r.ascii_lower == (expected.is_ascii_lower == pc::tri_state::known_true));
    }

    CHECK(s.has_cached_ci_crc32());
    CHECK(s.cached_is_ascii() == pc::tri_state::known_true);
    CHECK(s.cached_is_ascii_lower() == pc::tri_state::known_false);
}

TEST("byte_string - element access")
{
    auto const s = pc::byte_string::create_from_range("abc");
    CHECK(s[0] == 'a');
    CHECK(s.front() == 'a');
    CHECK(s.back() == 'c');

    std::string collected;
    for (auto c : s)
        collected += c;
    CHECK(collected == "abc");
}

TEST("byte_string - std::hash is case-insensitive")
{
    auto const a = pc::byte_string::create_from_range("Chara/Human");
    auto const b = pc::byte_string::create_from_range("chara/human");

    CHECK(std::hash<pc::byte_string>{}(a) == std::hash<pc::byte_string>{}(b));
    CHECK(a.hash() == b.hash());
    CHECK(a.crc32() != b.crc32());

    std::unordered_set<pc::byte_string> set;
    set.insert(a.clone());
    CHECK(set.contains(b));
    CHECK(!set.contains(pc::byte_string::create_from_range("chara/monster")));
}

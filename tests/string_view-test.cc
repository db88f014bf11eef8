#include <path-core/span.hh>
#include <path-core/string_view.hh>

#include <nexus/test.hh>

#include <string>
#include <type_traits>

static_assert(std::is_trivially_copyable_v<pc::string_view>, "string_view should be trivially copyable");
static_assert(std::is_trivially_destructible_v<pc::string_view>, "string_view should be trivially destructible");

TEST("string_view - construction")
{
    SECTION("default construction")
    {
        auto const sv = pc::string_view{};
        CHECK(sv.data() == nullptr);
        CHECK(sv.size() == 0);
        CHECK(sv.empty());
    }

    SECTION("C string construction")
    {
        char const* cstr = "chara/human";
        auto const sv = pc::string_view{cstr};
        CHECK(sv.data() == cstr);
        CHECK(sv.size() == 11);
    }

    SECTION("pointer + size construction may include zero bytes")
    {
        char const bytes[] = {'a', '\0', 'b'};
        auto const sv = pc::string_view{bytes, 3};
        CHECK(sv.size() == 3);
        CHECK(sv[1] == '\0');
        CHECK(sv[2] == 'b');
    }

    SECTION("container construction")
    {
        std::string const s = "vfx/common";
        pc::string_view const sv = s;
        CHECK(sv.data() == s.data());
        CHECK(sv.size() == 10);
    }
}

TEST("string_view - subview")
{
    auto const sv = pc::string_view("chara/equipment/e0001");

    CHECK(sv.subview(6) == "equipment/e0001");
    CHECK(sv.subview(6, 9) == "equipment");
    CHECK(sv.subview(sv.size()).empty());
    CHECK(sv.subview(6).data() == sv.data() + 6);
}

TEST("string_view - comparison treats bytes as unsigned")
{
    CHECK(pc::string_view("abc").compare("abc") == 0);
    CHECK(pc::string_view("abc").compare("abd") < 0);
    CHECK(pc::string_view("ab").compare("abc") < 0);
    CHECK(pc::string_view("abc").compare("ab") > 0);

    // 0xC3 sorts after every ASCII byte
    CHECK(pc::string_view("z").compare("\xC3\xA9") < 0);
    CHECK(pc::string_view("a") < pc::string_view("b"));
    CHECK(pc::string_view("A") != pc::string_view("a"));
}

TEST("string_view - prefix, suffix and search")
{
    auto const sv = pc::string_view("bg/ffxiv/sea_s1/twn/s1t1/texture/s1t1_w1_wall1_d.tex");

    CHECK(sv.starts_with("bg/"));
    CHECK(!sv.starts_with("BG/"));
    CHECK(sv.ends_with(".tex"));
    CHECK(!sv.ends_with(".TEX"));
    CHECK(sv.starts_with(""));

    CHECK(sv.find('/') == 2);
    CHECK(sv.find('/', 3) == 8);
    CHECK(sv.find('#') == -1);
    CHECK(sv.rfind('/') == 32);
    CHECK(sv.find("sea_s1") == 9);
    CHECK(sv.find("twn", 20) == -1);
    CHECK(sv.find("") == 0);
}

TEST("span - views over contiguous storage")
{
    int values[] = {1, 2, 3};
    auto const s = pc::span<int>(values);
    CHECK(s.size() == 3);
    CHECK(s[2] == 3);

    s[0] = 7;
    CHECK(values[0] == 7);

    int sum = 0;
    for (auto v : s)
        sum += v;
    CHECK(sum == 12);

    auto const empty = pc::span<int const>();
    CHECK(empty.empty());
}

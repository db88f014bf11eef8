#include "game_path.hh"

#include <path-core/char_predicates.hh>
#include <path-core/utility.hh>

#include <system_error>

namespace
{
// ASCII whitespace plus the BMP space, line and paragraph separators
bool is_space_unit(char16_t c)
{
    if (c < 0x80)
        return pc::is_space(char(c));

    switch (c)
    {
    case 0x0085:
    case 0x00A0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
        return true;
    default:
        return c >= 0x2000 && c <= 0x200A;
    }
}

bool is_drive_letter(char c)
{
    return pc::is_lower(c) || pc::is_upper(c);
}
} // namespace

bool pc::game_path::accept(byte_string s, game_path& out)
{
    if (s.size() > max_length)
    {
        out.dispose();
        return false;
    }

    out = game_path(pc::move(s));
    return true;
}

bool pc::game_path::try_create_from_pointer(char const* ptr, game_path& out, metadata requested)
{
    // one byte past the limit is enough to detect an over-long path
    return accept(byte_string::create_from_pointer(ptr, requested, max_length + 1), out);
}

bool pc::game_path::try_create_from_range(string_view bytes, game_path& out, metadata requested)
{
    return accept(byte_string::create_from_range(bytes, requested), out);
}

bool pc::game_path::try_create_from_platform_text(std::u16string_view text, game_path& out)
{
    out.dispose();

    std::u16string normalized(text);
    for (auto& c : normalized)
        if (c == u'\\')
            c = u'/';

    std::u16string_view rest = normalized;
    while (!rest.empty() && rest.front() == u'/')
        rest.remove_prefix(1);
    while (!rest.empty() && is_space_unit(rest.front()))
        rest.remove_prefix(1);
    while (!rest.empty() && is_space_unit(rest.back()))
        rest.remove_suffix(1);

    // every code unit takes at least one byte
    if (isize(rest.size()) > max_length)
        return false;

    if (rest.empty())
        return true;

    byte_string s;
    if (!byte_string::try_create_from_platform_text(rest, s))
        return false;

    return accept(pc::move(s), out);
}

bool pc::game_path::try_create_from_byte_string(byte_string s, game_path& out)
{
    return accept(pc::move(s), out);
}

bool pc::game_path::try_create_from_file(std::filesystem::path const& file, std::filesystem::path const& base_dir, game_path& out)
{
    out.dispose();

    std::error_code ec;
    auto const abs_file = std::filesystem::absolute(file, ec).lexically_normal();
    if (ec)
        return false;
    auto const abs_base = std::filesystem::absolute(base_dir, ec).lexically_normal();
    if (ec)
        return false;

    auto const relative = abs_file.lexically_relative(abs_base);
    if (relative.empty() || relative == "." || *relative.begin() == "..")
        return false;

    return try_create_from_platform_text(relative.generic_u16string(), out);
}

pc::byte_string pc::game_path::filename() const
{
    auto const idx = _path.last_index_of('/');
    return idx == -1 ? _path.view() : _path.substring(idx + 1);
}

pc::byte_string pc::game_path::extension() const
{
    auto const idx = _path.last_index_of('.');
    return idx == -1 ? byte_string() : _path.substring(idx);
}

bool pc::game_path::is_rooted(string_view path)
{
    if (path.size() >= 1 && (path[0] == '/' || path[0] == '\\'))
        return true;

    return path.size() >= 2 && is_drive_letter(path[0]) && path[1] == ':';
}

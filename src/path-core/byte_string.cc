#include "byte_string.hh"

#include <path-core/assertf.hh>
#include <path-core/bit.hh>
#include <path-core/char_predicates.hh>
#include <path-core/memory.hh>
#include <path-core/path_hash.hh>
#include <path-core/string_memory.hh>
#include <path-core/text_encoding.hh>
#include <path-core/utility.hh>
#include <path-core/wildcard.hh>

#include <memory>

// =========================================================================================================
// factories
// =========================================================================================================

pc::byte_string pc::byte_string::create_from_pointer(char const* ptr, metadata requested, isize max_length)
{
    PC_ASSERT(max_length >= 0, "max_length must be non-negative");

    if (ptr == nullptr)
        return {};

    auto const r = scan_metadata(ptr, max_length, requested);
    if (r.length == 0)
        return {};

    auto result = make_borrowed(ptr, r.length, r.terminated, tri_state::unknown, tri_state::unknown);
    result.apply_scan(r);
    return result;
}

pc::byte_string pc::byte_string::create_from_range(string_view bytes, metadata requested)
{
    if (bytes.data() == nullptr || bytes.empty())
        return {};

    return create_from_pointer(bytes.data(), requested, bytes.size());
}

bool pc::byte_string::try_create_from_platform_text(std::u16string_view text, byte_string& out, metadata requested, bool to_ascii_lower)
{
    out.dispose();

    if (text.empty())
        return true;

    auto const length = utf8_length_of(text);
    if (length < 0)
        return false;

    auto result = make_owned(length);
    encode_utf8(text, result.owned_data());

    if (to_ascii_lower)
    {
        ascii_to_lower_in_place(result.owned_data(), length);
        result._facts.is_ascii_lower = tri_state::known_true;
    }

    // every non-ASCII code unit takes at least two UTF-8 bytes
    result._facts.is_ascii = to_tri_state(length == isize(text.size()));

    auto missing = requested;
    if (is_known(result._facts.is_ascii_lower))
        missing = metadata(u8(missing) & ~u8(metadata::ascii_lower));
    missing = metadata(u8(missing) & ~u8(metadata::ascii));

    // the transcoded text may contain zero bytes, so the facts cover the exact range
    result.apply_scan(scan_range(result.bytes(), missing));

    out = pc::move(result);
    return true;
}

pc::byte_string pc::byte_string::create_from_trusted(char const* ptr, isize size, bool terminated, tri_state is_ascii_lower, tri_state is_ascii)
{
    PC_ASSERT(size >= 0, "size must be non-negative");
    PC_ASSERT(ptr != nullptr || size == 0, "null pointer only allowed for empty range");

    if (size <= 0)
        return {};

    return make_borrowed(ptr, size, terminated, is_ascii_lower, is_ascii);
}

pc::byte_string pc::byte_string::clone() const
{
    if (empty())
        return {};

    auto result = make_owned(size());
    mem_copy(result.owned_data(), data(), size());
    result.copy_facts_from(*this);
    return result;
}

pc::byte_string pc::byte_string::view() const
{
    auto result = make_borrowed(data(), size(), _terminated, tri_state::unknown, tri_state::unknown);
    result.copy_facts_from(*this);
    return result;
}

// =========================================================================================================
// lifecycle
// =========================================================================================================

pc::byte_string::byte_string(byte_string&& rhs) noexcept
  : _ownership(rhs._ownership),
    _terminated(rhs._terminated),
    _facts(rhs._facts),
    _ci_crc32_slot(rhs._ci_crc32_slot),
    _crc32_slot(rhs._crc32_slot)
{
    if (rhs.is_owned())
    {
        std::construct_at(&_data.owned, pc::move(rhs._data.owned));
        rhs._data.owned.~allocation();
        rhs._ownership = ownership::borrowed;
    }
    else
    {
        _data.borrowed = rhs._data.borrowed;
    }

    rhs.reset_to_empty();
}

pc::byte_string& pc::byte_string::operator=(byte_string&& rhs) noexcept
{
    if (this != &rhs)
    {
        // rhs may view our own buffer, so it is copied before the buffer is released
        if (is_owned() && !rhs.is_owned() && !rhs.empty())
        {
            auto const p = reinterpret_cast<byte const*>(rhs.data());
            if (p >= _data.owned.alloc_start && p < _data.owned.alloc_end)
            {
                auto copy = rhs.clone();
                rhs.reset_to_empty();
                return *this = pc::move(copy);
            }
        }

        dispose();

        _ownership = rhs._ownership;
        _terminated = rhs._terminated;
        _facts = rhs._facts;
        _ci_crc32_slot = rhs._ci_crc32_slot;
        _crc32_slot = rhs._crc32_slot;

        if (rhs.is_owned())
        {
            std::construct_at(&_data.owned, pc::move(rhs._data.owned));
            rhs._data.owned.~allocation();
            rhs._ownership = ownership::borrowed;
        }
        else
        {
            _data.borrowed = rhs._data.borrowed;
        }

        rhs.reset_to_empty();
    }
    return *this;
}

void pc::byte_string::dispose() noexcept
{
    if (is_owned())
    {
        // returns the buffer to string_memory_resource
        _data.owned.~allocation();
        _ownership = ownership::borrowed;
    }

    reset_to_empty();
}

void pc::byte_string::reset_to_empty() noexcept
{
    PC_ASSERT(!is_owned(), "owned buffer must be released first");

    _data.borrowed = {impl::empty_terminator, 0};
    _terminated = true;
    _facts = cached_facts{};
    _ci_crc32_slot = hash_known_bit;
    _crc32_slot = hash_known_bit;
}

// =========================================================================================================
// queries
// =========================================================================================================

char const* pc::byte_string::c_str() const
{
    PC_ASSERT(_terminated, "c_str() requires a terminated string");
    return data();
}

char pc::byte_string::operator[](isize i) const
{
    PC_ASSERT_ALWAYS(0 <= i && i < size(), "byte_string index out of bounds");
    return data()[i];
}

// =========================================================================================================
// cached facts
// =========================================================================================================

bool pc::byte_string::try_read_hash(u64 const& slot, u32& out)
{
    auto const v = pc::atomic_load(slot);
    if ((v & hash_known_bit) == 0)
        return false;

    out = u32(v);
    return true;
}

void pc::byte_string::write_hash(u64& slot, u32 value)
{
    pc::atomic_store(slot, hash_known_bit | value);
}

void pc::byte_string::evaluate(metadata requested) const
{
    auto const r = scan_range(bytes(), requested);

    if (has_any(r.computed, metadata::ci_crc32))
        write_hash(_ci_crc32_slot, r.ci_crc32);
    if (has_any(r.computed, metadata::crc32))
        write_hash(_crc32_slot, r.crc32);
    if (has_any(r.computed, metadata::ascii_lower))
        pc::atomic_store(_facts.is_ascii_lower, r.is_ascii_lower);
    if (has_any(r.computed, metadata::ascii))
        pc::atomic_store(_facts.is_ascii, r.is_ascii);
}

pc::u32 pc::byte_string::ci_crc32() const
{
    u32 value = 0;
    if (!try_read_hash(_ci_crc32_slot, value))
    {
        evaluate(metadata::ci_crc32);
        value = u32(pc::atomic_load(_ci_crc32_slot));
    }
    return value;
}

pc::u32 pc::byte_string::crc32() const
{
    u32 value = 0;
    if (!try_read_hash(_crc32_slot, value))
    {
        evaluate(metadata::crc32);
        value = u32(pc::atomic_load(_crc32_slot));
    }
    return value;
}

pc::u64 pc::byte_string::path_hash64() const
{
    return compute_lower_path_hash64(bytes());
}

bool pc::byte_string::is_ascii() const
{
    auto s = cached_is_ascii();
    if (!is_known(s))
    {
        // both flags come out of the same pass
        evaluate(is_known(cached_is_ascii_lower()) ? metadata::ascii : metadata::ascii | metadata::ascii_lower);
        s = cached_is_ascii();
    }
    return s == tri_state::known_true;
}

bool pc::byte_string::is_ascii_lower() const
{
    auto s = cached_is_ascii_lower();
    if (!is_known(s))
    {
        evaluate(is_known(cached_is_ascii()) ? metadata::ascii_lower : metadata::ascii | metadata::ascii_lower);
        s = cached_is_ascii_lower();
    }
    return s == tri_state::known_true;
}

pc::tri_state pc::byte_string::cached_is_ascii() const
{
    return pc::atomic_load(_facts.is_ascii);
}

pc::tri_state pc::byte_string::cached_is_ascii_lower() const
{
    return pc::atomic_load(_facts.is_ascii_lower);
}

bool pc::byte_string::has_cached_ci_crc32() const
{
    return (pc::atomic_load(_ci_crc32_slot) & hash_known_bit) != 0;
}

bool pc::byte_string::has_cached_crc32() const
{
    return (pc::atomic_load(_crc32_slot) & hash_known_bit) != 0;
}

// =========================================================================================================
// comparison
// =========================================================================================================

bool pc::byte_string::equals(byte_string const& rhs) const
{
    auto const n = size();
    if (data() == rhs.data() && n == rhs.size())
        return true;

    u32 lhs_hash = 0;
    u32 rhs_hash = 0;
    if (try_read_hash(_ci_crc32_slot, lhs_hash) && try_read_hash(rhs._ci_crc32_slot, rhs_hash) && lhs_hash != rhs_hash)
        return false;

    if (cached_is_ascii_lower() == tri_state::known_true && rhs.cached_is_ascii_lower() == tri_state::known_true)
        return n == rhs.size() && mem_compare(data(), rhs.data(), n) == 0;

    auto const lhs_wildcard = bytes().find('*') != -1;
    auto const rhs_wildcard = rhs.bytes().find('*') != -1;
    if (lhs_wildcard || rhs_wildcard)
    {
        if (n == rhs.size() && mem_equal_ci(data(), rhs.data(), n))
            return true;

        return lhs_wildcard ? wildcard_match_ci(bytes(), rhs.bytes()) : wildcard_match_ci(rhs.bytes(), bytes());
    }

    return n == rhs.size() && mem_equal_ci(data(), rhs.data(), n);
}

int pc::byte_string::compare(byte_string const& rhs) const
{
    if (data() == rhs.data() && size() == rhs.size())
        return 0;

    auto const n = pc::min(size(), rhs.size());
    auto const both_lower
        = cached_is_ascii_lower() == tri_state::known_true && rhs.cached_is_ascii_lower() == tri_state::known_true;

    auto const r = both_lower ? mem_compare(data(), rhs.data(), n) : mem_compare_ci(data(), rhs.data(), n);
    if (r != 0)
        return r;

    return size() < rhs.size() ? -1 : (size() > rhs.size() ? 1 : 0);
}

// =========================================================================================================
// search
// =========================================================================================================

bool pc::byte_string::contains_impl(string_view needle, bool needle_is_lower) const
{
    auto const n = needle.size();
    if (n == 0)
        return true;
    if (n > size())
        return false;

    auto const* hay = data();
    auto const first = to_lower(needle[0]);

    if (n == 1)
    {
        for (isize i = 0; i < size(); ++i)
            if (to_lower(hay[i]) == first)
                return true;
        return false;
    }

    if (needle_is_lower && cached_is_ascii_lower() == tri_state::known_true)
        return bytes().find(needle) != -1;

    for (isize i = 0; i + n <= size(); ++i)
        if (to_lower(hay[i]) == first && mem_equal_ci(hay + i + 1, needle.data() + 1, n - 1))
            return true;

    return false;
}

bool pc::byte_string::contains(byte_string const& needle) const
{
    return contains_impl(needle.bytes(), needle.cached_is_ascii_lower() == tri_state::known_true);
}

bool pc::byte_string::contains(string_view needle) const
{
    return contains_impl(needle, false);
}

bool pc::byte_string::contains(char c) const
{
    return contains_impl(string_view(&c, 1), false);
}

pc::isize pc::byte_string::index_of(char c, isize from) const
{
    auto const* p = data();
    for (auto i = pc::max(from, isize(0)); i < size(); ++i)
        if (p[i] == c)
            return i;
    return -1;
}

pc::isize pc::byte_string::last_index_of(char c, isize to) const
{
    auto const* p = data();
    auto const lower_bound = pc::max(to, isize(0));
    for (auto i = size() - 1; i >= lower_bound; --i)
        if (p[i] == c)
            return i;
    return -1;
}

// =========================================================================================================
// derived strings
// =========================================================================================================

namespace
{
// a fact known true for the whole string also holds for any part of it
pc::tri_state keep_if_true(pc::tri_state s)
{
    return s == pc::tri_state::known_true ? s : pc::tri_state::unknown;
}
} // namespace

pc::byte_string pc::byte_string::substring(isize from) const
{
    if (from == 0)
        return view();
    if (from < 0 || from >= size())
        return {};

    return make_borrowed(data() + from, size() - from, _terminated, keep_if_true(cached_is_ascii_lower()),
                         keep_if_true(cached_is_ascii()));
}

pc::byte_string pc::byte_string::substring(isize from, isize length) const
{
    if (from == 0 && length == size())
        return view();

    auto const max_length = size() - from;
    if (from < 0 || max_length <= 0 || length <= 0)
        return {};

    if (length < max_length)
        return make_borrowed(data() + from, length, false, keep_if_true(cached_is_ascii_lower()),
                             keep_if_true(cached_is_ascii()));

    return substring(from);
}

pc::byte_string pc::byte_string::trim_front() const
{
    auto const* p = data();
    isize start = 0;
    while (start < size() && is_space(p[start]))
        ++start;

    if (start == 0)
        return view();
    if (start == size())
        return {};

    return make_borrowed(p + start, size() - start, _terminated, cached_is_ascii_lower(), cached_is_ascii());
}

pc::byte_string pc::byte_string::trim_end() const
{
    auto const* p = data();
    auto end = size();
    while (end > 0 && is_space(p[end - 1]))
        --end;

    if (end == size())
        return view();
    if (end == 0)
        return {};

    return make_borrowed(p, end, false, cached_is_ascii_lower(), cached_is_ascii());
}

pc::byte_string pc::byte_string::trim() const
{
    return trim_front().trim_end();
}

pc::byte_string pc::byte_string::to_ascii_lower() const
{
    if (cached_is_ascii_lower() == tri_state::known_true)
        return view();

    return to_ascii_lower_clone();
}

pc::byte_string pc::byte_string::to_ascii_lower_clone() const
{
    if (empty())
        return {};

    auto result = make_owned(size());
    auto* p = result.owned_data();
    mem_copy(p, data(), size());
    ascii_to_lower_in_place(p, size());

    result._facts.is_ascii_lower = tri_state::known_true;
    result._facts.is_ascii = cached_is_ascii();
    u32 h = 0;
    if (try_read_hash(_ci_crc32_slot, h))
        write_hash(result._ci_crc32_slot, h);
    return result;
}

pc::byte_string pc::byte_string::to_ascii_mixed() const
{
    if (empty())
        return {};

    auto result = make_owned(size());
    auto* p = result.owned_data();
    mem_copy(p, data(), size());

    auto word_start = true;
    for (isize i = 0; i < size(); ++i)
    {
        if (word_start)
            p[i] = to_upper(p[i]);
        word_start = is_space(p[i]);
    }

    result._facts.is_ascii = cached_is_ascii();
    // case changes do not affect the case-insensitive hash
    u32 h = 0;
    if (try_read_hash(_ci_crc32_slot, h))
        write_hash(result._ci_crc32_slot, h);
    return result;
}

pc::byte_string pc::byte_string::replace(char from, char to) const
{
    if (empty())
        return {};

    auto result = make_owned(size());
    auto* p = result.owned_data();
    auto const* src = data();

    isize replaced = 0;
    for (isize i = 0; i < size(); ++i)
    {
        if (src[i] == from)
        {
            p[i] = to;
            ++replaced;
        }
        else
        {
            p[i] = src[i];
        }
    }

    if (replaced == 0)
    {
        result.copy_facts_from(*this);
        return result;
    }

    auto lower = cached_is_ascii_lower();
    if (!is_lower_invariant(to))
        lower = tri_state::known_false;
    else if (lower == tri_state::known_false && !is_lower_invariant(from))
        lower = tri_state::unknown; // the replaced byte may have been the only uppercase one

    auto ascii = cached_is_ascii();
    if (!pc::is_ascii(to))
        ascii = tri_state::known_false;
    else if (ascii == tri_state::known_false && !pc::is_ascii(from))
        ascii = tri_state::unknown;

    result._facts.is_ascii_lower = lower;
    result._facts.is_ascii = ascii;
    return result;
}

std::vector<pc::byte_string> pc::byte_string::split(char separator, isize max_parts, bool remove_empty) const
{
    PC_ASSERTF(max_parts > 0, "max_parts must be positive, got {}", max_parts);

    std::vector<byte_string> parts;

    isize start = 0;
    auto idx = index_of(separator, start);
    while (idx >= 0)
    {
        if (isize(parts.size()) == max_parts - 1)
            break;

        if (start != idx || !remove_empty)
            parts.push_back(substring(start, idx - start));

        start = idx + 1;
        idx = index_of(separator, start);
    }

    if (start < size() || !remove_empty)
        parts.push_back(substring(start));

    return parts;
}

pc::byte_string pc::byte_string::join_impl(string_view separator, span<byte_string const> parts)
{
    if (parts.empty())
        return {};

    auto total = separator.size() * (parts.size() - 1);
    for (auto const& part : parts)
        total += part.size();

    if (total == 0)
        return {};

    auto result = make_owned(total);
    auto* p = result.owned_data();

    // an absent separator is trivially ASCII and lowercase
    auto lower = tri_state::known_true;
    auto ascii = tri_state::known_true;
    for (auto const c : separator)
    {
        if (!is_lower_invariant(c))
            lower = tri_state::known_false;
        if (!pc::is_ascii(c))
            ascii = tri_state::known_false;
    }

    auto first = true;
    for (auto const& part : parts)
    {
        if (!first)
        {
            mem_copy(p, separator.data(), separator.size());
            p += separator.size();
        }
        first = false;

        mem_copy(p, part.data(), part.size());
        p += part.size();

        lower = combine(lower, part.cached_is_ascii_lower());
        ascii = combine(ascii, part.cached_is_ascii());
    }

    result._facts.is_ascii_lower = lower;
    result._facts.is_ascii = ascii;
    return result;
}

pc::byte_string pc::byte_string::join(char separator, span<byte_string const> parts)
{
    return join_impl(string_view(&separator, 1), parts);
}

pc::byte_string pc::byte_string::concat(span<byte_string const> parts)
{
    return join_impl(string_view(), parts);
}

// =========================================================================================================
// platform text
// =========================================================================================================

std::u16string pc::byte_string::to_platform_text() const
{
    if (cached_is_ascii() == tri_state::known_true)
    {
        std::u16string result;
        result.resize(size_t(size()));
        for (isize i = 0; i < size(); ++i)
            result[size_t(i)] = char16_t(u8(data()[i]));
        return result;
    }

    return decode_utf8_to_utf16(bytes());
}

// =========================================================================================================
// helpers
// =========================================================================================================

pc::byte_string pc::byte_string::make_borrowed(char const* ptr, isize size, bool terminated, tri_state is_ascii_lower, tri_state is_ascii)
{
    byte_string result;
    result._data.borrowed = {ptr, size};
    result._terminated = terminated;
    result._facts.is_ascii_lower = is_ascii_lower;
    result._facts.is_ascii = is_ascii;
    result._ci_crc32_slot = 0;
    result._crc32_slot = 0;
    return result;
}

pc::byte_string pc::byte_string::make_owned(isize size)
{
    PC_ASSERT(size >= 0, "size must be non-negative");

    byte_string result;
    std::construct_at(&result._data.owned, allocation<char>::create_uninitialized(size + 1, string_memory_resource));
    result._ownership = ownership::owned;

    // the terminator sits outside the payload window
    result._data.owned.obj_end = result._data.owned.obj_start + size;
    *result._data.owned.obj_end = '\0';

    result._terminated = true;
    result._facts.is_ascii_lower = tri_state::unknown;
    result._facts.is_ascii = tri_state::unknown;
    result._ci_crc32_slot = 0;
    result._crc32_slot = 0;
    return result;
}

void pc::byte_string::apply_scan(scan_result const& r)
{
    if (has_any(r.computed, metadata::ci_crc32))
        _ci_crc32_slot = hash_known_bit | r.ci_crc32;
    if (has_any(r.computed, metadata::crc32))
        _crc32_slot = hash_known_bit | r.crc32;
    if (has_any(r.computed, metadata::ascii_lower))
        _facts.is_ascii_lower = r.is_ascii_lower;
    if (has_any(r.computed, metadata::ascii))
        _facts.is_ascii = r.is_ascii;
}

void pc::byte_string::copy_facts_from(byte_string const& rhs)
{
    _facts.is_ascii = rhs.cached_is_ascii();
    _facts.is_ascii_lower = rhs.cached_is_ascii_lower();
    _ci_crc32_slot = pc::atomic_load(rhs._ci_crc32_slot);
    _crc32_slot = pc::atomic_load(rhs._crc32_slot);
}

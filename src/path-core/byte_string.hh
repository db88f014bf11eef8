#pragma once

#include <path-core/allocation.hh>
#include <path-core/fwd.hh>
#include <path-core/metadata_scan.hh>
#include <path-core/span.hh>
#include <path-core/string_view.hh>
#include <path-core/tri_state.hh>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace pc::impl
{
/// The single terminator byte every canonical empty byte_string points at
inline constexpr char empty_terminator[1] = {'\0'};
} // namespace pc::impl

/// Case-insensitive byte string for game resource paths.
///
/// A byte_string is either
///   - borrowed: a view into memory someone else owns (an asset index, another byte_string), or
///   - owned: a buffer allocated from pc::string_memory_resource that this instance frees exactly once.
/// Owned buffers always have capacity size() + 1 with a zero byte at size().
///
/// Next to the bytes, four derived facts are cached: the case-insensitive CRC32, the case-sensitive CRC32,
/// "every byte is ASCII" and "every byte is ASCII lowercase". Each fact is either known or not yet evaluated.
/// Accessors evaluate unknown facts on first use and cache them permanently.
/// Operations that produce new strings carry over whatever facts remain valid for the result.
///
/// Instances are logically immutable. All "modifying" operations return a new byte_string.
/// Operations that would not change anything return view(), a borrowed alias of *this that shares its
/// bytes (and facts). Like string_view, such aliases must not outlive the string they were taken from.
///
/// Comparison and search are ASCII case-insensitive. Equality additionally understands '*' wildcards.
///
/// Move-only: copies are explicit via clone(). A moved-from or disposed byte_string is the canonical empty
/// string: size 0, terminated, pointing at one process-wide terminator byte, with every fact known.
///
/// Concurrency: the cached facts are written with relaxed atomics. Two threads evaluating the same fact
/// race benignly (both compute and store the same value). Everything else requires external synchronization.
struct pc::byte_string
{
    // constants
public:
    /// Default bound for create_from_pointer scans
    static constexpr isize max_scan_length = 0x7FFFFFFF;

    // factories
public:
    /// Borrows a zero-terminated byte sequence.
    /// Scans once, up to the first zero byte or max_length bytes, gathering the `requested` facts.
    /// is_terminated() reports whether the zero byte was found within the bound.
    /// ptr == nullptr yields the canonical empty string.
    [[nodiscard]] static byte_string create_from_pointer(char const* ptr,
                                                         metadata requested = metadata::none,
                                                         isize max_length = max_scan_length);

    /// Borrows a byte range.
    /// Same as create_from_pointer bounded by bytes.size(): the string ends early at an embedded zero byte.
    [[nodiscard]] static byte_string create_from_range(string_view bytes, metadata requested = metadata::none);

    /// Creates an owned string from UTF-16 platform text, transcoded to UTF-8.
    /// With `to_ascii_lower`, ASCII letters are lowercased before facts are computed.
    /// Returns false and sets `out` to the canonical empty string if the text contains an unpaired surrogate.
    [[nodiscard]] static bool try_create_from_platform_text(std::u16string_view text,
                                                            byte_string& out,
                                                            metadata requested = metadata::ci_crc32,
                                                            bool to_ascii_lower = false);

    /// Borrows [ptr, ptr + size) without scanning.
    /// The hints are trusted as-is; passing wrong hints is a caller bug that breaks comparisons.
    [[nodiscard]] static byte_string create_from_trusted(char const* ptr,
                                                         isize size,
                                                         bool terminated,
                                                         tri_state is_ascii_lower = tri_state::unknown,
                                                         tri_state is_ascii = tri_state::unknown);

    /// Owned deep copy, carrying every known fact.
    [[nodiscard]] byte_string clone() const;

    /// Borrowed alias of the same bytes, carrying every known fact.
    [[nodiscard]] byte_string view() const;

    // lifecycle
public:
    /// The canonical empty string
    byte_string() = default;

    byte_string(byte_string const&) = delete;
    byte_string& operator=(byte_string const&) = delete;

    /// Transfers the bytes (and ownership if owned), rhs becomes the canonical empty string
    byte_string(byte_string&& rhs) noexcept;
    byte_string& operator=(byte_string&& rhs) noexcept;

    ~byte_string() { dispose(); }

    /// Frees an owned buffer and resets to the canonical empty string.
    /// Idempotent: further calls are no-ops.
    void dispose() noexcept;

    // queries
public:
    [[nodiscard]] char const* data() const { return is_owned() ? _data.owned.obj_start : _data.borrowed.ptr; }
    [[nodiscard]] isize size() const { return is_owned() ? _data.owned.obj_size() : _data.borrowed.size; }
    [[nodiscard]] bool empty() const { return size() == 0; }

    /// Zero-terminated C string.
    /// Precondition: is_terminated()
    [[nodiscard]] char const* c_str() const;

    [[nodiscard]] bool is_owned() const { return _ownership == ownership::owned; }
    /// True if a zero byte is known to follow the content
    [[nodiscard]] bool is_terminated() const { return _terminated; }

    /// Byte at index i. Out-of-range access is a contract violation and always asserts.
    [[nodiscard]] char operator[](isize i) const;
    [[nodiscard]] char front() const { return (*this)[0]; }
    [[nodiscard]] char back() const { return (*this)[size() - 1]; }

    /// The content as a plain, case-sensitive byte view
    [[nodiscard]] string_view bytes() const { return string_view(data(), size()); }

    [[nodiscard]] char const* begin() const { return data(); }
    [[nodiscard]] char const* end() const { return data() + size(); }

    // cached facts
public:
    /// CRC32 of the ASCII-lowercased bytes (evaluated once, then cached)
    [[nodiscard]] u32 ci_crc32() const;
    /// CRC32 of the raw bytes (evaluated once, then cached)
    [[nodiscard]] u32 crc32() const;
    /// True if every byte is below 0x80 (evaluated once, then cached)
    [[nodiscard]] bool is_ascii() const;
    /// True if no byte is an uppercase ASCII letter (evaluated once, then cached)
    [[nodiscard]] bool is_ascii_lower() const;

    /// Hash consistent with case-insensitive equality of non-wildcard strings
    [[nodiscard]] u64 hash() const { return ci_crc32(); }

    /// Folder/file key of the lowercased content, see compute_lower_path_hash64
    [[nodiscard]] u64 path_hash64() const;

    // inspection without evaluation
    [[nodiscard]] tri_state cached_is_ascii() const;
    [[nodiscard]] tri_state cached_is_ascii_lower() const;
    [[nodiscard]] bool has_cached_ci_crc32() const;
    [[nodiscard]] bool has_cached_crc32() const;

    // comparison
public:
    /// Case-insensitive equality. If either side contains '*', it is matched as a wildcard pattern
    /// against the other side.
    /// If both sides already cached their case-insensitive hash, differing hashes reject immediately.
    [[nodiscard]] bool equals(byte_string const& rhs) const;

    /// Byte-exact equality
    [[nodiscard]] bool equals_case_sensitive(string_view rhs) const { return bytes() == rhs; }

    /// Case-insensitive three-way comparison, bytes as unsigned values, shorter first on a common prefix.
    /// '*' has no special meaning here.
    [[nodiscard]] int compare(byte_string const& rhs) const;

    /// Byte-exact three-way comparison
    [[nodiscard]] int compare_case_sensitive(string_view rhs) const { return bytes().compare(rhs); }

    /// Byte-exact prefix test
    [[nodiscard]] bool starts_with(string_view prefix) const { return bytes().starts_with(prefix); }
    /// Byte-exact suffix test
    [[nodiscard]] bool ends_with(string_view suffix) const { return bytes().ends_with(suffix); }

    [[nodiscard]] friend bool operator==(byte_string const& lhs, byte_string const& rhs) { return lhs.equals(rhs); }
    [[nodiscard]] friend bool operator!=(byte_string const& lhs, byte_string const& rhs) { return !lhs.equals(rhs); }
    [[nodiscard]] friend bool operator<(byte_string const& lhs, byte_string const& rhs) { return lhs.compare(rhs) < 0; }
    [[nodiscard]] friend bool operator>(byte_string const& lhs, byte_string const& rhs) { return lhs.compare(rhs) > 0; }
    [[nodiscard]] friend bool operator<=(byte_string const& lhs, byte_string const& rhs) { return lhs.compare(rhs) <= 0; }
    [[nodiscard]] friend bool operator>=(byte_string const& lhs, byte_string const& rhs) { return lhs.compare(rhs) >= 0; }

    // search
public:
    /// Case-insensitive substring test. An empty needle is always contained.
    [[nodiscard]] bool contains(byte_string const& needle) const;
    [[nodiscard]] bool contains(string_view needle) const;
    [[nodiscard]] bool contains(char c) const;

    /// Byte-exact substring test
    [[nodiscard]] bool contains_case_sensitive(string_view needle) const { return bytes().find(needle) != -1; }

    /// Index of the first byte == c at or after `from`, or -1
    [[nodiscard]] isize index_of(char c, isize from = 0) const;
    /// Index of the last byte == c at or after `to`, or -1
    [[nodiscard]] isize last_index_of(char c, isize to = 0) const;

    // derived strings
public:
    /// Borrowed tail starting at `from`. from == 0 returns view(); out of range returns the empty string.
    /// Hashes are dropped; ASCII and lowercase stay known only if they were known true.
    [[nodiscard]] byte_string substring(isize from) const;

    /// Borrowed [from, from + length). Falls back to substring(from) when length reaches past the end.
    [[nodiscard]] byte_string substring(isize from, isize length) const;

    /// Borrowed view without leading ASCII whitespace
    [[nodiscard]] byte_string trim_front() const;
    /// Borrowed view without trailing ASCII whitespace
    [[nodiscard]] byte_string trim_end() const;
    /// Borrowed view without leading and trailing ASCII whitespace
    [[nodiscard]] byte_string trim() const;

    /// view() if already known lowercase, otherwise an owned lowercased copy
    [[nodiscard]] byte_string to_ascii_lower() const;
    /// Always an owned lowercased copy
    [[nodiscard]] byte_string to_ascii_lower_clone() const;
    /// Owned copy with the first byte of every whitespace-separated word uppercased
    [[nodiscard]] byte_string to_ascii_mixed() const;

    /// Owned copy with every `from` byte replaced by `to`
    [[nodiscard]] byte_string replace(char from, char to) const;

    /// Borrowed parts between separators.
    /// At most `max_parts` parts are produced, the last one holding the unsplit rest.
    [[nodiscard]] std::vector<byte_string> split(char separator, isize max_parts = max_scan_length, bool remove_empty = true) const;

    /// Owned concatenation of `parts` with `separator` between them
    /// ASCII and lowercase facts follow tri_state combine() over all parts and the separator.
    [[nodiscard]] static byte_string join(char separator, span<byte_string const> parts);
    /// Owned concatenation of `parts`
    [[nodiscard]] static byte_string concat(span<byte_string const> parts);

    // platform text
public:
    /// Decodes the UTF-8 content to UTF-16. Malformed sequences become U+FFFD.
    [[nodiscard]] std::u16string to_platform_text() const;

    // helpers
private:
    enum class ownership : u8
    {
        borrowed,
        owned,
    };

    /// Borrowed string with the given ASCII and lowercase facts and no hashes
    [[nodiscard]] static byte_string make_borrowed(char const* ptr, isize size, bool terminated, tri_state is_ascii_lower, tri_state is_ascii);

    /// Owned string with `size` uninitialized content bytes followed by a terminator, no known facts
    [[nodiscard]] static byte_string make_owned(isize size);

    /// Writable content of an owned string under construction
    [[nodiscard]] char* owned_data() { return _data.owned.obj_start; }

    void apply_scan(scan_result const& r);
    void copy_facts_from(byte_string const& rhs);
    void evaluate(metadata requested) const;
    void reset_to_empty() noexcept;

    [[nodiscard]] bool contains_impl(string_view needle, bool needle_is_lower) const;
    [[nodiscard]] static byte_string join_impl(string_view separator, span<byte_string const> parts);

    // a hash slot stores the value in the low 32 bits and a "known" marker in bit 32
    static constexpr u64 hash_known_bit = u64(1) << 32;
    [[nodiscard]] static bool try_read_hash(u64 const& slot, u32& out);
    static void write_hash(u64& slot, u32 value);

    // data member
private:
    struct data_borrowed
    {
        char const* ptr;
        isize size;
    };

    union data // NOLINT
    {
        data_borrowed borrowed;
        allocation<char> owned;

        data() : borrowed{impl::empty_terminator, 0} {}
        ~data() {}
    } _data;

    struct cached_facts
    {
        tri_state is_ascii = tri_state::known_true;
        tri_state is_ascii_lower = tri_state::known_true;
    };

    ownership _ownership = ownership::borrowed;
    bool _terminated = true;
    mutable cached_facts _facts;
    // CRC32 of the empty string is 0, so the canonical empty string knows both hashes
    alignas(8) mutable u64 _ci_crc32_slot = hash_known_bit;
    alignas(8) mutable u64 _crc32_slot = hash_known_bit;
};

template <>
struct std::hash<pc::byte_string>
{
    [[nodiscard]] size_t operator()(pc::byte_string const& s) const { return size_t(s.hash()); }
};

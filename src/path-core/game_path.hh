#pragma once

#include <path-core/byte_string.hh>
#include <path-core/fwd.hh>
#include <path-core/metadata_scan.hh>
#include <path-core/string_view.hh>
#include <path-core/utility.hh>

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

/// A byte_string that is known to be a valid game resource path.
///
/// The only enforced invariant is the length: size() <= max_length at every construction entry point.
/// Separators are not validated; paths coming from the game data use '/' already.
/// Equality, ordering and hashing are those of the wrapped byte_string (case-insensitive, '*' wildcards).
///
/// All try_create_* functions report failure by returning false and setting `out` to the empty path.
/// They never assert on bad input.
///
/// Usage:
///   pc::game_path p;
///   if (pc::game_path::try_create_from_platform_text(u"chara\\equipment\\e0001\\model.mdl", p))
///       use(p.filename(), p.extension(), p.path_hash64());
struct pc::game_path
{
    // constants
public:
    /// Longest accepted path in bytes
    static constexpr isize max_length = 2 << 10;

    // factories
public:
    /// Borrows a zero-terminated path. Scans at most max_length + 1 bytes.
    [[nodiscard]] static bool try_create_from_pointer(char const* ptr, game_path& out, metadata requested = metadata::none);

    /// Borrows a byte range (ending early at an embedded zero byte)
    [[nodiscard]] static bool try_create_from_range(string_view bytes, game_path& out, metadata requested = metadata::none);

    /// Owned path from platform text.
    /// '\' becomes '/', leading '/' and surrounding whitespace are removed before transcoding.
    /// Fails for unpaired surrogates or if the result is longer than max_length.
    [[nodiscard]] static bool try_create_from_platform_text(std::u16string_view text, game_path& out);

    /// Takes over an existing byte_string (owned or borrowed) if it is short enough
    [[nodiscard]] static bool try_create_from_byte_string(byte_string s, game_path& out);

    /// Path of `file` relative to `base_dir`, with '/' separators.
    /// Fails if the file does not lie strictly inside the base directory.
    [[nodiscard]] static bool try_create_from_file(std::filesystem::path const& file,
                                                   std::filesystem::path const& base_dir,
                                                   game_path& out);

    /// Owned deep copy
    [[nodiscard]] game_path clone() const { return game_path(_path.clone()); }

    // lifecycle
public:
    /// The empty path
    game_path() = default;

    game_path(game_path&&) noexcept = default;
    game_path& operator=(game_path&&) noexcept = default;

    /// Releases an owned buffer and resets to the empty path
    void dispose() noexcept { _path.dispose(); }

    // queries
public:
    [[nodiscard]] byte_string const& path() const { return _path; }
    [[nodiscard]] isize size() const { return _path.size(); }
    [[nodiscard]] bool empty() const { return _path.empty(); }

    /// Borrowed part after the last '/', or the whole path
    [[nodiscard]] byte_string filename() const;
    /// Borrowed part starting at the last '.', or the empty string
    [[nodiscard]] byte_string extension() const;

    /// True for a leading '/' or '\', or a drive letter followed by ':'
    [[nodiscard]] bool is_rooted() const { return is_rooted(_path.bytes()); }
    [[nodiscard]] static bool is_rooted(string_view path);

    /// 64-bit folder/file key as stored in the asset index, see compute_lower_path_hash64
    [[nodiscard]] u64 path_hash64() const { return _path.path_hash64(); }

    [[nodiscard]] std::u16string to_platform_text() const { return _path.to_platform_text(); }

    // comparison
public:
    [[nodiscard]] friend bool operator==(game_path const& lhs, game_path const& rhs) { return lhs._path == rhs._path; }
    [[nodiscard]] friend bool operator!=(game_path const& lhs, game_path const& rhs) { return lhs._path != rhs._path; }
    [[nodiscard]] friend bool operator<(game_path const& lhs, game_path const& rhs) { return lhs._path < rhs._path; }
    [[nodiscard]] friend bool operator>(game_path const& lhs, game_path const& rhs) { return lhs._path > rhs._path; }
    [[nodiscard]] friend bool operator<=(game_path const& lhs, game_path const& rhs) { return lhs._path <= rhs._path; }
    [[nodiscard]] friend bool operator>=(game_path const& lhs, game_path const& rhs) { return lhs._path >= rhs._path; }

    [[nodiscard]] int compare(game_path const& rhs) const { return _path.compare(rhs._path); }
    [[nodiscard]] u64 hash() const { return _path.hash(); }

private:
    explicit game_path(byte_string path) : _path(pc::move(path)) {}

    [[nodiscard]] static bool accept(byte_string s, game_path& out);

    byte_string _path;
};

template <>
struct std::hash<pc::game_path>
{
    [[nodiscard]] size_t operator()(pc::game_path const& p) const { return size_t(p.hash()); }
};

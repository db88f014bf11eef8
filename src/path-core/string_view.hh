#pragma once

#include <path-core/assert.hh>
#include <path-core/char_predicates.hh>
#include <path-core/fwd.hh>

#include <concepts>

/// Non-owning view over a contiguous byte range.
/// Stores char const* data and isize size.
/// Trivially copyable.
/// Does not own the underlying memory; caller must ensure the referenced data outlives the string_view.
///
/// This is the plain, case-sensitive byte view. pc::byte_string layers ownership, cached facts and
/// case-insensitive semantics on top and hands out its content as a string_view via bytes().
///
/// WARNING: string_view does NOT guarantee a trailing null terminator.
struct pc::string_view
{
    // construction
public:
    /// Default string_view is empty: data() == nullptr, size() == 0.
    constexpr string_view() = default;

    /// Prevent construction from nullptr (compile-time error instead of runtime crash).
    string_view(nullptr_t) = delete;

    /// Creates a string_view viewing [ptr, ptr+size).
    /// Precondition: size >= 0, and ptr must not be null unless size == 0.
    constexpr explicit string_view(char const* ptr, isize size) : _data(ptr), _size(size)
    {
        PC_ASSERT(size >= 0, "string_view size must be non-negative");
        PC_ASSERT(ptr != nullptr || size == 0, "null pointer only allowed for empty range");
    }

    /// Creates a string_view from a null-terminated C string.
    /// The resulting view does NOT include the null terminator.
    /// Precondition: cstr must not be null.
    constexpr string_view(char const* cstr)
    {
        PC_ASSERT(cstr != nullptr, "string_view cannot be constructed from nullptr");
        _data = cstr;
        while (cstr[_size] != '\0')
            ++_size;
    }

    /// Creates a string_view from any container providing .data() and .size().
    /// The string_view does not own the container; the container must outlive the string_view.
    template <class Container>
        requires requires(Container&& c) {
            { c.data() } -> std::convertible_to<char const*>;
            { c.size() } -> std::convertible_to<isize>;
        }
    constexpr string_view(Container&& c) : _data(c.data()), _size(static_cast<isize>(c.size()))
    {
    }

    // element access
public:
    /// Returns the byte at index i.
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr char operator[](isize i) const
    {
        PC_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _data[i];
    }

    /// Returns a pointer to the underlying contiguous storage.
    /// WARNING: The pointed-to data is NOT guaranteed to be null-terminated.
    [[nodiscard]] constexpr char const* data() const { return _data; }

    // iterators
public:
    [[nodiscard]] constexpr char const* begin() const { return _data; }
    [[nodiscard]] constexpr char const* end() const { return _data + _size; }

    // queries
public:
    /// Returns the number of bytes in the string_view.
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    // substring operations
public:
    /// Returns a subview starting at offset with the specified size.
    /// Precondition: offset <= size() && offset + size <= size().
    [[nodiscard]] constexpr string_view subview(isize offset, isize size) const
    {
        PC_ASSERT(0 <= offset && offset <= _size, "subview offset out of range");
        PC_ASSERT(0 <= size && offset + size <= _size, "subview size out of range");
        return string_view(_data + offset, size);
    }

    /// Returns a subview starting at offset to the end of the string.
    /// Precondition: offset <= size().
    [[nodiscard]] constexpr string_view subview(isize offset) const
    {
        PC_ASSERT(0 <= offset && offset <= _size, "subview offset out of range");
        return string_view(_data + offset, _size - offset);
    }

    // comparison
public:
    /// Lexicographically compares this string_view with another, bytes as unsigned values.
    /// Returns: <0 if *this < other, 0 if equal, >0 if *this > other.
    [[nodiscard]] constexpr int compare(string_view other) const
    {
        auto const min_size = _size < other._size ? _size : other._size;
        for (isize i = 0; i < min_size; ++i)
        {
            if (_data[i] != other._data[i])
                return compare_ascii_case_sensitive{}(_data[i], other._data[i]);
        }
        return _size < other._size ? -1 : (_size > other._size ? 1 : 0);
    }

    /// Returns true if this string_view starts with the given prefix.
    [[nodiscard]] constexpr bool starts_with(string_view prefix) const
    {
        if (prefix._size > _size)
            return false;
        for (isize i = 0; i < prefix._size; ++i)
        {
            if (_data[i] != prefix._data[i])
                return false;
        }
        return true;
    }

    /// Returns true if this string_view ends with the given suffix.
    [[nodiscard]] constexpr bool ends_with(string_view suffix) const
    {
        if (suffix._size > _size)
            return false;
        for (isize i = 0; i < suffix._size; ++i)
        {
            if (_data[_size - suffix._size + i] != suffix._data[i])
                return false;
        }
        return true;
    }

    // search operations
public:
    /// Finds the first occurrence of substring, starting at position pos.
    /// Returns the index of the first byte, or -1 if not found.
    /// Precondition: 0 <= pos <= size().
    [[nodiscard]] constexpr isize find(string_view substring, isize pos = 0) const
    {
        PC_ASSERT(0 <= pos && pos <= _size, "find position out of range");
        if (substring._size == 0)
            return pos;
        if (substring._size > _size - pos)
            return -1;

        for (isize i = pos; i <= _size - substring._size; ++i)
        {
            bool match = true;
            for (isize j = 0; j < substring._size; ++j)
            {
                if (_data[i + j] != substring._data[j])
                {
                    match = false;
                    break;
                }
            }
            if (match)
                return i;
        }
        return -1;
    }

    /// Finds the first occurrence of byte c, starting at position pos.
    /// Returns the index, or -1 if not found.
    /// Precondition: 0 <= pos <= size().
    [[nodiscard]] constexpr isize find(char c, isize pos = 0) const
    {
        PC_ASSERT(0 <= pos && pos <= _size, "find position out of range");
        for (isize i = pos; i < _size; ++i)
        {
            if (_data[i] == c)
                return i;
        }
        return -1;
    }

    /// Finds the last occurrence of byte c.
    /// Returns the index, or -1 if not found.
    [[nodiscard]] constexpr isize rfind(char c) const
    {
        for (isize i = _size - 1; i >= 0; --i)
        {
            if (_data[i] == c)
                return i;
        }
        return -1;
    }

    // operators
public:
    [[nodiscard]] friend constexpr bool operator==(string_view lhs, string_view rhs)
    {
        if (lhs._size != rhs._size)
            return false;
        for (isize i = 0; i < lhs._size; ++i)
        {
            if (lhs._data[i] != rhs._data[i])
                return false;
        }
        return true;
    }

    [[nodiscard]] friend constexpr bool operator!=(string_view lhs, string_view rhs) { return !(lhs == rhs); }
    [[nodiscard]] friend constexpr bool operator<(string_view lhs, string_view rhs) { return lhs.compare(rhs) < 0; }

    // members
private:
    char const* _data = nullptr;
    isize _size = 0;
};

#pragma once

#include <path-core/assert.hh>
#include <path-core/fwd.hh>

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <type_traits>

/// Non-owning view over a contiguous sequence of T, similar to std::span.
/// Stores a pointer and runtime size.
/// Does not own the underlying memory; caller must ensure the referenced data outlives the span.
/// Used to pass groups of move-only byte strings (join, concat) without transferring them.
template <class T>
struct pc::span
{
    // construction
public:
    /// Default span is empty: data() == nullptr, size() == 0.
    constexpr span() = default;

    /// Creates a span viewing [ptr, ptr+size).
    /// Precondition: size >= 0.
    constexpr explicit span(T* ptr, isize size) : _data(ptr), _size(size)
    {
        PC_ASSERT(size >= 0, "span size must be non-negative");
    }

    /// Creates a span from an initializer_list.
    /// Only available when T is const; allows calling byte_string::join('/', {a.view(), b.view()}).
    /// WARNING: initializer_list temporaries are destroyed at the end of the full expression.
    /// Safe ONLY as an immediate function argument.
    constexpr span(std::initializer_list<std::remove_const_t<T>> init)
        requires std::is_const_v<T>
      : _data(init.begin()), _size(static_cast<isize>(init.size()))
    {
    }

    /// Creates a span viewing the entire C array.
    template <std::size_t N>
    constexpr span(T (&arr)[N]) : _data(arr), _size(static_cast<isize>(N))
    {
    }

    /// Creates a span from any container providing .data() and .size().
    /// The span does not own the container; the container must outlive the span.
    template <class Container>
        requires requires(Container&& c) {
            { c.data() } -> std::convertible_to<T*>;
            { c.size() } -> std::convertible_to<isize>;
        }
    constexpr explicit span(Container&& c) : _data(c.data()), _size(static_cast<isize>(c.size()))
    {
    }

    // element access
public:
    /// Returns a reference to the element at index i.
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        PC_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _data[i];
    }

    [[nodiscard]] constexpr T* data() const { return _data; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() const { return _data; }
    [[nodiscard]] constexpr T* end() const { return _data + _size; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    // members
private:
    T* _data = nullptr;
    isize _size = 0;
};

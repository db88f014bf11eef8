#pragma once

#include <path-core/assert.hh>
#include <path-core/fwd.hh>
#include <path-core/utility.hh>

#include <type_traits>

// pc::allocation<T> is the owning "storage" handle behind every owned byte_string buffer.
//
// It models:
// 1) which bytes are owned (the allocation from a pc::memory_resource),
// 2) which part of those bytes holds the payload (the live window [obj_start, obj_end)).
//
// Memory is obtained from a polymorphic pc::memory_resource (POD, function-pointer based, static-init safe).
// The resource pointer is stored *in the allocation*, so an owned string returns its buffer to the
// resource it came from (the instrumented string memory resource) without any typed allocator.
//
// Only trivially copyable payloads are supported; there are no element lifetimes to track.
//
// Core invariants:
// - [alloc_start, alloc_end) is the owned byte range (exclusive end).
// - [obj_start, obj_end) is the payload range, always within the allocation.
// - custom_resource == nullptr implies use of pc::default_memory_resource.

namespace pc
{
/// Default memory resource used when allocation::custom_resource == nullptr.
/// This is a system allocator stored in the data segment, valid even during static initialization.
extern pc::memory_resource const* const default_memory_resource;
} // namespace pc

/// Polymorphic memory resource interface powering pc::allocation<T>.
/// This is a POD struct using function pointers to avoid virtual dispatch and non-trivial constructors.
struct pc::memory_resource
{
    /// Allocate between `min_bytes` and `max_bytes` with at least `alignment` alignment.
    /// Returns the actual allocated size, which will be in [min_bytes, max_bytes].
    /// The allocated pointer is stored in `*out_ptr`.
    /// min_bytes == 0 always sets *out_ptr to nullptr and returns 0.
    /// min_bytes > 0 always sets *out_ptr to non-null; failure is fatal.
    pc::function_ptr<isize(pc::byte** out_ptr, isize min_bytes, isize max_bytes, isize alignment, void* userdata)> allocate_bytes
        = nullptr;

    /// Deallocate a block previously obtained from this resource with matching bytes and alignment.
    /// `p` must be the exact pointer returned by allocate_bytes.
    pc::function_ptr<void(pc::byte* p, isize bytes, isize alignment, void* userdata)> deallocate_bytes = nullptr;

    /// User-defined data for custom allocators. Can be nullptr for stateless allocators.
    void* userdata = nullptr;
};

/// Owning allocation handle for a contiguous byte block plus a typed payload window inside it.
///
/// Move-only. The destructor (and move assignment) returns the block to its resource exactly once;
/// a moved-from allocation owns nothing.
template <class T>
struct pc::allocation
{
    static_assert(std::is_trivially_copyable_v<T>, "allocation only supports trivially copyable payloads");
    static_assert(std::is_trivially_destructible_v<T>, "allocation only supports trivially destructible payloads");

    /// Pointer to the first payload element.
    T* obj_start = nullptr;

    /// Pointer one past the last payload element (exclusive end).
    T* obj_end = nullptr;

    /// Start of the owned byte allocation (base pointer returned by the memory resource).
    pc::byte* alloc_start = nullptr;

    /// End of the owned byte allocation (exclusive).
    pc::byte* alloc_end = nullptr;

    /// Alignment used when allocating [alloc_start, alloc_end), passed back on deallocation.
    isize alignment = 0;

    /// Memory resource that owns the allocation, or nullptr for the global default.
    pc::memory_resource const* custom_resource = nullptr;

    // minimal helper api
public:
    /// Returns the effective resource to use for allocation operations.
    [[nodiscard]] pc::memory_resource const& resource() const
    {
        return custom_resource ? *custom_resource : *default_memory_resource;
    }

    /// True iff this allocation owns bytes
    [[nodiscard]] bool is_valid() const { return alloc_start != nullptr; }

    /// Number of allocated bytes
    [[nodiscard]] isize alloc_size_bytes() const { return alloc_end - alloc_start; }

    /// Number of payload elements
    [[nodiscard]] isize obj_size() const { return obj_end - obj_start; }

    // factories
public:
    /// Creates an allocation with reserved capacity and an empty payload window.
    /// min_bytes == 0 results in nullptr with no real allocation call.
    [[nodiscard]] static allocation create_empty_bytes(isize min_bytes,
                                                       isize max_bytes, // NOLINT
                                                       isize alignment, // NOLINT
                                                       memory_resource const* resource)
    {
        PC_ASSERT(alignment >= isize(alignof(T)), "alignment must be at least alignof(T)");
        PC_ASSERT(0 <= min_bytes && min_bytes <= max_bytes, "must have 0 <= min_bytes <= max_bytes");

        allocation result;
        result.custom_resource = resource;
        result.alignment = alignment;

        auto const& res = resource ? *resource : *default_memory_resource;

        auto const actual_byte_size
            = res.allocate_bytes(&result.alloc_start, min_bytes, max_bytes, result.alignment, res.userdata);
        result.alloc_end = result.alloc_start + actual_byte_size;

        result.obj_start = reinterpret_cast<T*>(result.alloc_start);
        result.obj_end = result.obj_start;

        return result;
    }

    /// Creates a tight allocation of `size` uninitialized elements, all inside the payload window.
    /// The caller initializes the memory (e.g. via mem_copy) before reading from it.
    [[nodiscard]] static allocation create_uninitialized(isize size, memory_resource const* resource)
    {
        auto const bytes = size * isize(sizeof(T));
        auto result = allocation::create_empty_bytes(bytes, bytes, alignof(T), resource);
        result.obj_end = result.obj_start + size;
        return result;
    }

    // lifecycle
public:
    allocation() = default;

    // no implicit copies for allocations
    allocation(allocation const&) = delete;
    allocation& operator=(allocation const&) = delete;

    allocation(allocation&& rhs) noexcept
      : obj_start(pc::exchange(rhs.obj_start, nullptr)),
        obj_end(pc::exchange(rhs.obj_end, nullptr)),
        alloc_start(pc::exchange(rhs.alloc_start, nullptr)),
        alloc_end(pc::exchange(rhs.alloc_end, nullptr)),
        alignment(pc::exchange(rhs.alignment, 0)),
        custom_resource(rhs.custom_resource) // rhs resource stays
    {
    }

    /// Move assignment that is safe even if rhs lives inside memory owned by *this:
    /// rhs is moved into a temporary before the old block is returned.
    allocation& operator=(allocation&& rhs) noexcept
    {
        if (this != &rhs)
        {
            auto rhs_tmp = pc::move(rhs);

            release();

            obj_start = pc::exchange(rhs_tmp.obj_start, nullptr);
            obj_end = pc::exchange(rhs_tmp.obj_end, nullptr);
            alloc_start = pc::exchange(rhs_tmp.alloc_start, nullptr);
            alloc_end = pc::exchange(rhs_tmp.alloc_end, nullptr);
            alignment = pc::exchange(rhs_tmp.alignment, 0);
            custom_resource = rhs_tmp.custom_resource;
        }

        return *this;
    }

    ~allocation() { release(); }

private:
    void release() noexcept
    {
        if (alloc_start != nullptr)
        {
            auto const& res = resource();
            res.deallocate_bytes(alloc_start, alloc_end - alloc_start, alignment, res.userdata);
            alloc_start = nullptr;
            alloc_end = nullptr;
            obj_start = nullptr;
            obj_end = nullptr;
        }
    }
};

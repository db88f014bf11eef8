#include "allocation.hh"

#include <path-core/assertf.hh>
#include <path-core/macros.hh>
#include <path-core/utility.hh>

#include <cstdlib>

namespace
{
/// Static function implementations for the system memory resource.
/// These ignore the userdata parameter as the system allocator is stateless.

pc::isize system_allocate_bytes(pc::byte** out_ptr, pc::isize min_bytes, pc::isize max_bytes, pc::isize alignment, void* userdata)
{
    PC_UNUSED(userdata);
    PC_UNUSED(max_bytes);

    PC_ASSERT(out_ptr != nullptr, "out_ptr must not be null");
    PC_ASSERT(alignment > 0 && pc::is_power_of_two(alignment), "alignment must be a power of 2");

    // Contract: min_bytes == 0 always returns nullptr
    if (min_bytes == 0)
    {
        *out_ptr = nullptr;
        return 0;
    }

    pc::byte* p = nullptr;

#ifdef PC_OS_WINDOWS
    p = static_cast<pc::byte*>(_aligned_malloc(min_bytes, alignment));
#else
    // posix_memalign has no bytes % alignment == 0 requirement but needs alignment >= sizeof(void*)
    void* raw_ptr = nullptr;
    pc::isize const effective_alignment = alignment < pc::isize(sizeof(void*)) ? pc::isize(sizeof(void*)) : alignment;
    int const result = posix_memalign(&raw_ptr, effective_alignment, min_bytes);
    p = result == 0 ? static_cast<pc::byte*>(raw_ptr) : nullptr;
#endif

    PC_ASSERTF_ALWAYS(p != nullptr, "allocation failed: requested {} bytes with alignment {}", min_bytes, alignment);

    *out_ptr = p;
    return min_bytes;
}

void system_deallocate_bytes(pc::byte* p, pc::isize bytes, pc::isize alignment, void* userdata)
{
    PC_UNUSED(bytes);
    PC_UNUSED(alignment);
    PC_UNUSED(userdata);

#ifdef PC_OS_WINDOWS
    _aligned_free(p);
#else
    std::free(p);
#endif
}

/// System memory resource instance stored in the data segment.
/// This is the fallback when pc::allocation<T>::custom_resource is nullptr.
constinit pc::memory_resource const system_memory_resource = {
    .allocate_bytes = system_allocate_bytes,
    .deallocate_bytes = system_deallocate_bytes,
    .userdata = nullptr,
};

} // namespace

constinit pc::memory_resource const* const pc::default_memory_resource = &system_memory_resource;

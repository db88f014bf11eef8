#include "string_memory.hh"

#include <path-core/allocation.hh>
#include <path-core/bit.hh>
#include <path-core/macros.hh>

namespace
{
struct string_memory_counters
{
    alignas(8) pc::u64 allocated_bytes = 0;
    alignas(8) pc::u64 freed_bytes = 0;
    alignas(8) pc::u64 allocated_strings = 0;
    alignas(8) pc::u64 freed_strings = 0;
};

constinit string_memory_counters g_counters;

pc::isize string_allocate_bytes(pc::byte** out_ptr, pc::isize min_bytes, pc::isize max_bytes, pc::isize alignment, void* userdata)
{
    auto const& base = *pc::default_memory_resource;
    auto const bytes = base.allocate_bytes(out_ptr, min_bytes, max_bytes, alignment, base.userdata);

#if PC_STRING_TELEMETRY_ENABLED
    if (bytes > 0)
    {
        auto& counters = *static_cast<string_memory_counters*>(userdata);
        pc::atomic_add(counters.allocated_bytes, pc::u64(bytes));
        pc::atomic_add(counters.allocated_strings, pc::u64(1));
    }
#else
    PC_UNUSED(userdata);
#endif

    return bytes;
}

void string_deallocate_bytes(pc::byte* p, pc::isize bytes, pc::isize alignment, void* userdata)
{
    auto const& base = *pc::default_memory_resource;
    base.deallocate_bytes(p, bytes, alignment, base.userdata);

#if PC_STRING_TELEMETRY_ENABLED
    if (p != nullptr)
    {
        auto& counters = *static_cast<string_memory_counters*>(userdata);
        pc::atomic_add(counters.freed_bytes, pc::u64(bytes));
        pc::atomic_add(counters.freed_strings, pc::u64(1));
    }
#else
    PC_UNUSED(userdata);
#endif
}

constinit pc::memory_resource const string_resource = {
    .allocate_bytes = string_allocate_bytes,
    .deallocate_bytes = string_deallocate_bytes,
    .userdata = &g_counters,
};
} // namespace

constinit pc::memory_resource const* const pc::string_memory_resource = &string_resource;

pc::string_memory_stats pc::string_memory_snapshot()
{
    string_memory_stats stats;
    stats.allocated_bytes = pc::atomic_load(g_counters.allocated_bytes);
    stats.freed_bytes = pc::atomic_load(g_counters.freed_bytes);
    stats.allocated_strings = pc::atomic_load(g_counters.allocated_strings);
    stats.freed_strings = pc::atomic_load(g_counters.freed_strings);
    return stats;
}

bool pc::string_memory_telemetry_enabled()
{
    return PC_STRING_TELEMETRY_ENABLED != 0;
}

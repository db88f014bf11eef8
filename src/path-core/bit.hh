#pragma once

#include <atomic>

// =========================================================================================================
// Atomic operations on plain fields
// =========================================================================================================
//
// These wrap std::atomic_ref so that ordinary members (cache slots, counters) can be accessed
// atomically without changing their type. Fields must be suitably aligned for atomic access.
//
//   atomic_load(value)          - relaxed atomic read
//   atomic_store(value, rhs)    - relaxed atomic write
//   atomic_add(value, rhs)      - atomically add rhs to value, return old value
//
// All operations use relaxed ordering.

namespace pc
{
/// Atomically reads a plain field with relaxed ordering
/// Usage:
///   u64 slot = pc::atomic_load(_ci_crc32_slot);
template <class T>
[[nodiscard]] T atomic_load(T const& v) noexcept
{
    // atomic_ref<T const> is C++26, the load does not modify
    return std::atomic_ref<T>(const_cast<T&>(v)).load(std::memory_order_relaxed);
}

/// Atomically writes a plain field with relaxed ordering
template <class T>
void atomic_store(T& v, T rhs) noexcept
{
    std::atomic_ref<T>(v).store(rhs, std::memory_order_relaxed);
}

/// Atomically adds a value and returns the old value
/// Usage:
///   u64 counter = 0;
///   u64 old_val = pc::atomic_add(counter, u64(1));  // counter is now 1, old_val is 0
template <class T>
T atomic_add(T& v, T rhs) noexcept
{
    return std::atomic_ref<T>(v).fetch_add(rhs);
}
} // namespace pc

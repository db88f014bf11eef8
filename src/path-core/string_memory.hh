#pragma once

#include <path-core/fwd.hh>

// Instrumented memory resource for owned byte_string buffers.
//
// Every owned string buffer is allocated from pc::string_memory_resource. The resource forwards to
// pc::default_memory_resource and, when PC_STRING_TELEMETRY_ENABLED, bumps process-wide counters with
// relaxed atomic increments. The counters are advisory: nothing in the library reads them to make a decision.
//
// Usage:
//   auto before = pc::string_memory_snapshot();
//   {
//       auto s = pc::byte_string::create_from_range("chara/equipment").clone();
//   }
//   auto after = pc::string_memory_snapshot();
//   // after.allocated_strings - before.allocated_strings == 1
//   // after.freed_strings - before.freed_strings == 1

namespace pc
{
/// Resource used for all owned byte_string buffers
extern memory_resource const* const string_memory_resource;

/// Point-in-time copy of the string memory counters
/// Counters only grow; the live balance is their difference
struct string_memory_stats
{
    u64 allocated_bytes = 0;
    u64 freed_bytes = 0;
    u64 allocated_strings = 0;
    u64 freed_strings = 0;

    [[nodiscard]] i64 current_bytes() const { return i64(allocated_bytes) - i64(freed_bytes); }
    [[nodiscard]] i64 current_strings() const { return i64(allocated_strings) - i64(freed_strings); }
};

/// Reads the counters. Individual fields are read atomically, the snapshot as a whole is not.
/// Always zero when telemetry is compiled out.
[[nodiscard]] string_memory_stats string_memory_snapshot();

/// True if this build updates the counters
[[nodiscard]] bool string_memory_telemetry_enabled();
} // namespace pc

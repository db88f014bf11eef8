#pragma once

#include <path-core/fwd.hh>
#include <path-core/string_view.hh>

// =========================================================================================================
// Domain hash of game resource paths
// =========================================================================================================
//
// The asset index addresses a file by a 64-bit key built from two 32-bit hashes:
//
//   "chara/equipment/e0001/model.mdl"
//    \_____________________/ \_______/
//      folder -> high 32 bits   file -> low 32 bits
//
// The split happens at the LAST '/'. Without a '/', the whole text is the file and the high half is 0.
// The empty path hashes to 0.
//
// The 32-bit hash is the CRC32 register (reflected polynomial 0xEDB88320, initial 0xFFFFFFFF)
// WITHOUT the final inversion, which is what the asset index stores. It therefore differs from pc::crc32.
//
// Usage:
//   u64 key = pc::compute_path_hash64("chara/equipment/e0001/model.mdl");
//   u32 folder = u32(key >> 32);
//   u32 file = u32(key);

namespace pc
{
/// 32-bit path hash of a byte range (raw bytes, case-sensitive)
[[nodiscard]] u32 path_hash32(string_view bytes);

/// 64-bit folder/file key of a path, hashing the raw bytes
[[nodiscard]] u64 compute_path_hash64(string_view path);

/// Same key as compute_path_hash64 of the ASCII-lowercased path.
/// Computes both halves in a single pass without lowercasing or splitting the text.
[[nodiscard]] u64 compute_lower_path_hash64(string_view path);
} // namespace pc

#include "path_hash.hh"

#include <path-core/char_predicates.hh>
#include <path-core/metadata_scan.hh>

namespace
{
constexpr pc::u32 path_hash_seed = 0xFFFFFFFFu;

constexpr pc::u64 make_key(pc::u32 folder, pc::u32 file)
{
    return (pc::u64(folder) << 32) | file;
}
} // namespace

pc::u32 pc::path_hash32(string_view bytes)
{
    auto crc = path_hash_seed;
    for (auto const b : bytes)
        crc = impl::crc32_step(crc, b);
    return crc;
}

pc::u64 pc::compute_path_hash64(string_view path)
{
    if (path.empty())
        return 0;

    auto const last_slash = path.rfind('/');
    if (last_slash == -1)
        return path_hash32(path);

    return make_key(path_hash32(path.subview(0, last_slash)), path_hash32(path.subview(last_slash + 1)));
}

pc::u64 pc::compute_lower_path_hash64(string_view path)
{
    if (path.empty())
        return 0;

    // `running` hashes everything seen so far, `file` restarts after every '/'.
    // At the last '/', `running` is the hash of the folder part.
    u32 folder = 0;
    auto file = path_hash_seed;
    auto running = path_hash_seed;
    for (auto const b : path)
    {
        if (b == '/')
        {
            folder = running;
            file = path_hash_seed;
            running = impl::crc32_step(running, b);
        }
        else
        {
            auto const lower = to_lower(b);
            file = impl::crc32_step(file, lower);
            running = impl::crc32_step(running, lower);
        }
    }

    return make_key(folder, file);
}

#pragma once

#include "common.hpp"

#include <cstdint>
#include <string_view>

namespace nodesync
{
    // Stable, platform-independent hashes for fleet partitioning.
    //
    // These must never change between releases: every node in a fleet has to
    // agree on which shard owns a given unit. std::hash gives no such guarantee.

    inline std::uint64_t splitmix64(std::uint64_t x) noexcept
    {
        x += 0x9e3779b97f4a7c15ULL;
        x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
        x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
        return x ^ (x >> 31);
    }

    inline std::uint64_t mix_u64(std::uint64_t a, std::uint64_t b) noexcept
    {
        return splitmix64(a ^ splitmix64(b));
    }

    inline std::uint64_t fnv1a64(std::string_view bytes) noexcept
    {
        std::uint64_t h = 1469598103934665603ULL;
        for (const char c : bytes)
        {
            h ^= static_cast<std::uint64_t>(static_cast<unsigned char>(c));
            h *= 1099511628211ULL;
        }
        return h;
    }

    // hash(streamId . partition): FNV-1a over the stream id bytes, then mixed
    // with the partition index through splitmix64.
    inline std::uint64_t unit_key_hash(const UnitKey &key) noexcept
    {
        return mix_u64(fnv1a64(key.streamId), static_cast<std::uint64_t>(key.partition));
    }
}

#pragma once

#include "hashing.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace nodesync
{
    // Static fleet partitioning of the unit space. The default is single-node
    // mode, in which every unit is in scope.
    struct ShardingParams
    {
        std::uint32_t shardCount = 1;

        // Must be in [0, shardCount).
        std::uint32_t shardIndex = 0;
    };

    inline void validate_sharding(const ShardingParams &params)
    {
        if (params.shardCount == 0)
        {
            throw std::runtime_error("ShardingParams: shardCount must be positive");
        }
        if (params.shardIndex >= params.shardCount)
        {
            throw std::runtime_error("ShardingParams: shardIndex " + std::to_string(params.shardIndex) +
                                     " out of range for shardCount " + std::to_string(params.shardCount));
        }
    }

    inline std::uint32_t shard_of(const UnitKey &key, std::uint32_t shardCount) noexcept
    {
        if (shardCount <= 1)
        {
            return 0;
        }
        return static_cast<std::uint32_t>(unit_key_hash(key) % shardCount);
    }

    inline bool in_shard(const ShardingParams &params, const UnitKey &key) noexcept
    {
        return shard_of(key, params.shardCount) == params.shardIndex;
    }

    // Expands each stream into its partitions and keeps the keys owned by this shard.
    inline UnitSet expand_in_shard(const std::vector<UnitMetadata> &streams, const ShardingParams &params)
    {
        UnitSet out;
        for (const auto &md : streams)
        {
            for (auto &key : expand_partitions(md))
            {
                if (in_shard(params, key))
                {
                    out.insert(std::move(key));
                }
            }
        }
        return out;
    }

    inline UnitSet expand_in_shard(const UnitMetadata &stream, const ShardingParams &params)
    {
        return expand_in_shard(std::vector<UnitMetadata>{stream}, params);
    }
}

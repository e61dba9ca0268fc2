#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstddef>
#include <limits>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace nodesync
{
    using StreamId = std::string;
    using PartitionIndex = std::uint32_t;
    using Watermark = std::uint64_t;
    using NodeAddress = std::string;

    // One (stream, partition) responsibility.
    struct UnitKey
    {
        StreamId streamId;
        PartitionIndex partition = 0;

        friend bool operator<(const UnitKey &lhs, const UnitKey &rhs)
        {
            const int c = lhs.streamId.compare(rhs.streamId);
            return (c < 0) || ((c == 0) && (lhs.partition < rhs.partition));
        }
        friend bool operator==(const UnitKey &lhs, const UnitKey &rhs)
        {
            return (lhs.partition == rhs.partition) && (lhs.streamId == rhs.streamId);
        }
    };

    using UnitSet = std::set<UnitKey>;

    struct UnitMetadata
    {
        StreamId streamId;
        std::uint32_t partitionCount = 0;
    };

    enum class ChangeType : std::uint8_t
    {
        Added = 1,
        Removed = 2,
    };

    inline const char *change_type_name(ChangeType t) noexcept
    {
        switch (t)
        {
        case ChangeType::Added:
            return "added";
        case ChangeType::Removed:
            return "removed";
        }
        return "unknown";
    }

    // "<streamId>#<partition>"
    inline std::string to_string(const UnitKey &key)
    {
        return key.streamId + "#" + std::to_string(key.partition);
    }

    // Stream ids may themselves contain '#', so split at the last one.
    inline UnitKey parse_unit_key(std::string_view text)
    {
        const auto pos = text.rfind('#');
        if (pos == std::string_view::npos || pos == 0 || pos + 1 == text.size())
        {
            throw std::runtime_error("parse_unit_key: malformed unit key '" + std::string(text) + "'");
        }

        std::uint64_t partition = 0;
        for (const char c : text.substr(pos + 1))
        {
            if (c < '0' || c > '9')
            {
                throw std::runtime_error("parse_unit_key: bad partition in '" + std::string(text) + "'");
            }
            partition = partition * 10 + static_cast<std::uint64_t>(c - '0');
            if (partition > std::numeric_limits<PartitionIndex>::max())
            {
                throw std::runtime_error("parse_unit_key: partition out of range in '" + std::string(text) + "'");
            }
        }

        return UnitKey{StreamId(text.substr(0, pos)), static_cast<PartitionIndex>(partition)};
    }

    // Keys for partitions [0, partitionCount), ascending.
    inline std::vector<UnitKey> expand_partitions(const UnitMetadata &metadata)
    {
        std::vector<UnitKey> out;
        out.reserve(metadata.partitionCount);
        for (std::uint32_t p = 0; p < metadata.partitionCount; ++p)
        {
            out.push_back(UnitKey{metadata.streamId, p});
        }
        return out;
    }

    // Registry addresses are hex strings; compare them case-insensitively.
    inline NodeAddress normalize_node_address(std::string_view address)
    {
        NodeAddress out(address);
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return out;
    }
}

/*
Purpose: Tests the in-process registry used to drive synchronizers.

What this tests: assigning and unassigning streams updates storage-node
queries and announces one event each with an advancing watermark; fetches
only report streams whose metadata exists; unsubscribed handlers stop
receiving events; injected failures surface as exceptions.
*/

#include "registry.hpp"

#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{
    struct Seen
    {
        nodesync::AssignmentEventKind kind;
        nodesync::RawAssignmentEvent ev;
    };
}

int main()
{
    nodesync::InMemoryRegistry reg;
    reg.put_stream(nodesync::UnitMetadata{"s1", 2});
    reg.put_stream(nodesync::UnitMetadata{"s2", 1});

    std::vector<Seen> seen;
    const auto addedSub = reg.subscribe(nodesync::AssignmentEventKind::UnitAdded, [&](const nodesync::RawAssignmentEvent &ev)
                                        { seen.push_back(Seen{nodesync::AssignmentEventKind::UnitAdded, ev}); });
    const auto removedSub = reg.subscribe(nodesync::AssignmentEventKind::UnitRemoved, [&](const nodesync::RawAssignmentEvent &ev)
                                          { seen.push_back(Seen{nodesync::AssignmentEventKind::UnitRemoved, ev}); });
    assert(reg.subscriber_count() == 2);

    // Assignment bookkeeping and announcements.
    {
        const auto w1 = reg.add_stream_to_node("s1", "0xAA");
        const auto w2 = reg.add_stream_to_node("s1", "0xbb");
        const auto w3 = reg.add_stream_to_node("s2", "0xaa");
        assert(w1 < w2 && w2 < w3);

        assert(reg.is_stored_stream("s1", "0xaa"));
        assert(reg.is_stored_stream("s1", "0xBB"));
        assert(!reg.is_stored_stream("s2", "0xbb"));
        assert((reg.get_storage_nodes("s1") == std::vector<nodesync::NodeAddress>{"0xaa", "0xbb"}));

        assert(seen.size() == 3);
        assert(seen[0].kind == nodesync::AssignmentEventKind::UnitAdded);
        assert(seen[0].ev.streamId == "s1");
        assert(seen[0].ev.targetNodeAddress == "0xaa");
        assert(seen[0].ev.watermark == w1);

        const auto fetched = reg.fetch_assigned_units("0xaa");
        assert(fetched.watermark == w3);
        assert(fetched.units.size() == 2);
        assert(fetched.units[0].streamId == "s1" && fetched.units[0].partitionCount == 2);
        assert(fetched.units[1].streamId == "s2");

        const auto w4 = reg.remove_stream_from_node("s1", "0xaa");
        assert(w4 > w3);
        assert(!reg.is_stored_stream("s1", "0xaa"));
        assert(seen.back().kind == nodesync::AssignmentEventKind::UnitRemoved);
        assert(seen.back().ev.watermark == w4);
    }

    // Deleted metadata drops out of fetches; lookups fail.
    {
        reg.delete_stream("s2");
        assert(reg.fetch_assigned_units("0xaa").units.empty());
        bool threw = false;
        try
        {
            (void)reg.get_unit_metadata("s2");
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);
        assert(reg.fetch_assigned_units("0xcc").units.empty());
    }

    // Failure injection.
    {
        reg.set_fetch_failure("down");
        bool threw = false;
        try
        {
            (void)reg.fetch_assigned_units("0xbb");
        }
        catch (const std::runtime_error &e)
        {
            threw = std::string(e.what()) == "down";
        }
        assert(threw);
        reg.set_fetch_failure(std::nullopt);
        assert(reg.fetch_assigned_units("0xbb").units.size() == 1);

        reg.set_lookup_failure("lookup down");
        threw = false;
        try
        {
            (void)reg.get_unit_metadata("s1");
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);
        reg.set_lookup_failure(std::nullopt);
        assert(reg.get_unit_metadata("s1").partitionCount == 2);
    }

    // Unsubscribe.
    {
        const std::size_t before = seen.size();
        reg.unsubscribe(nodesync::AssignmentEventKind::UnitAdded, addedSub);
        reg.unsubscribe(nodesync::AssignmentEventKind::UnitRemoved, removedSub);
        assert(reg.subscriber_count() == 0);
        reg.add_stream_to_node("s1", "0xaa");
        assert(seen.size() == before);
        assert(reg.unsubscribe_calls() == 2);
    }

    return 0;
}

/*
Purpose: Tests the push-event path of AssignmentSynchronizer.

What this tests: with polling unavailable, Added/Added/Removed events produce
exactly the implied transitions (3 adds, 2 removes, one unit left); repeated
or redundant events fire nothing; events addressed to another node are
ignored; a later poll overrides state built from events.
*/

#include "assignment_synchronizer.hpp"
#include "test_util.hpp"

#include <cassert>
#include <chrono>
#include <memory>
#include <vector>

namespace
{
    using namespace std::chrono_literals;
    using nodesync::test::key;
    using nodesync::test::wait_until;

    constexpr auto kPollTime = 10ms;
    const nodesync::NodeAddress kNode = "0xaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa";
    const nodesync::NodeAddress kOtherNode = "0xbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb";

    struct Fixture
    {
        Fixture()
            : registry(std::make_shared<nodesync::InMemoryRegistry>()),
              sync(make_config(), registry,
                   nodesync::SynchronizerCallbacks{
                       [this](const nodesync::UnitKey &k)
                       { rec.added(k); },
                       [this](const nodesync::UnitKey &k)
                       { rec.removed(k); },
                   },
                   std::make_shared<nodesync::test::CaptureLogger>(kNode))
        {
            registry->put_stream(nodesync::UnitMetadata{"stream-1", 2});
            registry->put_stream(nodesync::UnitMetadata{"stream-2", 4});
            registry->put_stream(nodesync::UnitMetadata{"stream-3", 1});
            registry->set_fetch_failure("results not available");
        }

        static nodesync::SynchronizerConfig make_config()
        {
            nodesync::SynchronizerConfig cfg;
            cfg.nodeAddress = kNode;
            cfg.pollInterval = kPollTime;
            return cfg;
        }

        void added(const char *streamId, nodesync::Watermark wm, const nodesync::NodeAddress &to = kNode)
        {
            registry->publish(nodesync::AssignmentEventKind::UnitAdded, nodesync::RawAssignmentEvent{streamId, to, wm});
        }

        void removed(const char *streamId, nodesync::Watermark wm, const nodesync::NodeAddress &to = kNode)
        {
            registry->publish(nodesync::AssignmentEventKind::UnitRemoved, nodesync::RawAssignmentEvent{streamId, to, wm});
        }

        nodesync::test::RecordingCallbacks rec;
        std::shared_ptr<nodesync::InMemoryRegistry> registry;
        nodesync::AssignmentSynchronizer sync;
    };
}

int main()
{
    // Added stream-1, Added stream-3, Removed stream-1.
    {
        Fixture f;
        f.sync.start();

        f.added("stream-1", 10);
        assert(wait_until([&]
                          { return f.rec.added_count() == 2; }));
        f.added("stream-3", 15);
        assert(wait_until([&]
                          { return f.rec.added_count() == 3; }));
        f.removed("stream-1", 13);
        assert(wait_until([&]
                          { return f.rec.removed_count() == 2; }));

        const std::vector<nodesync::UnitKey> added{key("stream-1#0"), key("stream-1#1"), key("stream-3#0")};
        const std::vector<nodesync::UnitKey> removed{key("stream-1#0"), key("stream-1#1")};
        assert(f.rec.added_calls() == added);
        assert(f.rec.removed_calls() == removed);

        const auto units = f.sync.get_assigned_units();
        assert(units.size() == 1);
        assert(units.count(key("stream-3#0")) == 1);

        const auto st = f.sync.stats();
        assert(st.eventsApplied == 3);
        assert(st.unitsAdded == 3);
        assert(st.unitsRemoved == 2);
        // Recorded as-is; an older watermark does not block the event.
        assert(st.lastWatermark == 13);
    }

    // Redundant events are no-ops; queued events apply in arrival order.
    {
        Fixture f;
        f.sync.start();

        f.added("stream-2", 1);
        f.added("stream-2", 2);
        f.removed("stream-3", 3);
        f.added("stream-3", 4);

        assert(wait_until([&]
                          { return f.sync.stats().eventsApplied == 4; }));
        assert(f.rec.added_count() == 5);
        assert(f.rec.removed_count() == 0);
        assert(f.sync.get_assigned_units().size() == 5);
    }

    // Foreign events ignored; events for deleted streams dropped.
    {
        Fixture f;
        f.sync.start();

        f.added("stream-2", 1, kOtherNode);
        f.added("no-such-stream", 2);
        f.added("stream-3", 3);

        assert(wait_until([&]
                          { return f.rec.added_count() == 1; }));
        std::this_thread::sleep_for(20ms);
        assert(f.rec.added_count() == 1);
        assert(f.sync.get_assigned_units() == nodesync::UnitSet{key("stream-3#0")});
        assert(f.sync.stats().eventsApplied == 1);
    }

    // Once polling recovers, the poll result wins over event-built state.
    {
        Fixture f;
        f.sync.start();

        f.added("stream-1", 5);
        assert(wait_until([&]
                          { return f.rec.added_count() == 2; }));

        f.registry->set_assignments(kNode, {"stream-3"}, 6);
        f.registry->set_fetch_failure(std::nullopt);

        assert(wait_until([&]
                          { return f.sync.get_assigned_units() == nodesync::UnitSet{key("stream-3#0")}; }));
        assert(f.rec.removed_count() == 2);
        assert(f.rec.added_count() == 3);
    }

    return 0;
}

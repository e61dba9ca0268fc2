#pragma once

#include "common.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace nodesync
{
    enum class AssignmentEventKind : std::uint8_t
    {
        UnitAdded = 1,
        UnitRemoved = 2,
    };

    inline const char *assignment_event_name(AssignmentEventKind k) noexcept
    {
        switch (k)
        {
        case AssignmentEventKind::UnitAdded:
            return "unitAdded";
        case AssignmentEventKind::UnitRemoved:
            return "unitRemoved";
        }
        return "unknown";
    }

    inline ChangeType change_type_of(AssignmentEventKind k) noexcept
    {
        return k == AssignmentEventKind::UnitAdded ? ChangeType::Added : ChangeType::Removed;
    }

    // As delivered by the registry's push feed; not yet filtered or resolved.
    struct RawAssignmentEvent
    {
        StreamId streamId;
        NodeAddress targetNodeAddress;
        Watermark watermark = 0;
    };

    struct AssignedUnits
    {
        std::vector<UnitMetadata> units;
        Watermark watermark = 0;
    };

    using SubscriptionId = std::uint64_t;

    // Registry / stream-metadata collaborator.
    //
    // fetch_assigned_units() and get_unit_metadata() may block and report
    // failure by throwing. Handlers passed to subscribe() are invoked on the
    // registry's own delivery thread, and a copy already dispatched may still
    // run after unsubscribe() returns.
    class IRegistryClient
    {
    public:
        using EventHandler = std::function<void(const RawAssignmentEvent &)>;

        virtual ~IRegistryClient() = default;
        virtual AssignedUnits fetch_assigned_units(const NodeAddress &node) = 0;
        virtual UnitMetadata get_unit_metadata(const StreamId &streamId) = 0;
        virtual SubscriptionId subscribe(AssignmentEventKind kind, EventHandler handler) = 0;
        virtual void unsubscribe(AssignmentEventKind kind, SubscriptionId id) = 0;
    };

    // In-process registry (single host). Thread-safe; events are delivered
    // synchronously on the thread that publishes them.
    class InMemoryRegistry final : public IRegistryClient
    {
    public:
        // Invoked before a fetch/lookup completes, outside the registry lock.
        using CallHook = std::function<void(const std::string &)>;

        AssignedUnits fetch_assigned_units(const NodeAddress &node) override
        {
            const NodeAddress addr = normalize_node_address(node);
            CallHook hook;
            {
                std::lock_guard<std::mutex> lk(m_mu);
                ++m_fetchCalls;
                hook = m_fetchHook;
            }
            if (hook)
            {
                hook(addr);
            }

            std::lock_guard<std::mutex> lk(m_mu);
            if (m_fetchFailure)
            {
                throw std::runtime_error(*m_fetchFailure);
            }

            AssignedUnits out;
            out.watermark = m_watermark;
            const auto it = m_assignments.find(addr);
            if (it == m_assignments.end())
            {
                return out;
            }
            for (const auto &streamId : it->second)
            {
                const auto s = m_streams.find(streamId);
                if (s != m_streams.end())
                {
                    out.units.push_back(s->second);
                }
            }
            return out;
        }

        UnitMetadata get_unit_metadata(const StreamId &streamId) override
        {
            CallHook hook;
            {
                std::lock_guard<std::mutex> lk(m_mu);
                ++m_lookupCalls;
                hook = m_lookupHook;
            }
            if (hook)
            {
                hook(streamId);
            }

            std::lock_guard<std::mutex> lk(m_mu);
            if (m_lookupFailure)
            {
                throw std::runtime_error(*m_lookupFailure);
            }
            const auto it = m_streams.find(streamId);
            if (it == m_streams.end())
            {
                throw std::runtime_error("stream not found: " + streamId);
            }
            return it->second;
        }

        SubscriptionId subscribe(AssignmentEventKind kind, EventHandler handler) override
        {
            if (!handler)
            {
                throw std::runtime_error("InMemoryRegistry::subscribe: null handler");
            }
            std::lock_guard<std::mutex> lk(m_mu);
            ++m_subscribeCalls;
            const SubscriptionId id = ++m_nextSubscription;
            m_handlers[kind].emplace(id, std::move(handler));
            return id;
        }

        void unsubscribe(AssignmentEventKind kind, SubscriptionId id) override
        {
            std::lock_guard<std::mutex> lk(m_mu);
            ++m_unsubscribeCalls;
            const auto it = m_handlers.find(kind);
            if (it != m_handlers.end())
            {
                it->second.erase(id);
            }
        }

        // Delivers `ev` to every current subscriber of `kind`, in subscription order.
        void publish(AssignmentEventKind kind, const RawAssignmentEvent &ev)
        {
            std::vector<EventHandler> targets;
            {
                std::lock_guard<std::mutex> lk(m_mu);
                const auto it = m_handlers.find(kind);
                if (it != m_handlers.end())
                {
                    for (const auto &[id, h] : it->second)
                    {
                        targets.push_back(h);
                    }
                }
            }
            for (const auto &h : targets)
            {
                h(ev);
            }
        }

        void put_stream(UnitMetadata metadata)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            auto id = metadata.streamId;
            m_streams.insert_or_assign(std::move(id), std::move(metadata));
        }

        void delete_stream(const StreamId &streamId)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_streams.erase(streamId);
        }

        // Records the assignment, advances the watermark and announces it.
        Watermark add_stream_to_node(const StreamId &streamId, const NodeAddress &node)
        {
            const NodeAddress addr = normalize_node_address(node);
            Watermark wm = 0;
            {
                std::lock_guard<std::mutex> lk(m_mu);
                m_assignments[addr].insert(streamId);
                wm = ++m_watermark;
            }
            publish(AssignmentEventKind::UnitAdded, RawAssignmentEvent{streamId, addr, wm});
            return wm;
        }

        Watermark remove_stream_from_node(const StreamId &streamId, const NodeAddress &node)
        {
            const NodeAddress addr = normalize_node_address(node);
            Watermark wm = 0;
            {
                std::lock_guard<std::mutex> lk(m_mu);
                const auto it = m_assignments.find(addr);
                if (it != m_assignments.end())
                {
                    it->second.erase(streamId);
                    if (it->second.empty())
                    {
                        m_assignments.erase(it);
                    }
                }
                wm = ++m_watermark;
            }
            publish(AssignmentEventKind::UnitRemoved, RawAssignmentEvent{streamId, addr, wm});
            return wm;
        }

        // Replaces the node's assignments without announcing anything, as if
        // the push feed had missed the changes. Only polls observe it.
        void set_assignments(const NodeAddress &node, const std::vector<StreamId> &streamIds, Watermark wm)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            auto &assigned = m_assignments[normalize_node_address(node)];
            assigned.clear();
            assigned.insert(streamIds.begin(), streamIds.end());
            m_watermark = wm;
        }

        bool is_stored_stream(const StreamId &streamId, const NodeAddress &node) const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            const auto it = m_assignments.find(normalize_node_address(node));
            return it != m_assignments.end() && it->second.count(streamId) != 0;
        }

        // Nodes storing `streamId`, ascending.
        std::vector<NodeAddress> get_storage_nodes(const StreamId &streamId) const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            std::vector<NodeAddress> out;
            for (const auto &[node, streams] : m_assignments)
            {
                if (streams.count(streamId) != 0)
                {
                    out.push_back(node);
                }
            }
            return out;
        }

        void set_watermark(Watermark wm)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_watermark = wm;
        }

        // Failure injection. std::nullopt restores normal behavior.
        void set_fetch_failure(std::optional<std::string> reason)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_fetchFailure = std::move(reason);
        }

        void set_lookup_failure(std::optional<std::string> reason)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_lookupFailure = std::move(reason);
        }

        void set_fetch_hook(CallHook hook)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_fetchHook = std::move(hook);
        }

        void set_lookup_hook(CallHook hook)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_lookupHook = std::move(hook);
        }

        std::size_t fetch_calls() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_fetchCalls;
        }

        std::size_t lookup_calls() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_lookupCalls;
        }

        std::size_t subscribe_calls() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_subscribeCalls;
        }

        std::size_t unsubscribe_calls() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_unsubscribeCalls;
        }

        std::size_t subscriber_count() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            std::size_t n = 0;
            for (const auto &[kind, handlers] : m_handlers)
            {
                n += handlers.size();
            }
            return n;
        }

    private:
        mutable std::mutex m_mu;

        std::map<StreamId, UnitMetadata> m_streams;
        std::map<NodeAddress, std::set<StreamId>> m_assignments;
        Watermark m_watermark = 0;

        std::map<AssignmentEventKind, std::map<SubscriptionId, EventHandler>> m_handlers;
        SubscriptionId m_nextSubscription = 0;

        std::optional<std::string> m_fetchFailure;
        std::optional<std::string> m_lookupFailure;
        CallHook m_fetchHook;
        CallHook m_lookupHook;

        std::size_t m_fetchCalls = 0;
        std::size_t m_lookupCalls = 0;
        std::size_t m_subscribeCalls = 0;
        std::size_t m_unsubscribeCalls = 0;
    };
}

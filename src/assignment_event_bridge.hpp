#pragma once

#include "log.hpp"
#include "registry.hpp"
#include "serial_executor.hpp"

#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace nodesync
{
    // Translates the registry's raw add/remove feed into resolved, node-local
    // notifications.
    //
    // - Events addressed to another node are dropped silently.
    // - Each accepted event costs one metadata lookup, run on a private worker
    //   so the registry's delivery thread never blocks.
    // - A failed lookup is logged and dropped; the owner's periodic poll is what
    //   restores consistency.
    class AssignmentEventBridge
    {
    public:
        using Callback = std::function<void(const UnitMetadata &, ChangeType, Watermark)>;

        struct Stats
        {
            std::uint64_t received = 0;
            std::uint64_t ignored = 0;
            std::uint64_t forwarded = 0;
            std::uint64_t lookupFailures = 0;
        };

        AssignmentEventBridge(NodeAddress nodeAddress,
                              std::shared_ptr<IRegistryClient> registry,
                              Callback onEvent,
                              std::shared_ptr<Logger> logger = nullptr)
            : m_nodeAddress(normalize_node_address(nodeAddress)),
              m_registry(std::move(registry)),
              m_onEvent(std::move(onEvent)),
              m_logger(logger ? std::move(logger) : make_default_logger(m_nodeAddress))
        {
            if (m_nodeAddress.empty())
            {
                throw std::runtime_error("AssignmentEventBridge: node address must be non-empty");
            }
            if (!m_registry)
            {
                throw std::runtime_error("AssignmentEventBridge: registry client required");
            }
            if (!m_onEvent)
            {
                throw std::runtime_error("AssignmentEventBridge: event callback required");
            }
        }

        AssignmentEventBridge(const AssignmentEventBridge &) = delete;
        AssignmentEventBridge &operator=(const AssignmentEventBridge &) = delete;

        ~AssignmentEventBridge() { destroy(); }

        // Precondition: not already started.
        void start()
        {
            m_executor.start();
            m_accepting = true;

            std::lock_guard<std::mutex> lk(m_slotsMu);
            m_gate = std::make_shared<DeliveryGate>();
            m_gate->owner = this;
            m_addedSlot = m_registry->subscribe(AssignmentEventKind::UnitAdded, [gate = m_gate](const RawAssignmentEvent &ev)
                                                { deliver_(*gate, AssignmentEventKind::UnitAdded, ev); });
            m_removedSlot = m_registry->subscribe(AssignmentEventKind::UnitRemoved, [gate = m_gate](const RawAssignmentEvent &ev)
                                                  { deliver_(*gate, AssignmentEventKind::UnitRemoved, ev); });
        }

        // Unregisters whatever start() registered, waits for a delivery that is
        // inside this bridge, then waits for a running lookup. Lookups still
        // queued are discarded. Handler copies the registry invokes later are
        // no-ops.
        void destroy()
        {
            m_accepting = false;
            {
                std::lock_guard<std::mutex> lk(m_slotsMu);
                if (m_gate)
                {
                    std::lock_guard<std::mutex> gateLk(m_gate->mu);
                    m_gate->owner = nullptr;
                }
                m_gate.reset();
                if (m_addedSlot)
                {
                    m_registry->unsubscribe(AssignmentEventKind::UnitAdded, *m_addedSlot);
                    m_addedSlot.reset();
                }
                if (m_removedSlot)
                {
                    m_registry->unsubscribe(AssignmentEventKind::UnitRemoved, *m_removedSlot);
                    m_removedSlot.reset();
                }
            }

            const std::size_t discarded = m_executor.stop();
            if (discarded != 0)
            {
                m_logger->logf(LogLevel::Debug, "events", "discarded %zu pending lookups on destroy", discarded);
            }
        }

        const NodeAddress &node_address() const noexcept { return m_nodeAddress; }

        Stats stats() const
        {
            std::lock_guard<std::mutex> lk(m_statsMu);
            return m_stats;
        }

    private:
        // Shared with the registered handlers, which may outlive the bridge.
        // owner is cleared by destroy(); deliveries run with mu held.
        struct DeliveryGate
        {
            std::mutex mu;
            AssignmentEventBridge *owner = nullptr;
        };

        static void deliver_(DeliveryGate &gate, AssignmentEventKind kind, const RawAssignmentEvent &ev)
        {
            std::lock_guard<std::mutex> lk(gate.mu);
            if (gate.owner)
            {
                gate.owner->handle_event_(kind, ev);
            }
        }

        void handle_event_(AssignmentEventKind kind, const RawAssignmentEvent &ev)
        {
            if (!m_accepting)
            {
                return;
            }

            if (normalize_node_address(ev.targetNodeAddress) != m_nodeAddress)
            {
                bump_(&Stats::ignored);
                return;
            }

            bump_(&Stats::received);
            m_logger->logf(LogLevel::Info, "events", "received %s stream=%s watermark=%llu",
                           assignment_event_name(kind),
                           ev.streamId.c_str(),
                           static_cast<unsigned long long>(ev.watermark));

            const ChangeType change = change_type_of(kind);
            const bool queued = m_executor.post([this, ev, change]
                                                { resolve_and_forward_(ev, change); });
            if (!queued)
            {
                m_logger->logf(LogLevel::Debug, "events", "dropped %s for stream=%s: bridge stopping",
                               assignment_event_name(kind), ev.streamId.c_str());
            }
        }

        void resolve_and_forward_(const RawAssignmentEvent &ev, ChangeType change)
        {
            UnitMetadata md;
            try
            {
                md = m_registry->get_unit_metadata(ev.streamId);
            }
            catch (const std::exception &e)
            {
                m_logger->logf(LogLevel::Warn, "events", "metadata lookup failed for stream=%s (%s): %s",
                               ev.streamId.c_str(), change_type_name(change), e.what());
                bump_(&Stats::lookupFailures);
                return;
            }

            if (!m_accepting)
            {
                return;
            }

            bump_(&Stats::forwarded);
            m_onEvent(md, change, ev.watermark);
        }

        void bump_(std::uint64_t Stats::*field)
        {
            std::lock_guard<std::mutex> lk(m_statsMu);
            ++(m_stats.*field);
        }

        const NodeAddress m_nodeAddress;
        std::shared_ptr<IRegistryClient> m_registry;
        Callback m_onEvent;
        std::shared_ptr<Logger> m_logger;

        SerialExecutor m_executor;
        std::atomic<bool> m_accepting{false};

        std::mutex m_slotsMu;
        std::shared_ptr<DeliveryGate> m_gate;
        std::optional<SubscriptionId> m_addedSlot;
        std::optional<SubscriptionId> m_removedSlot;

        mutable std::mutex m_statsMu;
        Stats m_stats{};
    };
}

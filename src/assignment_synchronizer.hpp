#pragma once

#include "assignment_event_bridge.hpp"
#include "log.hpp"
#include "registry.hpp"
#include "sharding.hpp"

#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace nodesync
{
    struct SynchronizerConfig
    {
        // Address this node is registered under. Compared case-insensitively.
        NodeAddress nodeAddress;

        ShardingParams sharding{};

        // Delay between the end of one full poll and the start of the next.
        std::chrono::milliseconds pollInterval{std::chrono::minutes(10)};

        // Used only when no logger is injected.
        LogLevel logLevel = LogLevel::Warn;
    };

    // Both run on a synchronizer worker with the state lock held. They may read
    // get_assigned_units(), has_unit() and stats(), which report the set as it
    // stands after the whole reconciliation step that fired the callback.
    struct SynchronizerCallbacks
    {
        std::function<void(const UnitKey &)> onUnitAdded;
        std::function<void(const UnitKey &)> onUnitRemoved;
    };

    // Owns the authoritative set of units assigned to this node.
    //
    // Two inputs feed the set: a periodic full poll of the registry and the
    // registry's push feed (through AssignmentEventBridge). Both are applied
    // under one mutex, and the callbacks fire from inside that critical section
    // once per effective transition, in ascending key order. Readers see a
    // snapshot published before the callbacks of each step, so they never wait
    // on that mutex.
    //
    // Watermarks are recorded but never compared: whichever input is applied
    // last wins, and a stale event is corrected by the next poll.
    //
    // Preconditions (not checked):
    // - start() is not called twice without an intervening destroy().
    // - Callbacks do not call start()/destroy() and return promptly. Reading
    //   state from a callback is allowed.
    class AssignmentSynchronizer
    {
    public:
        struct Stats
        {
            std::uint64_t pollsSucceeded = 0;
            std::uint64_t pollsFailed = 0;
            std::uint64_t eventsApplied = 0;
            std::uint64_t unitsAdded = 0;
            std::uint64_t unitsRemoved = 0;
            Watermark lastWatermark = 0;
        };

        AssignmentSynchronizer(SynchronizerConfig cfg,
                               std::shared_ptr<IRegistryClient> registry,
                               SynchronizerCallbacks callbacks,
                               std::shared_ptr<Logger> logger = nullptr)
            : m_cfg(std::move(cfg)),
              m_registry(std::move(registry)),
              m_callbacks(std::move(callbacks))
        {
            m_cfg.nodeAddress = normalize_node_address(m_cfg.nodeAddress);
            if (m_cfg.nodeAddress.empty())
            {
                throw std::runtime_error("AssignmentSynchronizer: node address must be non-empty");
            }
            if (!m_registry)
            {
                throw std::runtime_error("AssignmentSynchronizer: registry client required");
            }
            if (m_cfg.pollInterval.count() <= 0)
            {
                throw std::runtime_error("AssignmentSynchronizer: pollInterval must be positive");
            }
            if (!m_callbacks.onUnitAdded || !m_callbacks.onUnitRemoved)
            {
                throw std::runtime_error("AssignmentSynchronizer: onUnitAdded and onUnitRemoved are required");
            }
            validate_sharding(m_cfg.sharding);

            m_logger = logger ? std::move(logger) : make_default_logger(m_cfg.nodeAddress, m_cfg.logLevel);
            m_bridge = std::make_unique<AssignmentEventBridge>(
                m_cfg.nodeAddress,
                m_registry,
                [this](const UnitMetadata &md, ChangeType change, Watermark wm)
                { apply_event_(md, change, wm); },
                m_logger);
        }

        AssignmentSynchronizer(const AssignmentSynchronizer &) = delete;
        AssignmentSynchronizer &operator=(const AssignmentSynchronizer &) = delete;

        ~AssignmentSynchronizer() { destroy(); }

        UnitSet get_assigned_units() const
        {
            std::lock_guard<std::mutex> lk(m_viewMu);
            return *m_view;
        }

        bool has_unit(const UnitKey &key) const
        {
            std::lock_guard<std::mutex> lk(m_viewMu);
            return m_view->count(key) != 0;
        }

        Stats stats() const
        {
            std::lock_guard<std::mutex> lk(m_viewMu);
            return m_stats;
        }

        // Returns once the poll worker and the event bridge are running; the
        // first poll is issued immediately on the worker.
        void start()
        {
            {
                std::lock_guard<std::mutex> lk(m_stateMu);
                m_accepting = true;
            }
            {
                std::lock_guard<std::mutex> lk(m_timerMu);
                m_stopRequested = false;
            }
            m_pollThread = std::thread([this]
                                       { poll_loop_(); });
            m_bridge->start();

            m_logger->logf(LogLevel::Info, "sync", "started (shard %u/%u, poll every %lld ms)",
                           m_cfg.sharding.shardIndex,
                           m_cfg.sharding.shardCount,
                           static_cast<long long>(m_cfg.pollInterval.count()));
        }

        // Blocks until in-flight polls and lookups have finished. Afterwards the
        // unit set is frozen and no callback fires.
        void destroy()
        {
            bool wasStarted = false;
            {
                // Waits for any running critical section.
                std::lock_guard<std::mutex> lk(m_stateMu);
                wasStarted = m_accepting;
                m_accepting = false;
            }
            {
                std::lock_guard<std::mutex> lk(m_timerMu);
                m_stopRequested = true;
            }
            m_timerCv.notify_all();
            if (m_pollThread.joinable())
            {
                m_pollThread.join();
            }
            m_bridge->destroy();

            if (wasStarted)
            {
                m_logger->logf(LogLevel::Info, "sync", "stopped");
            }
        }

    private:
        void poll_loop_()
        {
            while (true)
            {
                poll_once_();

                std::unique_lock<std::mutex> lk(m_timerMu);
                if (m_timerCv.wait_for(lk, m_cfg.pollInterval, [this]
                                       { return m_stopRequested; }))
                {
                    return;
                }
            }
        }

        void poll_once_()
        {
            AssignedUnits fetched;
            try
            {
                fetched = m_registry->fetch_assigned_units(m_cfg.nodeAddress);
            }
            catch (const std::exception &e)
            {
                m_logger->logf(LogLevel::Warn, "sync", "poll failed: %s", e.what());
                std::lock_guard<std::mutex> lk(m_viewMu);
                ++m_stats.pollsFailed;
                return;
            }

            const UnitSet expanded = expand_in_shard(fetched.units, m_cfg.sharding);

            std::lock_guard<std::mutex> lk(m_stateMu);
            if (!m_accepting)
            {
                return;
            }

            std::vector<UnitKey> toRemove;
            for (const auto &key : m_units)
            {
                if (expanded.count(key) == 0)
                {
                    toRemove.push_back(key);
                }
            }
            std::vector<UnitKey> toAdd;
            for (const auto &key : expanded)
            {
                if (m_units.count(key) == 0)
                {
                    toAdd.push_back(key);
                }
            }

            for (const auto &key : toRemove)
            {
                m_units.erase(key);
            }
            for (const auto &key : toAdd)
            {
                m_units.insert(key);
            }
            publish_view_([&](Stats &st)
                          {
                              ++st.pollsSucceeded;
                              st.unitsAdded += toAdd.size();
                              st.unitsRemoved += toRemove.size();
                              st.lastWatermark = fetched.watermark; });

            for (const auto &key : toRemove)
            {
                notify_(m_callbacks.onUnitRemoved, key, ChangeType::Removed);
            }
            for (const auto &key : toAdd)
            {
                notify_(m_callbacks.onUnitAdded, key, ChangeType::Added);
            }

            if (!toAdd.empty() || !toRemove.empty())
            {
                m_logger->logf(LogLevel::Info, "sync", "poll at watermark=%llu: +%zu -%zu units, now %zu",
                               static_cast<unsigned long long>(fetched.watermark),
                               toAdd.size(), toRemove.size(), m_units.size());
            }
        }

        void apply_event_(const UnitMetadata &md, ChangeType change, Watermark wm)
        {
            const UnitSet keys = expand_in_shard(md, m_cfg.sharding);

            std::lock_guard<std::mutex> lk(m_stateMu);
            if (!m_accepting)
            {
                return;
            }

            std::vector<UnitKey> changed;
            for (const auto &key : keys)
            {
                const bool effective = change == ChangeType::Added ? m_units.insert(key).second
                                                                    : m_units.erase(key) != 0;
                if (effective)
                {
                    changed.push_back(key);
                }
            }
            const std::size_t applied = changed.size();
            publish_view_([&](Stats &st)
                          {
                              ++st.eventsApplied;
                              if (change == ChangeType::Added)
                              {
                                  st.unitsAdded += applied;
                              }
                              else
                              {
                                  st.unitsRemoved += applied;
                              }
                              st.lastWatermark = wm; });

            const auto &cb = change == ChangeType::Added ? m_callbacks.onUnitAdded : m_callbacks.onUnitRemoved;
            for (const auto &key : changed)
            {
                notify_(cb, key, change);
            }

            m_logger->logf(LogLevel::Debug, "sync", "event %s stream=%s watermark=%llu: %zu units changed",
                           change_type_name(change), md.streamId.c_str(),
                           static_cast<unsigned long long>(wm), applied);
        }

        // Called with m_stateMu held, after m_units has been updated.
        template <class StatsUpdate>
        void publish_view_(StatsUpdate &&update)
        {
            auto view = std::make_shared<const UnitSet>(m_units);
            std::lock_guard<std::mutex> lk(m_viewMu);
            m_view = std::move(view);
            update(m_stats);
        }

        // Called with m_stateMu held. A throwing consumer must not take down a worker.
        void notify_(const std::function<void(const UnitKey &)> &cb, const UnitKey &key, ChangeType change)
        {
            try
            {
                cb(key);
            }
            catch (const std::exception &e)
            {
                m_logger->logf(LogLevel::Error, "sync", "on-%s callback threw for %s: %s",
                               change_type_name(change), to_string(key).c_str(), e.what());
            }
        }

        SynchronizerConfig m_cfg;
        std::shared_ptr<IRegistryClient> m_registry;
        SynchronizerCallbacks m_callbacks;
        std::shared_ptr<Logger> m_logger;
        std::unique_ptr<AssignmentEventBridge> m_bridge;

        // Lock order: m_stateMu, then m_viewMu.
        std::mutex m_stateMu;
        UnitSet m_units;
        bool m_accepting = false;

        mutable std::mutex m_viewMu;
        std::shared_ptr<const UnitSet> m_view = std::make_shared<const UnitSet>();
        Stats m_stats{};

        std::mutex m_timerMu;
        std::condition_variable m_timerCv;
        bool m_stopRequested = false;
        std::thread m_pollThread;
    };
}

#include "assignment_synchronizer.hpp"
#include "registry.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace
{
    using namespace std::chrono_literals;

    const nodesync::NodeAddress kCluster = "0xAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA";

    // Two storage nodes share one registry address and split the units by shard.
    class StorageNode
    {
    public:
        StorageNode(std::uint32_t index, std::uint32_t count, std::shared_ptr<nodesync::InMemoryRegistry> registry)
            : m_name("node-" + std::to_string(index)),
              m_sync(make_config(index, count), std::move(registry),
                     nodesync::SynchronizerCallbacks{
                         [this](const nodesync::UnitKey &k)
                         { print("+", k); },
                         [this](const nodesync::UnitKey &k)
                         { print("-", k); },
                     })
        {
        }

        void start() { m_sync.start(); }
        void stop() { m_sync.destroy(); }

        std::size_t unit_count() const { return m_sync.get_assigned_units().size(); }
        const std::string &name() const { return m_name; }

    private:
        static nodesync::SynchronizerConfig make_config(std::uint32_t index, std::uint32_t count)
        {
            nodesync::SynchronizerConfig cfg;
            cfg.nodeAddress = kCluster;
            cfg.sharding = nodesync::ShardingParams{count, index};
            cfg.pollInterval = 200ms;
            cfg.logLevel = nodesync::LogLevel::Info;
            return cfg;
        }

        void print(const char *sign, const nodesync::UnitKey &k)
        {
            static std::mutex outMu;
            std::lock_guard<std::mutex> lk(outMu);
            std::cout << m_name << " " << sign << nodesync::to_string(k) << "\n";
        }

        std::string m_name;
        nodesync::AssignmentSynchronizer m_sync;
    };
}

int main()
{
    auto registry = std::make_shared<nodesync::InMemoryRegistry>();
    registry->put_stream(nodesync::UnitMetadata{"0x1234/sensors", 4});
    registry->put_stream(nodesync::UnitMetadata{"0x1234/logs", 2});
    registry->put_stream(nodesync::UnitMetadata{"0x5678/metrics", 3});

    registry->add_stream_to_node("0x1234/sensors", kCluster);

    StorageNode n0(0, 2, registry);
    StorageNode n1(1, 2, registry);
    n0.start();
    n1.start();
    std::this_thread::sleep_for(100ms);

    // Announced on the push feed.
    registry->add_stream_to_node("0x1234/logs", kCluster);
    std::this_thread::sleep_for(100ms);

    // Not announced: only the next poll picks this up.
    registry->set_assignments(kCluster, {"0x1234/logs", "0x5678/metrics"}, 100);
    std::this_thread::sleep_for(400ms);

    n0.stop();
    n1.stop();

    std::cout << n0.name() << " units=" << n0.unit_count() << "\n";
    std::cout << n1.name() << " units=" << n1.unit_count() << "\n";
    return 0;
}

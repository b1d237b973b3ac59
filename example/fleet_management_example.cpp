/*
 * fleet_management_example.cpp
 *
 * Copyright (C) 2024 The minerhub Authors
 */

/*************************************************

Date: 2024-12

Description: Example registering simulated miners and running pooled
operations against them

*************************************************/

#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "config/config.hpp"
#include "device/manager.hpp"
#include "logging/logger.hpp"

using namespace minerhub;
using namespace minerhub::device;

namespace {

// In-memory miner; accepts every pool and reports a fixed hashrate
class SimulatedSession : public MinerSession {
public:
    auto close() -> DeviceVoidResult override { return success(); }

    auto model(std::stop_token) -> DeviceResult<Model> override {
        return Model{"Simulated", "SIM-1", "simfw 1.0"};
    }

    auto stats(std::stop_token) -> DeviceResult<MinerStats> override {
        MinerStats stats;
        stats.model = Model{"Simulated", "SIM-1", "simfw 1.0"};
        stats.hashrate5s = 13500.0;
        stats.hashrateAvg = 13420.5;
        stats.tempMax = 71.0;
        stats.uptimeSec = 86400;
        return stats;
    }

    auto summary(std::stop_token) -> DeviceResult<MinerSummary> override {
        return MinerSummary{1200, 3, 0.01, 13500.0, 13420.5};
    }

    auto pools(std::stop_token) -> DeviceResult<std::vector<MiningPool>>
        override {
        return pools_;
    }

    auto addPool(std::stop_token, const std::string& url,
                 const std::string& user, const std::string&)
        -> DeviceVoidResult override {
        auto id = static_cast<int64_t>(pools_.size());
        pools_.push_back(MiningPool{id, url, user, id, pools_.empty()});
        return success();
    }

    auto enablePool(std::stop_token, int64_t) -> DeviceVoidResult override {
        return success();
    }
    auto disablePool(std::stop_token, int64_t) -> DeviceVoidResult override {
        return success();
    }
    auto removePool(std::stop_token, int64_t) -> DeviceVoidResult override {
        return failure(error::notImplemented("removePool"));
    }
    auto switchPool(std::stop_token, int64_t) -> DeviceVoidResult override {
        return success();
    }

    auto restart(std::stop_token) -> DeviceVoidResult override {
        return success();
    }
    auto quit(std::stop_token) -> DeviceVoidResult override {
        return success();
    }

    auto exec(std::stop_token, const std::string& command,
              const std::string&) -> DeviceResult<std::string> override {
        return std::string(R"({"STATUS":"S","command":")") + command + "\"}";
    }

    auto getPowerMode(std::stop_token) -> DeviceResult<PowerMode> override {
        return power_;
    }
    auto setPowerMode(std::stop_token, const PowerMode& mode)
        -> DeviceVoidResult override {
        power_ = mode;
        return success();
    }

    auto getFan(std::stop_token) -> DeviceResult<FanConfig> override {
        return fan_;
    }
    auto setFan(std::stop_token, const FanConfig& fan)
        -> DeviceVoidResult override {
        if (fan.mode == FanModeKind::Manual && fan.speedPct > 100) {
            return failure(error::invalidInput("fan speed above 100%"));
        }
        fan_ = fan;
        return success();
    }

private:
    std::vector<MiningPool> pools_;
    PowerMode power_;
    FanConfig fan_;
};

// Claims endpoints on the given port
class SimulatedDriver : public MinerDriver {
public:
    SimulatedDriver(std::string name, std::string port)
        : name_(std::move(name)), port_(std::move(port)) {}

    auto name() const -> std::string override { return name_; }

    auto detect(std::stop_token stop, const Endpoint& endpoint)
        -> DeviceResult<bool> override {
        if (stop.stop_requested()) {
            return failure<bool>(error::timeout("detect cancelled"));
        }
        auto pos = endpoint.address.rfind(':');
        return pos != std::string::npos &&
               endpoint.address.substr(pos + 1) == port_;
    }

    auto capabilities() const -> Capability override {
        Capability caps;
        caps.readStats = true;
        caps.readSummary = true;
        caps.listPools = true;
        caps.managePools = true;
        caps.restart = true;
        caps.commands = {"summary", "stats", "pools"};
        caps.fanControl = true;
        caps.powerControl = true;
        caps.supportedPowerModes = {PowerModeKind::Low,
                                    PowerModeKind::Balanced,
                                    PowerModeKind::High};
        return caps;
    }

    auto open(std::stop_token, const Endpoint&)
        -> DeviceResult<std::shared_ptr<MinerSession>> override {
        return std::make_shared<SimulatedSession>();
    }

private:
    std::string name_;
    std::string port_;
};

}  // namespace

int main(int argc, char* argv[]) {
    auto cfg = config::MinerHubConfig::load(argc > 1 ? argv[1]
                                                     : "minerhub.json");
    cfg.validate();

    auto logger = logging::createLogger(cfg.logging);

    auto registry = std::make_shared<DriverRegistry>(logger);
    registry->registerDriver(std::make_shared<SimulatedDriver>("cgminer", "4028"));
    registry->registerDriver(std::make_shared<SimulatedDriver>("luci", "80"));

    auto manager = DeviceManager::create(registry, cfg, logger);
    std::stop_source shutdown;

    if (cfg.manager.autoCleanup) {
        manager->startCleanup(shutdown.get_token(),
                              std::chrono::milliseconds(
                                  cfg.manager.cleanupIntervalMs));
    }

    std::cout << "=== Registering miners ===\n";
    for (const auto& [id, address] :
         std::vector<std::pair<std::string, std::string>>{
             {"rack1-s9", "192.168.1.10:4028"},
             {"rack1-m30", "192.168.1.11:80"},
             {"rack2-unknown", "192.168.1.12:9999"}}) {
        auto result = manager->addOrDetect(shutdown.get_token(), id,
                                           Endpoint{address});
        if (!result) {
            std::cout << id << ": " << result.error().toString() << "\n";
        }
    }
    for (const auto& info : manager->deviceInfos()) {
        std::cout << info.toJson().dump() << "\n";
    }

    std::cout << "\n=== Reading stats ===\n";
    for (const auto& device : manager->list()) {
        auto result = manager->withSession(
            shutdown.get_token(), device.id, [&](MinerSession& session) {
                auto stats = session.stats(shutdown.get_token());
                if (!stats) {
                    return failure(stats.error());
                }
                std::cout << device.id << ": " << stats->toJson().dump()
                          << "\n";
                return success();
            });
        if (!result) {
            std::cout << device.id << ": " << result.error().toString()
                      << "\n";
        }
    }

    std::cout << "\n=== Managing pools ===\n";
    auto added = manager->withSession(
        shutdown.get_token(), "rack1-s9", [&](MinerSession& session) {
            auto token = shutdown.get_token();
            if (auto r = session.addPool(token, "stratum+tcp://pool.example:3333",
                                         "worker1", "x");
                !r) {
                return r;
            }
            auto pools = session.pools(token);
            if (!pools) {
                return failure(pools.error());
            }
            for (const auto& pool : *pools) {
                std::cout << pool.toJson().dump() << "\n";
            }
            return session.removePool(token, 0);
        });
    if (!added) {
        std::cout << "pool update: " << added.error().toString() << "\n";
    }

    std::cout << "\n=== Concurrent checkouts ===\n";
    std::vector<std::jthread> workers;
    for (int i = 0; i < 4; ++i) {
        workers.emplace_back([&manager, &shutdown, &logger] {
            for (int n = 0; n < 25; ++n) {
                auto result = manager->withSession(
                    shutdown.get_token(), "rack1-m30",
                    [](MinerSession& session) {
                        auto fan = session.getFan({});
                        return fan ? success() : failure(fan.error());
                    });
                if (!result) {
                    logger->warn("Checkout failed: {}",
                                 result.error().toString());
                }
            }
        });
    }
    workers.clear();

    for (const auto& [id, stats] : manager->getPoolStats()) {
        std::cout << id << ": " << stats.toJson().dump() << "\n";
    }

    shutdown.request_stop();
    manager->close();
    return 0;
}

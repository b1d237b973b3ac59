/*
 * types.hpp
 *
 * Copyright (C) 2024 The minerhub Authors
 */

/*************************************************

Date: 2024-12

Description: Value types shared by miner drivers, sessions and the manager

**************************************************/

#ifndef MINERHUB_DEVICE_TYPES_HPP
#define MINERHUB_DEVICE_TYPES_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace minerhub::device {

using json = nlohmann::json;

/**
 * @brief Stable identifier for a miner instance
 */
using DeviceId = std::string;

/**
 * @brief How to reach a device (host:port or URL, depending on driver)
 */
struct Endpoint {
    std::string address;

    auto operator==(const Endpoint&) const -> bool = default;
};

enum class PowerModeKind { Low, Balanced, High, Custom };

[[nodiscard]] inline auto powerModeKindToString(PowerModeKind kind)
    -> std::string {
    switch (kind) {
        case PowerModeKind::Low: return "low";
        case PowerModeKind::Balanced: return "balanced";
        case PowerModeKind::High: return "high";
        case PowerModeKind::Custom: return "custom";
    }
    return "balanced";
}

[[nodiscard]] inline auto powerModeKindFromString(const std::string& str)
    -> PowerModeKind {
    if (str == "low") return PowerModeKind::Low;
    if (str == "high") return PowerModeKind::High;
    if (str == "custom") return PowerModeKind::Custom;
    return PowerModeKind::Balanced;
}

enum class FanModeKind { Auto, Manual };

[[nodiscard]] inline auto fanModeKindToString(FanModeKind kind) -> std::string {
    return kind == FanModeKind::Manual ? "manual" : "auto";
}

[[nodiscard]] inline auto fanModeKindFromString(const std::string& str)
    -> FanModeKind {
    return str == "manual" ? FanModeKind::Manual : FanModeKind::Auto;
}

/**
 * @brief Static feature flags a driver exposes
 */
struct Capability {
    bool readStats = false;
    bool readSummary = false;
    bool listPools = false;
    bool managePools = false;  // add/enable/disable/remove/switch
    bool restart = false;
    bool quit = false;
    std::vector<std::string> commands;  // supported raw commands, may be empty
    bool fanControl = false;
    bool powerControl = false;
    std::vector<PowerModeKind> supportedPowerModes;

    [[nodiscard]] auto supportsCommand(const std::string& command) const
        -> bool {
        for (const auto& c : commands) {
            if (c == command) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] auto toJson() const -> json {
        json j;
        j["readStats"] = readStats;
        j["readSummary"] = readSummary;
        j["listPools"] = listPools;
        j["managePools"] = managePools;
        j["restart"] = restart;
        j["quit"] = quit;
        j["commands"] = commands;
        j["fanControl"] = fanControl;
        j["powerControl"] = powerControl;
        json modes = json::array();
        for (auto mode : supportedPowerModes) {
            modes.push_back(powerModeKindToString(mode));
        }
        j["supportedPowerModes"] = modes;
        return j;
    }
};

/**
 * @brief Miner model/vendor/firmware tuple
 */
struct Model {
    std::string vendor;    // e.g. Bitmain, Whatsminer
    std::string product;   // e.g. S9, M30S
    std::string firmware;  // e.g. BMminer 2.0, BraiinsOS

    [[nodiscard]] auto toJson() const -> json {
        return {{"vendor", vendor}, {"product", product}, {"firmware", firmware}};
    }

    static auto fromJson(const json& j) -> Model {
        Model model;
        model.vendor = j.value("vendor", "");
        model.product = j.value("product", "");
        model.firmware = j.value("firmware", "");
        return model;
    }
};

/**
 * @brief Generic device metrics snapshot
 */
struct MinerStats {
    Model model;
    double hashrate5s = 0.0;   // GH/s, 5s window
    double hashrateAvg = 0.0;  // GH/s average
    double tempMax = 0.0;
    int64_t uptimeSec = 0;

    [[nodiscard]] auto toJson() const -> json {
        json j;
        j["model"] = model.toJson();
        j["hashrate5s"] = hashrate5s;
        j["hashrateAvg"] = hashrateAvg;
        j["tempMax"] = tempMax;
        j["uptimeSec"] = uptimeSec;
        return j;
    }

    static auto fromJson(const json& j) -> MinerStats {
        MinerStats stats;
        if (j.contains("model")) {
            stats.model = Model::fromJson(j.at("model"));
        }
        stats.hashrate5s = j.value("hashrate5s", 0.0);
        stats.hashrateAvg = j.value("hashrateAvg", 0.0);
        stats.tempMax = j.value("tempMax", 0.0);
        stats.uptimeSec = j.value("uptimeSec", int64_t{0});
        return stats;
    }
};

/**
 * @brief High-level miner summary
 */
struct MinerSummary {
    int64_t accepted = 0;
    int64_t rejected = 0;
    double deviceHardwarePercent = 0.0;
    double ghs5s = 0.0;
    double ghsAvg = 0.0;

    [[nodiscard]] auto toJson() const -> json {
        json j;
        j["accepted"] = accepted;
        j["rejected"] = rejected;
        j["deviceHardwarePercent"] = deviceHardwarePercent;
        j["ghs5s"] = ghs5s;
        j["ghsAvg"] = ghsAvg;
        return j;
    }

    static auto fromJson(const json& j) -> MinerSummary {
        MinerSummary summary;
        summary.accepted = j.value("accepted", int64_t{0});
        summary.rejected = j.value("rejected", int64_t{0});
        summary.deviceHardwarePercent = j.value("deviceHardwarePercent", 0.0);
        summary.ghs5s = j.value("ghs5s", 0.0);
        summary.ghsAvg = j.value("ghsAvg", 0.0);
        return summary;
    }
};

/**
 * @brief A mining pool configured on the device
 */
struct MiningPool {
    int64_t id = 0;
    std::string url;
    std::string user;
    int64_t priority = 0;
    bool active = false;

    [[nodiscard]] auto toJson() const -> json {
        return {{"id", id},
                {"url", url},
                {"user", user},
                {"priority", priority},
                {"active", active}};
    }

    static auto fromJson(const json& j) -> MiningPool {
        MiningPool pool;
        pool.id = j.value("id", int64_t{0});
        pool.url = j.value("url", "");
        pool.user = j.value("user", "");
        pool.priority = j.value("priority", int64_t{0});
        pool.active = j.value("active", false);
        return pool;
    }
};

struct PowerMode {
    PowerModeKind kind = PowerModeKind::Balanced;
    int watts = 0;      // optional target watts
    int voltageMv = 0;  // optional millivolts
    int freqMhz = 0;    // optional MHz per chain

    [[nodiscard]] auto toJson() const -> json {
        return {{"kind", powerModeKindToString(kind)},
                {"watts", watts},
                {"voltageMv", voltageMv},
                {"freqMhz", freqMhz}};
    }

    static auto fromJson(const json& j) -> PowerMode {
        PowerMode mode;
        mode.kind = powerModeKindFromString(j.value("kind", "balanced"));
        mode.watts = j.value("watts", 0);
        mode.voltageMv = j.value("voltageMv", 0);
        mode.freqMhz = j.value("freqMhz", 0);
        return mode;
    }
};

struct FanConfig {
    FanModeKind mode = FanModeKind::Auto;
    int speedPct = 0;  // valid when mode is Manual, 0..100

    [[nodiscard]] auto toJson() const -> json {
        return {{"mode", fanModeKindToString(mode)}, {"speedPct", speedPct}};
    }

    static auto fromJson(const json& j) -> FanConfig {
        FanConfig fan;
        fan.mode = fanModeKindFromString(j.value("mode", "auto"));
        fan.speedPct = j.value("speedPct", 0);
        return fan;
    }
};

/**
 * @brief Flattened device description for API responses
 */
struct DeviceInfo {
    std::string id;
    std::string address;
    std::string driver;

    [[nodiscard]] auto toJson() const -> json {
        return {{"id", id}, {"address", address}, {"driver", driver}};
    }
};

}  // namespace minerhub::device

#endif  // MINERHUB_DEVICE_TYPES_HPP

#include "kernel/Presets.h"
#include "modules/ResourceDynamics.h"

#include <cctype>
#include <stdexcept>
#include <string>

namespace {
    constexpr double kModelWeight = 40.0;

    std::string normalize(const std::string& raw) {
        std::string normalized;
        normalized.reserve(raw.size());
        for (unsigned char ch : raw) {
            if (std::isalnum(ch)) {
                normalized.push_back(static_cast<char>(std::tolower(ch)));
            }
        }
        return normalized;
    }

    // gamma* = q* of a task when the population is spread evenly
    double symmetricReferenceLevel(const EngineConfig& cfg) {
        ResourceDynamics dynamics;
        dynamics.configure(std::vector<TaskParams>(cfg.tasks, TaskParams{}), cfg.integrationStep);
        const auto level = dynamics.equilibriumLevel(0, 1.0 / static_cast<double>(cfg.tasks));
        if (!level) {
            throw std::logic_error("symmetric equilibrium unreachable for default task parameters");
        }
        return *level;
    }
}

const std::vector<std::string>& presetNames() {
    static const std::vector<std::string> names = {"baseline", "surge", "failures", "modelbased"};
    return names;
}

std::string canonicalPresetName(const std::string& name) {
    const std::string normalized = normalize(name);
    if (normalized.empty() || normalized == "baseline" || normalized == "default") {
        return "baseline";
    }
    if (normalized == "surge" || normalized == "growthsurge") {
        return "surge";
    }
    if (normalized == "failures" || normalized == "failure" || normalized == "robotfailure") {
        return "failures";
    }
    if (normalized == "modelbased" || normalized == "model") {
        return "modelbased";
    }
    return "";
}

EngineConfig presetConfig(const std::string& name) {
    const std::string canonical = canonicalPresetName(name);
    if (canonical.empty()) {
        throw std::invalid_argument("unknown preset '" + name + "'");
    }

    EngineConfig cfg;
    if (canonical == "surge") {
        cfg.scenario.surges.push_back(GrowthSurge{});
    } else if (canonical == "failures") {
        cfg.scenario.failures.push_back(FailureWave{});
    } else if (canonical == "modelbased") {
        cfg.nu = kModelWeight;
        cfg.referenceLevel = symmetricReferenceLevel(cfg);
    }
    return cfg;
}

bool applyConfigOverride(const std::string& arg, EngineConfig& cfg) {
    if (arg.rfind("--seed=", 0) == 0) {
        cfg.seed = std::stoull(arg.substr(7));
    } else if (arg.rfind("--agents=", 0) == 0) {
        cfg.agents = static_cast<std::uint32_t>(std::stoul(arg.substr(9)));
    } else if (arg.rfind("--nu=", 0) == 0) {
        cfg.nu = std::stod(arg.substr(5));
    } else if (arg.rfind("--horizon=", 0) == 0) {
        cfg.horizon = std::stod(arg.substr(10));
    } else {
        return false;
    }
    return true;
}

EngineConfig resolveConfig(const std::string& preset, const std::vector<std::string>& overrides) {
    EngineConfig cfg = presetConfig(preset);
    for (const auto& arg : overrides) {
        if (!applyConfigOverride(arg, cfg)) {
            throw std::invalid_argument("unknown option '" + arg + "'");
        }
    }
    return cfg;
}

#include "sociograph/config/EngineConfig.h"
#include "sociograph/common/Logger.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace sociograph {

namespace {

void readNumber(const json& j, const char* key, double& out) {
    if (j.contains(key) && j[key].is_number()) {
        out = j[key].get<double>();
    }
}

void readCount(const json& j, const char* key, std::size_t& out) {
    if (j.contains(key) && j[key].is_number_unsigned()) {
        out = j[key].get<std::size_t>();
    }
}

void readFlag(const json& j, const char* key, bool& out) {
    if (j.contains(key) && j[key].is_boolean()) {
        out = j[key].get<bool>();
    }
}

json layoutToJson(const ForceLayoutOptions& layout) {
    json j;
    j["repulsion"] = layout.repulsion;
    j["attraction"] = layout.attraction;
    j["springLength"] = layout.springLength;
    j["weightModulation"] = layout.weightModulation;
    j["gravity"] = layout.gravity;
    j["damping"] = layout.damping;
    j["minDistance"] = layout.minDistance;
    j["maxVelocity"] = layout.maxVelocity;
    j["initialTemperature"] = layout.initialTemperature;
    j["coolingRate"] = layout.coolingRate;
    j["minTemperature"] = layout.minTemperature;
    j["iterations"] = layout.iterations;
    return j;
}

void layoutFromJson(const json& j, ForceLayoutOptions& layout) {
    readNumber(j, "repulsion", layout.repulsion);
    readNumber(j, "attraction", layout.attraction);
    readNumber(j, "springLength", layout.springLength);
    readFlag(j, "weightModulation", layout.weightModulation);
    readNumber(j, "gravity", layout.gravity);
    readNumber(j, "damping", layout.damping);
    readNumber(j, "minDistance", layout.minDistance);
    readNumber(j, "maxVelocity", layout.maxVelocity);
    readNumber(j, "initialTemperature", layout.initialTemperature);
    readNumber(j, "coolingRate", layout.coolingRate);
    readNumber(j, "minTemperature", layout.minTemperature);
    readCount(j, "iterations", layout.iterations);
}

}  // namespace

std::string EngineConfigSerializer::toJson(const EngineConfig& config) {
    json j;
    j["layout"] = layoutToJson(config.layout);
    j["algorithms"] = {
        {"heuristicScale", config.algorithms.heuristicScale},
        {"defaultTopK", config.algorithms.defaultTopK},
    };
    return j.dump(2);
}

EngineConfig EngineConfigSerializer::fromJson(const std::string& jsonStr) {
    EngineConfig config;

    try {
        json j = json::parse(jsonStr);

        if (j.contains("layout") && j["layout"].is_object()) {
            layoutFromJson(j["layout"], config.layout);
        }
        if (j.contains("algorithms") && j["algorithms"].is_object()) {
            const json& aj = j["algorithms"];
            readNumber(aj, "heuristicScale", config.algorithms.heuristicScale);
            readCount(aj, "defaultTopK", config.algorithms.defaultTopK);
        }
    } catch (const json::exception& e) {
        LOG_WARN("Invalid engine config, using defaults: {}", e.what());
        return {};
    }

    return config;
}

bool EngineConfigSerializer::loadFromFile(const std::string& path, EngineConfig& out) {
    std::ifstream file(path);
    if (!file) {
        LOG_WARN("Cannot open engine config '{}'", path);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    const std::string text = buffer.str();

    if (!json::accept(text)) {
        LOG_WARN("Engine config '{}' is not valid JSON", path);
        return false;
    }

    out = fromJson(text);
    LOG_INFO("Loaded engine config from '{}'", path);
    return true;
}

bool EngineConfigSerializer::saveToFile(const std::string& path, const EngineConfig& config) {
    std::ofstream file(path);
    if (!file) {
        LOG_WARN("Cannot write engine config '{}'", path);
        return false;
    }
    file << toJson(config);
    return static_cast<bool>(file);
}

}  // namespace sociograph

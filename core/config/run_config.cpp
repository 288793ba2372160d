#include "config/run_config.h"

#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace firewatch {

RunConfig RunConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open run config: " + path);
    }

    RunConfig config;
    try {
        auto json = nlohmann::json::parse(file);
        if (!json.is_object()) {
            throw std::runtime_error("run config must be a JSON object: " + path);
        }

        config.rules_path = json.value("rules", config.rules_path);
        config.records_path = json.value("records", config.records_path);
        config.log_path = json.value("log", config.log_path);
        config.workers = json.value("workers", config.workers);
        config.matches_only = json.value("matches_only", config.matches_only);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("invalid run config " + path + ": " + e.what());
    }

    return config;
}

} // namespace firewatch

#pragma once

#include "ConfigData.hpp"

#include <set>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>


namespace YAML {

    inline void check_unknown_keys(const YAML::Node& node, const std::set<std::string>& valid_keys, const std::string& context) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            if (valid_keys.find(key) == valid_keys.end()) {
                throw std::runtime_error("Unknown configuration key in " + context + ": " + key);
            }
        }
    }

    template<>
    struct convert<RunnerConfig> {
        static bool decode(const Node& node, RunnerConfig& rhs) {
            // Detect unknown configuration keys
            static const std::set<std::string> valid_keys = {"max_steps"};
            check_unknown_keys(node, valid_keys, "runner");

            if (node["max_steps"]) {
                const auto value = node["max_steps"].as<long long>();
                if (value <= 0) {
                    throw std::runtime_error("runner.max_steps must be a positive integer, got " + std::to_string(value) + ".");
                }
                rhs.max_steps = static_cast<size_t>(value);
            }
            return true;
        }
    };

    template<>
    struct convert<LogConfig> {
        static bool decode(const Node& node, LogConfig& rhs) {
            static const std::set<std::string> valid_keys = {
                "level", "file", "max_file_size", "max_files"
            };
            check_unknown_keys(node, valid_keys, "log");

            if (node["level"]) {
                rhs.level = LogUtils::parse_level(node["level"].as<std::string>());
            }
            if (node["file"]) {
                rhs.file = node["file"].as<std::string>();
                if (rhs.file.empty()) {
                    throw std::runtime_error("log.file must not be empty.");
                }
            }
            if (node["max_file_size"]) {
                rhs.max_file_size = node["max_file_size"].as<size_t>();
            }
            if (node["max_files"]) {
                rhs.max_files = node["max_files"].as<size_t>();
            }
            return true;
        }
    };

}

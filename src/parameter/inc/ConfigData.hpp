#pragma once

#include "GeneratorRunner.hpp"
#include "LogUtils.hpp"
#include <cstddef>
#include <string>
#include <vector>

struct RunnerConfig {
    size_t max_steps = RunOptions::DEFAULT_MAX_STEPS;

    RunOptions to_run_options() const {
        RunOptions options;
        options.max_steps = max_steps;
        return options;
    }
};

struct LogConfig {
    LogUtils::Level level = LogUtils::Level::Info;
    std::string file = "log/stepgen.log";
    size_t max_file_size = 1024 * 1024 * 5;
    size_t max_files = 3;
};

// Top-level config
struct ConfigData {
    RunnerConfig runner;
    LogConfig log;
    bool verbose = false;
    std::string config_file;
    std::vector<std::string> fixture_files;   // Positional arguments
};

#include "ParameterContext.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

#ifndef STEPGEN_VERSION
#define STEPGEN_VERSION "1.0.0"
#endif

ParameterContext::ParameterContext() {}

// Define static member variable
const std::vector<ParameterContext::CommandOption> ParameterContext::valid_options = {
    {"--config-file", 'c', "Specify config file path", true},
    {"--max-steps", 'm', "Maximum number of steps a replayed sequence may hold", true},
    {"--verbose", 'v', "Increase output verbosity", false},
    {"--version", 'V', "Output version information", false},
    {"--help", '?', "Display this help message", false}
};

void ParameterContext::show_help() {
    std::cout << "Usage: stepgen [OPTIONS]... [FIXTURE.json]...\n\n"
              << "Validates persisted step sequence files and replays their steps\n"
              << "through the step builder and validator under the step limit.\n\n"
              << "Options:\n";

    // Calculate the longest option length for alignment
    size_t max_opt_len = 0;
    for (const auto& opt : valid_options) {
        size_t total_len = 4 + opt.long_opt.length(); // 4 = length of "-X, "
        max_opt_len = std::max(max_opt_len, total_len);
    }

    // Reserve fixed space for VALUE
    const size_t value_width = 8;
    const size_t desc_offset = max_opt_len + value_width;

    for (const auto& opt : valid_options) {
        std::cout << "  -" << opt.short_opt << ", " << opt.long_opt;

        size_t current_len = 4 + opt.long_opt.length();

        if (opt.requires_value) {
            std::cout << "=VALUE";
            current_len += 6;
        }

        size_t padding = desc_offset - current_len;
        std::cout << std::string(padding, ' ');

        std::cout << opt.description << "\n";
    }

    std::cout << "\nExamples:\n"
              << "  stepgen fixtures/binary-search.json\n"
              << "  stepgen --config-file=conf/stepgen.yaml -v fixtures/*.json\n"
              << "  stepgen --max-steps=500 fixtures/bubble-sort.json\n\n";
}

void ParameterContext::show_version() {
    std::cout << "stepgen version: " << STEPGEN_VERSION << std::endl;
}

size_t ParameterContext::parse_max_steps(const std::string& value, const std::string& source) {
    std::string trimmed = value;
    StringUtils::trim(trimmed);

    bool all_digits = !trimmed.empty() && std::all_of(trimmed.begin(), trimmed.end(),
        [](unsigned char ch) { return std::isdigit(ch); });
    if (!all_digits) {
        throw std::runtime_error("Invalid max steps from " + source + ": " + value);
    }

    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(trimmed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid max steps from " + source + ": " + value);
    }

    if (parsed == 0) {
        throw std::runtime_error("Max steps from " + source + " must be a positive integer, got " + value);
    }
    return static_cast<size_t>(parsed);
}

void ParameterContext::merge_yaml(const YAML::Node& config) {
    if (!config || config.IsNull()) {
        return;
    }

    // Detect unknown configuration keys
    static const std::set<std::string> valid_keys = {"runner", "log"};
    YAML::check_unknown_keys(config, valid_keys, "config");

    if (config["runner"]) {
        config_data.runner = config["runner"].as<RunnerConfig>();
    }

    if (config["log"]) {
        config_data.log = config["log"].as<LogConfig>();
    }
}

void ParameterContext::merge_yaml(const std::string& file_path) {
    try {
        YAML::Node config = YAML::LoadFile(file_path);
        config_data.config_file = file_path;
        merge_yaml(config);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse YAML file '" + file_path + "': " + e.what());
    } catch (const std::exception& e) {
        throw std::runtime_error("Error processing YAML file '" + file_path + "': " + e.what());
    }
}

void ParameterContext::merge_yaml() {
    // Without --config-file the built-in defaults stay in place
    if (cli_params.count("--config-file")) {
        merge_yaml(cli_params["--config-file"]);
    }
}

void ParameterContext::parse_commandline(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string key, value;

        // Handle long option format (--key=value)
        if (arg.substr(0, 2) == "--") {
            size_t pos = arg.find('=');
            if (pos != std::string::npos) {
                key = arg.substr(0, pos);
                value = arg.substr(pos + 1);
            } else {
                key = arg;
                value = "";
            }

            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [&key](const CommandOption& opt) { return opt.long_opt == key; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + key);
            }

            if (it->requires_value && pos == std::string::npos) {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Option requires a value: " + key);
                }
                value = argv[++i];
            }

            cli_params[key] = value;
        }
        // Handle short option format (-k value)
        else if (arg.size() > 1 && arg[0] == '-') {
            if (arg.length() != 2) {
                throw std::runtime_error("Invalid short option format '" + arg + "'. Must be single character after '-'");
            }

            char short_opt = arg[1];
            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [short_opt](const CommandOption& opt) { return opt.short_opt == short_opt; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + arg);
            }

            key = it->long_opt;
            if (it->requires_value) {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Option requires a value: " + key);
                }
                value = argv[++i];
            }

            cli_params[key] = value;
        }
        else {
            positional_args.push_back(arg);
        }
    }
}

void ParameterContext::merge_commandline() {
    if (cli_params.count("--max-steps")) {
        config_data.runner.max_steps = parse_max_steps(cli_params["--max-steps"], "--max-steps");
    }

    if (cli_params.count("--verbose")) {
        config_data.verbose = true;
        config_data.log.level = LogUtils::Level::Debug;
    }

    config_data.fixture_files = positional_args;
}

void ParameterContext::merge_environment_vars() {
    if (const char* env_value = std::getenv("STEPGEN_MAX_STEPS")) {
        config_data.runner.max_steps = parse_max_steps(env_value, "STEPGEN_MAX_STEPS");
    }

    if (const char* env_value = std::getenv("STEPGEN_LOG_LEVEL")) {
        config_data.log.level = LogUtils::parse_level(env_value);
    }
}

bool ParameterContext::init(int argc, char* argv[]) {
    parse_commandline(argc, argv);

    if (cli_params.count("--help")) {
        show_help();
        return false;
    } else if (cli_params.count("--version")) {
        show_version();
        return false;
    }

    // Merge by priority from low to high
    merge_yaml();
    merge_environment_vars();
    merge_commandline();
    return true;
}

const ConfigData& ParameterContext::get_config_data() const {
    return config_data;
}

const RunnerConfig& ParameterContext::get_runner_config() const {
    return config_data.runner;
}

const LogConfig& ParameterContext::get_log_config() const {
    return config_data.log;
}

RunOptions ParameterContext::get_run_options() const {
    return config_data.runner.to_run_options();
}

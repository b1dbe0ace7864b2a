#pragma once

#include "ConfigParser.hpp"
#include "ConfigData.hpp"

#include <unordered_map>
#include <vector>
#include <string>


class ParameterContext {
public:
    ParameterContext();

    bool init(int argc, char* argv[]);
    void show_help();
    void show_version();

    // Merge parameter sources
    void parse_commandline(int argc, char* argv[]);
    void merge_commandline();
    void merge_environment_vars();
    void merge_yaml(const YAML::Node& config);
    void merge_yaml(const std::string& file_path);
    void merge_yaml();

    const ConfigData& get_config_data() const;
    const RunnerConfig& get_runner_config() const;
    const LogConfig& get_log_config() const;
    RunOptions get_run_options() const;

private:
    ConfigData config_data; // Top-level config data

    // Command line storage
    std::unordered_map<std::string, std::string> cli_params;
    std::vector<std::string> positional_args;

    static size_t parse_max_steps(const std::string& value, const std::string& source);

private:
    // Command option structure definition
    struct CommandOption {
        std::string long_opt;    // Long option (e.g. "--max-steps")
        char short_opt;          // Short option (e.g. 'm')
        std::string description; // Option description
        bool requires_value;     // Whether value is required
    };

    // List of valid command options
    static const std::vector<CommandOption> valid_options;
};

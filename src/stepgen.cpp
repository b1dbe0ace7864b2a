#include "GeneratorError.hpp"
#include "GeneratorRunner.hpp"
#include "LogUtils.hpp"
#include "ParameterContext.hpp"
#include "StepSequence.hpp"
#include "StepSequenceDocumentValidator.hpp"
#include <iostream>

// Returns true when the fixture at path is a valid StepSequence document
// and its steps still pass the runtime checks under the configured limits
static bool validate_fixture(const std::string& path, const RunOptions& options) {
    nlohmann::json document;
    try {
        document = load_step_sequence_document(path);
    } catch (const std::exception& e) {
        LogUtils::error("{}", e.what());
        return false;
    }

    ValidationResult result = StepSequenceDocumentValidator::validate(document);
    if (!result.valid) {
        LogUtils::error("{}: {} error(s)", path, result.errors.size());
        for (const auto& error : result.errors) {
            LogUtils::error("  {}", error);
        }
        return false;
    }

    try {
        StepSequence replayed = replay_step_sequence(document.get<StepSequence>(), options);
        LogUtils::info("{}: valid ({} steps)", path, replayed.steps.size());
    } catch (const GeneratorError& e) {
        LogUtils::error("{}: replay failed: {}", path, e.what());
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    int result = 0;

    try {
        ParameterContext context;

        if (!context.init(argc, argv)) {
            return 0;
        }

        const ConfigData& config = context.get_config_data();
        const LogConfig& log = config.log;

        LogUtils::LoggerGuard guard(log.level, log.file, log.max_file_size, log.max_files);
        const RunOptions options = context.get_run_options();
        LogUtils::debug("Configuration loaded (max_steps={}, log_level={})",
                        options.max_steps, LogUtils::level_name(log.level));

        if (config.fixture_files.empty()) {
            LogUtils::error("No fixture files given");
            LogUtils::error("Use --help or -? to show usage information");
            return 1;
        }

        size_t failed = 0;
        for (const auto& path : config.fixture_files) {
            if (!validate_fixture(path, options)) {
                ++failed;
            }
        }

        if (failed > 0) {
            LogUtils::error("{} of {} fixture(s) failed validation", failed, config.fixture_files.size());
            result = 1;
        } else {
            LogUtils::info("All {} fixture(s) are valid", config.fixture_files.size());
        }

    } catch (const std::exception& e) {
        LogUtils::error("Error: " + std::string(e.what()));
        LogUtils::error("Use --help or -? to show usage information");
        result = 1;
    }

    return result;
}

#pragma once

#include "StepProducer.hpp"
#include "StepSequence.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>

struct RunOptions {
    static constexpr size_t DEFAULT_MAX_STEPS = 10000;

    // Upper bound on emitted steps before the run is aborted
    size_t max_steps = DEFAULT_MAX_STEPS;
};

// Drives one producer to completion and packages the validated result.
// Every call owns its accumulator and builder; nothing is shared between
// runs. Any failure throws GeneratorError and no sequence is returned.
class GeneratorRunner {
public:
    explicit GeneratorRunner(RunOptions options = RunOptions{}) : options_(options) {}

    StepSequence run(const GeneratorDefinition& definition, const nlohmann::json& inputs) const;

    const RunOptions& options() const { return options_; }

private:
    RunOptions options_;
};

StepSequence run_generator(const GeneratorDefinition& definition,
                           const nlohmann::json& inputs,
                           const RunOptions& options = RunOptions{});

// Re-runs the steps of an existing sequence through a fresh builder and
// validator under the given limits. Throws GeneratorError on the first
// violation; the returned sequence carries a new generatedAt.
StepSequence replay_step_sequence(const StepSequence& sequence,
                                  const RunOptions& options = RunOptions{});

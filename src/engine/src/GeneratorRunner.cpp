#include "GeneratorRunner.hpp"
#include "GeneratorError.hpp"
#include "SequenceValidator.hpp"
#include "LogUtils.hpp"
#include "TimestampUtils.hpp"
#include <deque>
#include <iterator>
#include <memory>
#include <vector>

StepSequence GeneratorRunner::run(const GeneratorDefinition& definition, const nlohmann::json& inputs) const {
    const std::string& algorithm_id = definition.id;
    const size_t max_steps = options_.max_steps;

    if (max_steps == 0) {
        throw GeneratorError(algorithm_id, GeneratorError::NO_STEP,
            "max_steps must be a positive integer (got 0).");
    }

    LogUtils::debug("Running generator {} (max_steps={})", algorithm_id, max_steps);

    std::deque<Step> accumulated;
    StepBuilder builder(algorithm_id, accumulated, max_steps);

    try {
        if (!definition.create) {
            throw GeneratorError(algorithm_id, GeneratorError::NO_STEP,
                "Generator has no producer factory.");
        }

        std::unique_ptr<StepProducer> producer = definition.create(inputs);
        if (!producer) {
            throw GeneratorError(algorithm_id, GeneratorError::NO_STEP,
                "Producer factory returned no producer.");
        }

        while (producer->resume(builder)) {
            // The producer suspended and wants another pull
            if (accumulated.size() >= max_steps) {
                throw GeneratorError(algorithm_id,
                                     static_cast<int64_t>(accumulated.size()) - 1,
                                     StepBuilder::step_limit_message(max_steps));
            }
        }
    } catch (const GeneratorError&) {
        throw;
    } catch (const std::exception& e) {
        throw GeneratorError(algorithm_id, static_cast<int64_t>(accumulated.size()),
            std::string("Generator threw an unexpected error: ") + e.what(),
            std::current_exception());
    } catch (...) {
        throw GeneratorError(algorithm_id, static_cast<int64_t>(accumulated.size()),
            "Generator threw an unexpected non-standard exception.",
            std::current_exception());
    }

    std::vector<Step> steps(std::make_move_iterator(accumulated.begin()),
                            std::make_move_iterator(accumulated.end()));

    SequenceValidator::validate(algorithm_id, steps);

    StepSequence sequence;
    sequence.format_version = STEP_FORMAT_VERSION;
    sequence.algorithm_id = algorithm_id;
    sequence.inputs = inputs;
    sequence.steps = std::move(steps);
    sequence.generated_at = TimestampUtils::now_iso8601();
    sequence.generated_by = STEPGEN_GENERATED_BY;

    LogUtils::info("Generator {} produced {} steps", algorithm_id, sequence.steps.size());
    return sequence;
}

StepSequence run_generator(const GeneratorDefinition& definition,
                           const nlohmann::json& inputs,
                           const RunOptions& options) {
    return GeneratorRunner(options).run(definition, inputs);
}

StepSequence replay_step_sequence(const StepSequence& sequence, const RunOptions& options) {
    std::vector<StepInput> inputs;
    inputs.reserve(sequence.steps.size());
    for (const auto& step : sequence.steps) {
        StepInput input;
        input.id = step.id;
        input.title = step.title;
        input.explanation = step.explanation;
        input.state = step.state;
        input.visual_actions = step.visual_actions;
        input.code_highlight = step.code_highlight;
        input.is_terminal = step.is_terminal;
        input.phase = step.phase;
        inputs.push_back(std::move(input));
    }

    GeneratorDefinition definition{sequence.algorithm_id, [inputs](const nlohmann::json&) {
        return std::make_unique<StepListProducer>(inputs);
    }};
    return GeneratorRunner(options).run(definition, sequence.inputs);
}

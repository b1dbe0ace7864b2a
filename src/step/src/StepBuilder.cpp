#include "StepBuilder.hpp"
#include "StringUtils.hpp"
#include <regex>
#include <fmt/format.h>

StepBuilder::StepBuilder(const std::string& algorithm_id, std::deque<Step>& steps, size_t capacity)
    : algorithm_id_(algorithm_id), steps_(steps), capacity_(capacity) {}

bool StepBuilder::is_valid_step_id(const std::string& id) {
    static const std::regex pattern("^[a-z0-9][a-z0-9_-]*$");
    return std::regex_match(id, pattern);
}

std::string StepBuilder::step_limit_message(size_t max_steps) {
    return fmt::format(
        "Generator exceeded maximum step limit of {}. "
        "This usually indicates an infinite loop in the generator. "
        "If this is intentional, increase the max_steps option.", max_steps);
}

const Step& StepBuilder::build(StepInput input) {
    const auto index = static_cast<int64_t>(steps_.size());

    if (steps_.size() >= capacity_) {
        throw GeneratorError(algorithm_id_, index - 1, step_limit_message(capacity_));
    }

    if (!is_valid_step_id(input.id)) {
        throw GeneratorError(algorithm_id_, index, fmt::format(
            "Invalid step ID \"{}\". Must match pattern: ^[a-z0-9][a-z0-9_-]*$ "
            "(lowercase alphanumeric, hyphens, underscores).", input.id));
    }

    if (input.title.empty()) {
        throw GeneratorError(algorithm_id_, index, "Step title must not be empty.");
    }

    const size_t title_length = StringUtils::utf8_length(input.title);
    if (title_length > MAX_TITLE_LENGTH) {
        throw GeneratorError(algorithm_id_, index, fmt::format(
            "Step title exceeds {} characters (got {}).", MAX_TITLE_LENGTH, title_length));
    }

    if (input.code_highlight.lines.empty()) {
        throw GeneratorError(algorithm_id_, index, "Code highlight lines must not be empty.");
    }

    for (auto line : input.code_highlight.lines) {
        if (line < 1) {
            throw GeneratorError(algorithm_id_, index, fmt::format(
                "Code highlight lines must be positive integers. Got: {}", line));
        }
    }

    Step step;
    step.index = steps_.size();
    step.id = std::move(input.id);
    step.title = std::move(input.title);
    step.explanation = std::move(input.explanation);
    step.state = std::move(input.state);
    step.visual_actions = std::move(input.visual_actions);
    step.code_highlight = std::move(input.code_highlight);
    step.is_terminal = input.is_terminal;
    step.phase = std::move(input.phase);

    steps_.push_back(std::move(step));
    return steps_.back();
}

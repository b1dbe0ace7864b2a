#include "SequenceValidator.hpp"
#include "GeneratorError.hpp"
#include "KahanSum.hpp"
#include <cmath>
#include <stdexcept>
#include <type_traits>
#include <variant>
#include <fmt/format.h>
#include <fmt/ranges.h>

void SequenceValidator::validate(const std::string& algorithm_id, const std::vector<Step>& steps) {
    validate_structure(algorithm_id, steps);

    for (const auto& step : steps) {
        validate_visual_actions(algorithm_id, step);
    }
}

std::vector<size_t> SequenceValidator::terminal_indices(const std::vector<Step>& steps) {
    std::vector<size_t> indices;
    for (size_t i = 0; i < steps.size(); ++i) {
        if (steps[i].is_terminal) {
            indices.push_back(i);
        }
    }
    return indices;
}

void SequenceValidator::validate_structure(const std::string& algorithm_id, const std::vector<Step>& steps) {
    if (steps.empty()) {
        throw GeneratorError(algorithm_id, GeneratorError::NO_STEP,
            "Generator produced zero steps. Every algorithm must yield at least one step.");
    }

    // The builder already guarantees this; a mismatch is a runtime bug
    for (size_t i = 0; i < steps.size(); ++i) {
        if (steps[i].index != i) {
            throw GeneratorError(algorithm_id, static_cast<int64_t>(i), fmt::format(
                "Index contiguity violation: steps[{}].index is {}, expected {}.",
                i, steps[i].index, i));
        }
    }

    const auto terminals = terminal_indices(steps);
    const size_t last = steps.size() - 1;

    if (terminals.empty()) {
        throw GeneratorError(algorithm_id, static_cast<int64_t>(last),
            "No terminal step found. The last step must have isTerminal: true.");
    }

    if (terminals.size() > 1) {
        throw GeneratorError(algorithm_id, static_cast<int64_t>(terminals[1]), fmt::format(
            "Multiple terminal steps found at indices: [{}]. "
            "Exactly one step must be terminal, and it must be the last step.",
            fmt::join(terminals, ", ")));
    }

    if (terminals[0] != last) {
        throw GeneratorError(algorithm_id, static_cast<int64_t>(terminals[0]), fmt::format(
            "Terminal step is at index {}, but the last step is at index {}. "
            "The terminal step must be the last step.", terminals[0], last));
    }
}

void SequenceValidator::validate_visual_actions(const std::string& algorithm_id, const Step& step) {
    for (const auto& action : step.visual_actions) {
        if (auto violation = check_action(action)) {
            throw GeneratorError(algorithm_id, static_cast<int64_t>(step.index), *violation);
        }
    }
}

std::optional<std::string> SequenceValidator::check_action(const VisualAction& action) {
    VisualActionKind kind;
    try {
        kind = action.kind();
    } catch (const std::invalid_argument& e) {
        return std::string(e.what());
    }

    return std::visit([](const auto& typed) -> std::optional<std::string> {
        using T = std::decay_t<decltype(typed)>;
        if constexpr (std::is_same_v<T, RangeAction>) {
            return check_range(typed);
        } else if constexpr (std::is_same_v<T, CompareAction>) {
            return check_compare(typed);
        } else if constexpr (std::is_same_v<T, WeightsAction>) {
            return check_weights(typed);
        } else if constexpr (std::is_same_v<T, BarChartAction>) {
            return check_bar_chart(typed);
        } else {
            // Open vocabulary: tags without a rule are accepted unchanged
            return std::nullopt;
        }
    }, kind);
}

std::optional<std::string> SequenceValidator::check_range(const RangeAction& action) {
    // Written as !(from <= to) so NaN bounds are rejected too
    if (!(action.from <= action.to)) {
        return fmt::format("{}: \"from\" ({}) must be <= \"to\" ({}).", action.type, action.from, action.to);
    }
    return std::nullopt;
}

std::optional<std::string> SequenceValidator::check_compare(const CompareAction& action) {
    if (action.result != "less" && action.result != "greater" && action.result != "equal") {
        return fmt::format(
            "compareElements: \"result\" must be \"less\", \"greater\", or \"equal\". Got: \"{}\".",
            action.result);
    }
    return std::nullopt;
}

std::optional<std::string> SequenceValidator::check_weights(const WeightsAction& action) {
    const auto& weights = action.weights;

    for (size_t i = 0; i < weights.size(); ++i) {
        if (!(weights[i] >= 0.0 && weights[i] <= 1.0)) {
            return fmt::format("showAttentionWeights: weight[{}] = {} is outside [0, 1].", i, weights[i]);
        }
    }

    const double sum = kahan_sum(weights);
    const double delta = std::abs(sum - 1.0);
    if (!(delta <= WEIGHT_SUM_TOLERANCE)) {
        return fmt::format(
            "showAttentionWeights: weights must sum to 1.0 (+/-{:g}). "
            "Got sum = {} (delta = {:.6e}). Sum computed using Kahan summation.",
            WEIGHT_SUM_TOLERANCE, sum, delta);
    }
    return std::nullopt;
}

std::optional<std::string> SequenceValidator::check_bar_chart(const BarChartAction& action) {
    if (action.label_count && *action.label_count != action.value_count) {
        return fmt::format("updateBarChart: labels.length ({}) must equal values.length ({}).",
                           *action.label_count, action.value_count);
    }
    return std::nullopt;
}

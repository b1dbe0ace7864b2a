#pragma once

#include "Step.hpp"
#include "VisualAction.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// Certifies a completed step list before it is packaged. Both passes are
// fail-fast and raise GeneratorError naming the rule and offending values.
class SequenceValidator {
public:
    static constexpr double WEIGHT_SUM_TOLERANCE = 1e-6;

    static void validate(const std::string& algorithm_id, const std::vector<Step>& steps);

    // Non-empty, contiguous indices, exactly one terminal step and it is last
    static void validate_structure(const std::string& algorithm_id, const std::vector<Step>& steps);

    // Per-action rules, dispatched on the action tag; unknown tags pass
    static void validate_visual_actions(const std::string& algorithm_id, const Step& step);

    static std::vector<size_t> terminal_indices(const std::vector<Step>& steps);

    // Individual rules. Each returns the violation message, or nullopt.
    static std::optional<std::string> check_action(const VisualAction& action);
    static std::optional<std::string> check_range(const RangeAction& action);
    static std::optional<std::string> check_compare(const CompareAction& action);
    static std::optional<std::string> check_weights(const WeightsAction& action);
    static std::optional<std::string> check_bar_chart(const BarChartAction& action);
};

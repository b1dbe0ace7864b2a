#pragma once

#include "Step.hpp"
#include "GeneratorError.hpp"
#include <cstddef>
#include <deque>
#include <string>

// Turns StepInput into indexed Steps for one run. Bound to that run's
// accumulator; the index of a new step is the accumulator length, so
// indices are contiguous by construction.
class StepBuilder {
public:
    static constexpr size_t MAX_TITLE_LENGTH = 200;

    StepBuilder(const std::string& algorithm_id, std::deque<Step>& steps, size_t capacity);

    // Validates, appends and returns the new step. The reference stays valid
    // for the lifetime of the accumulator. Throws GeneratorError.
    const Step& build(StepInput input);
    const Step& operator()(StepInput input) { return build(std::move(input)); }

    const std::string& algorithm_id() const { return algorithm_id_; }
    size_t size() const { return steps_.size(); }
    size_t capacity() const { return capacity_; }

    static bool is_valid_step_id(const std::string& id);
    static std::string step_limit_message(size_t max_steps);

private:
    std::string algorithm_id_;
    std::deque<Step>& steps_;
    size_t capacity_;
};

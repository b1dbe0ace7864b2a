#include "GeneratorRunner.hpp"
#include "GeneratorError.hpp"
#include "TimestampUtils.hpp"
#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// Reference producer: iterative binary search, one comparison per resume
class BinarySearchProducer : public StepProducer {
public:
    explicit BinarySearchProducer(const nlohmann::json& inputs)
        : array_(inputs.at("array").get<std::vector<int>>()),
          target_(inputs.at("target").get<int>()),
          right_(static_cast<int>(array_.size()) - 1) {}

    bool resume(StepBuilder& step) override {
        if (!started_) {
            started_ = true;
            StepInput init = make_step("initialize", "Initialize Search");
            if (!array_.empty()) {
                init.visual_actions.push_back(VisualAction::make("highlightRange", {{"from", left_}, {"to", right_}}));
            }
            init.code_highlight.lines = {1, 2};
            init.phase = "initialization";
            step(std::move(init));
            return true;
        }

        if (left_ > right_) {
            StepInput not_found = make_step("not_found", "Target Not Found");
            not_found.is_terminal = true;
            not_found.phase = "result";
            step(std::move(not_found));
            return false;
        }

        const int mid = left_ + (right_ - left_) / 2;
        const int value = array_[mid];
        const std::string result = value < target_ ? "less" : (value > target_ ? "greater" : "equal");

        StepInput compare = make_step(result == "equal" ? "found" : "compare_mid",
                                      result == "equal" ? "Target Found" : "Compare Middle Element");
        compare.state["mid"] = mid;
        compare.visual_actions.push_back(VisualAction::make("highlightRange", {{"from", left_}, {"to", right_}}));
        compare.visual_actions.push_back(VisualAction::make("compareElements", {{"i", mid}, {"result", result}}));
        compare.phase = "search";

        if (result == "equal") {
            compare.is_terminal = true;
            compare.phase = "result";
            step(std::move(compare));
            return false;
        }

        step(std::move(compare));
        if (result == "less") {
            left_ = mid + 1;
        } else {
            right_ = mid - 1;
        }
        return true;
    }

private:
    StepInput make_step(const std::string& id, const std::string& title) const {
        StepInput input;
        input.id = id;
        input.title = title;
        input.explanation = "Searching for " + std::to_string(target_) + ".";
        input.state = {{"array", array_}, {"target", target_}, {"left", left_}, {"right", right_}};
        input.code_highlight = {"pseudocode", {3}};
        return input;
    }

    std::vector<int> array_;
    int target_;
    int left_ = 0;
    int right_;
    bool started_ = false;
};

static GeneratorDefinition binary_search_definition() {
    return make_generator("binary-search", [](const nlohmann::json& inputs) {
        return std::make_unique<BinarySearchProducer>(inputs);
    });
}

static StepInput make_input(const std::string& id, bool terminal = false) {
    StepInput input;
    input.id = id;
    input.title = "Step " + id;
    input.explanation = "Explanation for " + id;
    input.state = {{"id", id}};
    input.code_highlight = {"pseudocode", {1}};
    input.is_terminal = terminal;
    return input;
}

static GeneratorDefinition list_definition(const std::string& id, std::vector<StepInput> inputs) {
    return make_generator(id, [inputs](const nlohmann::json&) {
        return std::make_unique<StepListProducer>(inputs);
    });
}

template <typename Fn>
static GeneratorError expect_generator_error(Fn&& fn) {
    try {
        fn();
    } catch (const GeneratorError& e) {
        return e;
    }
    assert(false && "Expected GeneratorError");
    throw std::logic_error("GeneratorError was not thrown");
}

void test_binary_search_found() {
    nlohmann::json inputs = {{"array", {1, 3, 5, 7, 9, 11, 13}}, {"target", 11}};
    StepSequence seq = run_generator(binary_search_definition(), inputs);

    assert(seq.format_version == STEP_FORMAT_VERSION);
    assert(seq.algorithm_id == "binary-search");
    assert(seq.inputs == inputs);
    assert(seq.generated_by == "cpp");
    assert(TimestampUtils::is_iso8601(seq.generated_at));

    assert(seq.steps.size() == 3);
    for (size_t i = 0; i < seq.steps.size(); ++i) {
        assert(seq.steps[i].index == i);
        assert(seq.steps[i].is_terminal == (i == seq.steps.size() - 1));
    }
    assert(seq.steps[0].id == "initialize");
    assert(seq.steps[1].id == "compare_mid");
    assert(seq.steps.back().id == "found");
    assert(seq.steps.back().state["mid"] == 5);
    assert(seq.steps[0].phase.value() == "initialization");
    std::cout << "test_binary_search_found passed\n";
}

void test_binary_search_not_found() {
    nlohmann::json inputs = {{"array", {1, 3, 5, 7, 9, 11, 13}}, {"target", 4}};
    StepSequence seq = run_generator(binary_search_definition(), inputs);

    assert(seq.steps.size() == 5);
    assert(seq.steps.back().id == "not_found");
    assert(seq.steps.back().is_terminal);
    std::cout << "test_binary_search_not_found passed\n";
}

void test_deterministic_steps() {
    nlohmann::json inputs = {{"array", {2, 4, 6, 8, 10, 12, 14, 16}}, {"target", 2}};
    StepSequence first = run_generator(binary_search_definition(), inputs);
    StepSequence second = run_generator(binary_search_definition(), inputs);

    assert(nlohmann::json(first.steps) == nlohmann::json(second.steps));
    assert(first.inputs == second.inputs);
    std::cout << "test_deterministic_steps passed\n";
}

void test_zero_steps() {
    auto def = make_generator("empty", [](const nlohmann::json&) {
        return std::make_unique<FunctionProducer>([](StepBuilder&) { return false; });
    });

    auto e = expect_generator_error([&] { run_generator(def, nlohmann::json::object()); });
    assert(e.algorithm_id() == "empty");
    assert(e.step_index() == GeneratorError::NO_STEP);
    assert(e.message().find("zero steps") != std::string::npos);
    assert(std::string(e.what()).find("[empty] Step -1:") == 0);
    std::cout << "test_zero_steps passed\n";
}

void test_two_terminal_steps() {
    auto def = list_definition("two-terminals", {
        make_input("a"), make_input("b", true), make_input("c", true)
    });

    auto e = expect_generator_error([&] { run_generator(def, nlohmann::json::object()); });
    assert(e.step_index() == 2);
    assert(e.message().find("Multiple terminal steps found at indices: [1, 2]") != std::string::npos);
    std::cout << "test_two_terminal_steps passed\n";
}

void test_terminal_not_last() {
    auto def = list_definition("early-terminal", {
        make_input("a", true), make_input("b"), make_input("c")
    });

    auto e = expect_generator_error([&] { run_generator(def, nlohmann::json::object()); });
    assert(e.step_index() == 0);
    assert(e.message().find("Terminal step is at index 0, but the last step is at index 2") != std::string::npos);
    std::cout << "test_terminal_not_last passed\n";
}

void test_no_terminal_step() {
    auto def = list_definition("no-terminal", {make_input("a"), make_input("b")});

    auto e = expect_generator_error([&] { run_generator(def, nlohmann::json::object()); });
    assert(e.step_index() == 1);
    assert(e.message().find("No terminal step found") != std::string::npos);
    std::cout << "test_no_terminal_step passed\n";
}

void test_reversed_range_fails() {
    StepInput bad = make_input("b");
    bad.visual_actions.push_back(VisualAction::make("highlightRange", {{"from", 5}, {"to", 2}}));
    auto def = list_definition("bad-range", {make_input("a"), bad, make_input("c", true)});

    auto e = expect_generator_error([&] { run_generator(def, nlohmann::json::object()); });
    assert(e.step_index() == 1);
    assert(e.message().find("highlightRange: \"from\" (5) must be <= \"to\" (2)") != std::string::npos);
    std::cout << "test_reversed_range_fails passed\n";
}

void test_single_point_range_passes() {
    StepInput last = make_input("a", true);
    last.visual_actions.push_back(VisualAction::make("dimRange", {{"from", 3}, {"to", 3}}));
    auto seq = run_generator(list_definition("point-range", {last}), nlohmann::json::object());
    assert(seq.steps.size() == 1);
    std::cout << "test_single_point_range_passes passed\n";
}

void test_weight_distributions() {
    StepInput ok = make_input("ok", true);
    ok.visual_actions.push_back(VisualAction::make("showAttentionWeights", {{"weights", {0.25, 0.25, 0.25, 0.25}}}));
    auto seq = run_generator(list_definition("weights-ok", {ok}), nlohmann::json::object());
    assert(seq.steps.size() == 1);

    StepInput short_sum = make_input("short", true);
    short_sum.visual_actions.push_back(VisualAction::make("showAttentionWeights", {{"weights", {0.3, 0.3, 0.3}}}));
    auto e = expect_generator_error([&] {
        run_generator(list_definition("weights-short", {short_sum}), nlohmann::json::object());
    });
    assert(e.step_index() == 0);
    assert(e.message().find("must sum to 1.0") != std::string::npos);
    assert(e.message().find("delta = 1.000000e-01") != std::string::npos);

    StepInput out_of_range = make_input("range", true);
    out_of_range.visual_actions.push_back(VisualAction::make("showAttentionWeights", {{"weights", {1.5, -0.5}}}));
    e = expect_generator_error([&] {
        run_generator(list_definition("weights-range", {out_of_range}), nlohmann::json::object());
    });
    assert(e.message().find("weight[0] = 1.5 is outside [0, 1]") != std::string::npos);
    std::cout << "test_weight_distributions passed\n";
}

void test_long_softmax_distribution_passes() {
    // 1000 equal weights: naive summation drifts, the compensated sum does not
    std::vector<double> weights(1000, 0.001);
    StepInput last = make_input("softmax", true);
    last.visual_actions.push_back(VisualAction::make("showAttentionWeights", {{"weights", weights}}));
    auto seq = run_generator(list_definition("softmax", {last}), nlohmann::json::object());
    assert(seq.steps.size() == 1);
    std::cout << "test_long_softmax_distribution_passes passed\n";
}

void test_compare_and_bar_chart_rules() {
    StepInput compare = make_input("cmp", true);
    compare.visual_actions.push_back(VisualAction::make("compareElements", {{"result", "bigger"}}));
    auto e = expect_generator_error([&] {
        run_generator(list_definition("compare", {compare}), nlohmann::json::object());
    });
    assert(e.message().find("Got: \"bigger\"") != std::string::npos);

    StepInput chart = make_input("chart", true);
    chart.visual_actions.push_back(VisualAction::make("updateBarChart", {{"values", {1, 2, 3}}, {"labels", {"a", "b"}}}));
    e = expect_generator_error([&] {
        run_generator(list_definition("chart", {chart}), nlohmann::json::object());
    });
    assert(e.message().find("labels.length (2) must equal values.length (3)") != std::string::npos);

    StepInput unlabeled = make_input("chart", true);
    unlabeled.visual_actions.push_back(VisualAction::make("updateBarChart", {{"values", {1, 2, 3}}}));
    auto seq = run_generator(list_definition("chart", {unlabeled}), nlohmann::json::object());
    assert(seq.steps.size() == 1);
    std::cout << "test_compare_and_bar_chart_rules passed\n";
}

void test_unknown_action_ignored() {
    StepInput last = make_input("future", true);
    last.visual_actions.push_back(VisualAction::make("futureAction", {{"from", 9}, {"to", 1}, {"glow", true}}));
    auto seq = run_generator(list_definition("future", {last}), nlohmann::json::object());

    assert(seq.steps.size() == 1);
    const auto& action = seq.steps[0].visual_actions[0];
    assert(action.type() == "futureAction");
    assert(action.payload()["glow"] == true);
    std::cout << "test_unknown_action_ignored passed\n";
}

void test_max_steps_runaway_producer() {
    size_t resumes = 0;
    auto def = make_generator("runaway", [&resumes](const nlohmann::json&) {
        return std::make_unique<FunctionProducer>([&resumes](StepBuilder& step) {
            ++resumes;
            step(make_input("loop"));
            return true;
        });
    });

    RunOptions options;
    options.max_steps = 5;
    auto e = expect_generator_error([&] { run_generator(def, nlohmann::json::object(), options); });
    assert(resumes == 5);
    assert(e.step_index() == 4);
    assert(e.message().find("maximum step limit of 5") != std::string::npos);
    std::cout << "test_max_steps_runaway_producer passed\n";
}

void test_max_steps_single_resume_loop() {
    auto def = make_generator("tight-loop", [](const nlohmann::json&) {
        return std::make_unique<FunctionProducer>([](StepBuilder& step) {
            for (;;) {
                step(make_input("spin"));
            }
            return false;
        });
    });

    RunOptions options;
    options.max_steps = 3;
    auto e = expect_generator_error([&] { run_generator(def, nlohmann::json::object(), options); });
    assert(e.message().find("maximum step limit of 3") != std::string::npos);
    assert(!e.has_cause());
    std::cout << "test_max_steps_single_resume_loop passed\n";
}

void test_max_steps_exact_fit() {
    auto def = list_definition("exact", {make_input("a"), make_input("b"), make_input("c", true)});

    RunOptions options;
    options.max_steps = 3;
    auto seq = GeneratorRunner(options).run(def, nlohmann::json::object());
    assert(seq.steps.size() == 3);
    std::cout << "test_max_steps_exact_fit passed\n";
}

void test_invalid_max_steps() {
    RunOptions options;
    options.max_steps = 0;
    auto def = list_definition("zero-limit", {make_input("a", true)});
    auto e = expect_generator_error([&] { run_generator(def, nlohmann::json::object(), options); });
    assert(e.step_index() == GeneratorError::NO_STEP);
    std::cout << "test_invalid_max_steps passed\n";
}

void test_producer_exception_wrapped() {
    auto def = make_generator("throws", [](const nlohmann::json&) {
        auto count = std::make_shared<int>(0);
        return std::make_unique<FunctionProducer>([count](StepBuilder& step) {
            if (*count == 2) {
                throw std::runtime_error("division by zero in kernel");
            }
            step(make_input("s" + std::to_string((*count)++)));
            return true;
        });
    });

    auto e = expect_generator_error([&] { run_generator(def, nlohmann::json::object()); });
    assert(e.step_index() == 2);
    assert(e.has_cause());
    assert(e.cause_message() == "division by zero in kernel");
    assert(e.message().find("unexpected error: division by zero in kernel") != std::string::npos);

    bool rethrown = false;
    try {
        std::rethrow_exception(e.cause());
    } catch (const std::runtime_error&) {
        rethrown = true;
    }
    assert(rethrown);
    std::cout << "test_producer_exception_wrapped passed\n";
}

void test_factory_failures_wrapped() {
    auto throwing = make_generator("bad-inputs", [](const nlohmann::json& inputs) -> std::unique_ptr<StepProducer> {
        return std::make_unique<BinarySearchProducer>(inputs);
    });
    auto e = expect_generator_error([&] { run_generator(throwing, nlohmann::json::object()); });
    assert(e.step_index() == 0);
    assert(e.has_cause());

    auto null_factory = make_generator("null-producer", [](const nlohmann::json&) -> std::unique_ptr<StepProducer> {
        return nullptr;
    });
    e = expect_generator_error([&] { run_generator(null_factory, nlohmann::json::object()); });
    assert(e.step_index() == GeneratorError::NO_STEP);
    std::cout << "test_factory_failures_wrapped passed\n";
}

void test_builder_error_not_rewrapped() {
    auto def = list_definition("bad-id", {make_input("a"), make_input("Bad_ID", true)});

    auto e = expect_generator_error([&] { run_generator(def, nlohmann::json::object()); });
    assert(e.step_index() == 1);
    assert(!e.has_cause());
    assert(e.message().find("Invalid step ID \"Bad_ID\"") != std::string::npos);
    std::cout << "test_builder_error_not_rewrapped passed\n";
}

void test_make_generator_rejects_bad_id() {
    bool thrown = false;
    try {
        make_generator("Binary_Search", [](const nlohmann::json&) {
            return std::make_unique<StepListProducer>(std::vector<StepInput>{});
        });
    } catch (const std::invalid_argument& e) {
        thrown = std::string(e.what()).find("Invalid algorithm ID \"Binary_Search\"") != std::string::npos;
    }
    assert(thrown);
    std::cout << "test_make_generator_rejects_bad_id passed\n";
}

void test_replay_step_sequence() {
    nlohmann::json inputs = {{"array", {1, 3, 5, 7, 9, 11, 13}}, {"target", 4}};
    StepSequence original = run_generator(binary_search_definition(), inputs);

    StepSequence replayed = replay_step_sequence(original);
    assert(replayed.algorithm_id == original.algorithm_id);
    assert(replayed.inputs == original.inputs);
    assert(nlohmann::json(replayed.steps) == nlohmann::json(original.steps));

    // Five steps do not fit under a limit of three
    RunOptions options;
    options.max_steps = 3;
    auto e = expect_generator_error([&] { replay_step_sequence(original, options); });
    assert(e.algorithm_id() == "binary-search");
    assert(e.step_index() == 2);
    assert(e.message().find("maximum step limit of 3") != std::string::npos);

    options.max_steps = original.steps.size();
    assert(replay_step_sequence(original, options).steps.size() == original.steps.size());

    // A tampered copy fails the same checks a live run would
    StepSequence tampered = original;
    tampered.steps[1].is_terminal = true;
    e = expect_generator_error([&] { replay_step_sequence(tampered); });
    assert(e.message().find("Multiple terminal steps") != std::string::npos);
    std::cout << "test_replay_step_sequence passed\n";
}

void test_concurrent_runs_are_independent() {
    auto def = binary_search_definition();
    nlohmann::json inputs = {{"array", {1, 2, 3, 4, 5, 6, 7, 8, 9}}, {"target", 9}};
    const nlohmann::json expected = run_generator(def, inputs).steps;

    std::vector<nlohmann::json> results(4);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&, i] {
            results[i] = run_generator(def, inputs).steps;
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (const auto& result : results) {
        assert(result == expected);
    }
    std::cout << "test_concurrent_runs_are_independent passed\n";
}

int main() {
    test_binary_search_found();
    test_binary_search_not_found();
    test_deterministic_steps();
    test_zero_steps();
    test_two_terminal_steps();
    test_terminal_not_last();
    test_no_terminal_step();
    test_reversed_range_fails();
    test_single_point_range_passes();
    test_weight_distributions();
    test_long_softmax_distribution_passes();
    test_compare_and_bar_chart_rules();
    test_unknown_action_ignored();
    test_max_steps_runaway_producer();
    test_max_steps_single_resume_loop();
    test_max_steps_exact_fit();
    test_invalid_max_steps();
    test_producer_exception_wrapped();
    test_factory_failures_wrapped();
    test_builder_error_not_rewrapped();
    test_make_generator_rejects_bad_id();
    test_replay_step_sequence();
    test_concurrent_runs_are_independent();

    std::cout << "All GeneratorRunner tests passed.\n";
    return 0;
}

#include "StepSequenceDocumentValidator.hpp"
#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>

nlohmann::json make_step_json(size_t index, bool terminal) {
    return {
        {"index", index},
        {"id", "step-" + std::to_string(index)},
        {"title", "Step " + std::to_string(index)},
        {"explanation", "Explanation."},
        {"state", {{"i", index}}},
        {"visualActions", nlohmann::json::array()},
        {"codeHighlight", {{"language", "pseudocode"}, {"lines", nlohmann::json::array({1})}}},
        {"isTerminal", terminal}
    };
}

nlohmann::json make_document() {
    return {
        {"formatVersion", 1},
        {"algorithmId", "bubble-sort"},
        {"inputs", {{"array", {3, 1, 2}}}},
        {"steps", {make_step_json(0, false), make_step_json(1, false), make_step_json(2, true)}},
        {"generatedAt", "2026-01-01T00:00:00.000Z"},
        {"generatedBy", "python"}
    };
}

bool has_error(const ValidationResult& result, const std::string& fragment) {
    return std::any_of(result.errors.begin(), result.errors.end(), [&](const std::string& error) {
        return error.find(fragment) != std::string::npos;
    });
}

void test_valid_document() {
    auto result = StepSequenceDocumentValidator::validate(make_document());
    assert(result.valid);
    assert(result.errors.empty());

    // Unknown action tags and extra payload fields are accepted
    auto doc = make_document();
    doc["steps"][2]["visualActions"].push_back({{"type", "futureAction"}, {"whatever", {{"x", 1}}}});
    doc["steps"][1]["phase"] = "sorting";
    assert(StepSequenceDocumentValidator::validate(doc).valid);
    std::cout << "test_valid_document passed\n";
}

void test_shape_errors_are_collected() {
    auto doc = make_document();
    doc["formatVersion"] = 2;
    doc["algorithmId"] = "Bubble_Sort";
    doc.erase("generatedAt");
    doc["steps"][0]["codeHighlight"]["lines"] = nlohmann::json::array({0});
    doc["steps"][1]["isTerminal"] = "no";

    auto result = StepSequenceDocumentValidator::validate(doc);
    assert(!result.valid);
    assert(result.errors.size() == 5);
    assert(has_error(result, "Shape: /formatVersion must be 1, got 2."));
    assert(has_error(result, "/algorithmId \"Bubble_Sort\""));
    assert(has_error(result, "Shape: /generatedAt must be a string."));
    assert(has_error(result, "/steps/0/codeHighlight/lines/0 must be a positive integer"));
    assert(has_error(result, "/steps/1/isTerminal must be a boolean"));
    std::cout << "test_shape_errors_are_collected passed\n";
}

void test_shape_errors_skip_semantics() {
    auto doc = make_document();
    doc["steps"][0]["title"] = "";
    doc["steps"][2]["isTerminal"] = false;

    auto result = StepSequenceDocumentValidator::validate(doc);
    assert(!result.valid);
    assert(has_error(result, "/steps/0/title must be 1 to 200 characters (got 0)"));
    assert(!has_error(result, "Semantic:"));
    std::cout << "test_shape_errors_skip_semantics passed\n";
}

void test_generated_at_format() {
    auto doc = make_document();
    doc["generatedAt"] = "yesterday";
    auto result = StepSequenceDocumentValidator::validate(doc);
    assert(!result.valid);
    assert(result.errors.size() == 1);
    assert(result.errors[0] == "Shape: /generatedAt \"yesterday\" must be an ISO-8601 date-time.");

    doc["generatedAt"] = "2026-01-01 00:00:00";
    assert(!StepSequenceDocumentValidator::validate(doc).valid);

    doc["generatedAt"] = "2026-03-09T14:05:00+01:00";
    assert(StepSequenceDocumentValidator::validate(doc).valid);
    std::cout << "test_generated_at_format passed\n";
}

void test_empty_and_malformed_documents() {
    auto result = StepSequenceDocumentValidator::validate(nlohmann::json::array());
    assert(!result.valid);
    assert(result.errors.size() == 1);

    auto doc = make_document();
    doc["steps"] = nlohmann::json::array();
    result = StepSequenceDocumentValidator::validate(doc);
    assert(has_error(result, "Shape: /steps must contain at least one step."));
    std::cout << "test_empty_and_malformed_documents passed\n";
}

void test_semantic_errors_are_collected() {
    auto doc = make_document();
    doc["steps"][1]["index"] = 5;
    doc["steps"][0]["isTerminal"] = true;
    doc["steps"][1]["visualActions"].push_back({{"type", "highlightRange"}, {"from", 4}, {"to", 1}});
    doc["steps"][2]["visualActions"].push_back({{"type", "showAttentionWeights"}, {"weights", {0.3, 0.3, 0.3}}});

    auto result = StepSequenceDocumentValidator::validate(doc);
    assert(!result.valid);
    assert(result.errors.size() == 4);
    assert(has_error(result, "Semantic: steps[1].index is 5, expected 1."));
    assert(has_error(result, "Multiple steps have isTerminal=true at indices [0, 2]"));
    assert(has_error(result, "Semantic: steps[1].visualActions[0] (highlightRange) highlightRange: \"from\" (4)"));
    assert(has_error(result, "Semantic: steps[2].visualActions[0] (showAttentionWeights)"));
    std::cout << "test_semantic_errors_are_collected passed\n";
}

void test_terminal_placement() {
    auto doc = make_document();
    doc["steps"][2]["isTerminal"] = false;
    auto result = StepSequenceDocumentValidator::validate(doc);
    assert(has_error(result, "No step has isTerminal=true"));

    doc["steps"][1]["isTerminal"] = true;
    result = StepSequenceDocumentValidator::validate(doc);
    assert(has_error(result, "isTerminal=true is at index 1, but the last step is at index 2"));
    std::cout << "test_terminal_placement passed\n";
}

void test_algorithm_id_pattern() {
    assert(StepSequenceDocumentValidator::is_valid_algorithm_id("binary-search"));
    assert(StepSequenceDocumentValidator::is_valid_algorithm_id("a2"));
    assert(!StepSequenceDocumentValidator::is_valid_algorithm_id("binary_search"));
    assert(!StepSequenceDocumentValidator::is_valid_algorithm_id("-search"));
    assert(!StepSequenceDocumentValidator::is_valid_algorithm_id(""));
    std::cout << "test_algorithm_id_pattern passed\n";
}

int main() {
    test_valid_document();
    test_shape_errors_are_collected();
    test_shape_errors_skip_semantics();
    test_generated_at_format();
    test_empty_and_malformed_documents();
    test_semantic_errors_are_collected();
    test_terminal_placement();
    test_algorithm_id_pattern();
    std::cout << "All tests passed!\n";
    return 0;
}

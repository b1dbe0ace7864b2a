#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
};

// Checks a serialized StepSequence (persisted fixture, export from another
// runtime) and reports every violation instead of stopping at the first.
// Shape errors are reported alone; semantic rules only run on a document
// whose shape is valid.
class StepSequenceDocumentValidator {
public:
    static ValidationResult validate(const nlohmann::json& document);

    static bool is_valid_algorithm_id(const std::string& id);

private:
    static void check_shape(const nlohmann::json& document, std::vector<std::string>& errors);
    static void check_step_shape(const nlohmann::json& step, size_t i, std::vector<std::string>& errors);
    static void check_semantics(const nlohmann::json& document, std::vector<std::string>& errors);
};

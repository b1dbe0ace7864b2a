#include "StepSequenceDocumentValidator.hpp"
#include "SequenceValidator.hpp"
#include "StepBuilder.hpp"
#include "StepSequence.hpp"
#include "StringUtils.hpp"
#include "TimestampUtils.hpp"
#include <regex>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace {

bool is_non_negative_integer(const nlohmann::json& value) {
    return value.is_number_unsigned() || (value.is_number_integer() && value.get<int64_t>() >= 0);
}

bool is_positive_integer(const nlohmann::json& value) {
    return value.is_number_integer() && value.get<int64_t>() >= 1;
}

}

bool StepSequenceDocumentValidator::is_valid_algorithm_id(const std::string& id) {
    static const std::regex pattern("^[a-z0-9][a-z0-9-]*$");
    return std::regex_match(id, pattern);
}

ValidationResult StepSequenceDocumentValidator::validate(const nlohmann::json& document) {
    ValidationResult result;

    check_shape(document, result.errors);
    if (result.errors.empty()) {
        check_semantics(document, result.errors);
    }

    result.valid = result.errors.empty();
    return result;
}

void StepSequenceDocumentValidator::check_shape(const nlohmann::json& doc, std::vector<std::string>& errors) {
    if (!doc.is_object()) {
        errors.push_back("Shape: document must be a JSON object.");
        return;
    }

    if (!doc.contains("formatVersion") || !doc["formatVersion"].is_number_integer()) {
        errors.push_back("Shape: /formatVersion must be an integer.");
    } else if (doc["formatVersion"].get<int64_t>() != STEP_FORMAT_VERSION) {
        errors.push_back(fmt::format("Shape: /formatVersion must be {}, got {}.",
                                     STEP_FORMAT_VERSION, doc["formatVersion"].get<int64_t>()));
    }

    if (!doc.contains("algorithmId") || !doc["algorithmId"].is_string()) {
        errors.push_back("Shape: /algorithmId must be a string.");
    } else if (!is_valid_algorithm_id(doc["algorithmId"].get<std::string>())) {
        errors.push_back(fmt::format("Shape: /algorithmId \"{}\" must match ^[a-z0-9][a-z0-9-]*$.",
                                     doc["algorithmId"].get<std::string>()));
    }

    if (!doc.contains("inputs") || !doc["inputs"].is_object()) {
        errors.push_back("Shape: /inputs must be an object.");
    }

    if (!doc.contains("generatedAt") || !doc["generatedAt"].is_string()) {
        errors.push_back("Shape: /generatedAt must be a string.");
    } else if (!TimestampUtils::is_iso8601(doc["generatedAt"].get<std::string>())) {
        errors.push_back(fmt::format("Shape: /generatedAt \"{}\" must be an ISO-8601 date-time.",
                                     doc["generatedAt"].get<std::string>()));
    }

    if (!doc.contains("generatedBy") || !doc["generatedBy"].is_string()) {
        errors.push_back("Shape: /generatedBy must be a string.");
    }

    if (!doc.contains("steps") || !doc["steps"].is_array()) {
        errors.push_back("Shape: /steps must be an array.");
        return;
    }

    const auto& steps = doc["steps"];
    if (steps.empty()) {
        errors.push_back("Shape: /steps must contain at least one step.");
    }

    for (size_t i = 0; i < steps.size(); ++i) {
        check_step_shape(steps[i], i, errors);
    }
}

void StepSequenceDocumentValidator::check_step_shape(const nlohmann::json& step, size_t i, std::vector<std::string>& errors) {
    const std::string at = fmt::format("/steps/{}", i);

    if (!step.is_object()) {
        errors.push_back(fmt::format("Shape: {} must be an object.", at));
        return;
    }

    if (!step.contains("index") || !is_non_negative_integer(step["index"])) {
        errors.push_back(fmt::format("Shape: {}/index must be a non-negative integer.", at));
    }

    if (!step.contains("id") || !step["id"].is_string()) {
        errors.push_back(fmt::format("Shape: {}/id must be a string.", at));
    } else if (!StepBuilder::is_valid_step_id(step["id"].get<std::string>())) {
        errors.push_back(fmt::format("Shape: {}/id \"{}\" must match ^[a-z0-9][a-z0-9_-]*$.",
                                     at, step["id"].get<std::string>()));
    }

    if (!step.contains("title") || !step["title"].is_string()) {
        errors.push_back(fmt::format("Shape: {}/title must be a string.", at));
    } else {
        const size_t length = StringUtils::utf8_length(step["title"].get<std::string>());
        if (length == 0 || length > StepBuilder::MAX_TITLE_LENGTH) {
            errors.push_back(fmt::format("Shape: {}/title must be 1 to {} characters (got {}).",
                                         at, StepBuilder::MAX_TITLE_LENGTH, length));
        }
    }

    if (!step.contains("explanation") || !step["explanation"].is_string()) {
        errors.push_back(fmt::format("Shape: {}/explanation must be a string.", at));
    }

    if (!step.contains("state")) {
        errors.push_back(fmt::format("Shape: {}/state is required.", at));
    }

    if (!step.contains("visualActions") || !step["visualActions"].is_array()) {
        errors.push_back(fmt::format("Shape: {}/visualActions must be an array.", at));
    } else {
        const auto& actions = step["visualActions"];
        for (size_t j = 0; j < actions.size(); ++j) {
            const auto& action = actions[j];
            if (!action.is_object() || !action.contains("type") || !action["type"].is_string()
                || action["type"].get<std::string>().empty()) {
                errors.push_back(fmt::format(
                    "Shape: {}/visualActions/{} must be an object with a non-empty string \"type\".", at, j));
            }
        }
    }

    if (!step.contains("codeHighlight") || !step["codeHighlight"].is_object()) {
        errors.push_back(fmt::format("Shape: {}/codeHighlight must be an object.", at));
    } else {
        const auto& highlight = step["codeHighlight"];
        if (!highlight.contains("language") || !highlight["language"].is_string()) {
            errors.push_back(fmt::format("Shape: {}/codeHighlight/language must be a string.", at));
        }
        if (!highlight.contains("lines") || !highlight["lines"].is_array() || highlight["lines"].empty()) {
            errors.push_back(fmt::format("Shape: {}/codeHighlight/lines must be a non-empty array.", at));
        } else {
            const auto& lines = highlight["lines"];
            for (size_t k = 0; k < lines.size(); ++k) {
                if (!is_positive_integer(lines[k])) {
                    errors.push_back(fmt::format(
                        "Shape: {}/codeHighlight/lines/{} must be a positive integer. Got: {}",
                        at, k, lines[k].dump()));
                }
            }
        }
    }

    if (!step.contains("isTerminal") || !step["isTerminal"].is_boolean()) {
        errors.push_back(fmt::format("Shape: {}/isTerminal must be a boolean.", at));
    }

    if (step.contains("phase") && !step["phase"].is_string() && !step["phase"].is_null()) {
        errors.push_back(fmt::format("Shape: {}/phase must be a string when present.", at));
    }
}

void StepSequenceDocumentValidator::check_semantics(const nlohmann::json& doc, std::vector<std::string>& errors) {
    // Shape is valid at this point, so the typed conversion cannot fail
    const auto sequence = doc.get<StepSequence>();
    const auto& steps = sequence.steps;

    for (size_t i = 0; i < steps.size(); ++i) {
        if (steps[i].index != i) {
            errors.push_back(fmt::format(
                "Semantic: steps[{}].index is {}, expected {}. Step indices must be contiguous and 0-based.",
                i, steps[i].index, i));
        }
    }

    const auto terminals = SequenceValidator::terminal_indices(steps);
    const size_t last = steps.size() - 1;
    if (terminals.empty()) {
        errors.push_back("Semantic: No step has isTerminal=true. The last step must be terminal.");
    } else if (terminals.size() > 1) {
        errors.push_back(fmt::format(
            "Semantic: Multiple steps have isTerminal=true at indices [{}]. Only the last step may be terminal.",
            fmt::join(terminals, ", ")));
    } else if (terminals[0] != last) {
        errors.push_back(fmt::format(
            "Semantic: isTerminal=true is at index {}, but the last step is at index {}. "
            "Only the last step may be terminal.", terminals[0], last));
    }

    for (size_t i = 0; i < steps.size(); ++i) {
        const auto& actions = steps[i].visual_actions;
        for (size_t j = 0; j < actions.size(); ++j) {
            if (auto violation = SequenceValidator::check_action(actions[j])) {
                errors.push_back(fmt::format("Semantic: steps[{}].visualActions[{}] ({}) {}",
                                             i, j, actions[j].type(), *violation));
            }
        }
    }
}

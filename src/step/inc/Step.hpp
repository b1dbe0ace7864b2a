#pragma once

#include "VisualAction.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct CodeHighlight {
    std::string language;         // Language tab to highlight (e.g. "pseudocode")
    std::vector<int64_t> lines;   // 1-based line numbers, non-empty
};

// One emitted moment of an algorithm's execution. Created once by the
// StepBuilder and never modified afterwards.
struct Step {
    size_t index = 0;
    std::string id;                       // ^[a-z0-9][a-z0-9_-]*$
    std::string title;                    // 1..200 characters
    std::string explanation;
    nlohmann::json state = nlohmann::json::object();   // Opaque producer snapshot
    std::vector<VisualAction> visual_actions;
    CodeHighlight code_highlight;
    bool is_terminal = false;
    std::optional<std::string> phase;
};

// What a producer hands to the builder: a Step without its index
struct StepInput {
    std::string id;
    std::string title;
    std::string explanation;
    nlohmann::json state = nlohmann::json::object();
    std::vector<VisualAction> visual_actions;
    CodeHighlight code_highlight;
    bool is_terminal = false;
    std::optional<std::string> phase;
};

void to_json(nlohmann::json& j, const CodeHighlight& highlight);
void from_json(const nlohmann::json& j, CodeHighlight& highlight);

void to_json(nlohmann::json& j, const Step& step);
void from_json(const nlohmann::json& j, Step& step);

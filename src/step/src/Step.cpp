#include "Step.hpp"

void to_json(nlohmann::json& j, const CodeHighlight& highlight) {
    j = nlohmann::json{
        {"language", highlight.language},
        {"lines", highlight.lines}
    };
}

void from_json(const nlohmann::json& j, CodeHighlight& highlight) {
    j.at("language").get_to(highlight.language);
    j.at("lines").get_to(highlight.lines);
}

void to_json(nlohmann::json& j, const Step& step) {
    nlohmann::json actions = nlohmann::json::array();
    for (const auto& action : step.visual_actions) {
        actions.push_back(action.payload());
    }

    j = nlohmann::json{
        {"index", step.index},
        {"id", step.id},
        {"title", step.title},
        {"explanation", step.explanation},
        {"state", step.state},
        {"visualActions", std::move(actions)},
        {"codeHighlight", step.code_highlight},
        {"isTerminal", step.is_terminal}
    };

    if (step.phase) {
        j["phase"] = *step.phase;
    }
}

void from_json(const nlohmann::json& j, Step& step) {
    j.at("index").get_to(step.index);
    j.at("id").get_to(step.id);
    j.at("title").get_to(step.title);
    j.at("explanation").get_to(step.explanation);
    step.state = j.at("state");

    step.visual_actions.clear();
    for (const auto& action : j.at("visualActions")) {
        step.visual_actions.emplace_back(action);
    }

    j.at("codeHighlight").get_to(step.code_highlight);
    step.is_terminal = j.value("isTerminal", false);

    if (j.contains("phase") && !j["phase"].is_null()) {
        step.phase = j["phase"].get<std::string>();
    } else {
        step.phase.reset();
    }
}

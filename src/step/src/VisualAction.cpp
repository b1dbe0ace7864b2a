#include "VisualAction.hpp"
#include <stdexcept>
#include <fmt/format.h>

namespace {

double number_field(const nlohmann::json& payload, const std::string& type, const char* field) {
    auto it = payload.find(field);
    if (it == payload.end()) {
        throw std::invalid_argument(fmt::format("{}: missing required field \"{}\".", type, field));
    }
    if (!it->is_number()) {
        throw std::invalid_argument(fmt::format("{}: \"{}\" must be a number. Got: {}", type, field, it->dump()));
    }
    return it->get<double>();
}

const nlohmann::json& array_field(const nlohmann::json& payload, const std::string& type, const char* field) {
    auto it = payload.find(field);
    if (it == payload.end()) {
        throw std::invalid_argument(fmt::format("{}: missing required field \"{}\".", type, field));
    }
    if (!it->is_array()) {
        throw std::invalid_argument(fmt::format("{}: \"{}\" must be an array. Got: {}", type, field, it->dump()));
    }
    return *it;
}

}

VisualAction::VisualAction(nlohmann::json payload) : payload_(std::move(payload)) {
    if (!payload_.is_object()) {
        throw std::invalid_argument("Visual action must be a JSON object. Got: " + payload_.dump());
    }

    auto it = payload_.find("type");
    if (it == payload_.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw std::invalid_argument("Visual action requires a non-empty string \"type\". Got: " + payload_.dump());
    }
    type_ = it->get<std::string>();
}

VisualAction VisualAction::make(const std::string& type, const nlohmann::json& params) {
    nlohmann::json payload = nlohmann::json::object();
    payload["type"] = type;
    if (params.is_object()) {
        for (auto it = params.begin(); it != params.end(); ++it) {
            if (it.key() != "type") {
                payload[it.key()] = it.value();
            }
        }
    } else if (!params.is_null()) {
        throw std::invalid_argument("Visual action params must be a JSON object. Got: " + params.dump());
    }
    return VisualAction(std::move(payload));
}

VisualActionKind VisualAction::kind() const {
    if (type_ == "highlightRange" || type_ == "dimRange") {
        return RangeAction{
            type_,
            number_field(payload_, type_, "from"),
            number_field(payload_, type_, "to")
        };
    }

    if (type_ == "compareElements") {
        auto it = payload_.find("result");
        if (it == payload_.end()) {
            return CompareAction{"undefined"};
        }
        return CompareAction{it->is_string() ? it->get<std::string>() : it->dump()};
    }

    if (type_ == "showAttentionWeights") {
        const auto& weights = array_field(payload_, type_, "weights");
        WeightsAction action;
        action.weights.reserve(weights.size());
        for (size_t i = 0; i < weights.size(); ++i) {
            if (!weights[i].is_number()) {
                throw std::invalid_argument(fmt::format(
                    "{}: weight[{}] must be a number. Got: {}", type_, i, weights[i].dump()));
            }
            action.weights.push_back(weights[i].get<double>());
        }
        return action;
    }

    if (type_ == "updateBarChart") {
        BarChartAction action;
        action.value_count = array_field(payload_, type_, "values").size();

        auto it = payload_.find("labels");
        if (it != payload_.end() && !it->is_null()) {
            if (!it->is_array()) {
                throw std::invalid_argument(fmt::format(
                    "{}: \"labels\" must be an array. Got: {}", type_, it->dump()));
            }
            action.label_count = it->size();
        }
        return action;
    }

    return OtherAction{type_};
}

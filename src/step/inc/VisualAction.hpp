#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// highlightRange / dimRange
struct RangeAction {
    std::string type;
    double from = 0.0;
    double to = 0.0;
};

// compareElements
struct CompareAction {
    std::string result;
};

// showAttentionWeights
struct WeightsAction {
    std::vector<double> weights;
};

// updateBarChart
struct BarChartAction {
    size_t value_count = 0;
    std::optional<size_t> label_count;
};

// Any tag without a validation rule. Always accepted.
struct OtherAction {
    std::string type;
};

using VisualActionKind = std::variant<
    OtherAction,
    RangeAction,
    CompareAction,
    WeightsAction,
    BarChartAction
>;

// One rendering instruction. The flat wire payload ({"type": ..., <fields>})
// is kept verbatim so unknown tags and fields pass through untouched.
class VisualAction {
public:
    explicit VisualAction(nlohmann::json payload);

    // Builds {"type": type} merged with the entries of params
    static VisualAction make(const std::string& type, const nlohmann::json& params = nlohmann::json::object());

    const std::string& type() const { return type_; }
    const nlohmann::json& payload() const { return payload_; }

    // Typed view used by the validator. Throws std::invalid_argument when a
    // recognized tag lacks a required field or carries the wrong JSON type.
    VisualActionKind kind() const;

    bool operator==(const VisualAction& other) const { return payload_ == other.payload_; }
    bool operator!=(const VisualAction& other) const { return !(*this == other); }

private:
    std::string type_;
    nlohmann::json payload_;
};

namespace nlohmann {

    template<>
    struct adl_serializer<VisualAction> {
        static VisualAction from_json(const json& j) {
            return VisualAction(j);
        }

        static void to_json(json& j, const VisualAction& action) {
            j = action.payload();
        }
    };

}

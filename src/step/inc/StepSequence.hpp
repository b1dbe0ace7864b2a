#pragma once

#include "Step.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Bumped only on breaking changes to the wire format
constexpr int STEP_FORMAT_VERSION = 1;

// Provenance tag written into generatedBy by this runtime
constexpr const char* STEPGEN_GENERATED_BY = "cpp";

// The packaged, validated trace of one run. Never returned unless every
// sequence invariant holds; treated as immutable afterwards.
struct StepSequence {
    int format_version = STEP_FORMAT_VERSION;
    std::string algorithm_id;
    nlohmann::json inputs = nlohmann::json::object();   // Caller inputs, verbatim
    std::vector<Step> steps;
    std::string generated_at;                           // ISO-8601, set once at packaging
    std::string generated_by = STEPGEN_GENERATED_BY;
};

void to_json(nlohmann::json& j, const StepSequence& sequence);
void from_json(const nlohmann::json& j, StepSequence& sequence);

std::string dump_step_sequence(const StepSequence& sequence, int indent = 2);

// Fixture persistence. Loading returns the raw document so it can be
// checked by StepSequenceDocumentValidator before anything trusts it.
void save_step_sequence(const StepSequence& sequence, const std::string& path, int indent = 2);
nlohmann::json load_step_sequence_document(const std::string& path);

#include "StepSequence.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

void to_json(nlohmann::json& j, const StepSequence& sequence) {
    j = nlohmann::json{
        {"formatVersion", sequence.format_version},
        {"algorithmId", sequence.algorithm_id},
        {"inputs", sequence.inputs},
        {"steps", sequence.steps},
        {"generatedAt", sequence.generated_at},
        {"generatedBy", sequence.generated_by}
    };
}

void from_json(const nlohmann::json& j, StepSequence& sequence) {
    j.at("formatVersion").get_to(sequence.format_version);
    j.at("algorithmId").get_to(sequence.algorithm_id);
    sequence.inputs = j.at("inputs");

    sequence.steps.clear();
    for (const auto& step_json : j.at("steps")) {
        sequence.steps.push_back(step_json.get<Step>());
    }

    j.at("generatedAt").get_to(sequence.generated_at);
    j.at("generatedBy").get_to(sequence.generated_by);
}

std::string dump_step_sequence(const StepSequence& sequence, int indent) {
    return nlohmann::json(sequence).dump(indent);
}

void save_step_sequence(const StepSequence& sequence, const std::string& path, int indent) {
    std::filesystem::path file_path(path);
    if (file_path.has_parent_path() && !std::filesystem::exists(file_path.parent_path())) {
        std::filesystem::create_directories(file_path.parent_path());
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to open step sequence file for writing: " + path);
    }

    out << dump_step_sequence(sequence, indent) << '\n';
    if (!out) {
        throw std::runtime_error("Failed to write step sequence file: " + path);
    }
}

nlohmann::json load_step_sequence_document(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open step sequence file: " + path);
    }

    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse step sequence file '" + path + "': " + e.what());
    }
}

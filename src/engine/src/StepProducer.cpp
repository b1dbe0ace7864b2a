#include "StepProducer.hpp"
#include "StepSequenceDocumentValidator.hpp"
#include <stdexcept>

GeneratorDefinition make_generator(const std::string& id, ProducerFactory factory) {
    if (!StepSequenceDocumentValidator::is_valid_algorithm_id(id)) {
        throw std::invalid_argument(
            "Invalid algorithm ID \"" + id + "\". Must match pattern: ^[a-z0-9][a-z0-9-]*$ "
            "(lowercase alphanumeric and hyphens, starting with a letter or digit).");
    }

    if (!factory) {
        throw std::invalid_argument("Generator \"" + id + "\" has no producer factory.");
    }

    return GeneratorDefinition{id, std::move(factory)};
}

bool FunctionProducer::resume(StepBuilder& step) {
    if (!body_) {
        return false;
    }
    return body_(step);
}

bool StepListProducer::resume(StepBuilder& step) {
    if (next_ >= inputs_.size()) {
        return false;
    }

    step.build(inputs_[next_++]);
    return next_ < inputs_.size();
}

#pragma once

#include "StepBuilder.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// A cooperative, pull-based producer. Each resume() runs to the next
// suspension point, building zero or more steps through the builder, and
// picks up where the previous call left off. Returns false once finished.
class StepProducer {
public:
    virtual ~StepProducer() = default;

    virtual bool resume(StepBuilder& step) = 0;
};

// Creates a fresh producer for one run
using ProducerFactory = std::function<std::unique_ptr<StepProducer>(const nlohmann::json& inputs)>;

struct GeneratorDefinition {
    std::string id;          // ^[a-z0-9][a-z0-9-]*$
    ProducerFactory create;
};

// Throws std::invalid_argument on a malformed id or an empty factory
GeneratorDefinition make_generator(const std::string& id, ProducerFactory factory);

// Producer whose body is a resumable closure; the closure keeps its own state
class FunctionProducer : public StepProducer {
public:
    using Body = std::function<bool(StepBuilder&)>;

    explicit FunctionProducer(Body body) : body_(std::move(body)) {}

    bool resume(StepBuilder& step) override;

private:
    Body body_;
};

// Replays a fixed list of inputs, one step per resume
class StepListProducer : public StepProducer {
public:
    explicit StepListProducer(std::vector<StepInput> inputs) : inputs_(std::move(inputs)) {}

    bool resume(StepBuilder& step) override;

private:
    std::vector<StepInput> inputs_;
    size_t next_ = 0;
};

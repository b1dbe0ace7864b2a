#pragma once

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>

// The single error type raised by the step runtime. Callers tell failure
// kinds apart by step_index() and message(), never by exception class.
class GeneratorError : public std::runtime_error {
public:
    // Failure happened before any step existed
    static constexpr int64_t NO_STEP = -1;

    GeneratorError(const std::string& algorithm_id,
                   int64_t step_index,
                   const std::string& message,
                   std::exception_ptr cause = nullptr);

    const std::string& algorithm_id() const noexcept { return algorithm_id_; }
    int64_t step_index() const noexcept { return step_index_; }
    const std::string& message() const noexcept { return message_; }

    // Original exception when this wraps an unexpected producer failure
    std::exception_ptr cause() const noexcept { return cause_; }
    bool has_cause() const noexcept { return static_cast<bool>(cause_); }
    std::string cause_message() const;

private:
    std::string algorithm_id_;
    int64_t step_index_;
    std::string message_;
    std::exception_ptr cause_;
};

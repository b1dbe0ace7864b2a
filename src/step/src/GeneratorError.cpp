#include "GeneratorError.hpp"
#include <fmt/format.h>

GeneratorError::GeneratorError(const std::string& algorithm_id,
                               int64_t step_index,
                               const std::string& message,
                               std::exception_ptr cause)
    : std::runtime_error(fmt::format("[{}] Step {}: {}", algorithm_id, step_index, message)),
      algorithm_id_(algorithm_id),
      step_index_(step_index),
      message_(message),
      cause_(std::move(cause)) {}

std::string GeneratorError::cause_message() const {
    if (!cause_) {
        return {};
    }

    try {
        std::rethrow_exception(cause_);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

#include "essay_anonymizer/core/error_codes.hpp"
#include <utility>

namespace essay_anonymizer {
namespace core {

RedactError::RedactError(RedactErrorCode code, const std::string& message,
                         common::ErrorContext context)
    : std::runtime_error(message.empty() ? RedactErrorCodeHelper::getMessage(code) : message),
      code_(code),
      context_(std::move(context)) {}

}}

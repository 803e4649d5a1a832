#include "pipeline/error_sanitizer.hpp"

#include <fmt/format.h>

#include "common/string_util.hpp"

bool ErrorSanitizer::is_safe_message(std::string_view message) {
    const std::string lowered = to_lower(message);
    for (const auto safe : kSafeErrorSubstrings) {
        if (lowered.find(safe) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::string ErrorSanitizer::generic_message(ErrorKind kind) {
    return fmt::format("{}: An error occurred. Enable debug_mode for details.", error_kind_name(kind));
}

std::string ErrorSanitizer::sanitize(ErrorKind kind, std::string_view message) const {
    if (debug_mode_ || is_safe_message(message)) {
        return std::string(message);
    }
    return generic_message(kind);
}

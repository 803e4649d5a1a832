#include "logger/pii_redactor.hpp"

PiiRedactor::PiiRedactor() {
    const auto flags = std::regex_constants::ECMAScript;

    rules_.push_back({std::regex(R"(\b\d{4}[-\s]?\d{4}[-\s]?\d{4}[-\s]?\d{4}\b)", flags), "[CARD_REDACTED]"});
    rules_.push_back({std::regex(R"(\b\d{3}-\d{2}-\d{4}\b)", flags), "[SSN_REDACTED]"});
    rules_.push_back({std::regex(R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)", flags), "[EMAIL_REDACTED]"});
    rules_.push_back({std::regex(R"(\b\d{3}[-.]?\d{3}[-.]?\d{4}\b)", flags), "[PHONE_REDACTED]"});
    rules_.push_back({std::regex(R"(\+\d{1,3}[-.\s]?\d{1,4}[-.\s]?\d{1,4}[-.\s]?\d{1,9}\b)", flags), "[PHONE_REDACTED]"});
}

std::string PiiRedactor::redact(std::string_view text) const {
    std::string out(text);
    for (const auto& rule : rules_) {
        out = std::regex_replace(out, rule.pattern, rule.replacement);
    }
    return out;
}

ParameterMap PiiRedactor::redact(const ParameterMap& params) const {
    ParameterMap out;
    for (const auto& [name, value] : params) {
        out.emplace(name, redact(value));
    }
    return out;
}

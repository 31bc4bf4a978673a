// File: src/pipeline/input_validator.cpp
#include "pipeline/input_validator.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>

namespace careledger {

namespace {

std::string ToLower(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

std::string Trim(const std::string& text) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(text.begin(), text.end(), not_space);
    auto end = std::find_if(text.rbegin(), text.rend(), not_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

InputValidator::InputValidator()
    : config_() {
}

InputValidator::InputValidator(const Config& config)
    : config_(config) {
}

const std::string& InputValidator::EmergencyMessage() {
    static const std::string message =
        "EMERGENCY ALERT: Your message indicates a potential emergency. "
        "Please contact emergency services (911 in US) immediately or go to the "
        "nearest emergency room. Do not rely on this system for emergency care.";
    return message;
}

void InputValidator::ValidateOwnerId(const std::string& owner_id) const {
    if (owner_id.empty()) {
        throw ValidationError("Owner id is required");
    }
    if (owner_id.size() > config_.max_owner_id_length) {
        throw ValidationError("Owner id too long (max " +
                              std::to_string(config_.max_owner_id_length) + " characters)");
    }
    bool valid = std::all_of(owner_id.begin(), owner_id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
    if (!valid) {
        throw ValidationError("Owner id contains invalid characters: '" + owner_id + "'");
    }
}

std::string InputValidator::SanitizeQuery(const std::string& query_text) const {
    std::string sanitized = Trim(query_text);

    if (sanitized.empty()) {
        throw ValidationError("Query text cannot be empty");
    }
    if (sanitized.size() > config_.max_query_length) {
        throw ValidationError("Query text too long (max " +
                              std::to_string(config_.max_query_length) + " characters)");
    }

    std::string lowered = ToLower(sanitized);
    for (const auto& pattern : config_.blocked_patterns) {
        if (lowered.find(ToLower(pattern)) != std::string::npos) {
            throw ValidationError("Query text contains a disallowed pattern");
        }
    }
    return sanitized;
}

QueryRequest InputValidator::Validate(const QueryRequest& request) const {
    ValidateOwnerId(request.owner_id);

    QueryRequest validated = request;
    validated.query_text = SanitizeQuery(request.query_text);

    if (request.result_limit &&
        (*request.result_limit == 0 || *request.result_limit > config_.max_result_limit)) {
        throw ValidationError("result_limit must be between 1 and " +
                              std::to_string(config_.max_result_limit));
    }
    if (request.similarity_floor &&
        !(*request.similarity_floor >= -1.0f && *request.similarity_floor <= 1.0f)) {
        throw ValidationError("similarity_floor must be in [-1, 1]");
    }
    if (request.time_weight &&
        !(*request.time_weight >= 0.0 && *request.time_weight <= 1.0)) {
        throw ValidationError("time_weight must be in [0, 1]");
    }
    return validated;
}

EmergencyCheck InputValidator::CheckEmergency(const std::string& text) const {
    EmergencyCheck check;
    std::string lowered = ToLower(text);

    for (const auto& keyword : config_.emergency_keywords) {
        if (lowered.find(ToLower(keyword)) != std::string::npos) {
            check.keywords.push_back(keyword);
        }
    }

    check.detected = !check.keywords.empty();
    if (check.detected) {
        check.message = EmergencyMessage();
    }
    return check;
}

} // namespace careledger

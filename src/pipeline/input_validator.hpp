// File: src/pipeline/input_validator.hpp
#pragma once

#include "pipeline/query_result.hpp"
#include <string>
#include <vector>

namespace careledger {

/// Emergency phrases found in a query
struct EmergencyCheck {
    bool detected{false};
    std::vector<std::string> keywords;
    std::string message;
};

/// First pipeline stage: rejects malformed input and detects emergencies
class InputValidator {
public:
    struct Config {
        Config() = default;

        size_t max_owner_id_length{100};
        size_t max_query_length{5000};
        size_t max_result_limit{1000};

        /// Case-insensitive substrings that abort the query with a safety message
        std::vector<std::string> blocked_patterns{
            "<script", "javascript:", "onerror=", "onload="};

        /// Case-insensitive phrases that short-circuit to the emergency response
        std::vector<std::string> emergency_keywords{
            "chest pain", "can't breathe", "suicide", "severe bleeding",
            "unconscious", "stroke", "heart attack", "overdose",
            "severe pain", "can't move", "seizure"};
    };

    InputValidator();
    explicit InputValidator(const Config& config);

    /// @throws ValidationError if the owner id is empty, too long or has
    ///         characters outside [A-Za-z0-9_-]
    void ValidateOwnerId(const std::string& owner_id) const;

    /// Trimmed query text
    /// @throws ValidationError if empty, too long or containing a blocked pattern
    std::string SanitizeQuery(const std::string& query_text) const;

    /// Validate every field of a request; returns it with the text sanitized
    /// @throws ValidationError on the first violation
    QueryRequest Validate(const QueryRequest& request) const;

    EmergencyCheck CheckEmergency(const std::string& text) const;

    /// Fixed response for emergency input
    static const std::string& EmergencyMessage();

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
};

} // namespace careledger

// File: include/cli/cli_config.hpp
//
// YAML configuration for the CareLedger CLI
// Every key is optional; missing keys keep their defaults

#ifndef CARELEDGER_CLI_CONFIG_HPP
#define CARELEDGER_CLI_CONFIG_HPP

#include <string>
#include <optional>
#include <vector>
#include <cstddef>

namespace careledger {

struct ServiceConfig;
struct StoreConfig;

/// Configuration structure for the CareLedger CLI
struct CliConfig {
    // === Interface Settings ===
    struct Interface {
        std::string prompt = "careledger> ";
        bool colors_enabled = true;
        bool verbose = false;
    } interface;

    // === Storage Settings ===
    struct Storage {
        std::string backend = "sqlite";
        std::string db_path = "careledger.db";
        bool enable_wal = true;
    } storage;

    // === Embedding Settings ===
    struct EmbeddingSettings {
        size_t dimension = 384;
    } embedding;

    // === Ranking Settings ===
    struct Ranking {
        size_t result_limit = 10;
        float similarity_floor = 0.5f;
        double time_weight = 0.3;
        int recent_window_days = 180;
    } ranking;

    // === Reinforcement and Decay Settings ===
    struct Memory {
        int decay_threshold_days = 365;
        double decay_scale = 1000.0;
        double min_decay = 0.3;
        unsigned protection_access_threshold = 5;
        double protected_floor = 0.7;
        double base_increment = 0.05;
        double level_bonus = 0.15;
        unsigned level_interval = 3;
    } memory;

    // === Forgotten Insight Settings ===
    struct InsightSettings {
        size_t max_insights = 3;
        std::string markers = "recommended,follow-up,suggested,referred,advised";
    } insight;

    // === Pipeline Settings ===
    struct Pipeline {
        long collaborator_timeout_ms = 2000;
        long lock_timeout_ms = 1000;
        int lock_retries = 3;
    } pipeline;

    // === Logging Settings ===
    struct Logging {
        std::string level = "info";
        std::string pattern = "[%H:%M:%S] [%^%l%$] %v";
    } logging;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return CliConfig structure if successful, std::nullopt on error
    static std::optional<CliConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return CliConfig structure if successful, std::nullopt on error
    static std::optional<CliConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// YAML representation that LoadFromString reads back
    std::string ToYamlString() const;

    /// Validate configuration values
    bool Validate() const;

    /// Get validation errors (if any)
    std::vector<std::string> GetValidationErrors() const;

    /// Comma-separated insight markers, trimmed, empty entries dropped
    std::vector<std::string> InsightMarkers() const;

    /// Settings for the record store factory
    StoreConfig ToStoreConfig() const;

    /// Settings for every service component
    ServiceConfig ToServiceConfig() const;

    /// Create default configuration
    static CliConfig Default();
};

} // namespace careledger

#endif // CARELEDGER_CLI_CONFIG_HPP

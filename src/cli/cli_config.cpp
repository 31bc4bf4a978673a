// File: src/cli/cli_config.cpp
//
// YAML configuration implementation for the CareLedger CLI

#include "cli/cli_config.hpp"
#include "service/memory_service.hpp"
#include "storage/record_store.hpp"
#include "core/logging.hpp"
#include <yaml.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace careledger {

// Helper function to read string from YAML scalar
static std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                      event->data.scalar.length);
}

// Helper to convert string to bool
static bool ParseBool(const std::string& value) {
    return (value == "true" || value == "True" || value == "TRUE" ||
            value == "yes" || value == "Yes" || value == "YES" ||
            value == "1" || value == "on" || value == "On" || value == "ON");
}

static const char* BoolString(bool value) {
    return value ? "true" : "false";
}

static std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t");
    return value.substr(first, last - first + 1);
}

/// Apply one `section.key: value` pair; unknown keys are ignored
/// @throws std::invalid_argument or std::out_of_range for unparsable numbers
static void ApplySetting(CliConfig& config, const std::string& section,
                         const std::string& key, const std::string& value) {
    if (section == "interface") {
        if (key == "prompt") config.interface.prompt = value;
        else if (key == "colors_enabled") config.interface.colors_enabled = ParseBool(value);
        else if (key == "verbose") config.interface.verbose = ParseBool(value);
    }
    else if (section == "storage") {
        if (key == "backend") config.storage.backend = value;
        else if (key == "db_path") config.storage.db_path = value;
        else if (key == "enable_wal") config.storage.enable_wal = ParseBool(value);
    }
    else if (section == "embedding") {
        if (key == "dimension") config.embedding.dimension = std::stoul(value);
    }
    else if (section == "ranking") {
        if (key == "result_limit") config.ranking.result_limit = std::stoul(value);
        else if (key == "similarity_floor") config.ranking.similarity_floor = std::stof(value);
        else if (key == "time_weight") config.ranking.time_weight = std::stod(value);
        else if (key == "recent_window_days") config.ranking.recent_window_days = std::stoi(value);
    }
    else if (section == "memory") {
        if (key == "decay_threshold_days") config.memory.decay_threshold_days = std::stoi(value);
        else if (key == "decay_scale") config.memory.decay_scale = std::stod(value);
        else if (key == "min_decay") config.memory.min_decay = std::stod(value);
        else if (key == "protection_access_threshold") config.memory.protection_access_threshold = std::stoul(value);
        else if (key == "protected_floor") config.memory.protected_floor = std::stod(value);
        else if (key == "base_increment") config.memory.base_increment = std::stod(value);
        else if (key == "level_bonus") config.memory.level_bonus = std::stod(value);
        else if (key == "level_interval") config.memory.level_interval = std::stoul(value);
    }
    else if (section == "insight") {
        if (key == "max_insights") config.insight.max_insights = std::stoul(value);
        else if (key == "markers") config.insight.markers = value;
    }
    else if (section == "pipeline") {
        if (key == "collaborator_timeout_ms") config.pipeline.collaborator_timeout_ms = std::stol(value);
        else if (key == "lock_timeout_ms") config.pipeline.lock_timeout_ms = std::stol(value);
        else if (key == "lock_retries") config.pipeline.lock_retries = std::stoi(value);
    }
    else if (section == "logging") {
        if (key == "level") config.logging.level = value;
        else if (key == "pattern") config.logging.pattern = value;
    }
}

std::optional<CliConfig> CliConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        GetLogger()->error("Failed to open config file: {}", filepath);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<CliConfig> CliConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        GetLogger()->error("Failed to initialize YAML parser");
        return std::nullopt;
    }

    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    CliConfig config = Default();
    std::string current_section;
    std::string current_key;
    int depth = 0;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            GetLogger()->error("YAML parse error at line {}: {}",
                               parser.problem_mark.line + 1,
                               parser.problem ? parser.problem : "unknown problem");
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        switch (event.type) {
            case YAML_MAPPING_START_EVENT:
                depth++;
                break;

            case YAML_MAPPING_END_EVENT:
                depth--;
                if (depth == 1) {
                    current_section.clear();
                }
                break;

            case YAML_SCALAR_EVENT: {
                std::string value = GetScalarValue(&event);

                if (depth == 1) {
                    // Top-level key (section name)
                    current_section = value;
                } else if (depth == 2) {
                    if (current_key.empty()) {
                        current_key = value;
                    } else {
                        try {
                            ApplySetting(config, current_section, current_key, value);
                        } catch (const std::logic_error& e) {
                            // stoul and friends throw invalid_argument / out_of_range
                            GetLogger()->error("Invalid value '{}' for {}.{}: {}",
                                               value, current_section, current_key, e.what());
                            yaml_event_delete(&event);
                            yaml_parser_delete(&parser);
                            return std::nullopt;
                        }
                        current_key.clear();
                    }
                }
                break;
            }

            case YAML_STREAM_END_EVENT:
            case YAML_DOCUMENT_END_EVENT:
                done = true;
                break;

            default:
                break;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    if (!config.Validate()) {
        GetLogger()->error("Configuration validation failed:");
        for (const auto& error : config.GetValidationErrors()) {
            GetLogger()->error("  - {}", error);
        }
        return std::nullopt;
    }

    return config;
}

bool CliConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        GetLogger()->error("Failed to open file for writing: {}", filepath);
        return false;
    }

    file << ToYamlString();
    return static_cast<bool>(file);
}

std::string CliConfig::ToYamlString() const {
    std::ostringstream ss;

    ss << "# CareLedger CLI Configuration\n\n";

    ss << "interface:\n";
    ss << "  prompt: \"" << interface.prompt << "\"\n";
    ss << "  colors_enabled: " << BoolString(interface.colors_enabled) << "\n";
    ss << "  verbose: " << BoolString(interface.verbose) << "\n\n";

    ss << "storage:\n";
    ss << "  backend: \"" << storage.backend << "\"\n";
    ss << "  db_path: \"" << storage.db_path << "\"\n";
    ss << "  enable_wal: " << BoolString(storage.enable_wal) << "\n\n";

    ss << "embedding:\n";
    ss << "  dimension: " << embedding.dimension << "\n\n";

    ss << "ranking:\n";
    ss << "  result_limit: " << ranking.result_limit << "\n";
    ss << "  similarity_floor: " << ranking.similarity_floor << "\n";
    ss << "  time_weight: " << ranking.time_weight << "\n";
    ss << "  recent_window_days: " << ranking.recent_window_days << "\n\n";

    ss << "memory:\n";
    ss << "  decay_threshold_days: " << memory.decay_threshold_days << "\n";
    ss << "  decay_scale: " << memory.decay_scale << "\n";
    ss << "  min_decay: " << memory.min_decay << "\n";
    ss << "  protection_access_threshold: " << memory.protection_access_threshold << "\n";
    ss << "  protected_floor: " << memory.protected_floor << "\n";
    ss << "  base_increment: " << memory.base_increment << "\n";
    ss << "  level_bonus: " << memory.level_bonus << "\n";
    ss << "  level_interval: " << memory.level_interval << "\n\n";

    ss << "insight:\n";
    ss << "  max_insights: " << insight.max_insights << "\n";
    ss << "  markers: \"" << insight.markers << "\"\n\n";

    ss << "pipeline:\n";
    ss << "  collaborator_timeout_ms: " << pipeline.collaborator_timeout_ms << "\n";
    ss << "  lock_timeout_ms: " << pipeline.lock_timeout_ms << "\n";
    ss << "  lock_retries: " << pipeline.lock_retries << "\n\n";

    ss << "logging:\n";
    ss << "  level: \"" << logging.level << "\"\n";
    ss << "  pattern: \"" << logging.pattern << "\"\n";

    return ss.str();
}

bool CliConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> CliConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    if (storage.backend != "sqlite" && storage.backend != "memory") {
        errors.push_back("storage backend must be one of: sqlite, memory");
    }
    if (storage.backend == "sqlite" && storage.db_path.empty()) {
        errors.push_back("db_path must not be empty for the sqlite backend");
    }

    if (embedding.dimension == 0) {
        errors.push_back("embedding dimension must be greater than 0");
    }

    // Ranking
    if (ranking.result_limit == 0) {
        errors.push_back("result_limit must be greater than 0");
    }
    if (ranking.similarity_floor < -1.0f || ranking.similarity_floor > 1.0f) {
        errors.push_back("similarity_floor must be between -1.0 and 1.0");
    }
    if (ranking.time_weight < 0.0 || ranking.time_weight > 1.0) {
        errors.push_back("time_weight must be between 0.0 and 1.0");
    }
    if (ranking.recent_window_days <= 0) {
        errors.push_back("recent_window_days must be greater than 0");
    }

    // Reinforcement and decay
    if (memory.decay_threshold_days < 0) {
        errors.push_back("decay_threshold_days must be non-negative");
    }
    if (memory.decay_scale <= 0.0) {
        errors.push_back("decay_scale must be greater than 0");
    }
    if (memory.min_decay <= 0.0 || memory.min_decay > 1.0) {
        errors.push_back("min_decay must be in (0.0, 1.0]");
    }
    if (memory.protected_floor < memory.min_decay || memory.protected_floor > 1.0) {
        errors.push_back("protected_floor must be between min_decay and 1.0");
    }
    if (memory.base_increment < 0.0 || memory.level_bonus < 0.0) {
        errors.push_back("reinforcement increments must be non-negative");
    }
    if (memory.level_interval == 0) {
        errors.push_back("level_interval must be greater than 0");
    }

    if (insight.max_insights == 0) {
        errors.push_back("max_insights must be greater than 0");
    }
    if (InsightMarkers().empty()) {
        errors.push_back("at least one insight marker is required");
    }

    // Pipeline
    if (pipeline.collaborator_timeout_ms <= 0) {
        errors.push_back("collaborator_timeout_ms must be greater than 0");
    }
    if (pipeline.lock_timeout_ms <= 0) {
        errors.push_back("lock_timeout_ms must be greater than 0");
    }
    if (pipeline.lock_retries < 0) {
        errors.push_back("lock_retries must be non-negative");
    }

    static const std::vector<std::string> kLevels{
        "trace", "debug", "info", "warn", "warning", "error", "critical", "off"};
    bool known_level = false;
    for (const auto& level : kLevels) {
        known_level = known_level || level == logging.level;
    }
    if (!known_level) {
        errors.push_back("logging level must be one of: trace, debug, info, warn, error, critical, off");
    }

    return errors;
}

std::vector<std::string> CliConfig::InsightMarkers() const {
    std::vector<std::string> markers;
    std::stringstream ss(insight.markers);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = Trim(item);
        if (!item.empty()) {
            markers.push_back(item);
        }
    }
    return markers;
}

StoreConfig CliConfig::ToStoreConfig() const {
    StoreConfig store_config;
    store_config.backend = storage.backend;
    store_config.db_path = storage.db_path;
    store_config.enable_wal = storage.enable_wal;
    return store_config;
}

ServiceConfig CliConfig::ToServiceConfig() const {
    ServiceConfig service_config;

    service_config.locks.timeout = std::chrono::milliseconds(pipeline.lock_timeout_ms);
    service_config.locks.retries = pipeline.lock_retries;

    service_config.ranking.recent_window_days = ranking.recent_window_days;

    service_config.memory.decay_threshold_days = memory.decay_threshold_days;
    service_config.memory.decay_scale = memory.decay_scale;
    service_config.memory.min_decay = memory.min_decay;
    service_config.memory.protection_access_threshold = memory.protection_access_threshold;
    service_config.memory.protected_floor = memory.protected_floor;
    service_config.memory.base_increment = memory.base_increment;
    service_config.memory.level_bonus = memory.level_bonus;
    service_config.memory.level_interval = memory.level_interval;

    service_config.insight.max_insights = insight.max_insights;
    service_config.insight.markers = InsightMarkers();

    service_config.pipeline.default_result_limit = ranking.result_limit;
    service_config.pipeline.default_similarity_floor = ranking.similarity_floor;
    service_config.pipeline.default_time_weight = ranking.time_weight;
    service_config.pipeline.collaborator_timeout =
        std::chrono::milliseconds(pipeline.collaborator_timeout_ms);

    return service_config;
}

CliConfig CliConfig::Default() {
    return CliConfig{};  // Uses default member initializers
}

} // namespace careledger

#pragma once

#include <string>

#include "lambdalang/types.hpp"

namespace lambdalang {

struct LogConfig {
    std::string level = "info";
    std::string file;
};

struct Config {
    std::string vocabulary_path;
    Lang language = Lang::EN;
    LogConfig log;
    std::string config_file;
};

// Default config file looked up in the working directory
constexpr const char* kDefaultConfigFile = "lambdalang.yaml";

// Vocabulary used when neither the config file nor the environment names one
std::string default_vocabulary_path();

/**
 * Load configuration.
 *
 * Order: built-in defaults, then the YAML file (if present), then the
 * environment (LAMBDALANG_VOCAB, LAMBDALANG_LANG, LAMBDALANG_LOG_LEVEL,
 * LAMBDALANG_LOG_FILE). A missing file is an error only when `required`.
 * Throws ConfigurationError on malformed files or invalid values.
 */
Config load_config(const std::string& config_file = kDefaultConfigFile, bool required = false);

// Parse configuration from YAML text (no environment overrides)
Config parse_config(const std::string& yaml_text);

void apply_env_overrides(Config& config);

// Apply log level and optional log file from the configuration
void init_logging(const Config& config);

} // namespace lambdalang

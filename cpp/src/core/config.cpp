#include "lambdalang/config.hpp"
#include "lambdalang/error.hpp"
#include "lambdalang/logging.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>

#ifndef LAMBDALANG_DEFAULT_VOCAB
#define LAMBDALANG_DEFAULT_VOCAB "data/atoms.json"
#endif

namespace lambdalang {

namespace {

void set_if_env(std::string& target, const char* env_var) {
    const char* value = std::getenv(env_var);
    if (value && *value) {
        target = value;
    }
}

Lang parse_language(const std::string& value, const std::string& origin) {
    auto lang = parse_lang(value);
    if (!lang) {
        throw ConfigurationError("Unknown language '" + value + "'", origin, "use 'en' or 'zh'");
    }
    return *lang;
}

void validate(const Config& config, const std::string& origin) {
    LogLevel level;
    if (!parse_log_level(config.log.level, level)) {
        throw ConfigurationError("Unknown log level '" + config.log.level + "'", origin,
                                 "use trace, debug, info, warn, error, critical or off");
    }
    LAMBDALANG_CHECK_CONFIG(!config.vocabulary_path.empty(), "No vocabulary configured", origin);
}

void read_yaml(Config& config, const YAML::Node& yaml, const std::string& origin) {
    if (yaml.IsNull()) return;
    LAMBDALANG_CHECK_CONFIG(yaml.IsMap(), "Configuration must be a mapping", origin);

    try {
        if (yaml["vocabulary"]) config.vocabulary_path = yaml["vocabulary"].as<std::string>();
        if (yaml["language"]) config.language = parse_language(yaml["language"].as<std::string>(), origin);

        if (const YAML::Node log = yaml["log"]) {
            if (log["level"]) config.log.level = log["level"].as<std::string>();
            if (log["file"]) config.log.file = log["file"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Invalid configuration value: " + std::string(e.what()), origin);
    }
}

} // namespace

std::string default_vocabulary_path() {
    return LAMBDALANG_DEFAULT_VOCAB;
}

Config parse_config(const std::string& yaml_text) {
    Config config;
    config.vocabulary_path = default_vocabulary_path();

    YAML::Node yaml;
    try {
        yaml = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Malformed configuration: " + std::string(e.what()), "<string>");
    }
    read_yaml(config, yaml, "<string>");
    validate(config, "<string>");
    return config;
}

void apply_env_overrides(Config& config) {
    set_if_env(config.vocabulary_path, "LAMBDALANG_VOCAB");
    set_if_env(config.log.level, "LAMBDALANG_LOG_LEVEL");
    set_if_env(config.log.file, "LAMBDALANG_LOG_FILE");

    std::string lang;
    set_if_env(lang, "LAMBDALANG_LANG");
    if (!lang.empty()) config.language = parse_language(lang, "LAMBDALANG_LANG");
}

Config load_config(const std::string& config_file, bool required) {
    Config config;
    config.vocabulary_path = default_vocabulary_path();

    if (!config_file.empty() && std::filesystem::exists(config_file)) {
        YAML::Node yaml;
        try {
            yaml = YAML::LoadFile(config_file);
        } catch (const YAML::Exception& e) {
            throw ConfigurationError("Malformed configuration: " + std::string(e.what()), config_file);
        }
        read_yaml(config, yaml, config_file);
        config.config_file = config_file;
    } else if (required) {
        throw ConfigurationError("Configuration file not found: " + config_file, "load_config");
    }

    apply_env_overrides(config);
    validate(config, config.config_file.empty() ? "environment" : config.config_file);
    return config;
}

void init_logging(const Config& config) {
    LogLevel level = LogLevel::INFO;
    if (!parse_log_level(config.log.level, level)) {
        throw ConfigurationError("Unknown log level '" + config.log.level + "'", "init_logging");
    }
    set_log_level(level);

    if (!config.log.file.empty()) {
        Logger::getInstance().set_output_file(config.log.file);
    }

    if (!config.config_file.empty()) {
        LOG_DEBUG("Loaded configuration from file: ", config.config_file);
    }
    LOG_DEBUG("Log level: ", log_level_name(level), ", vocabulary: ", config.vocabulary_path);
}

} // namespace lambdalang

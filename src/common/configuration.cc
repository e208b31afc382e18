#include "configuration.h"
#include <algorithm>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Pushline {

namespace {

// Applies the "pushline:" section of a parsed document to the config.
void ApplyYAML(const YAML::Node& yaml, PushlineConfig& config) {
    if (!yaml["pushline"]) {
        LOG(WARNING) << "Configuration has no 'pushline' section, using defaults";
        return;
    }
    auto root = yaml["pushline"];

    // Pipeline
    if (root["pipeline"]) {
        auto pipeline = root["pipeline"];
        if (pipeline["queue_size"]) config.pipeline.queue_size.set(pipeline["queue_size"].as<size_t>());
        if (pipeline["batch_size"]) config.pipeline.batch_size.set(pipeline["batch_size"].as<size_t>());
        if (pipeline["batch_timeout"]) config.pipeline.batch_timeout.set(pipeline["batch_timeout"].as<double>());
        if (pipeline["batch_max_timeout"]) config.pipeline.batch_max_timeout.set(pipeline["batch_max_timeout"].as<double>());
        if (pipeline["out_batch_size"]) config.pipeline.out_batch_size.set(pipeline["out_batch_size"].as<size_t>());
        if (pipeline["out_batch_timeout"]) config.pipeline.out_batch_timeout.set(pipeline["out_batch_timeout"].as<double>());
        if (pipeline["out_max_futures"]) config.pipeline.out_max_futures.set(pipeline["out_max_futures"].as<size_t>());
        if (pipeline["phase_timeout"]) config.pipeline.phase_timeout.set(pipeline["phase_timeout"].as<double>());
        if (pipeline["interrupt_interval"]) config.pipeline.interrupt_interval.set(pipeline["interrupt_interval"].as<double>());
    }

    // Checksum
    if (root["checksum"]) {
        auto checksum = root["checksum"];
        if (checksum["threads"]) config.checksum.threads.set(checksum["threads"].as<int>());
    }

    // Progress
    if (root["progress"]) {
        auto progress = root["progress"];
        if (progress["interval"]) config.progress.interval.set(progress["interval"].as<int>());
    }

    // Associate
    if (root["associate"]) {
        auto associate = root["associate"];
        if (associate["retries"]) config.associate.retries.set(associate["retries"].as<int>());
    }

    // Remote
    if (root["remote"]) {
        auto remote = root["remote"];
        if (remote["worker_threads"]) config.remote.worker_threads.set(remote["worker_threads"].as<int>());
        if (remote["shared_client"]) config.remote.shared_client.set(remote["shared_client"].as<bool>());
        if (remote["rpm_upload_repo"]) config.remote.rpm_upload_repo.set(remote["rpm_upload_repo"].as<std::string>());
    }

    // Publish
    if (root["publish"]) {
        auto publish = root["publish"];
        if (publish["force"]) config.publish.force.set(publish["force"].as<bool>());
        if (publish["clean"]) config.publish.clean.set(publish["clean"].as<bool>());
    }
}

} // namespace

const Configuration& GetConfig() {
    return Configuration::getInstance();
}

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoull(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stod(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        ApplyYAML(yaml, config_);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        ApplyYAML(yaml, config_);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    const auto& pipeline = config_.pipeline;
    if (pipeline.queue_size.get() < 1) {
        validation_errors_.push_back("Queue size must be at least 1");
    }
    if (pipeline.batch_size.get() < 1 || pipeline.out_batch_size.get() < 1) {
        validation_errors_.push_back("Batch sizes must be at least 1");
    }
    if (pipeline.batch_timeout.get() < 0 || pipeline.batch_max_timeout.get() < pipeline.batch_timeout.get()) {
        validation_errors_.push_back("Batch timeouts must satisfy 0 <= batch_timeout <= batch_max_timeout");
    }
    if (pipeline.out_max_futures.get() < 1) {
        validation_errors_.push_back("Max outstanding futures must be at least 1");
    }
    if (pipeline.phase_timeout.get() <= 0) {
        validation_errors_.push_back("Phase timeout must be positive");
    }
    if (pipeline.interrupt_interval.get() <= 0) {
        validation_errors_.push_back("Interrupt interval must be positive");
    }

    if (config_.checksum.threads.get() < 1) {
        validation_errors_.push_back("Checksum threads must be at least 1");
    }
    if (config_.progress.interval.get() < 0) {
        validation_errors_.push_back("Progress interval cannot be negative");
    }
    if (config_.associate.retries.get() < 0) {
        validation_errors_.push_back("Associate retries cannot be negative");
    }
    if (config_.remote.worker_threads.get() < 1) {
        validation_errors_.push_back("Remote worker threads must be at least 1");
    }
    if (config_.remote.rpm_upload_repo.get().empty()) {
        validation_errors_.push_back("RPM upload repository must be set");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Pushline

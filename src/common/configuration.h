#ifndef PUSHLINE_CONFIGURATION_H_
#define PUSHLINE_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace Pushline {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct PushlineConfig {
    // Stage queues, batching and deadlock guards
    struct Pipeline {
        ConfigValue<size_t> queue_size{10, "PUSHLINE_QUEUE_SIZE"};
        ConfigValue<size_t> batch_size{1000, "PUSHLINE_BATCH_SIZE"};
        // Seconds. Input batching waits between these two bounds depending
        // on how full the output queue is.
        ConfigValue<double> batch_timeout{0.1, "PUSHLINE_BATCH_TIMEOUT"};
        ConfigValue<double> batch_max_timeout{60.0, "PUSHLINE_BATCH_MAX_TIMEOUT"};
        ConfigValue<size_t> out_batch_size{100, "PUSHLINE_OUT_BATCH_SIZE"};
        ConfigValue<double> out_batch_timeout{10.0, "PUSHLINE_OUT_BATCH_TIMEOUT"};
        ConfigValue<size_t> out_max_futures{10, "PUSHLINE_OUT_MAX_FUTURES"};
        ConfigValue<double> phase_timeout{200000.0, "PUSHLINE_PHASE_TIMEOUT"};
        ConfigValue<double> interrupt_interval{1.0, "PUSHLINE_INTERRUPT_INTERVAL"};
    } pipeline;

    struct Checksum {
        ConfigValue<int> threads{4, "PUSHLINE_CHECKSUM_THREADS"};
    } checksum;

    struct Progress {
        // Seconds between progress log lines, 0 disables.
        ConfigValue<int> interval{300, "PUSHLINE_PROGRESS_INTERVAL"};
    } progress;

    struct Associate {
        ConfigValue<int> retries{2, "PUSHLINE_ASSOCIATE_RETRIES"};
    } associate;

    struct Remote {
        ConfigValue<int> worker_threads{4, "PUSHLINE_REMOTE_THREADS"};
        // One client for all stages, or one client per stage.
        ConfigValue<bool> shared_client{true, "PUSHLINE_REMOTE_SHARED_CLIENT"};
        ConfigValue<std::string> rpm_upload_repo{"all-rpm-content", "PUSHLINE_RPM_UPLOAD_REPO"};
    } remote;

    struct Publish {
        ConfigValue<bool> force{false, "PUSHLINE_PUBLISH_FORCE"};
        ConfigValue<bool> clean{false, "PUSHLINE_PUBLISH_CLEAN"};
    } publish;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const PushlineConfig& config() const { return config_; }
    PushlineConfig& config() { return config_; }

    // Restore every value to its built-in default
    void reset() { config_ = PushlineConfig(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    PushlineConfig config_;
    mutable std::vector<std::string> validation_errors_;
};

// Global accessor used throughout the pipeline
const Configuration& GetConfig();

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Pushline

#endif // PUSHLINE_CONFIGURATION_H_

#ifndef TOLLGATE_CONFIGURATION_H_
#define TOLLGATE_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace YAML {
class Node;
}

namespace Tollgate {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), default_(default_value), env_var_(env_var) {}

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
    void reset() { value_ = default_; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    T default_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct TollgateConfig {
    // Shared atomic store
    struct Store {
        // "memory" keeps the store in-process; "remote" talks to tollgate_store_server.
        ConfigValue<std::string> backend{"memory", "TOLLGATE_STORE_BACKEND"};
        ConfigValue<std::string> address{"127.0.0.1:50061", "TOLLGATE_STORE_ADDRESS"};
        ConfigValue<int> listen_port{50061, "TOLLGATE_STORE_LISTEN_PORT"};
        ConfigValue<int> rpc_timeout_ms{500, "TOLLGATE_STORE_RPC_TIMEOUT_MS"};
        ConfigValue<int> connect_timeout_ms{2000, "TOLLGATE_STORE_CONNECT_TIMEOUT_MS"};
        ConfigValue<std::string> key_prefix{"tollgate:", "TOLLGATE_STORE_KEY_PREFIX"};
    } store;

    // Inbound webhook signing
    struct Signature {
        ConfigValue<std::string> secret{"", "TOLLGATE_SIGNING_SECRET"};
        ConfigValue<std::string> header_name{"x-tollgate-signature", "TOLLGATE_SIGNATURE_HEADER"};
        ConfigValue<std::string> timestamp_header{"x-tollgate-request-timestamp", "TOLLGATE_TIMESTAMP_HEADER"};
        ConfigValue<int> tolerance_seconds{300, "TOLLGATE_SIGNATURE_TOLERANCE_SECONDS"};
    } signature;

    struct Idempotency {
        ConfigValue<int> ttl_seconds{86400, "TOLLGATE_DEDUP_TTL_SECONDS"};
        ConfigValue<std::string> key_namespace{"webhook-dedup", "TOLLGATE_DEDUP_NAMESPACE"};
        // treat_as_new | treat_as_duplicate
        ConfigValue<std::string> store_failure_policy{"treat_as_new", "TOLLGATE_DEDUP_STORE_FAILURE_POLICY"};
    } idempotency;

    struct Lock {
        ConfigValue<int> default_ttl_seconds{30, "TOLLGATE_LOCK_TTL_SECONDS"};
        ConfigValue<int> retry_delay_ms{50, "TOLLGATE_LOCK_RETRY_DELAY_MS"};
        ConfigValue<int> max_retries{20, "TOLLGATE_LOCK_MAX_RETRIES"};
    } lock;

    struct RateLimit {
        ConfigValue<int> token_bucket_ttl_seconds{3600, "TOLLGATE_TOKEN_BUCKET_TTL_SECONDS"};
    } rate_limit;

    struct Resilience {
        ConfigValue<int> max_attempts{3, "TOLLGATE_RETRY_MAX_ATTEMPTS"};
        ConfigValue<int> retry_delay_ms{1000, "TOLLGATE_RETRY_DELAY_MS"};
        ConfigValue<bool> exponential_backoff{true, "TOLLGATE_RETRY_EXPONENTIAL"};
        ConfigValue<int> failure_threshold{5, "TOLLGATE_BREAKER_FAILURE_THRESHOLD"};
        ConfigValue<int> open_timeout_ms{60000, "TOLLGATE_BREAKER_OPEN_TIMEOUT_MS"};
        ConfigValue<int> max_parallel{5, "TOLLGATE_BATCH_MAX_PARALLEL"};
        ConfigValue<bool> continue_on_error{true, "TOLLGATE_BATCH_CONTINUE_ON_ERROR"};
        ConfigValue<int> worker_threads{8, "TOLLGATE_WORKER_THREADS"};
    } resilience;
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

    // Restore every value to its compiled-in default
    void resetToDefaults();

    // Get the configuration
    const TollgateConfig& config() const { return config_; }
    TollgateConfig& config() { return config_; }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    TollgateConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& yaml);
};

// Shorthand for Configuration::getInstance().config()
const TollgateConfig& GetConfig();

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Tollgate

#endif // TOLLGATE_CONFIGURATION_H_

#include "configuration.h"
#include <algorithm>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Tollgate {

const TollgateConfig& GetConfig() {
    return Configuration::getInstance().config();
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
        applyYAML(YAML::LoadFile(filename));
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        applyYAML(YAML::Load(yaml_content));
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::resetToDefaults() {
    config_ = TollgateConfig{};
    validation_errors_.clear();
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["tollgate"]) {
        LOG(WARNING) << "Configuration has no top-level 'tollgate' section; keeping defaults";
        return;
    }
    auto root = yaml["tollgate"];

    // Store
    if (root["store"]) {
        auto store = root["store"];
        if (store["backend"]) config_.store.backend.set(store["backend"].as<std::string>());
        if (store["address"]) config_.store.address.set(store["address"].as<std::string>());
        if (store["listen_port"]) config_.store.listen_port.set(store["listen_port"].as<int>());
        if (store["rpc_timeout_ms"]) config_.store.rpc_timeout_ms.set(store["rpc_timeout_ms"].as<int>());
        if (store["connect_timeout_ms"]) config_.store.connect_timeout_ms.set(store["connect_timeout_ms"].as<int>());
        if (store["key_prefix"]) config_.store.key_prefix.set(store["key_prefix"].as<std::string>());
    }

    // Signature
    if (root["signature"]) {
        auto signature = root["signature"];
        if (signature["secret"]) config_.signature.secret.set(signature["secret"].as<std::string>());
        if (signature["header_name"]) config_.signature.header_name.set(signature["header_name"].as<std::string>());
        if (signature["timestamp_header"]) config_.signature.timestamp_header.set(signature["timestamp_header"].as<std::string>());
        if (signature["tolerance_seconds"]) config_.signature.tolerance_seconds.set(signature["tolerance_seconds"].as<int>());
    }

    // Idempotency
    if (root["idempotency"]) {
        auto idempotency = root["idempotency"];
        if (idempotency["ttl_seconds"]) config_.idempotency.ttl_seconds.set(idempotency["ttl_seconds"].as<int>());
        if (idempotency["key_namespace"]) config_.idempotency.key_namespace.set(idempotency["key_namespace"].as<std::string>());
        if (idempotency["store_failure_policy"]) config_.idempotency.store_failure_policy.set(idempotency["store_failure_policy"].as<std::string>());
    }

    // Lock
    if (root["lock"]) {
        auto lock = root["lock"];
        if (lock["default_ttl_seconds"]) config_.lock.default_ttl_seconds.set(lock["default_ttl_seconds"].as<int>());
        if (lock["retry_delay_ms"]) config_.lock.retry_delay_ms.set(lock["retry_delay_ms"].as<int>());
        if (lock["max_retries"]) config_.lock.max_retries.set(lock["max_retries"].as<int>());
    }

    // Rate limit
    if (root["rate_limit"]) {
        auto rate_limit = root["rate_limit"];
        if (rate_limit["token_bucket_ttl_seconds"]) config_.rate_limit.token_bucket_ttl_seconds.set(rate_limit["token_bucket_ttl_seconds"].as<int>());
    }

    // Resilience
    if (root["resilience"]) {
        auto resilience = root["resilience"];
        if (resilience["max_attempts"]) config_.resilience.max_attempts.set(resilience["max_attempts"].as<int>());
        if (resilience["retry_delay_ms"]) config_.resilience.retry_delay_ms.set(resilience["retry_delay_ms"].as<int>());
        if (resilience["exponential_backoff"]) config_.resilience.exponential_backoff.set(resilience["exponential_backoff"].as<bool>());
        if (resilience["failure_threshold"]) config_.resilience.failure_threshold.set(resilience["failure_threshold"].as<int>());
        if (resilience["open_timeout_ms"]) config_.resilience.open_timeout_ms.set(resilience["open_timeout_ms"].as<int>());
        if (resilience["max_parallel"]) config_.resilience.max_parallel.set(resilience["max_parallel"].as<int>());
        if (resilience["continue_on_error"]) config_.resilience.continue_on_error.set(resilience["continue_on_error"].as<bool>());
        if (resilience["worker_threads"]) config_.resilience.worker_threads.set(resilience["worker_threads"].as<int>());
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    // Store
    const std::string backend = config_.store.backend.get();
    if (backend != "memory" && backend != "remote") {
        validation_errors_.push_back("Store backend must be 'memory' or 'remote'");
    }
    if (config_.store.listen_port.get() < 1024 || config_.store.listen_port.get() > 65535) {
        validation_errors_.push_back("Store listen port must be between 1024 and 65535");
    }
    if (config_.store.rpc_timeout_ms.get() < 1) {
        validation_errors_.push_back("Store RPC timeout must be at least 1ms");
    }

    // Signature
    if (config_.signature.tolerance_seconds.get() < 1) {
        validation_errors_.push_back("Signature tolerance must be at least 1 second");
    }
    if (config_.signature.header_name.get().empty()) {
        validation_errors_.push_back("Signature header name cannot be empty");
    }

    // Idempotency
    if (config_.idempotency.ttl_seconds.get() < 1) {
        validation_errors_.push_back("Dedup TTL must be at least 1 second");
    }
    const std::string policy = config_.idempotency.store_failure_policy.get();
    if (policy != "treat_as_new" && policy != "treat_as_duplicate") {
        validation_errors_.push_back("Dedup store failure policy must be 'treat_as_new' or 'treat_as_duplicate'");
    }

    // Lock
    if (config_.lock.default_ttl_seconds.get() < 1) {
        validation_errors_.push_back("Lock TTL must be at least 1 second");
    }
    if (config_.lock.retry_delay_ms.get() < 0) {
        validation_errors_.push_back("Lock retry delay cannot be negative");
    }
    if (config_.lock.max_retries.get() < 0) {
        validation_errors_.push_back("Lock max retries cannot be negative");
    }

    if (config_.rate_limit.token_bucket_ttl_seconds.get() < 1) {
        validation_errors_.push_back("Token bucket TTL must be at least 1 second");
    }

    // Resilience
    if (config_.resilience.max_attempts.get() < 1) {
        validation_errors_.push_back("Retry max attempts must be at least 1");
    }
    if (config_.resilience.retry_delay_ms.get() < 0) {
        validation_errors_.push_back("Retry delay cannot be negative");
    }
    if (config_.resilience.failure_threshold.get() < 1) {
        validation_errors_.push_back("Breaker failure threshold must be at least 1");
    }
    if (config_.resilience.open_timeout_ms.get() < 1) {
        validation_errors_.push_back("Breaker open timeout must be at least 1ms");
    }
    if (config_.resilience.max_parallel.get() < 1) {
        validation_errors_.push_back("Batch max parallel must be at least 1");
    }
    if (config_.resilience.worker_threads.get() < 1) {
        validation_errors_.push_back("Worker threads must be at least 1");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Tollgate

#include "distributed_mutex.h"

#include <glog/logging.h>
#include <openssl/rand.h>

#include "absl/strings/escaping.h"

#include <stdexcept>

namespace Tollgate {

namespace {

constexpr char kLockNamespace[] = "distributed-lock";
constexpr int kTokenBytes = 16;

} // namespace

DistributedMutex::Options DistributedMutex::Options::FromConfig(const TollgateConfig& config) {
    Options options;
    options.default_ttl_seconds = config.lock.default_ttl_seconds.get();
    options.retry_delay_ms = config.lock.retry_delay_ms.get();
    options.max_retries = config.lock.max_retries.get();
    return options;
}

DistributedMutex::DistributedMutex(AtomicStore& store, Options options, Clock& clock)
    : store_(store), options_(options), clock_(clock) {}

std::string DistributedMutex::GenerateToken() {
    unsigned char bytes[kTokenBytes];
    if (RAND_bytes(bytes, kTokenBytes) != 1) {
        throw std::runtime_error("RAND_bytes failed to generate lock token");
    }
    return absl::BytesToHexString(
        absl::string_view(reinterpret_cast<const char*>(bytes), kTokenBytes));
}

std::string DistributedMutex::FullKey(const std::string& key) const {
    return store_.BuildKey(kLockNamespace, key);
}

std::string DistributedMutex::Acquire(const std::string& key) {
    return Acquire(key, options_.default_ttl_seconds, options_.max_retries);
}

std::string DistributedMutex::Acquire(const std::string& key, int ttl_seconds, int max_retries) {
    if (ttl_seconds <= 0) {
        throw std::invalid_argument("lock ttl must be positive");
    }
    const std::string lock_key = FullKey(key);
    const std::string token = GenerateToken();

    for (int attempt = 0; attempt <= max_retries; ++attempt) {
        bool acquired = false;
        try {
            acquired = store_.SetIfNotExists(lock_key, token, ttl_seconds);
        } catch (const std::exception& e) {
            LOG(ERROR) << "Error acquiring lock " << key << ": " << e.what();
            throw;
        }
        if (acquired) {
            VLOG(1) << "Lock acquired: " << key << " (attempt " << attempt + 1 << ")";
            return token;
        }
        if (attempt < max_retries) {
            clock_.SleepForMs(options_.retry_delay_ms);
        }
    }

    LOG(WARNING) << "Lock " << key << " still held after " << max_retries << " retries";
    throw LockAcquisitionTimeout(key, max_retries);
}

Result<std::string> DistributedMutex::TryAcquire(const std::string& key, int ttl_seconds, int max_retries) {
    try {
        return Acquire(key, ttl_seconds, max_retries);
    } catch (const TollgateError& e) {
        return Error{e.code(), e.what(), std::current_exception()};
    } catch (const std::exception& e) {
        return Error{ErrorCode::kStoreUnavailable, e.what(), std::current_exception()};
    }
}

bool DistributedMutex::Release(const std::string& key, const std::string& token) {
    try {
        const int64_t deleted = store_.ExecuteScript(AtomicScript::kCompareAndDelete,
                                                     {FullKey(key)}, {token});
        if (deleted == 1) {
            VLOG(1) << "Lock released: " << key;
            return true;
        }
        LOG(WARNING) << "Lock " << key << " was not held by this token at release (expired or taken over)";
        return false;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Error releasing lock " << key << ": " << e.what();
        return false;
    }
}

bool DistributedMutex::Extend(const std::string& key, const std::string& token, int ttl_seconds) {
    try {
        const int64_t extended = store_.ExecuteScript(AtomicScript::kCompareAndExpire,
                                                      {FullKey(key)}, {token, std::to_string(ttl_seconds)});
        if (extended != 1) {
            LOG(WARNING) << "Lock " << key << " could not be extended: not held by this token";
        }
        return extended == 1;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Error extending lock " << key << ": " << e.what();
        return false;
    }
}

bool DistributedMutex::IsLocked(const std::string& key) {
    try {
        return store_.Get(FullKey(key)).has_value();
    } catch (const std::exception& e) {
        LOG(ERROR) << "Error checking lock " << key << ": " << e.what();
        return false;
    }
}

} // namespace Tollgate

#include "idempotency_filter.h"

#include <glog/logging.h>

#include <stdexcept>

namespace Tollgate {

const char* StoreFailurePolicyName(StoreFailurePolicy policy) {
	switch (policy) {
		case StoreFailurePolicy::kTreatAsNew:
			return "treat_as_new";
		case StoreFailurePolicy::kTreatAsDuplicate:
			return "treat_as_duplicate";
	}
	return "unknown";
}

StoreFailurePolicy ParseStoreFailurePolicy(const std::string& name) {
	if (name == "treat_as_new") return StoreFailurePolicy::kTreatAsNew;
	if (name == "treat_as_duplicate") return StoreFailurePolicy::kTreatAsDuplicate;
	throw std::invalid_argument("Unknown store failure policy: " + name);
}

IdempotencyFilter::Options IdempotencyFilter::Options::FromConfig(const TollgateConfig& config) {
	Options options;
	options.ttl_seconds = config.idempotency.ttl_seconds.get();
	options.key_namespace = config.idempotency.key_namespace.get();
	options.store_failure_policy = ParseStoreFailurePolicy(config.idempotency.store_failure_policy.get());
	return options;
}

IdempotencyFilter::IdempotencyFilter(AtomicStore& store, Options options)
	: store_(store), options_(std::move(options)) {
	LOG(INFO) << "IdempotencyFilter ttl=" << options_.ttl_seconds << "s store_failure_policy="
		<< StoreFailurePolicyName(options_.store_failure_policy);
}

bool IdempotencyFilter::CheckAndMark(const std::string& event_id) {
	if (event_id.empty()) {
		throw std::invalid_argument("event id must not be empty");
	}
	const std::string key = store_.BuildKey(options_.key_namespace, event_id);

	try {
		if (store_.SetIfNotExists(key, "1", options_.ttl_seconds)) {
			VLOG(2) << "First delivery of event " << event_id;
			return false;
		}
		LOG(INFO) << "Duplicate delivery of event " << event_id << " suppressed";
		return true;
	} catch (const std::exception& e) {
		store_failures_.fetch_add(1);
		const bool duplicate = options_.store_failure_policy == StoreFailurePolicy::kTreatAsDuplicate;
		LOG(ERROR) << "Dedup store unavailable for event " << event_id << ": " << e.what()
			<< "; applying " << StoreFailurePolicyName(options_.store_failure_policy)
			<< " (duplicate=" << duplicate << ")";
		if (options_.on_store_failure) {
			options_.on_store_failure(event_id, e.what());
		}
		return duplicate;
	}
}

} // namespace Tollgate

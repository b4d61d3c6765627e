#ifndef TOLLGATE_SRC_INGRESS_IDEMPOTENCY_FILTER_H_
#define TOLLGATE_SRC_INGRESS_IDEMPOTENCY_FILTER_H_

#include <atomic>
#include <functional>
#include <string>

#include "../common/configuration.h"
#include "../store/atomic_store.h"

namespace Tollgate {

// What CheckAndMark answers when the store cannot be reached.
enum class StoreFailurePolicy {
	kTreatAsNew,        // process the event, accepting a possible double process
	kTreatAsDuplicate   // acknowledge without processing, accepting a possible drop
};

const char* StoreFailurePolicyName(StoreFailurePolicy policy);
StoreFailurePolicy ParseStoreFailurePolicy(const std::string& name);

/**
 * Duplicate suppression for at-least-once delivered events. A presence marker
 * per event id is created with set-if-not-exists, so exactly one caller per
 * TTL window sees "not a duplicate".
 */
class IdempotencyFilter {
	public:
		struct Options {
			int ttl_seconds = 86400;
			std::string key_namespace = "webhook-dedup";
			StoreFailurePolicy store_failure_policy = StoreFailurePolicy::kTreatAsNew;
			// Invoked with (event_id, error message) on every store failure.
			std::function<void(const std::string&, const std::string&)> on_store_failure;

			static Options FromConfig(const TollgateConfig& config);
		};

		IdempotencyFilter(AtomicStore& store, Options options);

		// True when event_id was already marked within the TTL window.
		// Throws std::invalid_argument for an empty id.
		bool CheckAndMark(const std::string& event_id);

		uint64_t StoreFailureCount() const { return store_failures_.load(); }

		StoreFailurePolicy policy() const { return options_.store_failure_policy; }

	private:
		AtomicStore& store_;
		Options options_;
		std::atomic<uint64_t> store_failures_{0};
};

} // namespace Tollgate

#endif // TOLLGATE_SRC_INGRESS_IDEMPOTENCY_FILTER_H_

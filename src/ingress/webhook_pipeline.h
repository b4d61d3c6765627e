#ifndef TOLLGATE_SRC_INGRESS_WEBHOOK_PIPELINE_H_
#define TOLLGATE_SRC_INGRESS_WEBHOOK_PIPELINE_H_

#include <functional>
#include <string>

#include "idempotency_filter.h"
#include "signature_gate.h"
#include "../concurrency/distributed_mutex.h"

namespace Tollgate {

// One inbound delivery. Only event_id and tenant_id are inspected; the body
// is opaque and handed to the handler as received.
struct WebhookEnvelope {
	HeaderMap headers;
	std::string raw_body;
	std::string event_id;
	std::string tenant_id;
};

enum class WebhookOutcome {
	kRejected,   // signature gate or envelope validation refused it
	kDuplicate,
	kProcessed,
	kFailed,     // handler raised; acknowledged so the sender stops redelivering
	kSkipped     // tenant lock not acquired within the retry budget
};

const char* WebhookOutcomeName(WebhookOutcome outcome);

struct WebhookAck {
	int http_status = 200;
	WebhookOutcome outcome = WebhookOutcome::kProcessed;
	std::string message;
};

using WebhookHandler = std::function<void(const WebhookEnvelope&)>;

/**
 * Ingress path for webhook deliveries:
 * signature gate -> idempotency filter -> tenant lock -> handler.
 *
 * Only gate rejections produce a non-2xx status. Everything past the gate is
 * acknowledged with 200, since the event id is already marked and a
 * redelivery would be suppressed anyway.
 *
 * A tenant lock timeout is a best-effort skip: the handler never runs, and
 * because the event id stays marked, redeliveries within the dedup TTL are
 * suppressed too. The event is lost unless the sender replays it after the
 * marker expires.
 */
class WebhookPipeline {
	public:
		struct Options {
			// <= 0 uses the mutex default
			int lock_ttl_seconds = 0;
		};

		// mutex may be null, in which case handlers run without a tenant lock.
		WebhookPipeline(const SignatureGate& gate, IdempotencyFilter& filter, DistributedMutex* mutex)
			: WebhookPipeline(gate, filter, mutex, Options()) {}
		WebhookPipeline(const SignatureGate& gate, IdempotencyFilter& filter,
				DistributedMutex* mutex, Options options);

		WebhookAck Handle(const WebhookEnvelope& envelope, const WebhookHandler& handler);

		static std::string TenantLockKey(const std::string& tenant_id) {
			return "tenant:" + tenant_id;
		}

	private:
		const SignatureGate& gate_;
		IdempotencyFilter& filter_;
		DistributedMutex* mutex_;
		Options options_;
};

} // namespace Tollgate

#endif // TOLLGATE_SRC_INGRESS_WEBHOOK_PIPELINE_H_

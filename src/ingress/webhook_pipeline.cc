#include "webhook_pipeline.h"

#include <glog/logging.h>

namespace Tollgate {

namespace {

int StatusForRejection(ErrorCode code) {
	switch (code) {
		case ErrorCode::kValidationFailed:
			return 400;
		case ErrorCode::kUnauthenticated:
			return 401;
		default:
			return 500;
	}
}

} // namespace

const char* WebhookOutcomeName(WebhookOutcome outcome) {
	switch (outcome) {
		case WebhookOutcome::kRejected: return "rejected";
		case WebhookOutcome::kDuplicate: return "duplicate";
		case WebhookOutcome::kProcessed: return "processed";
		case WebhookOutcome::kFailed: return "failed";
		case WebhookOutcome::kSkipped: return "skipped";
	}
	return "unknown";
}

WebhookPipeline::WebhookPipeline(const SignatureGate& gate, IdempotencyFilter& filter,
		DistributedMutex* mutex, Options options)
	: gate_(gate), filter_(filter), mutex_(mutex), options_(options) {}

WebhookAck WebhookPipeline::Handle(const WebhookEnvelope& envelope, const WebhookHandler& handler) {
	GateDecision decision = gate_.Verify(envelope.headers, envelope.raw_body);
	if (!decision.ok()) {
		return WebhookAck{StatusForRejection(decision.code), WebhookOutcome::kRejected, decision.reason};
	}

	if (envelope.event_id.empty()) {
		LOG(WARNING) << "Webhook without event id rejected";
		return WebhookAck{400, WebhookOutcome::kRejected, "Missing event id"};
	}

	if (filter_.CheckAndMark(envelope.event_id)) {
		return WebhookAck{200, WebhookOutcome::kDuplicate, "Event already processed"};
	}

	if (mutex_ == nullptr || envelope.tenant_id.empty()) {
		try {
			handler(envelope);
		} catch (const std::exception& e) {
			LOG(ERROR) << "Webhook handler failed for event " << envelope.event_id << ": " << e.what();
			return WebhookAck{200, WebhookOutcome::kFailed, std::string("Processing error: ") + e.what()};
		}
		return WebhookAck{200, WebhookOutcome::kProcessed, "Processed"};
	}

	Result<Unit> result = mutex_->TryWithLock(TenantLockKey(envelope.tenant_id),
			[&]() { handler(envelope); }, options_.lock_ttl_seconds);
	if (result.ok()) {
		return WebhookAck{200, WebhookOutcome::kProcessed, "Processed"};
	}

	const Error& error = result.error();
	if (error.code == ErrorCode::kLockTimeout) {
		LOG(WARNING) << "Skipping event " << envelope.event_id << ": tenant " << envelope.tenant_id
			<< " busy (" << error.message << ")";
		return WebhookAck{200, WebhookOutcome::kSkipped, "Skipped: tenant busy"};
	}
	LOG(ERROR) << "Webhook processing failed for event " << envelope.event_id << " ("
		<< ErrorCodeName(error.code) << "): " << error.message;
	return WebhookAck{200, WebhookOutcome::kFailed, "Processing error: " + error.message};
}

} // namespace Tollgate

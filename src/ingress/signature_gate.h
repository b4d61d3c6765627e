#ifndef TOLLGATE_SRC_INGRESS_SIGNATURE_GATE_H_
#define TOLLGATE_SRC_INGRESS_SIGNATURE_GATE_H_

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>

#include "../common/clock.h"
#include "../common/configuration.h"
#include "../common/errors.h"

namespace Tollgate {

// Request headers as received. Lookups are case-insensitive.
using HeaderMap = std::unordered_map<std::string, std::string>;

struct GateDecision {
	ErrorCode code = ErrorCode::kOk;
	std::string reason;

	bool ok() const { return code == ErrorCode::kOk; }
};

/**
 * Authenticity and freshness check for inbound webhooks.
 *
 * The signature header has the form "t=<unixSeconds>,v1=<hexHmacSha256>",
 * where the digest is HMAC-SHA256(secret, "<t>:<raw body>"). Several v1
 * entries may be present (secret rotation on the sender side); the request is
 * authentic if any of them matches. Digests are compared in constant time.
 *
 * Verify() has no side effects other than logging and must run before any
 * state-mutating logic.
 */
class SignatureGate {
	public:
		struct Options {
			std::string secret;
			std::string header_name = "x-tollgate-signature";
			// Optional companion header; when present it must equal t.
			std::string timestamp_header = "x-tollgate-request-timestamp";
			int tolerance_seconds = 300;

			static Options FromConfig(const TollgateConfig& config);
		};

		explicit SignatureGate(Options options, Clock& clock = SystemClock::Instance());

		GateDecision Verify(const HeaderMap& headers, std::string_view raw_body) const;

		// Header value for a body signed at the given unix time.
		std::string Sign(int64_t timestamp, std::string_view raw_body) const;

		// Lower-case hex HMAC-SHA256 over "<timestamp_text>:<raw_body>".
		static std::string ComputeDigestHex(std::string_view secret,
				std::string_view timestamp_text, std::string_view raw_body);

	private:
		GateDecision Reject(ErrorCode code, std::string reason, const HeaderMap& headers) const;

		Options options_;
		Clock& clock_;
};

// Case-insensitive header lookup; nullptr when absent.
const std::string* FindHeader(const HeaderMap& headers, std::string_view name);

} // namespace Tollgate

#endif // TOLLGATE_SRC_INGRESS_SIGNATURE_GATE_H_

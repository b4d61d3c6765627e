#include "signature_gate.h"

#include <glog/logging.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "absl/strings/ascii.h"
#include "absl/strings/escaping.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_split.h"

#include <cstdlib>
#include <stdexcept>
#include <vector>

namespace Tollgate {

namespace {

constexpr size_t kDigestSize = 32;  // SHA-256

// Keeps enough of a header value to correlate log lines without leaking it.
std::string Redact(const std::string& value) {
	constexpr size_t kVisible = 12;
	if (value.size() <= kVisible) {
		return value;
	}
	return value.substr(0, kVisible) + "...";
}

bool IsHexDigest(std::string_view text) {
	if (text.size() != kDigestSize * 2) {
		return false;
	}
	for (char c : text) {
		if (!absl::ascii_isxdigit(static_cast<unsigned char>(c))) {
			return false;
		}
	}
	return true;
}

std::string HmacSha256(std::string_view secret, std::string_view message) {
	unsigned char digest[EVP_MAX_MD_SIZE];
	unsigned int digest_len = 0;
	if (HMAC(EVP_sha256(), secret.data(), static_cast<int>(secret.size()),
				reinterpret_cast<const unsigned char*>(message.data()), message.size(),
				digest, &digest_len) == nullptr) {
		throw std::runtime_error("HMAC-SHA256 computation failed");
	}
	return std::string(reinterpret_cast<const char*>(digest), digest_len);
}

} // namespace

const std::string* FindHeader(const HeaderMap& headers, std::string_view name) {
	for (const auto& [key, value] : headers) {
		if (absl::EqualsIgnoreCase(key, name)) {
			return &value;
		}
	}
	return nullptr;
}

SignatureGate::Options SignatureGate::Options::FromConfig(const TollgateConfig& config) {
	Options options;
	options.secret = config.signature.secret.get();
	options.header_name = config.signature.header_name.get();
	options.timestamp_header = config.signature.timestamp_header.get();
	options.tolerance_seconds = config.signature.tolerance_seconds.get();
	return options;
}

SignatureGate::SignatureGate(Options options, Clock& clock)
	: options_(std::move(options)), clock_(clock) {
	if (options_.secret.empty()) {
		LOG(WARNING) << "SignatureGate created without a signing secret; every request will be rejected";
	}
}

std::string SignatureGate::ComputeDigestHex(std::string_view secret,
		std::string_view timestamp_text, std::string_view raw_body) {
	std::string message;
	message.reserve(timestamp_text.size() + 1 + raw_body.size());
	message.append(timestamp_text);
	message.push_back(':');
	message.append(raw_body);
	return absl::BytesToHexString(HmacSha256(secret, message));
}

std::string SignatureGate::Sign(int64_t timestamp, std::string_view raw_body) const {
	const std::string ts = std::to_string(timestamp);
	return "t=" + ts + ",v1=" + ComputeDigestHex(options_.secret, ts, raw_body);
}

GateDecision SignatureGate::Reject(ErrorCode code, std::string reason, const HeaderMap& headers) const {
	const std::string* signature = FindHeader(headers, options_.header_name);
	LOG(WARNING) << "Webhook signature verification failed: " << ErrorCodeName(code)
		<< " (" << reason << ") header=" << options_.header_name << ":"
		<< (signature ? Redact(*signature) : std::string("<absent>"));
	return GateDecision{code, std::move(reason)};
}

GateDecision SignatureGate::Verify(const HeaderMap& headers, std::string_view raw_body) const {
	if (options_.secret.empty()) {
		LOG(ERROR) << "Signing secret not configured";
		return GateDecision{ErrorCode::kConfigurationError, "Signing secret not configured"};
	}

	const std::string* header = FindHeader(headers, options_.header_name);
	if (header == nullptr || header->empty()) {
		return Reject(ErrorCode::kValidationFailed, "Missing signature header", headers);
	}

	// "t=<unix>,v1=<hex>[,v1=<hex>...]"; unknown schemes are ignored.
	std::string timestamp_text;
	std::vector<std::string> digests;
	for (absl::string_view part : absl::StrSplit(*header, ',')) {
		part = absl::StripAsciiWhitespace(part);
		std::pair<absl::string_view, absl::string_view> kv =
			absl::StrSplit(part, absl::MaxSplits('=', 1));
		if (kv.first == "t") {
			timestamp_text = std::string(kv.second);
		} else if (kv.first == "v1") {
			digests.emplace_back(kv.second);
		}
	}

	int64_t timestamp = 0;
	if (timestamp_text.empty() || !absl::SimpleAtoi(timestamp_text, &timestamp) || timestamp < 0) {
		return Reject(ErrorCode::kValidationFailed, "Missing or malformed timestamp", headers);
	}
	if (digests.empty()) {
		return Reject(ErrorCode::kValidationFailed, "Missing v1 signature", headers);
	}
	for (const auto& digest : digests) {
		if (!IsHexDigest(digest)) {
			return Reject(ErrorCode::kValidationFailed, "Malformed v1 signature", headers);
		}
	}

	if (!options_.timestamp_header.empty()) {
		const std::string* companion = FindHeader(headers, options_.timestamp_header);
		if (companion != nullptr) {
			int64_t companion_ts = 0;
			if (!absl::SimpleAtoi(*companion, &companion_ts) || companion_ts != timestamp) {
				return Reject(ErrorCode::kValidationFailed, "Timestamp header does not match signature", headers);
			}
		}
	}

	const int64_t now = clock_.NowSeconds();
	if (std::llabs(now - timestamp) > options_.tolerance_seconds) {
		return Reject(ErrorCode::kValidationFailed, "Request timestamp outside tolerance", headers);
	}

	std::string message;
	message.reserve(timestamp_text.size() + 1 + raw_body.size());
	message.append(timestamp_text);
	message.push_back(':');
	message.append(raw_body);
	const std::string expected = HmacSha256(options_.secret, message);

	// Every candidate is compared in full, no early exit.
	int matches = 0;
	for (const auto& digest : digests) {
		const std::string supplied = absl::HexStringToBytes(digest);
		matches |= (CRYPTO_memcmp(expected.data(), supplied.data(), kDigestSize) == 0) ? 1 : 0;
	}
	if (!matches) {
		return Reject(ErrorCode::kUnauthenticated, "Invalid signature", headers);
	}

	VLOG(2) << "Webhook signature verified (t=" << timestamp << ")";
	return GateDecision{};
}

} // namespace Tollgate

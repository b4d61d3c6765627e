#include "in_memory_store.h"

#include <glog/logging.h>
#include "absl/strings/numbers.h"

#include <mutex>
#include <stdexcept>

namespace Tollgate {

namespace {

int64_t ExpiryFor(int64_t now_ms, int ttl_seconds) {
	if (ttl_seconds <= 0) {
		throw std::invalid_argument("ttl_seconds must be positive, got " + std::to_string(ttl_seconds));
	}
	return now_ms + static_cast<int64_t>(ttl_seconds) * 1000;
}

int ParseTtlArg(const std::string& arg) {
	int ttl = 0;
	if (!absl::SimpleAtoi(arg, &ttl)) {
		throw std::invalid_argument("ttl argument is not an integer: " + arg);
	}
	return ttl;
}

void RequireArity(AtomicScript script, const std::vector<std::string>& keys,
		const std::vector<std::string>& args, size_t num_args) {
	if (keys.size() != 1 || args.size() != num_args) {
		throw std::invalid_argument(std::string("script ") + AtomicScriptName(script) +
				" expects 1 key and " + std::to_string(num_args) + " args");
	}
}

} // namespace

InMemoryAtomicStore::InMemoryAtomicStore(Clock& clock, std::string key_prefix)
	: AtomicStore(std::move(key_prefix)), clock_(clock) {}

const InMemoryAtomicStore::Entry* InMemoryAtomicStore::findLive(const Shard& shard,
		const std::string& key, int64_t now_ms) const {
	auto it = shard.data.find(key);
	if (it == shard.data.end() || it->second.expires_at_ms <= now_ms) {
		return nullptr;
	}
	return &it->second;
}

void InMemoryAtomicStore::sweepLocked(Shard& shard, int64_t now_ms) {
	absl::erase_if(shard.data, [now_ms](const auto& kv) {
		return kv.second.expires_at_ms <= now_ms;
	});
	shard.writes_since_sweep = 0;
}

void InMemoryAtomicStore::noteWriteLocked(Shard& shard, int64_t now_ms) {
	if (++shard.writes_since_sweep >= SWEEP_EVERY_WRITES) {
		sweepLocked(shard, now_ms);
	}
}

std::optional<std::string> InMemoryAtomicStore::Get(const std::string& key) {
	const int64_t now_ms = clock_.NowMs();
	const Shard& shard = shards_[getShardIndex(key)];
	std::shared_lock<std::shared_mutex> lock(shard.mutex);

	const Entry* entry = findLive(shard, key, now_ms);
	if (entry == nullptr) {
		return std::nullopt;
	}
	return entry->value;
}

void InMemoryAtomicStore::Set(const std::string& key, const std::string& value, int ttl_seconds) {
	const int64_t now_ms = clock_.NowMs();
	const int64_t expires_at = ExpiryFor(now_ms, ttl_seconds);
	Shard& shard = shards_[getShardIndex(key)];
	std::unique_lock<std::shared_mutex> lock(shard.mutex);

	shard.data[key] = Entry{value, expires_at};
	noteWriteLocked(shard, now_ms);
}

bool InMemoryAtomicStore::SetIfNotExists(const std::string& key, const std::string& value, int ttl_seconds) {
	const int64_t now_ms = clock_.NowMs();
	const int64_t expires_at = ExpiryFor(now_ms, ttl_seconds);
	Shard& shard = shards_[getShardIndex(key)];
	std::unique_lock<std::shared_mutex> lock(shard.mutex);

	if (findLive(shard, key, now_ms) != nullptr) {
		return false;
	}
	shard.data[key] = Entry{value, expires_at};
	noteWriteLocked(shard, now_ms);
	return true;
}

int64_t InMemoryAtomicStore::ExecuteScript(AtomicScript script,
		const std::vector<std::string>& keys,
		const std::vector<std::string>& args) {
	const int64_t now_ms = clock_.NowMs();

	switch (script) {
		case AtomicScript::kCompareAndDelete: {
			RequireArity(script, keys, args, 1);
			Shard& shard = shards_[getShardIndex(keys[0])];
			std::unique_lock<std::shared_mutex> lock(shard.mutex);

			const Entry* entry = findLive(shard, keys[0], now_ms);
			if (entry == nullptr || entry->value != args[0]) {
				return 0;
			}
			shard.data.erase(keys[0]);
			return 1;
		}
		case AtomicScript::kCompareAndExpire: {
			RequireArity(script, keys, args, 2);
			const int64_t expires_at = ExpiryFor(now_ms, ParseTtlArg(args[1]));
			Shard& shard = shards_[getShardIndex(keys[0])];
			std::unique_lock<std::shared_mutex> lock(shard.mutex);

			auto it = shard.data.find(keys[0]);
			if (it == shard.data.end() || it->second.expires_at_ms <= now_ms ||
					it->second.value != args[0]) {
				return 0;
			}
			it->second.expires_at_ms = expires_at;
			return 1;
		}
		case AtomicScript::kIncrementWithExpire: {
			RequireArity(script, keys, args, 1);
			const int64_t expires_at = ExpiryFor(now_ms, ParseTtlArg(args[0]));
			Shard& shard = shards_[getShardIndex(keys[0])];
			std::unique_lock<std::shared_mutex> lock(shard.mutex);

			auto it = shard.data.find(keys[0]);
			if (it == shard.data.end() || it->second.expires_at_ms <= now_ms) {
				shard.data[keys[0]] = Entry{"1", expires_at};
				noteWriteLocked(shard, now_ms);
				return 1;
			}
			int64_t current = 0;
			if (!absl::SimpleAtoi(it->second.value, &current)) {
				throw std::invalid_argument("value at " + keys[0] + " is not an integer");
			}
			it->second.value = std::to_string(current + 1);
			return current + 1;
		}
	}
	throw std::invalid_argument("unknown atomic script");
}

bool InMemoryAtomicStore::Remove(const std::string& key) {
	Shard& shard = shards_[getShardIndex(key)];
	std::unique_lock<std::shared_mutex> lock(shard.mutex);
	return shard.data.erase(key) > 0;
}

std::optional<int64_t> InMemoryAtomicStore::TtlMs(const std::string& key) const {
	const int64_t now_ms = clock_.NowMs();
	const Shard& shard = shards_[getShardIndex(key)];
	std::shared_lock<std::shared_mutex> lock(shard.mutex);

	const Entry* entry = findLive(shard, key, now_ms);
	if (entry == nullptr) {
		return std::nullopt;
	}
	return entry->expires_at_ms - now_ms;
}

size_t InMemoryAtomicStore::PurgeExpired() {
	const int64_t now_ms = clock_.NowMs();
	size_t removed = 0;
	for (auto& shard : shards_) {
		std::unique_lock<std::shared_mutex> lock(shard.mutex);
		const size_t before = shard.data.size();
		sweepLocked(shard, now_ms);
		removed += before - shard.data.size();
	}
	if (removed > 0) {
		VLOG(2) << "Purged " << removed << " expired keys";
	}
	return removed;
}

size_t InMemoryAtomicStore::Size() const {
	const int64_t now_ms = clock_.NowMs();
	size_t total = 0;
	for (const auto& shard : shards_) {
		std::shared_lock<std::shared_mutex> lock(shard.mutex);
		for (const auto& kv : shard.data) {
			if (kv.second.expires_at_ms > now_ms) {
				++total;
			}
		}
	}
	return total;
}

void InMemoryAtomicStore::Clear() {
	for (auto& shard : shards_) {
		std::unique_lock<std::shared_mutex> lock(shard.mutex);
		shard.data.clear();
		shard.writes_since_sweep = 0;
	}
}

} // namespace Tollgate

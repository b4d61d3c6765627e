#ifndef TOLLGATE_SRC_STORE_IN_MEMORY_STORE_H_
#define TOLLGATE_SRC_STORE_IN_MEMORY_STORE_H_

#include "absl/container/flat_hash_map.h"

#include "atomic_store.h"
#include "../common/clock.h"

#include <array>
#include <shared_mutex>

namespace Tollgate {

/**
 * Sharded, TTL-aware implementation of AtomicStore. Backs single-process
 * deployments and tests directly, and sits behind AtomicStoreServer when
 * several instances share it over gRPC.
 *
 * Every operation takes exactly one shard lock, which is what makes the
 * compare-and-act scripts atomic per key.
 */
class InMemoryAtomicStore final : public AtomicStore {
	private:
		// Number of shards - use power of 2 for efficient modulo with bit masking
		static const size_t NUM_SHARDS = 64;

		// Writes to a shard between opportunistic expiry sweeps of that shard
		static const uint32_t SWEEP_EVERY_WRITES = 1024;

		struct Entry {
			std::string value;
			int64_t expires_at_ms;
		};

		struct Shard {
			absl::flat_hash_map<std::string, Entry> data;
			mutable std::shared_mutex mutex;
			uint32_t writes_since_sweep = 0;

			Shard() = default;

			// Prevent copying and moving
			Shard(const Shard&) = delete;
			Shard& operator=(const Shard&) = delete;
		};

		std::array<Shard, NUM_SHARDS> shards_;
		Clock& clock_;

		inline size_t getShardIndex(const std::string& key) const {
			return std::hash<std::string>{}(key) & (NUM_SHARDS - 1);
		}

		// Shard lock must be held exclusively.
		void sweepLocked(Shard& shard, int64_t now_ms);
		void noteWriteLocked(Shard& shard, int64_t now_ms);

		// Returns the live entry for key or nullptr. Shard lock must be held.
		const Entry* findLive(const Shard& shard, const std::string& key, int64_t now_ms) const;

	public:
		explicit InMemoryAtomicStore(Clock& clock = SystemClock::Instance(),
				std::string key_prefix = "");

		std::optional<std::string> Get(const std::string& key) override;
		void Set(const std::string& key, const std::string& value, int ttl_seconds) override;
		bool SetIfNotExists(const std::string& key, const std::string& value, int ttl_seconds) override;
		int64_t ExecuteScript(AtomicScript script,
				const std::vector<std::string>& keys,
				const std::vector<std::string>& args) override;

		// Delete a key regardless of its value
		bool Remove(const std::string& key);

		// Remaining lifetime in milliseconds of a live key
		std::optional<int64_t> TtlMs(const std::string& key) const;

		// Drop every expired entry. Returns the number removed.
		size_t PurgeExpired();

		// Number of live keys across all shards
		size_t Size() const;

		void Clear();
};

} // namespace Tollgate

#endif // TOLLGATE_SRC_STORE_IN_MEMORY_STORE_H_

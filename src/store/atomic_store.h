#ifndef TOLLGATE_SRC_STORE_ATOMIC_STORE_H_
#define TOLLGATE_SRC_STORE_ATOMIC_STORE_H_

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Tollgate {

/**
 * Compare-and-act programs the store runs atomically with respect to every
 * other operation on the same key.
 *
 *  kCompareAndDelete    keys[0], args[0]=expected        -> 1 deleted, 0 otherwise
 *  kCompareAndExpire    keys[0], args[0]=expected,
 *                       args[1]=ttl_seconds              -> 1 extended, 0 otherwise
 *  kIncrementWithExpire keys[0], args[0]=ttl_seconds     -> value after increment;
 *                       the TTL is applied only when the increment creates the key
 */
enum class AtomicScript {
	kCompareAndDelete,
	kCompareAndExpire,
	kIncrementWithExpire
};

const char* AtomicScriptName(AtomicScript script);

/**
 * The shared key-value store every cross-instance coordination primitive
 * (locks, dedup markers, rate counters) is built on. Implementations throw
 * StoreUnavailableError when the backing store cannot be reached.
 *
 * Every write carries a TTL; ttl_seconds must be positive.
 */
class AtomicStore {
	public:
		explicit AtomicStore(std::string key_prefix = "") : key_prefix_(std::move(key_prefix)) {}
		virtual ~AtomicStore() = default;

		AtomicStore(const AtomicStore&) = delete;
		AtomicStore& operator=(const AtomicStore&) = delete;

		virtual std::optional<std::string> Get(const std::string& key) = 0;

		virtual void Set(const std::string& key, const std::string& value, int ttl_seconds) = 0;

		// Returns true when the key did not exist and was written.
		virtual bool SetIfNotExists(const std::string& key, const std::string& value, int ttl_seconds) = 0;

		virtual int64_t ExecuteScript(AtomicScript script,
				const std::vector<std::string>& keys,
				const std::vector<std::string>& args) = 0;

		// "<prefix><namespace>:<id>"
		std::string BuildKey(const std::string& key_namespace, const std::string& id) const {
			return key_prefix_ + key_namespace + ":" + id;
		}

		const std::string& key_prefix() const { return key_prefix_; }

	private:
		std::string key_prefix_;
};

} // namespace Tollgate

#endif // TOLLGATE_SRC_STORE_ATOMIC_STORE_H_

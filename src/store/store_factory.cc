#include "store_factory.h"

#include <glog/logging.h>

#include <stdexcept>

#include "in_memory_store.h"
#include "remote_store.h"

namespace Tollgate {

std::unique_ptr<AtomicStore> MakeAtomicStore(const TollgateConfig& config, Clock& clock) {
	const std::string backend = config.store.backend.get();
	const std::string prefix = config.store.key_prefix.get();

	if (backend == "memory") {
		LOG(INFO) << "Using in-process atomic store (prefix '" << prefix << "')";
		return std::make_unique<InMemoryAtomicStore>(clock, prefix);
	}
	if (backend == "remote") {
		auto store = std::make_unique<RemoteAtomicStore>(
				config.store.address.get(), config.store.rpc_timeout_ms.get(), prefix);
		if (!store->Connect(config.store.connect_timeout_ms.get())) {
			LOG(WARNING) << "Atomic store " << config.store.address.get()
				<< " not reachable yet; continuing degraded";
		}
		return store;
	}
	throw std::invalid_argument("Unknown store backend: " + backend);
}

} // namespace Tollgate

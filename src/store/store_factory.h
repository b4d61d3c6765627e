#ifndef TOLLGATE_SRC_STORE_STORE_FACTORY_H_
#define TOLLGATE_SRC_STORE_STORE_FACTORY_H_

#include <memory>

#include "atomic_store.h"
#include "../common/clock.h"
#include "../common/configuration.h"

namespace Tollgate {

// Builds the store selected by store.backend ("memory" or "remote").
// A remote store that cannot connect within store.connect_timeout_ms is still
// returned; its operations raise StoreUnavailableError until the server is up.
std::unique_ptr<AtomicStore> MakeAtomicStore(const TollgateConfig& config,
		Clock& clock = SystemClock::Instance());

} // namespace Tollgate

#endif // TOLLGATE_SRC_STORE_STORE_FACTORY_H_

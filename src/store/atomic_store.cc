#include "atomic_store.h"

namespace Tollgate {

const char* AtomicScriptName(AtomicScript script) {
	switch (script) {
		case AtomicScript::kCompareAndDelete:
			return "compare_and_delete";
		case AtomicScript::kCompareAndExpire:
			return "compare_and_expire";
		case AtomicScript::kIncrementWithExpire:
			return "increment_with_expire";
	}
	return "unknown";
}

} // namespace Tollgate

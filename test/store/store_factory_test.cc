#include <gtest/gtest.h>
#include "../../src/common/errors.h"
#include "../../src/store/in_memory_store.h"
#include "../../src/store/remote_store.h"
#include "../../src/store/store_factory.h"

#include <stdexcept>

using namespace Tollgate;

TEST(StoreFactoryTest, MemoryBackendUsesConfiguredPrefix) {
    TollgateConfig config;
    config.store.key_prefix.set("svc:");
    ManualClock clock;

    auto store = MakeAtomicStore(config, clock);
    ASSERT_NE(dynamic_cast<InMemoryAtomicStore*>(store.get()), nullptr);
    EXPECT_EQ(store->BuildKey("rate-limit", "org-1"), "svc:rate-limit:org-1");

    store->Set("k", "v", 1);
    EXPECT_EQ(*store->Get("k"), "v");
    clock.AdvanceMs(1000);
    EXPECT_FALSE(store->Get("k").has_value());
}

TEST(StoreFactoryTest, RemoteBackendIsReturnedEvenWhenUnreachable) {
    TollgateConfig config;
    config.store.backend.set("remote");
    config.store.address.set("127.0.0.1:1");
    config.store.rpc_timeout_ms.set(200);
    config.store.connect_timeout_ms.set(200);

    auto store = MakeAtomicStore(config);
    auto* remote = dynamic_cast<RemoteAtomicStore*>(store.get());
    ASSERT_NE(remote, nullptr);
    EXPECT_FALSE(remote->IsConnected());
    EXPECT_THROW(store->Get("k"), StoreUnavailableError);
}

TEST(StoreFactoryTest, UnknownBackendThrows) {
    TollgateConfig config;
    config.store.backend.set("redis");
    EXPECT_THROW(MakeAtomicStore(config), std::invalid_argument);
}

#include <gtest/gtest.h>
#include "../../src/common/errors.h"
#include "../../src/store/in_memory_store.h"
#include "../../src/store/remote_store.h"
#include "../../src/store/store_server.h"

#include <memory>
#include <stdexcept>

using namespace Tollgate;

class AtomicStoreServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_ = std::make_unique<AtomicStoreServer>(backing_, "127.0.0.1:0", 50);
        ASSERT_GT(server_->port(), 0);
        client_ = std::make_unique<RemoteAtomicStore>(
            "127.0.0.1:" + std::to_string(server_->port()), 2000, "remote:");
        ASSERT_TRUE(client_->Connect(5000));
    }

    void TearDown() override {
        client_.reset();
        if (server_) {
            server_->Shutdown();
        }
    }

    ManualClock clock_;
    InMemoryAtomicStore backing_{clock_};
    std::unique_ptr<AtomicStoreServer> server_;
    std::unique_ptr<RemoteAtomicStore> client_;
};

TEST_F(AtomicStoreServerTest, ClientOperationsReachBackingStore) {
    const std::string key = client_->BuildKey("ns", "id");
    EXPECT_EQ(key, "remote:ns:id");

    EXPECT_FALSE(client_->Get(key).has_value());
    client_->Set(key, "value", 30);
    EXPECT_EQ(*client_->Get(key), "value");
    EXPECT_EQ(*backing_.Get(key), "value");
}

TEST_F(AtomicStoreServerTest, SetIfNotExistsIsExclusiveAcrossTheWire) {
    EXPECT_TRUE(client_->SetIfNotExists("k", "a", 30));
    EXPECT_FALSE(client_->SetIfNotExists("k", "b", 30));
    EXPECT_EQ(*backing_.Get("k"), "a");
}

TEST_F(AtomicStoreServerTest, ScriptsExecuteOnServer) {
    client_->Set("lock", "token", 30);
    EXPECT_EQ(client_->ExecuteScript(AtomicScript::kCompareAndExpire, {"lock"}, {"token", "60"}), 1);
    EXPECT_EQ(*backing_.TtlMs("lock"), 60000);
    EXPECT_EQ(client_->ExecuteScript(AtomicScript::kCompareAndDelete, {"lock"}, {"other"}), 0);
    EXPECT_EQ(client_->ExecuteScript(AtomicScript::kCompareAndDelete, {"lock"}, {"token"}), 1);
    EXPECT_EQ(client_->ExecuteScript(AtomicScript::kIncrementWithExpire, {"count"}, {"10"}), 1);
    EXPECT_EQ(client_->ExecuteScript(AtomicScript::kIncrementWithExpire, {"count"}, {"10"}), 2);
}

TEST_F(AtomicStoreServerTest, InvalidArgumentsAreNotReportedAsUnavailable) {
    EXPECT_THROW(client_->Set("k", "v", 0), std::invalid_argument);
    EXPECT_TRUE(client_->IsConnected());
}

TEST_F(AtomicStoreServerTest, StoppedServerSurfacesStoreUnavailable) {
    server_->Shutdown();
    server_->Shutdown();
    EXPECT_THROW(client_->Get("k"), StoreUnavailableError);
    EXPECT_FALSE(client_->IsConnected());
}

TEST(RemoteAtomicStoreTest, UnreachableServerThrowsStoreUnavailable) {
    RemoteAtomicStore client("127.0.0.1:1", 200);
    EXPECT_FALSE(client.Connect(200));
    EXPECT_THROW(client.SetIfNotExists("k", "v", 10), StoreUnavailableError);
}

#ifndef TOLLGATE_SRC_STORE_REMOTE_STORE_H_
#define TOLLGATE_SRC_STORE_REMOTE_STORE_H_

#include <atomic>
#include <memory>
#include <string>

#include "atomic_store.h"

// Include the generated gRPC headers
#include "atomic_store.grpc.pb.h"

namespace Tollgate {

/**
 * @brief AtomicStore backed by a remote AtomicStoreService
 *
 * Thread-safe. Each call carries its own deadline; an RPC that fails for any
 * transport reason raises StoreUnavailableError so callers can apply their
 * own availability policy. Calls are never retried here.
 */
class RemoteAtomicStore final : public AtomicStore {
public:
    /**
     * @param server_address "host:port" of tollgate_store_server
     * @param rpc_timeout_ms deadline applied to every RPC
     * @param key_prefix prefix applied by BuildKey
     */
    RemoteAtomicStore(const std::string& server_address, int rpc_timeout_ms,
                      std::string key_prefix = "");

    /**
     * @brief Wait for the channel to become ready
     *
     * @param timeout_ms Maximum time to wait for connection
     * @return true if connected, false otherwise
     */
    bool Connect(int timeout_ms);

    bool IsConnected() const;

    std::optional<std::string> Get(const std::string& key) override;
    void Set(const std::string& key, const std::string& value, int ttl_seconds) override;
    bool SetIfNotExists(const std::string& key, const std::string& value, int ttl_seconds) override;
    int64_t ExecuteScript(AtomicScript script,
                          const std::vector<std::string>& keys,
                          const std::vector<std::string>& args) override;

private:
    // Throws for a non-OK status; marks the client disconnected on transport errors.
    void CheckStatus(const grpc::Status& status, const char* rpc);

    std::string server_address_;
    int rpc_timeout_ms_;
    std::shared_ptr<grpc::Channel> channel_;
    std::unique_ptr<tollgate::store::AtomicStoreService::Stub> stub_;
    std::atomic<bool> is_connected_{false};
};

} // namespace Tollgate

#endif // TOLLGATE_SRC_STORE_REMOTE_STORE_H_

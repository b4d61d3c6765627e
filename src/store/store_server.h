#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// Forward declarations
namespace grpc {
    class Server;
}

namespace Tollgate {

class InMemoryAtomicStore;
class AtomicStoreServiceImpl;

/**
 * Serves an InMemoryAtomicStore over gRPC so horizontally scaled instances
 * share one set of locks, dedup markers and rate counters. A background
 * thread purges expired keys every sweep_interval_ms.
 */
class AtomicStoreServer {
public:
    // listen_address "host:port"; port 0 picks a free port (see port()).
    AtomicStoreServer(InMemoryAtomicStore& store,
                      const std::string& listen_address,
                      int sweep_interval_ms = 1000);
    ~AtomicStoreServer();

    // Prevent copying
    AtomicStoreServer(const AtomicStoreServer&) = delete;
    AtomicStoreServer& operator=(const AtomicStoreServer&) = delete;

    // Port actually bound
    int port() const { return selected_port_; }

    // Explicitly shutdown the server. Idempotent.
    void Shutdown();

private:
    void SweepLoop();

    InMemoryAtomicStore& store_;
    std::unique_ptr<AtomicStoreServiceImpl> service_;
    std::unique_ptr<grpc::Server> server_;
    int selected_port_ = 0;
    int sweep_interval_ms_;

    std::thread sweep_thread_;
    std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;
    std::atomic<bool> running_{true};
};

} // namespace Tollgate

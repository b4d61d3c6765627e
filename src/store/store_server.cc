#include "store_server.h"

#include <grpcpp/grpcpp.h>
#include <glog/logging.h>

#include <chrono>
#include <stdexcept>

#include "atomic_store.grpc.pb.h"
#include "in_memory_store.h"

namespace Tollgate {

	using grpc::Server;
	using grpc::ServerBuilder;
	using grpc::ServerContext;
	using grpc::Status;
	using grpc::StatusCode;
	using tollgate::store::AtomicStoreService;

	class AtomicStoreServiceImpl final : public AtomicStoreService::Service {
		public:
			explicit AtomicStoreServiceImpl(InMemoryAtomicStore& store) : store_(store) {}

			Status Get(ServerContext* context, const tollgate::store::GetRequest* request,
					tollgate::store::GetResponse* response) override {
				return Guard("Get", [&] {
					auto value = store_.Get(request->key());
					response->set_found(value.has_value());
					if (value) {
						response->set_value(*value);
					}
				});
			}

			Status Set(ServerContext* context, const tollgate::store::SetRequest* request,
					tollgate::store::SetResponse* response) override {
				return Guard("Set", [&] {
					store_.Set(request->key(), request->value(), request->ttl_seconds());
				});
			}

			Status SetIfNotExists(ServerContext* context, const tollgate::store::SetRequest* request,
					tollgate::store::SetIfNotExistsResponse* response) override {
				return Guard("SetIfNotExists", [&] {
					response->set_written(
							store_.SetIfNotExists(request->key(), request->value(), request->ttl_seconds()));
				});
			}

			Status ExecuteScript(ServerContext* context, const tollgate::store::ScriptRequest* request,
					tollgate::store::ScriptResponse* response) override {
				AtomicScript script;
				switch (request->script()) {
					case tollgate::store::COMPARE_AND_DELETE:
						script = AtomicScript::kCompareAndDelete;
						break;
					case tollgate::store::COMPARE_AND_EXPIRE:
						script = AtomicScript::kCompareAndExpire;
						break;
					case tollgate::store::INCREMENT_WITH_EXPIRE:
						script = AtomicScript::kIncrementWithExpire;
						break;
					default:
						return Status(StatusCode::INVALID_ARGUMENT, "unknown script");
				}
				std::vector<std::string> keys(request->keys().begin(), request->keys().end());
				std::vector<std::string> args(request->args().begin(), request->args().end());
				return Guard(AtomicScriptName(script), [&] {
					response->set_result(store_.ExecuteScript(script, keys, args));
				});
			}

		private:
			// Maps store exceptions onto gRPC status codes.
			template<typename Fn>
			Status Guard(const char* rpc, Fn&& fn) {
				try {
					fn();
					return Status::OK;
				} catch (const std::invalid_argument& e) {
					VLOG(1) << "Rejected " << rpc << ": " << e.what();
					return Status(StatusCode::INVALID_ARGUMENT, e.what());
				} catch (const std::exception& e) {
					LOG(ERROR) << "Store error during " << rpc << ": " << e.what();
					return Status(StatusCode::INTERNAL, e.what());
				}
			}

			InMemoryAtomicStore& store_;
	};

	AtomicStoreServer::AtomicStoreServer(InMemoryAtomicStore& store,
			const std::string& listen_address,
			int sweep_interval_ms)
		: store_(store),
		service_(std::make_unique<AtomicStoreServiceImpl>(store)),
		sweep_interval_ms_(sweep_interval_ms) {
			ServerBuilder builder;
			builder.AddListeningPort(listen_address, grpc::InsecureServerCredentials(), &selected_port_);
			builder.RegisterService(service_.get());
			server_ = builder.BuildAndStart();
			if (!server_) {
				throw std::runtime_error("Failed to start atomic store server on " + listen_address);
			}
			LOG(INFO) << "Atomic store server listening on port " << selected_port_;
			sweep_thread_ = std::thread(&AtomicStoreServer::SweepLoop, this);
		}

	AtomicStoreServer::~AtomicStoreServer() {
		Shutdown();
	}

	void AtomicStoreServer::Shutdown() {
		bool expected = true;
		if (!running_.compare_exchange_strong(expected, false)) {
			return;
		}
		{
			std::lock_guard<std::mutex> lock(sweep_mutex_);
		}
		sweep_cv_.notify_all();
		if (sweep_thread_.joinable()) {
			sweep_thread_.join();
		}
		if (server_) {
			server_->Shutdown();
		}
		LOG(INFO) << "Atomic store server stopped";
	}

	void AtomicStoreServer::SweepLoop() {
		std::unique_lock<std::mutex> lock(sweep_mutex_);
		while (running_) {
			sweep_cv_.wait_for(lock, std::chrono::milliseconds(sweep_interval_ms_),
					[this] { return !running_; });
			if (!running_) {
				break;
			}
			store_.PurgeExpired();
		}
	}

} // namespace Tollgate

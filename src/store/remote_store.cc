#include "remote_store.h"

#include <grpcpp/grpcpp.h>
#include <glog/logging.h>

#include <chrono>
#include <stdexcept>

#include "../common/errors.h"

namespace Tollgate {

namespace {

tollgate::store::Script ToProtoScript(AtomicScript script) {
    switch (script) {
        case AtomicScript::kCompareAndDelete:
            return tollgate::store::COMPARE_AND_DELETE;
        case AtomicScript::kCompareAndExpire:
            return tollgate::store::COMPARE_AND_EXPIRE;
        case AtomicScript::kIncrementWithExpire:
            return tollgate::store::INCREMENT_WITH_EXPIRE;
    }
    return tollgate::store::SCRIPT_UNSPECIFIED;
}

} // namespace

RemoteAtomicStore::RemoteAtomicStore(const std::string& server_address, int rpc_timeout_ms,
                                     std::string key_prefix)
    : AtomicStore(std::move(key_prefix)),
      server_address_(server_address),
      rpc_timeout_ms_(rpc_timeout_ms) {
    channel_ = grpc::CreateChannel(server_address_, grpc::InsecureChannelCredentials());
    stub_ = tollgate::store::AtomicStoreService::NewStub(channel_);
}

bool RemoteAtomicStore::Connect(int timeout_ms) {
    LOG(INFO) << "Connecting to atomic store at " << server_address_ << " ...";
    auto deadline = std::chrono::system_clock::now() + std::chrono::milliseconds(timeout_ms);
    bool connected = channel_->WaitForConnected(deadline);
    is_connected_.store(connected, std::memory_order_release);
    if (!connected) {
        LOG(ERROR) << "Failed to connect to atomic store at " << server_address_ << " within "
                   << timeout_ms << "ms";
    }
    return connected;
}

bool RemoteAtomicStore::IsConnected() const {
    return is_connected_.load(std::memory_order_acquire);
}

void RemoteAtomicStore::CheckStatus(const grpc::Status& status, const char* rpc) {
    if (status.ok()) {
        is_connected_.store(true, std::memory_order_release);
        return;
    }
    if (status.error_code() == grpc::StatusCode::INVALID_ARGUMENT) {
        throw std::invalid_argument(std::string(rpc) + ": " + status.error_message());
    }
    is_connected_.store(false, std::memory_order_release);
    VLOG(1) << "Atomic store RPC " << rpc << " failed: " << status.error_code() << ": "
            << status.error_message();
    throw StoreUnavailableError(std::string("atomic store ") + rpc + " failed (" +
                                std::to_string(status.error_code()) + "): " +
                                status.error_message());
}

std::optional<std::string> RemoteAtomicStore::Get(const std::string& key) {
    tollgate::store::GetRequest request;
    request.set_key(key);
    tollgate::store::GetResponse response;

    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + std::chrono::milliseconds(rpc_timeout_ms_));
    CheckStatus(stub_->Get(&context, request, &response), "Get");

    if (!response.found()) {
        return std::nullopt;
    }
    return response.value();
}

void RemoteAtomicStore::Set(const std::string& key, const std::string& value, int ttl_seconds) {
    tollgate::store::SetRequest request;
    request.set_key(key);
    request.set_value(value);
    request.set_ttl_seconds(ttl_seconds);
    tollgate::store::SetResponse response;

    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + std::chrono::milliseconds(rpc_timeout_ms_));
    CheckStatus(stub_->Set(&context, request, &response), "Set");
}

bool RemoteAtomicStore::SetIfNotExists(const std::string& key, const std::string& value, int ttl_seconds) {
    tollgate::store::SetRequest request;
    request.set_key(key);
    request.set_value(value);
    request.set_ttl_seconds(ttl_seconds);
    tollgate::store::SetIfNotExistsResponse response;

    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + std::chrono::milliseconds(rpc_timeout_ms_));
    CheckStatus(stub_->SetIfNotExists(&context, request, &response), "SetIfNotExists");
    return response.written();
}

int64_t RemoteAtomicStore::ExecuteScript(AtomicScript script,
                                         const std::vector<std::string>& keys,
                                         const std::vector<std::string>& args) {
    tollgate::store::ScriptRequest request;
    request.set_script(ToProtoScript(script));
    for (const auto& key : keys) {
        request.add_keys(key);
    }
    for (const auto& arg : args) {
        request.add_args(arg);
    }
    tollgate::store::ScriptResponse response;

    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + std::chrono::milliseconds(rpc_timeout_ms_));
    CheckStatus(stub_->ExecuteScript(&context, request, &response), AtomicScriptName(script));
    return response.result();
}

} // namespace Tollgate

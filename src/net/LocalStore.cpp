#include "LocalStore.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace net {

std::string ReducerCall::describe() const {
    if (reducer == "create_storage_device") {
        return fmt::format("{}('{}' @ {:.2f},{:.2f},{:.2f})", reducer, text, position.x, position.y, position.z);
    }
    if (reducer == "initiate_transfer") {
        return fmt::format("{}(device={}, samples={}, packets={})", reducer, targetId,
                           composition.size(), totalCount(composition));
    }
    if (reducer == "complete_transfer") {
        return fmt::format("{}({})", reducer, targetId);
    }
    return reducer + "()";
}

LocalStore::LocalStore()
    : nextId_(std::make_shared<CallbackId>(kInvalidCallback)),
      players_(nextId_),
      sources_(nextId_),
      devices_(nextId_),
      transfers_(nextId_),
      messages_(nextId_),
      circuits_(nextId_),
      spheres_(nextId_),
      tunnels_(nextId_),
      miningSessions_(nextId_) {}

std::optional<Identity> LocalStore::identity() const {
    if (identity_.empty()) return std::nullopt;
    return identity_;
}

void LocalStore::subscribeAll() {
    if (!connected_) {
        spdlog::warn("[store] subscribeAll while disconnected");
        return;
    }
    subscriptionRequested_ = true;
}

CallbackId LocalStore::onConnect(ConnectCallback cb) {
    CallbackId id = ++*nextId_;
    connectCbs_.push_back({id, std::move(cb)});
    return id;
}

CallbackId LocalStore::onDisconnect(DisconnectCallback cb) {
    CallbackId id = ++*nextId_;
    disconnectCbs_.push_back({id, std::move(cb)});
    return id;
}

CallbackId LocalStore::onConnectError(ErrorCallback cb) {
    CallbackId id = ++*nextId_;
    errorCbs_.push_back({id, std::move(cb)});
    return id;
}

CallbackId LocalStore::onSubscriptionApplied(SubscriptionCallback cb) {
    CallbackId id = ++*nextId_;
    subscriptionCbs_.push_back({id, std::move(cb)});
    return id;
}

CallbackId LocalStore::onReducerError(ReducerErrorCallback cb) {
    CallbackId id = ++*nextId_;
    reducerErrorCbs_.push_back({id, std::move(cb)});
    return id;
}

void LocalStore::removeCallback(CallbackId id) {
    if (detail::eraseSlot(connectCbs_, id)) return;
    if (detail::eraseSlot(disconnectCbs_, id)) return;
    if (detail::eraseSlot(errorCbs_, id)) return;
    if (detail::eraseSlot(subscriptionCbs_, id)) return;
    detail::eraseSlot(reducerErrorCbs_, id);
}

void LocalStore::createStorageDevice(float x, float y, float z, const std::string& name) {
    ReducerCall call;
    call.reducer = "create_storage_device";
    call.position = {x, y, z};
    call.text = name;
    record(std::move(call));
}

void LocalStore::initiateTransfer(const Composition& composition, uint64_t destinationDeviceId) {
    ReducerCall call;
    call.reducer = "initiate_transfer";
    call.targetId = destinationDeviceId;
    call.composition = composition;
    record(std::move(call));
}

void LocalStore::completeTransfer(uint64_t transferId) {
    ReducerCall call;
    call.reducer = "complete_transfer";
    call.targetId = transferId;
    record(std::move(call));
}

void LocalStore::ensurePlayerInventory() {
    ReducerCall call;
    call.reducer = "ensure_player_inventory";
    record(std::move(call));
}

void LocalStore::record(ReducerCall call) {
    if (!connected_) {
        spdlog::warn("[store] reducer {} dropped: not connected", call.reducer);
        return;
    }
    spdlog::debug("[store] reducer {}", call.describe());
    callLog_.push_back(call);
    pending_.push_back(std::move(call));
}

std::vector<ReducerCall> LocalStore::takePendingCalls() {
    std::vector<ReducerCall> out;
    out.swap(pending_);
    return out;
}

void LocalStore::connect(const Identity& identity, const std::string& token) {
    identity_ = identity;
    connected_ = true;
    detail::dispatch(connectCbs_, identity_, token);
}

void LocalStore::failConnection(const std::string& error) {
    connected_ = false;
    detail::dispatch(errorCbs_, error);
}

void LocalStore::disconnect(const std::string& reason) {
    if (!connected_) return;
    connected_ = false;
    subscriptionRequested_ = false;
    subscribed_ = false;
    detail::dispatch(disconnectCbs_, reason);
}

bool LocalStore::applySubscription() {
    if (!subscriptionRequested_ || subscribed_) return false;
    subscribed_ = true;
    detail::dispatch(subscriptionCbs_);
    return true;
}

void LocalStore::failReducer(const std::string& reducer, const std::string& error) {
    detail::dispatch(reducerErrorCbs_, reducer, error);
}

} // namespace net

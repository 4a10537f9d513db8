#pragma once

#include <algorithm>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "net/RemoteStore.h"

// LocalStore — in-process RemoteStore. The demo runtime and the tests play the
// server against it: row mutations dispatch the registered callbacks
// synchronously, reducer invocations are queued for the caller to answer.
namespace net {

namespace detail {

template <typename Fn>
struct CallbackSlot {
    CallbackId id = kInvalidCallback;
    Fn fn;
};

template <typename Fn>
bool hasSlot(const std::vector<CallbackSlot<Fn>>& slots, CallbackId id) {
    return std::any_of(slots.begin(), slots.end(), [id](const CallbackSlot<Fn>& s) { return s.id == id; });
}

template <typename Fn>
bool eraseSlot(std::vector<CallbackSlot<Fn>>& slots, CallbackId id) {
    auto it = std::remove_if(slots.begin(), slots.end(), [id](const CallbackSlot<Fn>& s) { return s.id == id; });
    bool removed = it != slots.end();
    slots.erase(it, slots.end());
    return removed;
}

// Callbacks may unregister themselves (or others) while being dispatched;
// iterate a snapshot and skip entries that vanished meanwhile.
template <typename Fn, typename... Args>
void dispatch(const std::vector<CallbackSlot<Fn>>& slots, const Args&... args) {
    const auto snapshot = slots;
    for (const auto& slot : snapshot) {
        if (!hasSlot(slots, slot.id)) continue;
        slot.fn(args...);
    }
}

} // namespace detail

template <typename Row>
class LocalTable final : public Table<Row> {
public:
    using typename Table<Row>::RowCallback;
    using typename Table<Row>::UpdateCallback;

    explicit LocalTable(std::shared_ptr<CallbackId> idCounter) : nextId_(std::move(idCounter)) {}

    CallbackId onInsert(RowCallback cb) override {
        CallbackId id = ++*nextId_;
        inserts_.push_back({id, std::move(cb)});
        return id;
    }
    CallbackId onUpdate(UpdateCallback cb) override {
        CallbackId id = ++*nextId_;
        updates_.push_back({id, std::move(cb)});
        return id;
    }
    CallbackId onDelete(RowCallback cb) override {
        CallbackId id = ++*nextId_;
        deletes_.push_back({id, std::move(cb)});
        return id;
    }
    void removeCallback(CallbackId id) override {
        if (detail::eraseSlot(inserts_, id)) return;
        if (detail::eraseSlot(updates_, id)) return;
        detail::eraseSlot(deletes_, id);
    }

    std::vector<Row> iter() const override {
        std::vector<Row> out;
        out.reserve(rows_.size());
        for (const auto& kv : rows_) out.push_back(kv.second);
        return out;
    }
    std::optional<Row> find(uint64_t key) const override {
        auto it = rows_.find(key);
        if (it == rows_.end()) return std::nullopt;
        return it->second;
    }
    std::size_t count() const override { return rows_.size(); }

    // Server-side mutations.
    void insert(const Row& row) {
        auto it = rows_.find(rowKey(row));
        if (it != rows_.end()) {
            update(row);
            return;
        }
        rows_.emplace(rowKey(row), row);
        detail::dispatch(inserts_, row);
    }

    void update(const Row& row) {
        auto it = rows_.find(rowKey(row));
        if (it == rows_.end()) {
            insert(row);
            return;
        }
        Row old = it->second;
        it->second = row;
        detail::dispatch(updates_, old, row);
    }

    bool remove(uint64_t key) {
        auto it = rows_.find(key);
        if (it == rows_.end()) return false;
        Row old = std::move(it->second);
        rows_.erase(it);
        detail::dispatch(deletes_, old);
        return true;
    }

    std::size_t callbackCount() const { return inserts_.size() + updates_.size() + deletes_.size(); }

private:
    std::shared_ptr<CallbackId> nextId_;
    std::map<uint64_t, Row> rows_;
    std::vector<detail::CallbackSlot<RowCallback>> inserts_;
    std::vector<detail::CallbackSlot<UpdateCallback>> updates_;
    std::vector<detail::CallbackSlot<RowCallback>> deletes_;
};

struct ReducerCall {
    std::string reducer;
    uint64_t targetId = 0;      // transfer or destination device
    DbVector3 position{};
    std::string text;
    Composition composition;

    std::string describe() const;
};

class LocalStore final : public RemoteStore, public Reducers {
public:
    LocalStore();

    // RemoteStore
    bool isConnected() const override { return connected_; }
    std::optional<Identity> identity() const override;
    Table<Player>& players() override { return players_; }
    Table<WavePacketSource>& sources() override { return sources_; }
    Table<StorageDevice>& devices() override { return devices_; }
    Table<PacketTransfer>& transfers() override { return transfers_; }
    Table<BroadcastMessage>& messages() override { return messages_; }
    Table<WorldCircuit>& circuits() override { return circuits_; }
    Table<DistributionSphere>& spheres() override { return spheres_; }
    Table<QuantumTunnel>& tunnels() override { return tunnels_; }
    Table<MiningSession>& miningSessions() override { return miningSessions_; }
    Reducers& reducers() override { return *this; }
    void subscribeAll() override;

    CallbackId onConnect(ConnectCallback cb) override;
    CallbackId onDisconnect(DisconnectCallback cb) override;
    CallbackId onConnectError(ErrorCallback cb) override;
    CallbackId onSubscriptionApplied(SubscriptionCallback cb) override;
    CallbackId onReducerError(ReducerErrorCallback cb) override;
    void removeCallback(CallbackId id) override;

    // Reducers
    void createStorageDevice(float x, float y, float z, const std::string& name) override;
    void initiateTransfer(const Composition& composition, uint64_t destinationDeviceId) override;
    void completeTransfer(uint64_t transferId) override;
    void ensurePlayerInventory() override;

    // Server side
    LocalTable<Player>& playerTable() { return players_; }
    LocalTable<WavePacketSource>& sourceTable() { return sources_; }
    LocalTable<StorageDevice>& deviceTable() { return devices_; }
    LocalTable<PacketTransfer>& transferTable() { return transfers_; }
    LocalTable<BroadcastMessage>& messageTable() { return messages_; }
    LocalTable<WorldCircuit>& circuitTable() { return circuits_; }
    LocalTable<DistributionSphere>& sphereTable() { return spheres_; }
    LocalTable<QuantumTunnel>& tunnelTable() { return tunnels_; }
    LocalTable<MiningSession>& miningSessionTable() { return miningSessions_; }

    void connect(const Identity& identity, const std::string& token);
    void failConnection(const std::string& error);
    void disconnect(const std::string& reason);
    // Completes a pending subscribeAll(); returns false when none was requested.
    bool applySubscription();
    void failReducer(const std::string& reducer, const std::string& error);

    bool subscriptionRequested() const { return subscriptionRequested_; }
    bool subscribed() const { return subscribed_; }
    const std::vector<ReducerCall>& callLog() const { return callLog_; }
    std::vector<ReducerCall> takePendingCalls();

private:
    void record(ReducerCall call);

    std::shared_ptr<CallbackId> nextId_;
    LocalTable<Player> players_;
    LocalTable<WavePacketSource> sources_;
    LocalTable<StorageDevice> devices_;
    LocalTable<PacketTransfer> transfers_;
    LocalTable<BroadcastMessage> messages_;
    LocalTable<WorldCircuit> circuits_;
    LocalTable<DistributionSphere> spheres_;
    LocalTable<QuantumTunnel> tunnels_;
    LocalTable<MiningSession> miningSessions_;

    std::vector<detail::CallbackSlot<ConnectCallback>> connectCbs_;
    std::vector<detail::CallbackSlot<DisconnectCallback>> disconnectCbs_;
    std::vector<detail::CallbackSlot<ErrorCallback>> errorCbs_;
    std::vector<detail::CallbackSlot<SubscriptionCallback>> subscriptionCbs_;
    std::vector<detail::CallbackSlot<ReducerErrorCallback>> reducerErrorCbs_;

    Identity identity_;
    bool connected_ = false;
    bool subscriptionRequested_ = false;
    bool subscribed_ = false;
    std::vector<ReducerCall> callLog_;
    std::vector<ReducerCall> pending_;
};

} // namespace net

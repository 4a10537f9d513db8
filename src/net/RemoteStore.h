#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "net/Rows.h"

// RemoteStore — the reactive database client as seen by the presentation layer.
// Tables mirror server rows and notify on insert/update/delete; reducers request
// server-side mutations. All callbacks arrive on the frame thread.
namespace net {

using CallbackId = uint64_t;
constexpr CallbackId kInvalidCallback = 0;

template <typename Row>
class Table {
public:
    using RowCallback = std::function<void(const Row&)>;
    using UpdateCallback = std::function<void(const Row& oldRow, const Row& newRow)>;

    virtual ~Table() = default;

    virtual CallbackId onInsert(RowCallback cb) = 0;
    virtual CallbackId onUpdate(UpdateCallback cb) = 0;
    virtual CallbackId onDelete(RowCallback cb) = 0;
    virtual void removeCallback(CallbackId id) = 0;

    virtual std::vector<Row> iter() const = 0;
    virtual std::optional<Row> find(uint64_t key) const = 0;
    virtual std::size_t count() const = 0;
};

class Reducers {
public:
    virtual ~Reducers() = default;

    virtual void createStorageDevice(float x, float y, float z, const std::string& name) = 0;
    virtual void initiateTransfer(const Composition& composition, uint64_t destinationDeviceId) = 0;
    virtual void completeTransfer(uint64_t transferId) = 0;
    virtual void ensurePlayerInventory() = 0;
};

class RemoteStore {
public:
    using ConnectCallback = std::function<void(const Identity& identity, const std::string& token)>;
    using DisconnectCallback = std::function<void(const std::string& reason)>;
    using ErrorCallback = std::function<void(const std::string& error)>;
    using SubscriptionCallback = std::function<void()>;
    using ReducerErrorCallback = std::function<void(const std::string& reducer, const std::string& error)>;

    virtual ~RemoteStore() = default;

    virtual bool isConnected() const = 0;
    virtual std::optional<Identity> identity() const = 0;

    virtual Table<Player>& players() = 0;
    virtual Table<WavePacketSource>& sources() = 0;
    virtual Table<StorageDevice>& devices() = 0;
    virtual Table<PacketTransfer>& transfers() = 0;
    virtual Table<BroadcastMessage>& messages() = 0;
    virtual Table<WorldCircuit>& circuits() = 0;
    virtual Table<DistributionSphere>& spheres() = 0;
    virtual Table<QuantumTunnel>& tunnels() = 0;
    virtual Table<MiningSession>& miningSessions() = 0;
    virtual Reducers& reducers() = 0;

    // Requests a subscription covering every table; completion is reported
    // through onSubscriptionApplied.
    virtual void subscribeAll() = 0;

    virtual CallbackId onConnect(ConnectCallback cb) = 0;
    virtual CallbackId onDisconnect(DisconnectCallback cb) = 0;
    virtual CallbackId onConnectError(ErrorCallback cb) = 0;
    virtual CallbackId onSubscriptionApplied(SubscriptionCallback cb) = 0;
    virtual CallbackId onReducerError(ReducerErrorCallback cb) = 0;
    virtual void removeCallback(CallbackId id) = 0;
};

// Finds the player row owned by the store's own identity.
inline std::optional<Player> findLocalPlayer(RemoteStore& store) {
    auto id = store.identity();
    if (!id) return std::nullopt;
    for (const auto& p : store.players().iter()) {
        if (p.identity == *id) return p;
    }
    return std::nullopt;
}

} // namespace net

// In-process store: table callbacks, connection lifecycle, reducer queue.
#include <string>
#include <vector>

#include "TestCheck.h"
#include "net/LocalStore.h"

int main() {
    bool success = true;

    // Table mutations dispatch insert/update/delete; insert of a known key is an update
    {
        net::LocalStore store;
        auto& table = store.sourceTable();
        int inserts = 0;
        int updates = 0;
        int deletes = 0;
        uint32_t lastOld = 0;
        uint32_t lastNew = 0;
        table.onInsert([&](const net::WavePacketSource&) { ++inserts; });
        table.onUpdate([&](const net::WavePacketSource& o, const net::WavePacketSource& n) {
            ++updates;
            lastOld = o.totalWavePackets;
            lastNew = n.totalWavePackets;
        });
        const net::CallbackId del = table.onDelete([&](const net::WavePacketSource&) { ++deletes; });
        CHECK(table.callbackCount() == 3, "Three callbacks registered");

        net::WavePacketSource s;
        s.sourceId = 4;
        s.totalWavePackets = 10;
        table.insert(s);
        s.totalWavePackets = 8;
        table.insert(s);
        CHECK(inserts == 1 && updates == 1, "Second insert becomes an update (i=%d u=%d)", inserts, updates);
        CHECK(lastOld == 10 && lastNew == 8, "Update carries old and new rows");

        net::WavePacketSource other;
        other.sourceId = 5;
        table.update(other);
        CHECK(inserts == 2 && table.count() == 2, "Update of an unknown key inserts");

        auto found = store.sources().find(4);
        CHECK(found && found->totalWavePackets == 8, "find by key");
        CHECK(!store.sources().find(99), "Unknown key");
        CHECK(store.sources().iter().size() == 2, "iter returns every row");

        CHECK(table.remove(4) && deletes == 1, "Remove dispatches delete");
        CHECK(!table.remove(4), "Second remove is a no-op");

        table.removeCallback(del);
        table.remove(5);
        CHECK(deletes == 1 && table.callbackCount() == 2, "Removed callback no longer fires");
    }

    // A callback that unregisters itself mid-dispatch does not disturb the others
    {
        net::LocalStore store;
        auto& table = store.playerTable();
        int first = 0;
        int second = 0;
        net::CallbackId selfId = net::kInvalidCallback;
        selfId = table.onInsert([&](const net::Player&) {
            ++first;
            table.removeCallback(selfId);
        });
        table.onInsert([&](const net::Player&) { ++second; });

        net::Player a;
        a.playerId = 1;
        table.insert(a);
        net::Player b;
        b.playerId = 2;
        table.insert(b);
        CHECK(first == 1 && second == 2, "Self-removal (first=%d second=%d)", first, second);
    }

    // Connection lifecycle and subscription
    {
        net::LocalStore store;
        std::string connectedAs;
        std::string lostReason;
        std::string failure;
        int applied = 0;
        store.onConnect([&](const net::Identity& id, const std::string&) { connectedAs = id; });
        store.onDisconnect([&](const std::string& reason) { lostReason = reason; });
        store.onConnectError([&](const std::string& error) { failure = error; });
        store.onSubscriptionApplied([&]() { ++applied; });

        CHECK(!store.identity(), "No identity before connecting");
        store.subscribeAll();
        CHECK(!store.subscriptionRequested(), "subscribeAll ignored while disconnected");

        store.failConnection("refused");
        CHECK(failure == "refused" && !store.isConnected(), "Connect error reported");

        store.connect("abc", "tok");
        CHECK(store.isConnected() && connectedAs == "abc", "Connected");
        CHECK(store.identity() && *store.identity() == "abc", "Identity known");

        CHECK(!store.applySubscription(), "Nothing to apply without a request");
        store.subscribeAll();
        CHECK(store.applySubscription() && applied == 1 && store.subscribed(), "Subscription applied");
        CHECK(!store.applySubscription() && applied == 1, "Applied once");

        store.disconnect("bye");
        CHECK(!store.isConnected() && lostReason == "bye" && !store.subscribed(), "Disconnected");
        lostReason.clear();
        store.disconnect("again");
        CHECK(lostReason.empty(), "Disconnect while disconnected is silent");
    }

    // Reducer calls are queued while connected, dropped otherwise
    {
        net::LocalStore store;
        net::Reducers& reducers = store.reducers();
        reducers.completeTransfer(3);
        CHECK(store.callLog().empty(), "Dropped while disconnected");

        store.connect("abc", "tok");
        reducers.createStorageDevice(1.0f, 2.0f, 3.0f, "Vault");
        reducers.initiateTransfer({{0.0f, 2}, {2.094f, 1}}, 42);
        reducers.completeTransfer(3);
        reducers.ensurePlayerInventory();

        const auto calls = store.takePendingCalls();
        CHECK(calls.size() == 4, "Four queued calls");
        CHECK(store.takePendingCalls().empty(), "Queue drained");
        CHECK(store.callLog().size() == 4, "Log keeps everything");
        if (calls.size() == 4) {
            CHECK(calls[0].describe() == "create_storage_device('Vault' @ 1.00,2.00,3.00)", "describe: %s",
                  calls[0].describe().c_str());
            CHECK(calls[1].describe() == "initiate_transfer(device=42, samples=2, packets=3)", "describe: %s",
                  calls[1].describe().c_str());
            CHECK(calls[2].describe() == "complete_transfer(3)", "describe: %s", calls[2].describe().c_str());
            CHECK(calls[3].describe() == "ensure_player_inventory()", "describe: %s", calls[3].describe().c_str());
        }

        std::string failedReducer;
        store.onReducerError([&](const std::string& reducer, const std::string&) { failedReducer = reducer; });
        store.failReducer("complete_transfer", "no such transfer");
        CHECK(failedReducer == "complete_transfer", "Reducer error dispatched");
    }

    // Local player lookup by identity
    {
        net::LocalStore store;
        net::Player p;
        p.playerId = 7;
        p.identity = "abc";
        store.playerTable().insert(p);
        CHECK(!net::findLocalPlayer(store), "No identity, no local player");
        store.connect("abc", "tok");
        auto local = net::findLocalPlayer(store);
        CHECK(local && local->playerId == 7, "Local player found");
    }

    return success ? 0 : 1;
}

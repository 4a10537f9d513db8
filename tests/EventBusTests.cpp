// Event bus dispatch and the session state machine.
#include <stdexcept>
#include <string>
#include <vector>

#include "TestCheck.h"
#include "core/EventBus.h"

using core::EventBus;
using core::GameState;

int main() {
    bool success = true;

    // Handlers run in subscription order and see the payload
    {
        EventBus bus;
        std::vector<std::string> calls;
        auto a = bus.subscribe<core::ConnectionFailedEvent>(
            [&](const core::ConnectionFailedEvent& e) { calls.push_back("a:" + e.error); });
        auto b = bus.subscribe<core::ConnectionFailedEvent>(
            [&](const core::ConnectionFailedEvent& e) { calls.push_back("b:" + e.error); });
        bus.publish(core::ConnectionFailedEvent{"timeout"});
        CHECK(calls.size() == 2, "Expected two handler calls (got %zu)", calls.size());
        CHECK(calls.size() == 2 && calls[0] == "a:timeout" && calls[1] == "b:timeout",
              "Handlers should run in subscription order");
        CHECK(bus.handlerCount(core::EventKind::ConnectionFailed) == 2, "Two handlers registered");
    }

    // A throwing handler does not stop the others; publish reports the failure
    {
        EventBus bus;
        int reached = 0;
        auto bad = bus.subscribe<core::LogoutEvent>([](const core::LogoutEvent&) {
            throw std::runtime_error("boom");
        });
        auto good = bus.subscribe<core::LogoutEvent>([&](const core::LogoutEvent&) { ++reached; });
        bool ok = bus.publish(core::LogoutEvent{});
        CHECK(!ok, "publish should report the throwing handler");
        CHECK(reached == 1, "Second handler should still run (reached=%d)", reached);
    }

    // Subscriptions unsubscribe on destruction and on reset
    {
        EventBus bus;
        int count = 0;
        {
            auto sub = bus.subscribe<core::SystemReadyEvent>([&](const core::SystemReadyEvent&) { ++count; });
            bus.publish(core::SystemReadyEvent{});
        }
        bus.publish(core::SystemReadyEvent{});
        CHECK(count == 1, "Handler should be gone after its subscription died (count=%d)", count);
        CHECK(bus.handlerCount(core::EventKind::SystemReady) == 0, "No handlers should remain");

        auto sub = bus.subscribe<core::SystemReadyEvent>([&](const core::SystemReadyEvent&) { ++count; });
        EventBus::Subscription moved = std::move(sub);
        CHECK(!sub.active() && moved.active(), "Moved-from subscription should be inactive");
        moved.reset();
        bus.publish(core::SystemReadyEvent{});
        CHECK(count == 1, "Reset subscription should not fire (count=%d)", count);
    }

    // A handler may unsubscribe a later handler during dispatch
    {
        EventBus bus;
        int second = 0;
        EventBus::Subscription later;
        auto first = bus.subscribe<core::SystemReadyEvent>([&](const core::SystemReadyEvent&) { later.reset(); });
        later = bus.subscribe<core::SystemReadyEvent>([&](const core::SystemReadyEvent&) { ++second; });
        bus.publish(core::SystemReadyEvent{});
        CHECK(second == 0, "Handler removed mid-dispatch should not run");
    }

    // Happy path through the automatic transitions
    {
        EventBus bus;
        std::vector<GameState> seen;
        auto sub = bus.subscribe<core::StateChangedEvent>(
            [&](const core::StateChangedEvent& e) { seen.push_back(e.newState); });
        CHECK(bus.state() == GameState::Disconnected, "Bus starts disconnected");
        bus.publish(core::ConnectionStartedEvent{"local://test"});
        bus.publish(core::ConnectionEstablishedEvent{"id", "tok"});
        bus.publish(core::SubscriptionReadyEvent{});
        bus.publish(core::LocalPlayerReadyEvent{});
        bus.publish(core::WorldLoadStartedEvent{});
        bus.publish(core::WorldLoadedEvent{});
        CHECK(bus.state() == GameState::InGame, "Expected InGame (got %s)", core::gameStateName(bus.state()));
        const std::vector<GameState> expected{GameState::Connecting, GameState::Connected, GameState::CheckingPlayer,
                                              GameState::PlayerReady, GameState::LoadingWorld, GameState::InGame};
        CHECK(seen == expected, "StateChanged sequence mismatch (%zu entries)", seen.size());

        // World hop goes back through LoadingWorld
        bus.publish(core::WorldLoadStartedEvent{});
        CHECK(bus.state() == GameState::LoadingWorld, "World hop should reload");
        bus.publish(core::ConnectionLostEvent{"bye"});
        CHECK(bus.state() == GameState::Disconnected, "ConnectionLost should disconnect");
    }

    // Player-not-found routes depend on where the session is
    {
        EventBus bus;
        bus.forceSetState(GameState::CheckingPlayer);
        bus.publish(core::LocalPlayerNotFoundEvent{});
        CHECK(bus.state() == GameState::WaitingForLogin, "Not found while checking waits for login");
        bus.publish(core::LoginStartedEvent{"ann"});
        bus.publish(core::LoginSuccessfulEvent{"ann", 7});
        CHECK(bus.state() == GameState::Authenticated, "Login should authenticate");
        bus.publish(core::LocalPlayerNotFoundEvent{});
        CHECK(bus.state() == GameState::CreatingPlayer, "Not found after login creates a player");
    }

    // Invalid transitions are refused; same-state is a no-op success
    {
        EventBus bus;
        int changes = 0;
        auto sub = bus.subscribe<core::StateChangedEvent>([&](const core::StateChangedEvent&) { ++changes; });
        CHECK(!bus.trySetState(GameState::InGame), "Disconnected -> InGame must be refused");
        CHECK(bus.state() == GameState::Disconnected, "State unchanged after refusal");
        CHECK(bus.trySetState(GameState::Disconnected), "Same state is allowed");
        CHECK(changes == 0, "No StateChanged for refused or no-op transitions (changes=%d)", changes);
        CHECK(EventBus::isTransitionAllowed(GameState::InGame, GameState::LoadingWorld), "InGame -> LoadingWorld");
        CHECK(!EventBus::isTransitionAllowed(GameState::Connected, GameState::InGame), "Connected -> InGame refused");
    }

    // History is bounded and stamped with the injected clock
    {
        EventBus::Config cfg;
        cfg.maxHistory = 3;
        cfg.logEvents = false;
        EventBus bus(cfg);
        double now = 0.0;
        bus.setClock([&]() { return now; });
        for (int i = 0; i < 5; ++i) {
            now = static_cast<double>(i);
            bus.publish(core::SystemReadyEvent{});
        }
        CHECK(bus.history().size() == 3, "History should be capped at 3 (got %zu)", bus.history().size());
        CHECK(bus.history().front().timestamp == 2.0, "Oldest kept entry should be t=2 (got %g)",
              bus.history().front().timestamp);
        bus.clearHistory();
        CHECK(bus.history().empty(), "clearHistory empties the log");
    }

    return success ? 0 : 1;
}

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/Events.h"

// EventBus — typed publish/subscribe plus the client's connection/session state machine.
//
// Handlers run synchronously in subscription order. A handler that throws is logged
// and skipped; the remaining handlers still see the event. Handlers may subscribe or
// unsubscribe while an event is being dispatched. After the handlers ran, the bus
// applies the automatic state transition for the event kind (if any), which in turn
// publishes StateChangedEvent.
namespace core {

using HandlerId = uint64_t;

class EventBus {
public:
    struct Config {
        std::size_t maxHistory = 100;
        bool logEvents = true;
    };

    struct HistoryEntry {
        double timestamp = 0.0;
        EventKind kind = EventKind::StateChanged;
        GameState state = GameState::Disconnected; // state when published
    };

    // Move-only handle; unsubscribes when destroyed. Must not outlive the bus.
    class Subscription {
    public:
        Subscription() = default;
        Subscription(EventBus* bus, HandlerId id) : bus_(bus), id_(id) {}
        ~Subscription() { reset(); }
        Subscription(Subscription&& other) noexcept : bus_(other.bus_), id_(other.id_) {
            other.bus_ = nullptr;
            other.id_ = 0;
        }
        Subscription& operator=(Subscription&& other) noexcept {
            if (this != &other) {
                reset();
                bus_ = other.bus_;
                id_ = other.id_;
                other.bus_ = nullptr;
                other.id_ = 0;
            }
            return *this;
        }
        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        void reset() {
            if (bus_) bus_->unsubscribe(id_);
            bus_ = nullptr;
            id_ = 0;
        }
        bool active() const { return bus_ != nullptr; }
        HandlerId id() const { return id_; }

    private:
        EventBus* bus_ = nullptr;
        HandlerId id_ = 0;
    };

    EventBus();
    explicit EventBus(const Config& config);

    // Time source for history timestamps (seconds). Defaults to a steady clock.
    void setClock(std::function<double()> clock);

    template <typename E>
    [[nodiscard]] Subscription subscribe(std::function<void(const E&)> handler) {
        HandlerId id = addHandler(E::kKind, [fn = std::move(handler)](const void* payload) {
            fn(*static_cast<const E*>(payload));
        });
        return Subscription(this, id);
    }

    bool unsubscribe(HandlerId id);

    // Returns false if any handler threw.
    template <typename E>
    bool publish(const E& event) {
        return dispatch(E::kKind, &event);
    }

    GameState state() const { return state_; }
    // No-op (true) when already in `next`; false when the transition is not allowed.
    bool trySetState(GameState next);
    // Bypasses validation. Recovery and tests only.
    void forceSetState(GameState next);
    static bool isTransitionAllowed(GameState from, GameState to);

    std::size_t handlerCount(EventKind kind) const;
    const std::deque<HistoryEntry>& history() const { return history_; }
    void clearHistory() { history_.clear(); }
    std::string stateInfo() const;
    void dumpHistory() const;

private:
    using ErasedHandler = std::function<void(const void*)>;
    struct HandlerSlot {
        HandlerId id = 0;
        ErasedHandler fn;
    };

    HandlerId addHandler(EventKind kind, ErasedHandler fn);
    bool hasHandler(EventKind kind, HandlerId id) const;
    bool dispatch(EventKind kind, const void* payload);
    void record(EventKind kind);
    void applyAutomaticTransition(EventKind kind);

    Config config_{};
    std::function<double()> clock_;
    std::unordered_map<EventKind, std::vector<HandlerSlot>> handlers_;
    std::deque<HistoryEntry> history_;
    GameState state_ = GameState::Disconnected;
    HandlerId nextId_ = 0;
};

} // namespace core

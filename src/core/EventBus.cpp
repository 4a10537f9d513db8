#include "EventBus.h"

#include <algorithm>
#include <chrono>
#include <exception>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace core {

const char* gameStateName(GameState state) {
    switch (state) {
        case GameState::Disconnected: return "Disconnected";
        case GameState::Connecting: return "Connecting";
        case GameState::Connected: return "Connected";
        case GameState::CheckingPlayer: return "CheckingPlayer";
        case GameState::WaitingForLogin: return "WaitingForLogin";
        case GameState::Authenticating: return "Authenticating";
        case GameState::Authenticated: return "Authenticated";
        case GameState::CreatingPlayer: return "CreatingPlayer";
        case GameState::PlayerReady: return "PlayerReady";
        case GameState::LoadingWorld: return "LoadingWorld";
        case GameState::InGame: return "InGame";
    }
    return "Unknown";
}

const char* eventKindName(EventKind kind) {
    switch (kind) {
        case EventKind::ConnectionStarted: return "ConnectionStarted";
        case EventKind::ConnectionEstablished: return "ConnectionEstablished";
        case EventKind::ConnectionFailed: return "ConnectionFailed";
        case EventKind::ConnectionLost: return "ConnectionLost";
        case EventKind::LoginStarted: return "LoginStarted";
        case EventKind::LoginSuccessful: return "LoginSuccessful";
        case EventKind::LoginFailed: return "LoginFailed";
        case EventKind::Logout: return "Logout";
        case EventKind::SessionCreated: return "SessionCreated";
        case EventKind::LocalPlayerCheckStarted: return "LocalPlayerCheckStarted";
        case EventKind::LocalPlayerCreated: return "LocalPlayerCreated";
        case EventKind::LocalPlayerRestored: return "LocalPlayerRestored";
        case EventKind::LocalPlayerReady: return "LocalPlayerReady";
        case EventKind::LocalPlayerNotFound: return "LocalPlayerNotFound";
        case EventKind::PlayerCreationStarted: return "PlayerCreationStarted";
        case EventKind::PlayerCreationFailed: return "PlayerCreationFailed";
        case EventKind::SubscriptionReady: return "SubscriptionReady";
        case EventKind::SubscriptionError: return "SubscriptionError";
        case EventKind::SystemReady: return "SystemReady";
        case EventKind::ReducerError: return "ReducerError";
        case EventKind::WorldLoadStarted: return "WorldLoadStarted";
        case EventKind::WorldLoaded: return "WorldLoaded";
        case EventKind::WorldLoadFailed: return "WorldLoadFailed";
        case EventKind::WorldTransitionStarted: return "WorldTransitionStarted";
        case EventKind::StateChanged: return "StateChanged";
        case EventKind::SourceInserted: return "SourceInserted";
        case EventKind::SourceUpdated: return "SourceUpdated";
        case EventKind::SourceDeleted: return "SourceDeleted";
        case EventKind::InitialSourcesLoaded: return "InitialSourcesLoaded";
        case EventKind::DeviceInserted: return "DeviceInserted";
        case EventKind::DeviceUpdated: return "DeviceUpdated";
        case EventKind::DeviceDeleted: return "DeviceDeleted";
        case EventKind::InitialDevicesLoaded: return "InitialDevicesLoaded";
        case EventKind::TransferInserted: return "TransferInserted";
        case EventKind::TransferUpdated: return "TransferUpdated";
        case EventKind::TransferDeleted: return "TransferDeleted";
        case EventKind::CircuitInserted: return "CircuitInserted";
        case EventKind::CircuitUpdated: return "CircuitUpdated";
        case EventKind::CircuitDeleted: return "CircuitDeleted";
        case EventKind::SphereInserted: return "SphereInserted";
        case EventKind::SphereUpdated: return "SphereUpdated";
        case EventKind::SphereDeleted: return "SphereDeleted";
        case EventKind::TunnelInserted: return "TunnelInserted";
        case EventKind::TunnelUpdated: return "TunnelUpdated";
        case EventKind::TunnelDeleted: return "TunnelDeleted";
        case EventKind::InitialSpiresLoaded: return "InitialSpiresLoaded";
        case EventKind::MiningSessionStarted: return "MiningSessionStarted";
        case EventKind::MiningSessionUpdated: return "MiningSessionUpdated";
        case EventKind::MiningSessionEnded: return "MiningSessionEnded";
        case EventKind::BroadcastMessageReceived: return "BroadcastMessageReceived";
    }
    return "Unknown";
}

namespace {

// Table mirror traffic is high-volume; keep it out of info-level logs.
bool isChattyEvent(EventKind kind) {
    switch (kind) {
        case EventKind::SourceInserted:
        case EventKind::SourceUpdated:
        case EventKind::SourceDeleted:
        case EventKind::DeviceUpdated:
        case EventKind::TransferUpdated:
        case EventKind::TunnelUpdated:
        case EventKind::MiningSessionUpdated:
            return true;
        default:
            return false;
    }
}

} // namespace

EventBus::EventBus() : EventBus(Config{}) {}

EventBus::EventBus(const Config& config) : config_(config) {
    const auto origin = std::chrono::steady_clock::now();
    clock_ = [origin]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - origin).count();
    };
}

void EventBus::setClock(std::function<double()> clock) {
    if (clock) clock_ = std::move(clock);
}

HandlerId EventBus::addHandler(EventKind kind, ErasedHandler fn) {
    HandlerId id = ++nextId_;
    handlers_[kind].push_back({id, std::move(fn)});
    spdlog::debug("[bus] subscribe {} (id={}, total={})", eventKindName(kind), id, handlers_[kind].size());
    return id;
}

bool EventBus::unsubscribe(HandlerId id) {
    for (auto it = handlers_.begin(); it != handlers_.end(); ++it) {
        auto& slots = it->second;
        auto found = std::find_if(slots.begin(), slots.end(), [id](const HandlerSlot& s) { return s.id == id; });
        if (found == slots.end()) continue;
        slots.erase(found);
        if (slots.empty()) handlers_.erase(it);
        return true;
    }
    return false;
}

bool EventBus::hasHandler(EventKind kind, HandlerId id) const {
    auto it = handlers_.find(kind);
    if (it == handlers_.end()) return false;
    return std::any_of(it->second.begin(), it->second.end(), [id](const HandlerSlot& s) { return s.id == id; });
}

std::size_t EventBus::handlerCount(EventKind kind) const {
    auto it = handlers_.find(kind);
    return it == handlers_.end() ? 0u : it->second.size();
}

void EventBus::record(EventKind kind) {
    history_.push_back({clock_(), kind, state_});
    while (history_.size() > config_.maxHistory) history_.pop_front();
}

bool EventBus::dispatch(EventKind kind, const void* payload) {
    record(kind);
    if (config_.logEvents) {
        if (isChattyEvent(kind)) {
            spdlog::trace("[bus] {} (state={})", eventKindName(kind), gameStateName(state_));
        } else {
            spdlog::info("[bus] {} (state={})", eventKindName(kind), gameStateName(state_));
        }
    }

    bool ok = true;
    auto it = handlers_.find(kind);
    if (it != handlers_.end()) {
        const std::vector<HandlerSlot> snapshot = it->second;
        for (std::size_t i = 0; i < snapshot.size(); ++i) {
            if (!hasHandler(kind, snapshot[i].id)) continue;
            try {
                snapshot[i].fn(payload);
            } catch (const std::exception& ex) {
                ok = false;
                spdlog::error("[bus] handler {}/{} for {} threw: {}", i + 1, snapshot.size(),
                              eventKindName(kind), ex.what());
            }
        }
    }

    applyAutomaticTransition(kind);
    return ok;
}

void EventBus::applyAutomaticTransition(EventKind kind) {
    switch (kind) {
        case EventKind::ConnectionStarted:
            trySetState(GameState::Connecting);
            break;
        case EventKind::ConnectionEstablished:
            trySetState(GameState::Connected);
            break;
        case EventKind::SubscriptionReady:
            trySetState(GameState::CheckingPlayer);
            break;
        case EventKind::LocalPlayerNotFound:
            if (state_ == GameState::CheckingPlayer) {
                trySetState(GameState::WaitingForLogin);
            } else if (state_ == GameState::Authenticated) {
                trySetState(GameState::CreatingPlayer);
            }
            break;
        case EventKind::LoginStarted:
            trySetState(GameState::Authenticating);
            break;
        case EventKind::LoginSuccessful:
            trySetState(GameState::Authenticated);
            break;
        case EventKind::LocalPlayerCheckStarted:
            if (state_ == GameState::Authenticated) trySetState(GameState::CheckingPlayer);
            break;
        case EventKind::PlayerCreationStarted:
            if (state_ == GameState::Authenticated || state_ == GameState::WaitingForLogin) {
                trySetState(GameState::CreatingPlayer);
            }
            break;
        case EventKind::LocalPlayerReady:
        case EventKind::LocalPlayerRestored:
            trySetState(GameState::PlayerReady);
            break;
        case EventKind::WorldLoadStarted:
            trySetState(GameState::LoadingWorld);
            break;
        case EventKind::WorldLoaded:
            trySetState(GameState::InGame);
            break;
        case EventKind::ConnectionLost:
            trySetState(GameState::Disconnected);
            break;
        default:
            break;
    }
}

bool EventBus::isTransitionAllowed(GameState from, GameState to) {
    using S = GameState;
    switch (from) {
        case S::Disconnected:
            return to == S::Connecting;
        case S::Connecting:
            return to == S::Connected || to == S::Disconnected;
        case S::Connected:
            return to == S::CheckingPlayer || to == S::Disconnected;
        case S::CheckingPlayer:
            return to == S::WaitingForLogin || to == S::PlayerReady || to == S::Disconnected;
        case S::WaitingForLogin:
            return to == S::Authenticating || to == S::Disconnected;
        case S::Authenticating:
            return to == S::Authenticated || to == S::WaitingForLogin || to == S::Disconnected;
        case S::Authenticated:
            return to == S::InGame || to == S::CheckingPlayer || to == S::CreatingPlayer ||
                   to == S::PlayerReady || to == S::Disconnected;
        case S::CreatingPlayer:
            return to == S::PlayerReady || to == S::Authenticated || to == S::Disconnected;
        case S::PlayerReady:
            return to == S::InGame || to == S::LoadingWorld || to == S::Disconnected;
        case S::LoadingWorld:
            return to == S::InGame || to == S::PlayerReady || to == S::Disconnected;
        case S::InGame:
            return to == S::LoadingWorld || to == S::PlayerReady || to == S::Disconnected;
    }
    return false;
}

bool EventBus::trySetState(GameState next) {
    if (state_ == next) return true;
    if (!isTransitionAllowed(state_, next)) {
        spdlog::warn("[bus] invalid state transition {} -> {}", gameStateName(state_), gameStateName(next));
        return false;
    }
    GameState previous = state_;
    state_ = next;
    spdlog::info("[bus] state {} -> {}", gameStateName(previous), gameStateName(next));
    publish(StateChangedEvent{previous, next});
    return true;
}

void EventBus::forceSetState(GameState next) {
    GameState previous = state_;
    state_ = next;
    spdlog::warn("[bus] forced state {} -> {}", gameStateName(previous), gameStateName(next));
}

std::string EventBus::stateInfo() const {
    return fmt::format("State: {}, Handlers: {} types, History: {} events",
                       gameStateName(state_), handlers_.size(), history_.size());
}

void EventBus::dumpHistory() const {
    spdlog::info("[bus] === event history ({} events) ===", history_.size());
    for (const auto& entry : history_) {
        spdlog::info("[bus]   {:10.3f} [{}] {}", entry.timestamp, gameStateName(entry.state), eventKindName(entry.kind));
    }
}

} // namespace core

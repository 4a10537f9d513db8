#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "net/Rows.h"

// Events — payloads carried by core::EventBus. Each event names its kind so the
// bus can key handlers and history without RTTI.
namespace core {

enum class GameState : uint8_t {
    Disconnected,
    Connecting,
    Connected,
    CheckingPlayer,
    WaitingForLogin,
    Authenticating,
    Authenticated,
    CreatingPlayer,
    PlayerReady,
    LoadingWorld,
    InGame,
};

const char* gameStateName(GameState state);

enum class EventKind : uint16_t {
    // Connection
    ConnectionStarted,
    ConnectionEstablished,
    ConnectionFailed,
    ConnectionLost,
    // Login
    LoginStarted,
    LoginSuccessful,
    LoginFailed,
    Logout,
    SessionCreated,
    // Local player
    LocalPlayerCheckStarted,
    LocalPlayerCreated,
    LocalPlayerRestored,
    LocalPlayerReady,
    LocalPlayerNotFound,
    PlayerCreationStarted,
    PlayerCreationFailed,
    // Subscription
    SubscriptionReady,
    SubscriptionError,
    SystemReady,
    ReducerError,
    // World
    WorldLoadStarted,
    WorldLoaded,
    WorldLoadFailed,
    WorldTransitionStarted,
    StateChanged,
    // Table mirrors
    SourceInserted,
    SourceUpdated,
    SourceDeleted,
    InitialSourcesLoaded,
    DeviceInserted,
    DeviceUpdated,
    DeviceDeleted,
    InitialDevicesLoaded,
    TransferInserted,
    TransferUpdated,
    TransferDeleted,
    CircuitInserted,
    CircuitUpdated,
    CircuitDeleted,
    SphereInserted,
    SphereUpdated,
    SphereDeleted,
    TunnelInserted,
    TunnelUpdated,
    TunnelDeleted,
    InitialSpiresLoaded,
    MiningSessionStarted,
    MiningSessionUpdated,
    MiningSessionEnded,
    BroadcastMessageReceived,
};

const char* eventKindName(EventKind kind);

struct ConnectionStartedEvent { static constexpr EventKind kKind = EventKind::ConnectionStarted; std::string serverUrl; };
struct ConnectionEstablishedEvent { static constexpr EventKind kKind = EventKind::ConnectionEstablished; net::Identity identity; std::string token; };
struct ConnectionFailedEvent { static constexpr EventKind kKind = EventKind::ConnectionFailed; std::string error; };
struct ConnectionLostEvent { static constexpr EventKind kKind = EventKind::ConnectionLost; std::string reason; };

struct LoginStartedEvent { static constexpr EventKind kKind = EventKind::LoginStarted; std::string username; };
struct LoginSuccessfulEvent { static constexpr EventKind kKind = EventKind::LoginSuccessful; std::string username; uint64_t accountId = 0; };
struct LoginFailedEvent { static constexpr EventKind kKind = EventKind::LoginFailed; std::string reason; };
struct LogoutEvent { static constexpr EventKind kKind = EventKind::Logout; };
struct SessionCreatedEvent { static constexpr EventKind kKind = EventKind::SessionCreated; std::string username; std::string sessionToken; };

struct LocalPlayerCheckStartedEvent { static constexpr EventKind kKind = EventKind::LocalPlayerCheckStarted; };
struct LocalPlayerCreatedEvent { static constexpr EventKind kKind = EventKind::LocalPlayerCreated; net::Player player; bool isNewPlayer = true; };
struct LocalPlayerRestoredEvent { static constexpr EventKind kKind = EventKind::LocalPlayerRestored; net::Player player; };
struct LocalPlayerReadyEvent { static constexpr EventKind kKind = EventKind::LocalPlayerReady; net::Player player; };
struct LocalPlayerNotFoundEvent { static constexpr EventKind kKind = EventKind::LocalPlayerNotFound; };
struct PlayerCreationStartedEvent { static constexpr EventKind kKind = EventKind::PlayerCreationStarted; std::string playerName; };
struct PlayerCreationFailedEvent { static constexpr EventKind kKind = EventKind::PlayerCreationFailed; std::string reason; };

struct SubscriptionReadyEvent { static constexpr EventKind kKind = EventKind::SubscriptionReady; };
struct SubscriptionErrorEvent { static constexpr EventKind kKind = EventKind::SubscriptionError; std::string error; };
struct SystemReadyEvent { static constexpr EventKind kKind = EventKind::SystemReady; };
struct ReducerErrorEvent { static constexpr EventKind kKind = EventKind::ReducerError; std::string reducer; std::string error; };

struct WorldLoadStartedEvent { static constexpr EventKind kKind = EventKind::WorldLoadStarted; net::WorldCoords worldCoords{}; };
struct WorldLoadedEvent { static constexpr EventKind kKind = EventKind::WorldLoaded; net::WorldRow world; };
struct WorldLoadFailedEvent { static constexpr EventKind kKind = EventKind::WorldLoadFailed; std::string error; };
struct WorldTransitionStartedEvent {
    static constexpr EventKind kKind = EventKind::WorldTransitionStarted;
    net::WorldCoords fromWorld{};
    net::WorldCoords toWorld{};
};
struct StateChangedEvent {
    static constexpr EventKind kKind = EventKind::StateChanged;
    GameState previousState = GameState::Disconnected;
    GameState newState = GameState::Disconnected;
};

struct SourceInsertedEvent { static constexpr EventKind kKind = EventKind::SourceInserted; net::WavePacketSource source; };
struct SourceUpdatedEvent { static constexpr EventKind kKind = EventKind::SourceUpdated; net::WavePacketSource oldSource; net::WavePacketSource newSource; };
struct SourceDeletedEvent { static constexpr EventKind kKind = EventKind::SourceDeleted; net::WavePacketSource source; };
struct InitialSourcesLoadedEvent { static constexpr EventKind kKind = EventKind::InitialSourcesLoaded; std::vector<net::WavePacketSource> sources; };

struct DeviceInsertedEvent { static constexpr EventKind kKind = EventKind::DeviceInserted; net::StorageDevice device; };
struct DeviceUpdatedEvent { static constexpr EventKind kKind = EventKind::DeviceUpdated; net::StorageDevice oldDevice; net::StorageDevice newDevice; };
struct DeviceDeletedEvent { static constexpr EventKind kKind = EventKind::DeviceDeleted; net::StorageDevice device; };
struct InitialDevicesLoadedEvent { static constexpr EventKind kKind = EventKind::InitialDevicesLoaded; std::vector<net::StorageDevice> devices; };

struct TransferInsertedEvent { static constexpr EventKind kKind = EventKind::TransferInserted; net::PacketTransfer transfer; };
struct TransferUpdatedEvent { static constexpr EventKind kKind = EventKind::TransferUpdated; net::PacketTransfer oldTransfer; net::PacketTransfer newTransfer; };
struct TransferDeletedEvent { static constexpr EventKind kKind = EventKind::TransferDeleted; net::PacketTransfer transfer; };

struct CircuitInsertedEvent { static constexpr EventKind kKind = EventKind::CircuitInserted; net::WorldCircuit circuit; };
struct CircuitUpdatedEvent { static constexpr EventKind kKind = EventKind::CircuitUpdated; net::WorldCircuit oldCircuit; net::WorldCircuit newCircuit; };
struct CircuitDeletedEvent { static constexpr EventKind kKind = EventKind::CircuitDeleted; net::WorldCircuit circuit; };
struct SphereInsertedEvent { static constexpr EventKind kKind = EventKind::SphereInserted; net::DistributionSphere sphere; };
struct SphereUpdatedEvent { static constexpr EventKind kKind = EventKind::SphereUpdated; net::DistributionSphere oldSphere; net::DistributionSphere newSphere; };
struct SphereDeletedEvent { static constexpr EventKind kKind = EventKind::SphereDeleted; net::DistributionSphere sphere; };
struct TunnelInsertedEvent { static constexpr EventKind kKind = EventKind::TunnelInserted; net::QuantumTunnel tunnel; };
struct TunnelUpdatedEvent { static constexpr EventKind kKind = EventKind::TunnelUpdated; net::QuantumTunnel oldTunnel; net::QuantumTunnel newTunnel; };
struct TunnelDeletedEvent { static constexpr EventKind kKind = EventKind::TunnelDeleted; net::QuantumTunnel tunnel; };
struct InitialSpiresLoadedEvent {
    static constexpr EventKind kKind = EventKind::InitialSpiresLoaded;
    std::vector<net::WorldCircuit> circuits;
    std::vector<net::DistributionSphere> spheres;
    std::vector<net::QuantumTunnel> tunnels;
};

struct MiningSessionStartedEvent { static constexpr EventKind kKind = EventKind::MiningSessionStarted; net::MiningSession session; };
struct MiningSessionUpdatedEvent { static constexpr EventKind kKind = EventKind::MiningSessionUpdated; net::MiningSession oldSession; net::MiningSession newSession; };
struct MiningSessionEndedEvent { static constexpr EventKind kKind = EventKind::MiningSessionEnded; net::MiningSession session; };

struct BroadcastMessageReceivedEvent {
    static constexpr EventKind kKind = EventKind::BroadcastMessageReceived;
    uint64_t messageId = 0;
    uint64_t senderPlayerId = 0;
    std::string senderName;
    std::string content;
};

} // namespace core

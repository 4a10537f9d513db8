#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <glm/vec3.hpp>
#include <glm/gtc/quaternion.hpp>

#include "world/CoordUtils.h"

// Rows — client-side mirrors of the server tables. Plain data, keyed by rowKey().
namespace net {

using Identity = std::string;
using world::WorldCoords;

struct DbVector3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

struct DbQuaternion {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
    float w = 1.0f;
};

inline glm::vec3 toVec3(const DbVector3& v) { return {v.x, v.y, v.z}; }
inline DbVector3 toDb(const glm::vec3& v) { return {v.x, v.y, v.z}; }
inline glm::quat toQuat(const DbQuaternion& q) { return glm::quat(q.w, q.x, q.y, q.z); }
inline DbQuaternion toDb(const glm::quat& q) { return {q.x, q.y, q.z, q.w}; }

struct Player {
    Identity identity;
    uint64_t playerId = 0;
    std::string name;
    WorldCoords currentWorld{};
    DbVector3 position{};
    DbQuaternion rotation{};
    uint64_t lastUpdate = 0;
};

struct WavePacketSample {
    float frequency = 0.0f; // radians, [0, 2pi)
    uint32_t count = 0;
};

using Composition = std::vector<WavePacketSample>;

// Server movement state of a wave packet source.
enum class SourceState : uint8_t {
    MovingHorizontal = 0,
    ArrivedAtSurface = 1,
    Rising = 2,
    Stationary = 3,
};

struct WavePacketSource {
    uint64_t sourceId = 0;
    WorldCoords worldCoords{};
    DbVector3 position{};
    DbVector3 velocity{};
    DbVector3 destination{};
    uint8_t state = 0;
    uint32_t totalWavePackets = 0;
    uint32_t activeMinerCount = 0;
    Composition composition;
    uint64_t lastDissipation = 0;
};

struct StorageDevice {
    uint64_t deviceId = 0;
    uint64_t ownerPlayerId = 0;
    std::string deviceName;
    WorldCoords worldCoords{};
    DbVector3 position{};
    uint32_t capacityPerFrequency = 0;
    Composition storedComposition;
};

enum class TransferLegType : uint8_t {
    PendingAtObject,
    ObjectToSphere,
    ArrivedAtSphere,
    SphereToSphere,
    SphereToObject,
};

inline const char* transferLegTypeName(TransferLegType type) {
    switch (type) {
        case TransferLegType::PendingAtObject: return "PendingAtObject";
        case TransferLegType::ObjectToSphere: return "ObjectToSphere";
        case TransferLegType::ArrivedAtSphere: return "ArrivedAtSphere";
        case TransferLegType::SphereToSphere: return "SphereToSphere";
        case TransferLegType::SphereToObject: return "SphereToObject";
    }
    return "Unknown";
}

struct PacketTransfer {
    uint64_t transferId = 0;
    uint64_t playerId = 0;
    Composition composition;
    std::vector<DbVector3> routeWaypoints;
    uint64_t destinationDeviceId = 0;
    uint32_t currentLeg = 0;
    TransferLegType currentLegType = TransferLegType::PendingAtObject;
    bool completed = false;
};

// Spire parts share a cardinal direction name ("North", "NorthEast",
// "NorthEastForward", ...) that places them on the world surface.
struct WorldCircuit {
    uint64_t circuitId = 0;
    WorldCoords worldCoords{};
    std::string cardinalDirection;
};

struct DistributionSphere {
    uint64_t sphereId = 0;
    WorldCoords worldCoords{};
    std::string cardinalDirection;
    DbVector3 spherePosition{};
    uint64_t packetsRouted = 0;
};

struct QuantumTunnel {
    uint64_t tunnelId = 0;
    WorldCoords worldCoords{};
    std::string cardinalDirection;
    std::string tunnelColor;
    float ringCharge = 0.0f; // percent, 0..100
};

struct MiningSession {
    uint64_t sessionId = 0;
    uint64_t playerId = 0;
    uint64_t sourceId = 0;
    Composition crystalComposition;
    uint32_t totalExtracted = 0;
};

struct WorldRow {
    WorldCoords worldCoords{};
    std::string worldName;
};

struct BroadcastMessage {
    uint64_t messageId = 0;
    uint64_t senderPlayerId = 0;
    std::string senderName;
    std::string content;
};

inline uint64_t rowKey(const Player& r) { return r.playerId; }
inline uint64_t rowKey(const WavePacketSource& r) { return r.sourceId; }
inline uint64_t rowKey(const StorageDevice& r) { return r.deviceId; }
inline uint64_t rowKey(const PacketTransfer& r) { return r.transferId; }
inline uint64_t rowKey(const BroadcastMessage& r) { return r.messageId; }
inline uint64_t rowKey(const WorldCircuit& r) { return r.circuitId; }
inline uint64_t rowKey(const DistributionSphere& r) { return r.sphereId; }
inline uint64_t rowKey(const QuantumTunnel& r) { return r.tunnelId; }
inline uint64_t rowKey(const MiningSession& r) { return r.sessionId; }

inline uint32_t totalCount(const Composition& c) {
    uint32_t total = 0;
    for (const auto& s : c) total += s.count;
    return total;
}

} // namespace net

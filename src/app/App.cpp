#include "App.h"
#include "Input.h"
#include "app/DemoScenario.h"
#include "core/EventBus.h"
#include "core/FrameScheduler.h"
#include "game/CameraRig.h"
#include "game/ChatBubbles.h"
#include "game/DevicePlacement.h"
#include "game/MiningVisuals.h"
#include "game/PlayerTracker.h"
#include "game/PlayerViews.h"
#include "game/SourceManager.h"
#include "game/SpireManager.h"
#include "game/StorageDeviceManager.h"
#include "game/TransferBatcher.h"
#include "game/TransferVisualizer.h"
#include "math/Spherical.h"
#include "net/LocalStore.h"
#include "net/StoreEventBridge.h"
#include "scene/SceneGraph.h"
#include "world/Icosphere.h"
#if WAVESYS_ENABLE_WINDOW
#include "platform/Window.h"
#endif

#include <chrono>
#include <memory>
#include <thread>
#include <glm/vec3.hpp>
#include <spdlog/spdlog.h>

namespace app {

namespace {

game::CameraRig::Config cameraConfig(const core::ClientConfig& cfg) {
    game::CameraRig::Config c;
    c.smoothing = cfg.cameraSmoothing;
    c.occlusion = cfg.cameraOcclusion;
    return c;
}

game::PlayerTracker::Config trackerConfig(const core::ClientConfig& cfg) {
    game::PlayerTracker::Config c;
    c.proximityRadius = cfg.proximityRadius;
    c.proximityUpdateInterval = cfg.proximityInterval;
    return c;
}

game::TransferVisualizer::Config routeConfig(const core::ClientConfig& cfg) {
    game::TransferVisualizer::Config c;
    c.transferSpeed = cfg.transferSpeed;
    return c;
}

game::TransferBatcher::Config legConfig(const core::ClientConfig& cfg) {
    game::TransferBatcher::Config c;
    c.packetSpeed = cfg.transferSpeed;
    return c;
}

class Runtime {
public:
    explicit Runtime(const core::ClientConfig& cfg);
    int run();

private:
    bool initialize();
    void mainLoop();
    void frame(float dt);
    void applyInput(const InputState& input);
    void onWorldLoaded(const net::WorldRow& world);
    void logSummary() const;
    void shutdown();

    core::ClientConfig cfg_;
    net::LocalStore store_;
    core::EventBus bus_;
    core::FrameScheduler scheduler_;
    scene::SceneGraph scene_;
    world::IcosphereCache icospheres_;
    scene::NodeId worldNode_ = scene::kInvalidNode;

    net::StoreEventBridge bridge_;
    game::PlayerTracker tracker_;
    game::PlayerViews views_;
    game::CameraRig camera_;
    game::ChatBubbles chat_;
    game::SourceManager sources_;
    game::StorageDeviceManager devices_;
    game::SpireManager spires_;
    game::MiningVisuals mining_;
    game::TransferVisualizer routeView_;
    game::TransferBatcher legView_;
    game::DevicePlacement placement_;
    DemoScenario demo_;
    std::vector<core::EventBus::Subscription> subs_;

#if WAVESYS_ENABLE_WINDOW
    platform::Window window_;
    bool windowOpen_ = false;
#endif
    Input input_;
    uint64_t framesRun_ = 0;
};

Runtime::Runtime(const core::ClientConfig& cfg)
    : cfg_(cfg),
      bridge_(store_, bus_),
      tracker_(store_, bus_, scheduler_, trackerConfig(cfg)),
      views_(tracker_, scene_),
      camera_(scene_, views_, scheduler_, cameraConfig(cfg)),
      chat_(bus_, scheduler_, views_, game::ChatBubbles::Config{cfg.phraseDisplayTime}),
      sources_(bus_, scene_),
      devices_(bus_, scene_),
      spires_(bus_, scene_),
      mining_(bus_, store_, scheduler_, scene_),
      routeView_(bus_, store_, scene_, routeConfig(cfg)),
      legView_(bus_, store_, scheduler_, scene_, legConfig(cfg)),
      placement_(store_, tracker_),
      demo_(store_, scheduler_) {}

int Runtime::run() {
    if (!initialize()) {
        shutdown();
        return 1;
    }
    mainLoop();
    logSummary();
    shutdown();
    return 0;
}

bool Runtime::initialize() {
    bus_.setClock([this]() { return scheduler_.now(); });
    subs_.push_back(bus_.subscribe<core::WorldLoadedEvent>(
        [this](const core::WorldLoadedEvent& e) { onWorldLoaded(e.world); }));
    subs_.push_back(bus_.subscribe<core::ConnectionFailedEvent>([](const core::ConnectionFailedEvent& e) {
        spdlog::error("[app] connection failed: {}", e.error);
    }));

    bridge_.attach();
    tracker_.attach();
    views_.attach();
    camera_.attach([this]() { return &tracker_; });
    camera_.setPitch(cfg_.cameraPitch);
    chat_.attach();
    sources_.attach();
    devices_.attach();
    spires_.attach();
    mining_.attach();
    if (cfg_.transferMode == core::TransferMode::Route) {
        routeView_.attach();
    } else {
        legView_.attach();
    }
    spdlog::info("[app] transfer view: {}", core::transfer_mode_name(cfg_.transferMode));

#if WAVESYS_ENABLE_WINDOW
    if (cfg_.window) {
        if (!window_.create(1280, 720, "wavesys")) {
            spdlog::error("[app] window creation failed");
            return false;
        }
        windowOpen_ = true;
        input_.initialize(window_);
    }
#else
    if (cfg_.window) spdlog::warn("[app] built without window support, ignoring --window");
#endif

    bus_.publish(core::ConnectionStartedEvent{"local://demo"});
    demo_.start();
    // The local player places a device shortly after arriving; the second attempt
    // lands on the same spot and is refused.
    scheduler_.after(3.0, [this]() { placement_.placeInFrontOfLocalPlayer(); });
    scheduler_.after(3.5, [this]() { placement_.placeInFrontOfLocalPlayer(); });
    return true;
}

void Runtime::mainLoop() {
    const float dt = cfg_.frameDt;
#if WAVESYS_ENABLE_WINDOW
    if (windowOpen_) {
        auto last = std::chrono::steady_clock::now();
        while (!window_.shouldClose()) {
            if (cfg_.frames > 0 && framesRun_ >= static_cast<uint64_t>(cfg_.frames)) break;
            window_.poll();
            InputState inputState = input_.sample(window_);
            if (inputState.requestExit) break;
            applyInput(inputState);
            frame(dt);
            auto next = last + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                   std::chrono::duration<float>(dt));
            std::this_thread::sleep_until(next);
            last = next;
        }
        return;
    }
#endif
    if (cfg_.frames <= 0) {
        spdlog::warn("[app] no window and no frame limit, running 600 frames");
        cfg_.frames = 600;
    }
    for (int i = 0; i < cfg_.frames; ++i) frame(dt);
}

void Runtime::applyInput(const InputState& input) {
    if (input.lookDelta.y != 0.0f) camera_.setPitch(camera_.pitch() + input.lookDelta.y);
    if (input.snapCamera) camera_.snapToTarget();
    if (input.placeDevice) placement_.placeInFrontOfLocalPlayer();
}

void Runtime::frame(float dt) {
    scheduler_.tick(dt);
    demo_.serve();
    views_.update(dt);
    sources_.update(dt);
    mining_.update(dt);
    if (cfg_.transferMode == core::TransferMode::Route) {
        routeView_.update(dt);
    } else {
        legView_.update(dt);
    }
    camera_.update(dt);
    scene_.update(dt);
    ++framesRun_;

    if (framesRun_ % 300 == 0) {
        const auto& cam = scene_.camera();
        spdlog::debug("[app] t={:.1f}s nodes={} effects={} camera=({:.1f}, {:.1f}, {:.1f})", scheduler_.now(),
                      scene_.nodeCount(), scene_.effects().size(), cam.position.x, cam.position.y, cam.position.z);
    }
}

void Runtime::onWorldLoaded(const net::WorldRow& world) {
    if (worldNode_ != scene::kInvalidNode) scene_.destroyNode(worldNode_);
    const int subdivisions = world::recommendedSubdivisions(world::Platform::Desktop);
    auto mesh = icospheres_.get(math::kWorldRadius, subdivisions);
    worldNode_ = scene_.createNode(scene::NodeKind::WorldSphere, world.worldName, glm::vec3(0.0f));
    if (scene::Node* node = scene_.find(worldNode_)) {
        node->meshVertices = mesh->vertexCount();
        node->label = world.worldName;
    }
    spdlog::info("[app] world '{}' ready ({} vertices, {} triangles)", world.worldName, mesh->vertexCount(),
                 mesh->triangleCount());
}

void Runtime::logSummary() const {
    spdlog::info("[app] ran {} frames ({:.1f}s simulated)", framesRun_, scheduler_.now());
    spdlog::info("[app] {}", bus_.stateInfo());
    spdlog::info("[app] players: {} tracked, {} nearby; sources: {}; devices: {}", tracker_.playerCount(),
                 tracker_.nearbyPlayers().size(), sources_.sourceCount(), devices_.deviceCount());
    if (cfg_.transferMode == core::TransferMode::Route) {
        const auto& s = routeView_.stats();
        spdlog::info("[app] transfers: {} started, {} completed, {} stopped, {} segments", s.started, s.completed,
                     s.stopped, s.segments);
    } else {
        const auto& s = legView_.stats();
        spdlog::info("[app] transfer legs: {} departures, {} batches spawned, {} arrived, {} sphere hops",
                     s.departures, s.batchesSpawned, s.batchesArrived, s.sphereHops);
    }
    spdlog::info("[app] spires: {} circuits, {} spheres ({} flashes), {} tunnels", spires_.circuitCount(),
                 spires_.sphereCount(), spires_.stats().flashes, spires_.tunnelCount());
    const auto& m = mining_.stats();
    spdlog::info("[app] mining: {} sessions started, {} ended; {} packets launched, {} landed", m.sessionsStarted,
                 m.sessionsEnded, m.packetsLaunched, m.packetsArrived);
    spdlog::info("[app] effects spawned: {}, reducers served: {}, camera target: {}", scene_.effectsSpawned(),
                 demo_.reducersServed(), camera_.hasTarget() ? "yes" : "no");
    if (spdlog::default_logger_raw()->should_log(spdlog::level::debug)) bus_.dumpHistory();
}

void Runtime::shutdown() {
    demo_.stop();
    subs_.clear();
#if WAVESYS_ENABLE_WINDOW
    if (windowOpen_) {
        window_.destroy();
        windowOpen_ = false;
    }
#endif
}

} // namespace

int App::run() {
    auto runtime = std::make_unique<Runtime>(config_);
    return runtime->run();
}

} // namespace app

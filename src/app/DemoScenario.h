#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <glm/vec3.hpp>

#include "core/FrameScheduler.h"
#include "net/LocalStore.h"

// DemoScenario — a scripted server session played against the LocalStore so the
// client can run without a backend: players walking and chatting, sources drifting
// and rising, a miner draining a source, a storage device filling up, multi-leg
// transfers routed through a charging spire, a world hop.
namespace app {

class DemoScenario {
public:
    struct Config {
        std::string localIdentity = "identity-explorer";
        std::string token = "demo-token";
        double connectDelay = 0.1;
        double subscribeDelay = 0.3;
        double legInterval = 1.5;
        double worldHopTime = 16.0;
        bool worldHop = true;
    };

    DemoScenario(net::LocalStore& store, core::FrameScheduler& scheduler);
    DemoScenario(net::LocalStore& store, core::FrameScheduler& scheduler, const Config& config);
    ~DemoScenario();

    // Seeds the tables and schedules the script.
    void start();
    void stop();
    // Answers reducer calls made since the previous frame.
    void serve();

    uint32_t reducersServed() const { return served_; }
    const Config& config() const { return config_; }

private:
    void seed();
    void scheduleScript();
    void walkWanderer();
    void startTransfers();
    void advanceLegs();
    void finishTransfer(uint64_t transferId);
    void routeThrough(uint64_t sphereId);
    void hopWorld();
    void answer(const net::ReducerCall& call);

    net::LocalStore& store_;
    core::FrameScheduler& scheduler_;
    Config config_{};
    std::vector<core::TimerId> timers_;

    glm::vec3 sphereA_{0.0f};
    glm::vec3 sphereB_{0.0f};
    uint64_t nextDeviceId_ = 100;
    uint64_t nextTransferId_ = 1;
    uint64_t nextMessageId_ = 1;
    std::vector<uint64_t> legTransfers_;
    uint32_t served_ = 0;
};

} // namespace app

// Follow camera: target acquisition, orbit pose, pitch limits, occlusion.
#include <string>

#include <glm/geometric.hpp>

#include "TestCheck.h"
#include "core/EventBus.h"
#include "core/FrameScheduler.h"
#include "game/CameraRig.h"
#include "game/PlayerTracker.h"
#include "game/PlayerViews.h"
#include "net/LocalStore.h"
#include "scene/SceneGraph.h"

using test::approx;

namespace {

net::Player localRow() {
    net::Player p;
    p.playerId = 1;
    p.identity = "me";
    p.name = "Me";
    p.position = {0.0f, 300.0f, 0.0f};
    return p;
}

bool near(const glm::vec3& a, const glm::vec3& b, float eps = 1e-3f) { return glm::length(a - b) <= eps; }

struct Fixture {
    net::LocalStore store;
    core::EventBus bus{core::EventBus::Config{100, false}};
    core::FrameScheduler scheduler;
    scene::SceneGraph scene;
    game::PlayerTracker tracker{store, bus, scheduler};
    game::PlayerViews views{tracker, scene};

    Fixture() {
        store.connect("me", "tok");
        store.playerTable().insert(localRow());
        tracker.attach();
    }
};

} // namespace

int main() {
    bool success = true;

    // Immediate acquisition and the orbit pose without smoothing
    {
        Fixture f;
        f.views.attach();
        game::CameraRig rig(f.scene, f.views, f.scheduler);
        rig.attach([&]() { return &f.tracker; });
        CHECK(rig.hasTarget(), "Target acquired immediately");
        CHECK(rig.targetPlayerId() && *rig.targetPlayerId() == 1, "Following the local player");
        CHECK(near(f.scene.camera().position, glm::vec3(0.0f, 302.5f, -6.0f)), "Initial placement behind and above");

        rig.update(1.0f / 60.0f);
        CHECK(near(f.scene.camera().position, glm::vec3(0.0f, 302.5f, -6.0f)), "Orbit pose at pitch 0 (%g %g %g)",
              f.scene.camera().position.x, f.scene.camera().position.y, f.scene.camera().position.z);
        const glm::vec3 fwd = f.scene.camera().forward();
        CHECK(fwd.z > 0.9f, "Camera looks toward the character (fwd.z=%g)", fwd.z);

        rig.setPitch(30.0f);
        rig.update(1.0f / 60.0f);
        const glm::vec3 pitched = f.scene.camera().position;
        CHECK(approx(glm::distance(pitched, glm::vec3(0.0f, 300.0f, 0.0f)),
                     glm::length(glm::vec3(0.0f, 2.5f, -6.0f)), 1e-3f),
              "Pitch keeps the orbit distance");
        CHECK(pitched.y > 302.5f, "Positive pitch raises the camera (y=%g)", pitched.y);

        rig.setPitch(120.0f);
        CHECK(approx(rig.pitch(), 85.0f), "Pitch clamps to max");
        rig.setPitch(-120.0f);
        CHECK(approx(rig.pitch(), -60.0f), "Pitch clamps to min");

        // Local player leaving clears the target
        f.store.playerTable().remove(1);
        CHECK(!rig.hasTarget() && !rig.targetPlayerId(), "Target cleared when the player leaves");
    }

    // Node not there yet: retries until the view appears
    {
        Fixture f;
        game::CameraRig rig(f.scene, f.views, f.scheduler);
        rig.attach([&]() { return &f.tracker; });
        CHECK(!rig.hasTarget() && rig.acquiring(), "Retrying while the view is missing");
        f.views.attach();
        f.scheduler.tick(0.2);
        CHECK(rig.hasTarget() && !rig.acquiring(), "Acquired on the next retry");
    }

    // Acquisition gives up after the timeout
    {
        Fixture f;
        game::CameraRig::Config cfg;
        cfg.acquireInterval = 0.2;
        cfg.acquireTimeout = 1.0;
        game::CameraRig rig(f.scene, f.views, f.scheduler, cfg);
        rig.attach([&]() { return &f.tracker; });
        for (int i = 0; i < 10; ++i) f.scheduler.tick(0.2);
        CHECK(!rig.acquiring() && !rig.hasTarget(), "Gave up after the timeout");
    }

    // Tracker located later by polling, or never
    {
        Fixture f;
        f.views.attach();
        game::PlayerTracker* available = nullptr;
        game::CameraRig rig(f.scene, f.views, f.scheduler);
        rig.attach([&]() { return available; });
        CHECK(rig.waitingForTracker(), "Polling for the tracker");
        f.scheduler.tick(0.5);
        CHECK(rig.waitingForTracker(), "Still waiting");
        available = &f.tracker;
        f.scheduler.tick(0.5);
        CHECK(!rig.waitingForTracker() && rig.hasTarget(), "Bound once the tracker exists");

        game::CameraRig lonely(f.scene, f.views, f.scheduler);
        lonely.attach([]() { return static_cast<game::PlayerTracker*>(nullptr); });
        for (int i = 0; i < 25; ++i) f.scheduler.tick(0.5);
        CHECK(!lonely.waitingForTracker() && !lonely.hasTarget(), "Tracker wait times out");
    }

    // Occlusion pulls the camera in front of the planet surface
    {
        Fixture f;
        game::CameraRig rig(f.scene, f.views, f.scheduler);
        const glm::vec3 pos(0.0f, 300.0f, 0.0f);
        const glm::vec3 up(0.0f, 1.0f, 0.0f);
        const glm::vec3 clear(0.0f, 302.5f, -6.0f);
        CHECK(near(rig.resolveOcclusion(pos, clear, up), clear), "Unobstructed ideal is kept");

        const glm::vec3 buried(0.0f, 290.0f, -6.0f);
        const glm::vec3 resolved = rig.resolveOcclusion(pos, buried, up);
        CHECK(approx(glm::distance(resolved, pos + up * 0.5f), 1.0f, 1e-3f),
              "Blocked camera clamps to the minimum distance (d=%g)", glm::distance(resolved, pos + up * 0.5f));
    }

    // Smoothing: height follows exactly, horizontal eases
    {
        Fixture f;
        f.views.attach();
        game::CameraRig::Config cfg;
        cfg.smoothing = true;
        game::CameraRig rig(f.scene, f.views, f.scheduler, cfg);
        rig.attach([&]() { return &f.tracker; });
        rig.update(1.0f / 60.0f);
        rig.setPitch(45.0f);
        rig.update(1.0f / 60.0f);
        const glm::vec3 cam = f.scene.camera().position;
        const glm::vec3 ideal = rig.orbitalPosition(glm::vec3(0.0f, 300.0f, 0.0f), glm::vec3(0.0f, 0.0f, 1.0f),
                                                    glm::vec3(0.0f, 1.0f, 0.0f));
        CHECK(approx(cam.y, ideal.y, 1e-3f), "Height snaps to the ideal");
        CHECK(cam.z < ideal.z - 1e-3f || cam.z > ideal.z + 1e-3f, "Horizontal lags behind (z=%g ideal=%g)",
              cam.z, ideal.z);
        rig.snapToTarget();
        CHECK(near(f.scene.camera().position, ideal), "snapToTarget jumps to the ideal pose");
    }

    return success ? 0 : 1;
}

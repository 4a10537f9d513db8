// Phrase splitting and timed chat bubbles above players.
#include <string>
#include <vector>

#include "TestCheck.h"
#include "core/EventBus.h"
#include "core/FrameScheduler.h"
#include "game/ChatBubbles.h"
#include "game/PlayerTracker.h"
#include "game/PlayerViews.h"
#include "net/LocalStore.h"
#include "scene/SceneGraph.h"

using game::splitIntoPhrases;

namespace {

net::Player makePlayer(uint64_t id, const std::string& identity, const std::string& name) {
    net::Player p;
    p.playerId = id;
    p.identity = identity;
    p.name = name;
    p.position = {0.0f, 300.0f, 0.0f};
    return p;
}

} // namespace

int main() {
    bool success = true;

    // Splitting
    {
        auto p = splitIntoPhrases("Hello there. How are you? Fine");
        CHECK(p.size() == 3, "Three phrases (got %zu)", p.size());
        CHECK(p.size() == 3 && p[0] == "Hello there." && p[1] == "How are you?" && p[2] == "Fine", "Phrase text");

        p = splitIntoPhrases("pi is 3.14, roughly");
        CHECK(p.size() == 2 && p[0] == "pi is 3.14,", "Break needs trailing whitespace (first=%s)",
              p.empty() ? "" : p[0].c_str());

        p = splitIntoPhrases("  no breaks here  ");
        CHECK(p.size() == 1 && p[0] == "no breaks here", "Whole message, trimmed");

        CHECK(splitIntoPhrases("   ").empty(), "Blank message has no phrases");

        p = splitIntoPhrases("wait!   ok;  go");
        CHECK(p.size() == 3 && p[1] == "ok;", "Runs of whitespace collapse between phrases");
    }

    // Timed display, queueing and clearing
    {
        net::LocalStore store;
        core::EventBus bus(core::EventBus::Config{100, false});
        core::FrameScheduler scheduler;
        scene::SceneGraph scene;
        store.connect("me", "tok");
        store.playerTable().insert(makePlayer(1, "me", "Me"));
        store.playerTable().insert(makePlayer(2, "them", "Them"));
        game::PlayerTracker tracker(store, bus, scheduler);
        tracker.attach();
        game::PlayerViews views(tracker, scene);
        views.attach();
        game::ChatBubbles chat(bus, scheduler, views);
        chat.attach();

        bus.publish(core::BroadcastMessageReceivedEvent{1, 2, "Them", "Hi. Bye."});
        CHECK(chat.isDisplaying(2), "Bubble shown right away");
        CHECK(views.status(2) == "Hi.", "First phrase shown (got %s)", views.status(2).c_str());
        CHECK(chat.queuedPhrases(2) == 1, "One phrase waiting");

        chat.enqueue(2, "Later");
        CHECK(chat.queuedPhrases(2) == 2, "New message appends to the queue");

        scheduler.tick(1.0);
        CHECK(views.status(2) == "Hi.", "Phrase held for the display time");
        scheduler.tick(1.0);
        CHECK(views.status(2) == "Bye.", "Second phrase after 2s (got %s)", views.status(2).c_str());
        scheduler.tick(2.0);
        CHECK(views.status(2) == "Later", "Queued message follows");
        scheduler.tick(2.0);
        CHECK(views.status(2).empty(), "Bubble cleared after the last phrase");
        CHECK(!chat.isDisplaying(2), "No longer displaying");

        // Unknown sender: dropped without touching any view
        bus.publish(core::BroadcastMessageReceivedEvent{2, 42, "Ghost", "boo"});
        CHECK(!chat.isDisplaying(42) && chat.queuedPhrases(42) == 0, "Unknown sender dropped");

        // Detach cancels pending phrases
        chat.enqueue(1, "one. two.");
        chat.detach();
        scheduler.tick(5.0);
        CHECK(views.status(1) == "one.", "Detach leaves the current label and stops the queue");
        CHECK(!chat.isDisplaying(1), "Detach clears display state");
    }

    // Custom display time
    {
        net::LocalStore store;
        core::EventBus bus(core::EventBus::Config{100, false});
        core::FrameScheduler scheduler;
        scene::SceneGraph scene;
        store.connect("me", "tok");
        store.playerTable().insert(makePlayer(1, "me", "Me"));
        game::PlayerTracker tracker(store, bus, scheduler);
        tracker.attach();
        game::PlayerViews views(tracker, scene);
        views.attach();
        game::ChatBubbles chat(bus, scheduler, views, game::ChatBubbles::Config{0.5f});
        chat.enqueue(1, "quick");
        scheduler.tick(0.5);
        CHECK(views.status(1).empty(), "Short display time clears after 0.5s");
    }

    return success ? 0 : 1;
}

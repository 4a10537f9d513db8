#pragma once

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/EventBus.h"
#include "core/FrameScheduler.h"
#include "game/PlayerViews.h"

// ChatBubbles — shows broadcast chat above the sender, one phrase at a time.
namespace game {

// Splits after any of . ! ? , ; that is followed by whitespace. Phrases are trimmed
// and empty ones dropped; a message without such breaks yields itself, trimmed.
std::vector<std::string> splitIntoPhrases(std::string_view message);

class ChatBubbles {
public:
    struct Config {
        float phraseDisplayTime = 2.0f;
    };

    ChatBubbles(core::EventBus& bus, core::FrameScheduler& scheduler, PlayerViews& views);
    ChatBubbles(core::EventBus& bus, core::FrameScheduler& scheduler, PlayerViews& views, const Config& config);
    ~ChatBubbles();

    void attach();
    void detach();

    void enqueue(uint64_t playerId, std::string_view content);
    bool isDisplaying(uint64_t playerId) const { return active_.count(playerId) != 0; }
    std::size_t queuedPhrases(uint64_t playerId) const;

private:
    void showNext(uint64_t playerId);
    void stop(uint64_t playerId);

    core::EventBus& bus_;
    core::FrameScheduler& scheduler_;
    PlayerViews& views_;
    Config config_{};
    std::unordered_map<uint64_t, std::deque<std::string>> queues_;
    std::unordered_map<uint64_t, core::TimerId> active_;
    core::EventBus::Subscription sub_;
};

} // namespace game

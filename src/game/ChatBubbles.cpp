#include "ChatBubbles.h"

#include <cctype>

#include <spdlog/spdlog.h>

#include "core/Config.h"

namespace game {

namespace {
bool isBreak(char c) {
    return c == '.' || c == '!' || c == '?' || c == ',' || c == ';';
}
bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}
}

std::vector<std::string> splitIntoPhrases(std::string_view message) {
    std::vector<std::string> phrases;
    std::size_t start = 0;
    for (std::size_t i = 0; i < message.size(); ++i) {
        if (!isBreak(message[i]) || i + 1 >= message.size() || !isSpace(message[i + 1])) continue;
        auto part = core::trim_view(message.substr(start, i + 1 - start));
        if (!part.empty()) phrases.emplace_back(part);
        std::size_t next = i + 1;
        while (next < message.size() && isSpace(message[next])) ++next;
        start = next;
        i = next - 1;
    }
    if (start < message.size()) {
        auto part = core::trim_view(message.substr(start));
        if (!part.empty()) phrases.emplace_back(part);
    }
    if (phrases.empty()) {
        auto whole = core::trim_view(message);
        if (!whole.empty()) phrases.emplace_back(whole);
    }
    return phrases;
}

ChatBubbles::ChatBubbles(core::EventBus& bus, core::FrameScheduler& scheduler, PlayerViews& views)
    : ChatBubbles(bus, scheduler, views, Config{}) {}

ChatBubbles::ChatBubbles(core::EventBus& bus, core::FrameScheduler& scheduler, PlayerViews& views,
                         const Config& config)
    : bus_(bus), scheduler_(scheduler), views_(views), config_(config) {}

ChatBubbles::~ChatBubbles() {
    detach();
}

void ChatBubbles::attach() {
    if (sub_.active()) return;
    sub_ = bus_.subscribe<core::BroadcastMessageReceivedEvent>([this](const core::BroadcastMessageReceivedEvent& e) {
        spdlog::debug("[chat] message from player {}: {}", e.senderPlayerId, e.content);
        enqueue(e.senderPlayerId, e.content);
    });
}

void ChatBubbles::detach() {
    sub_.reset();
    for (const auto& kv : active_) scheduler_.cancel(kv.second);
    active_.clear();
    queues_.clear();
}

std::size_t ChatBubbles::queuedPhrases(uint64_t playerId) const {
    auto it = queues_.find(playerId);
    return it == queues_.end() ? 0 : it->second.size();
}

void ChatBubbles::enqueue(uint64_t playerId, std::string_view content) {
    auto phrases = splitIntoPhrases(content);
    if (phrases.empty()) return;
    auto& queue = queues_[playerId];
    for (auto& p : phrases) queue.push_back(std::move(p));
    if (!isDisplaying(playerId)) {
        active_[playerId] = core::kInvalidTimer;
        showNext(playerId);
    }
}

void ChatBubbles::showNext(uint64_t playerId) {
    if (!views_.hasView(playerId)) {
        spdlog::warn("[chat] player {} not found in world", playerId);
        active_.erase(playerId);
        queues_.erase(playerId);
        return;
    }
    auto it = queues_.find(playerId);
    if (it == queues_.end() || it->second.empty()) {
        stop(playerId);
        return;
    }
    std::string phrase = std::move(it->second.front());
    it->second.pop_front();
    views_.setStatus(playerId, phrase);
    spdlog::debug("[chat] showing \"{}\" for {:.1f}s", phrase, config_.phraseDisplayTime);
    active_[playerId] = scheduler_.after(config_.phraseDisplayTime, [this, playerId]() { showNext(playerId); });
}

void ChatBubbles::stop(uint64_t playerId) {
    views_.clearStatus(playerId);
    active_.erase(playerId);
    auto it = queues_.find(playerId);
    if (it != queues_.end() && it->second.empty()) queues_.erase(it);
}

} // namespace game

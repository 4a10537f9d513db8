#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Config — env/CLI overlay for the client runtime. Module defaults live in each
// module's own Config struct; this only carries what the command line can change.
namespace core {

std::string_view trim_view(std::string_view s);

// Non-empty environment variable, or nullopt.
std::optional<std::string> env_value(const char* name);

// Accepts both "--name value" and "--name=value". Last occurrence wins.
std::optional<std::string_view> flag_value(int argc, char** argv, std::string_view name);
bool has_flag(int argc, char** argv, std::string_view name);

enum class TransferMode : uint8_t { Route, Legs };

const char* transfer_mode_name(TransferMode mode);
std::optional<TransferMode> parse_transfer_mode(std::string_view s);

struct ClientConfig {
    // Frame loop
    int   frames = 1200;        // <= 0 runs until the window closes
    float frameDt = 1.0f / 60.0f;
    bool  window = false;

    // Player tracking
    float proximityRadius = 50.0f;
    float proximityInterval = 0.5f;

    // Chat
    float phraseDisplayTime = 2.0f;

    // Transfers
    float transferSpeed = 5.0f;
    TransferMode transferMode = TransferMode::Route;

    // Camera
    bool cameraSmoothing = false;
    bool cameraOcclusion = false;
    float cameraPitch = 0.0f;
};

// Env vars (WAVESYS_*) first, CLI flags override. Unknown values are logged and ignored.
ClientConfig determine_client_config(int argc, char** argv);

} // namespace core

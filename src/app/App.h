#pragma once

#include "core/Config.h"

namespace app {

class App {
public:
    App() = default;
    explicit App(const core::ClientConfig& config) : config_(config) {}

    // Runs the client against the scripted local session. Returns the process exit code.
    int run();

private:
    core::ClientConfig config_{};
};

} // namespace app

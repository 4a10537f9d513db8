#pragma once

#include <glm/vec2.hpp>

namespace platform {
class Window;
}

namespace app {

struct InputState {
    glm::vec2 lookDelta{0.0f};   // degrees this frame; y drives camera pitch
    bool placeDevice = false;    // edge-triggered
    bool snapCamera = false;     // edge-triggered
    bool requestExit = false;
    bool cursorCaptured = false;
};

class Input {
public:
    void initialize(platform::Window& window);
    InputState sample(platform::Window& window);

private:
    bool cursorCaptured_ = false;
    bool firstMouse_ = true;
    bool rawMouseSupported_ = false;
    double lastX_ = 0.0;
    double lastY_ = 0.0;
    bool placePrev_ = false;
    bool snapPrev_ = false;
};

}

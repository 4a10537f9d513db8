#include "Input.h"
#include "platform/Window.h"

#if WAVESYS_ENABLE_WINDOW
#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>
#endif

namespace app {

namespace {
constexpr float kMouseDegreesPerPixel = 0.08f;
constexpr float kKeyPitchDegrees = 1.5f;
}

void Input::initialize(platform::Window& window) {
#if WAVESYS_ENABLE_WINDOW
    GLFWwindow* handle = window.handle();
    if (!handle) return;
    glfwSetInputMode(handle, GLFW_CURSOR, GLFW_CURSOR_NORMAL);
    rawMouseSupported_ = glfwRawMouseMotionSupported() == GLFW_TRUE;
    if (rawMouseSupported_) {
        glfwSetInputMode(handle, GLFW_RAW_MOUSE_MOTION, GLFW_FALSE);
    }
#else
    (void)window;
#endif
}

InputState Input::sample(platform::Window& window) {
    InputState state{};
#if WAVESYS_ENABLE_WINDOW
    GLFWwindow* handle = window.handle();
    if (!handle) {
        return state;
    }

    // Mouse look only while the left button is held.
    bool capturePressed = glfwGetMouseButton(handle, GLFW_MOUSE_BUTTON_LEFT) == GLFW_PRESS;
    if (capturePressed != cursorCaptured_) {
        cursorCaptured_ = capturePressed;
        glfwSetInputMode(handle, GLFW_CURSOR, cursorCaptured_ ? GLFW_CURSOR_DISABLED : GLFW_CURSOR_NORMAL);
        if (rawMouseSupported_) {
            glfwSetInputMode(handle, GLFW_RAW_MOUSE_MOTION, cursorCaptured_ ? GLFW_TRUE : GLFW_FALSE);
        }
        firstMouse_ = true;
    }
    state.cursorCaptured = cursorCaptured_;

    double mouseX = 0.0;
    double mouseY = 0.0;
    glfwGetCursorPos(handle, &mouseX, &mouseY);
    if (firstMouse_) {
        lastX_ = mouseX;
        lastY_ = mouseY;
        firstMouse_ = false;
    }
    double xoffset = cursorCaptured_ ? (mouseX - lastX_) : 0.0;
    double yoffset = cursorCaptured_ ? (mouseY - lastY_) : 0.0;
    lastX_ = mouseX;
    lastY_ = mouseY;

    state.lookDelta.x = -static_cast<float>(xoffset) * kMouseDegreesPerPixel;
    state.lookDelta.y = static_cast<float>(yoffset) * kMouseDegreesPerPixel;

    auto keyDown = [&](int key) -> bool {
        return glfwGetKey(handle, key) == GLFW_PRESS;
    };

    // Arrow keys tilt the orbit without grabbing the cursor.
    if (keyDown(GLFW_KEY_UP)) state.lookDelta.y += kKeyPitchDegrees;
    if (keyDown(GLFW_KEY_DOWN)) state.lookDelta.y -= kKeyPitchDegrees;

    state.requestExit = keyDown(GLFW_KEY_ESCAPE);

    bool placePressed = keyDown(GLFW_KEY_R);
    state.placeDevice = placePressed && !placePrev_;
    placePrev_ = placePressed;

    bool snapPressed = keyDown(GLFW_KEY_C);
    state.snapCamera = snapPressed && !snapPrev_;
    snapPrev_ = snapPressed;
#else
    (void)window;
#endif
    return state;
}

}

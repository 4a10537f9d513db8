#pragma once

#include <cstdint>

struct GLFWwindow;

namespace platform {

// Input-only desktop window. Nothing is drawn into it; it exists so mouse look and
// keys can drive the client in an interactive run.
class Window {
public:
    bool create(int width = 1280, int height = 720, const char* title = "wavesys");
    void poll();
    void destroy();

    int width() const { return width_; }
    int height() const { return height_; }
    GLFWwindow* handle() const { return window_; }
    bool shouldClose() const;

private:
    GLFWwindow* window_ = nullptr;
    int width_ = 0;
    int height_ = 0;
};

} // namespace platform

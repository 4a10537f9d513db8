#include "Window.h"

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>
#include <spdlog/spdlog.h>

namespace platform {

static void glfwErrorCallback(int code, const char* desc) {
    spdlog::error("[glfw] error {}: {}", code, desc ? desc : "(null)");
}

bool Window::create(int w, int h, const char* title) {
    glfwSetErrorCallback(glfwErrorCallback);
    if (!glfwInit()) return false;
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_DECORATED, GLFW_TRUE);
    window_ = glfwCreateWindow(w, h, title, nullptr, nullptr);
    if (!window_) {
        glfwTerminate();
        return false;
    }
    width_ = w; height_ = h;

    // ESC closes
    glfwSetKeyCallback(window_, [](GLFWwindow* win, int key, int sc, int action, int mods){
        (void)sc; (void)mods;
        if (action == GLFW_PRESS && key == GLFW_KEY_ESCAPE) {
            glfwSetWindowShouldClose(win, GLFW_TRUE);
        }
    });
    spdlog::info("[window] created {}x{}", w, h);
    return true;
}

void Window::poll() {
    if (window_) glfwPollEvents();
}

void Window::destroy() {
    if (window_) { glfwDestroyWindow(window_); window_ = nullptr; }
    glfwTerminate();
}

bool Window::shouldClose() const { return window_ && glfwWindowShouldClose(window_); }

} // namespace platform

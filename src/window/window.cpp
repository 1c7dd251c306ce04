#include "mapgen/window/window.hpp"
#include "mapgen/core/instance.hpp"
#include "mapgen/core/logging.hpp"

#include <stdexcept>

namespace mapgen {

// ============================================================================
// Builder
// ============================================================================

Window::Builder::Builder(Instance* instance)
    : instance_(instance) {
}

Window::Builder& Window::Builder::title(std::string_view title) {
    config_.title = std::string(title);
    return *this;
}

Window::Builder& Window::Builder::size(uint32_t width, uint32_t height) {
    config_.width = width;
    config_.height = height;
    return *this;
}

Window::Builder& Window::Builder::resizable(bool enabled) {
    config_.resizable = enabled;
    return *this;
}

WindowPtr Window::Builder::build() {
    if (!instance_) {
        throw std::runtime_error("Window requires an instance");
    }
    if (config_.width == 0 || config_.height == 0) {
        throw std::runtime_error("Window size must be non-zero");
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, config_.resizable ? GLFW_TRUE : GLFW_FALSE);

    auto window = WindowPtr(new Window());
    window->instance_ = instance_;
    window->handle_ = glfwCreateWindow(static_cast<int>(config_.width),
                                       static_cast<int>(config_.height),
                                       config_.title.c_str(), nullptr, nullptr);
    if (!window->handle_) {
        throw std::runtime_error("Failed to create GLFW window");
    }

    glfwSetWindowUserPointer(window->handle_, window.get());
    glfwSetFramebufferSizeCallback(window->handle_, framebufferResized);

    if (glfwCreateWindowSurface(instance_->handle(), window->handle_, nullptr,
                                &window->surface_) != VK_SUCCESS) {
        throw std::runtime_error("Failed to create window surface");
    }

    MAPGEN_INFO(LogCategory::Core, "Window \"" + config_.title + "\" opened at " +
                std::to_string(config_.width) + "x" + std::to_string(config_.height));
    return window;
}

// ============================================================================
// Window
// ============================================================================

Window::Builder Window::create(Instance* instance) {
    return Builder(instance);
}

Window::~Window() {
    if (surface_ != VK_NULL_HANDLE) {
        vkDestroySurfaceKHR(instance_->handle(), surface_, nullptr);
    }
    if (handle_) {
        glfwDestroyWindow(handle_);
    }
}

bool Window::isOpen() const {
    return glfwWindowShouldClose(handle_) == GLFW_FALSE;
}

VkExtent2D Window::extent() const {
    int width = 0;
    int height = 0;
    glfwGetFramebufferSize(handle_, &width, &height);
    return {static_cast<uint32_t>(width), static_cast<uint32_t>(height)};
}

bool Window::isMinimized() const {
    VkExtent2D size = extent();
    return size.width == 0 || size.height == 0;
}

bool Window::consumeResize() {
    bool resized = resized_;
    resized_ = false;
    return resized;
}

void Window::pollEvents() {
    glfwPollEvents();
}

void Window::waitEvents() {
    glfwWaitEvents();
}

bool Window::isKeyPressed(int key) const {
    return key != GLFW_KEY_UNKNOWN && glfwGetKey(handle_, key) == GLFW_PRESS;
}

bool Window::isGamepadButtonPressed(int button) const {
    if (button < 0 || button > GLFW_GAMEPAD_BUTTON_LAST) {
        return false;
    }
    GLFWgamepadstate state;
    if (!glfwJoystickIsGamepad(GLFW_JOYSTICK_1) || !glfwGetGamepadState(GLFW_JOYSTICK_1, &state)) {
        return false;
    }
    return state.buttons[button] == GLFW_PRESS;
}

void Window::framebufferResized(GLFWwindow* handle, int /*width*/, int /*height*/) {
    if (auto* window = static_cast<Window*>(glfwGetWindowUserPointer(handle))) {
        window->resized_ = true;
    }
}

} // namespace mapgen

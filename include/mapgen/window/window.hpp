#pragma once

#include "mapgen/core/types.hpp"

#include <vulkan/vulkan.h>
#include <GLFW/glfw3.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace mapgen {

/// Settings a window is opened with
struct WindowConfig {
    std::string title = "MapGen";
    uint32_t width = 800;
    uint32_t height = 480;
    bool resizable = true;
};

/**
 * @brief GLFW window plus the Vulkan surface that presents into it
 *
 * Only the platform side lives here. The swap chain and frame pacing
 * belong to FrameRenderer, which polls extent() and consumeResize().
 *
 * Usage:
 * @code
 * auto window = Window::create(instance.get())
 *     .title("MapGen")
 *     .size(800, 480)
 *     .build();
 *
 * while (window->isOpen()) {
 *     window->pollEvents();
 *     if (window->isMinimized()) {
 *         window->waitEvents();
 *     }
 * }
 * @endcode
 */
class Window {
public:
    class Builder {
    public:
        explicit Builder(Instance* instance);

        Builder& title(std::string_view title);
        Builder& size(uint32_t width, uint32_t height);
        Builder& resizable(bool enabled = true);

        /// @throws std::runtime_error if the window or its surface cannot be created
        WindowPtr build();

    private:
        Instance* instance_;
        WindowConfig config_;
    };

    static Builder create(Instance* instance);

    VkSurfaceKHR surface() const { return surface_; }

    bool isOpen() const;

    /// Framebuffer size in pixels; 0x0 while minimized
    VkExtent2D extent() const;

    bool isMinimized() const;

    /// True if the framebuffer changed size since the previous call
    bool consumeResize();

    void pollEvents();

    /// Sleep until at least one event arrives
    void waitEvents();

    /// @p key is a GLFW_KEY_* code
    bool isKeyPressed(int key) const;

    /// True if the first connected gamepad holds @p button (GLFW_GAMEPAD_BUTTON_*)
    bool isGamepadButtonPressed(int button) const;

    /// Destroys the surface, then the GLFW window
    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

private:
    Window() = default;

    static void framebufferResized(GLFWwindow* handle, int width, int height);

    Instance* instance_ = nullptr;
    GLFWwindow* handle_ = nullptr;
    VkSurfaceKHR surface_ = VK_NULL_HANDLE;
    bool resized_ = false;
};

} // namespace mapgen

#pragma once

#include "mapgen/core/types.hpp"

#include <vulkan/vulkan.h>
#include <string>
#include <string_view>

namespace mapgen {

/**
 * @brief Vulkan instance able to present to GLFW windows
 *
 * Building one initializes GLFW and enables the surface extensions GLFW
 * asks for. With validation on, validation messages are forwarded to
 * Logger under LogCategory::Vulkan; when the Khronos layer is missing the
 * instance is created without it and a warning is logged.
 *
 * Usage:
 * @code
 * auto instance = Instance::create()
 *     .applicationName("MapGen")
 *     .enableValidation(config.enableValidation)
 *     .build();
 * @endcode
 */
class Instance {
public:
    class Builder {
    public:
        Builder& applicationName(std::string_view name);
        Builder& enableValidation(bool enable = true);

        /// @throws std::runtime_error if GLFW or the instance cannot be initialized
        InstancePtr build();

    private:
        std::string appName_ = "MapGen";
        bool validation_ = false;
    };

    static Builder create();

    VkInstance handle() const { return instance_; }
    bool validationEnabled() const { return messenger_ != VK_NULL_HANDLE; }

    /// Destroys the messenger, the instance, then terminates GLFW
    ~Instance();

    Instance(const Instance&) = delete;
    Instance& operator=(const Instance&) = delete;

private:
    Instance() = default;

    VkInstance instance_ = VK_NULL_HANDLE;
    VkDebugUtilsMessengerEXT messenger_ = VK_NULL_HANDLE;
    bool ownsGlfw_ = false;
};

} // namespace mapgen

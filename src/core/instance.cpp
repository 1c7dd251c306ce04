#include "mapgen/core/instance.hpp"
#include "mapgen/core/logging.hpp"

#include <GLFW/glfw3.h>

#include <cstring>
#include <stdexcept>
#include <vector>

namespace mapgen {

namespace {

constexpr const char* kKhronosValidation = "VK_LAYER_KHRONOS_validation";

LogLevel levelForSeverity(VkDebugUtilsMessageSeverityFlagBitsEXT severity) {
    if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT) {
        return LogLevel::Error;
    }
    if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT) {
        return LogLevel::Warning;
    }
    if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_INFO_BIT_EXT) {
        return LogLevel::Debug;
    }
    return LogLevel::Trace;
}

VKAPI_ATTR VkBool32 VKAPI_CALL forwardToLogger(
    VkDebugUtilsMessageSeverityFlagBitsEXT severity,
    VkDebugUtilsMessageTypeFlagsEXT,
    const VkDebugUtilsMessengerCallbackDataEXT* data,
    void*)
{
    Logger::global().log(levelForSeverity(severity), LogCategory::Vulkan, data->pMessage);
    return VK_FALSE;
}

VkDebugUtilsMessengerCreateInfoEXT validationMessengerInfo() {
    VkDebugUtilsMessengerCreateInfoEXT info{};
    info.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
    info.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_VERBOSE_BIT_EXT
                         | VK_DEBUG_UTILS_MESSAGE_SEVERITY_INFO_BIT_EXT
                         | VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT
                         | VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
    info.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT
                     | VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT
                     | VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
    info.pfnUserCallback = forwardToLogger;
    return info;
}

bool layerInstalled(const char* name) {
    uint32_t count = 0;
    if (vkEnumerateInstanceLayerProperties(&count, nullptr) != VK_SUCCESS) {
        return false;
    }
    std::vector<VkLayerProperties> layers(count);
    if (vkEnumerateInstanceLayerProperties(&count, layers.data()) != VK_SUCCESS) {
        return false;
    }
    for (const VkLayerProperties& layer : layers) {
        if (std::strcmp(layer.layerName, name) == 0) {
            return true;
        }
    }
    return false;
}

/// Surface extensions GLFW needs, plus debug utils when validating
std::vector<const char*> instanceExtensions(bool validation) {
    uint32_t count = 0;
    const char** names = glfwGetRequiredInstanceExtensions(&count);
    if (!names) {
        throw std::runtime_error("GLFW cannot create Vulkan surfaces on this system");
    }

    std::vector<const char*> extensions(names, names + count);
    if (validation) {
        extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
    }
#ifdef VK_USE_PLATFORM_MACOS_MVK
    extensions.push_back(VK_KHR_PORTABILITY_ENUMERATION_EXTENSION_NAME);
    extensions.push_back("VK_KHR_get_physical_device_properties2");
#endif
    return extensions;
}

} // namespace

// ============================================================================
// Builder
// ============================================================================

Instance::Builder& Instance::Builder::applicationName(std::string_view name) {
    appName_ = std::string(name);
    return *this;
}

Instance::Builder& Instance::Builder::enableValidation(bool enable) {
    validation_ = enable;
    return *this;
}

InstancePtr Instance::Builder::build() {
    if (glfwInit() != GLFW_TRUE) {
        throw std::runtime_error("Failed to initialize GLFW");
    }

    // From here on a throw unwinds through ~Instance, which terminates GLFW
    auto instance = InstancePtr(new Instance());
    instance->ownsGlfw_ = true;

    bool validation = validation_;
    if (validation && !layerInstalled(kKhronosValidation)) {
        MAPGEN_WARN(LogCategory::Vulkan, std::string(kKhronosValidation) +
                    " is not installed; continuing without validation");
        validation = false;
    }

    std::vector<const char*> extensions = instanceExtensions(validation);

    VkApplicationInfo app{};
    app.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    app.pApplicationName = appName_.c_str();
    app.applicationVersion = VK_MAKE_VERSION(1, 0, 0);
    app.pEngineName = "mapgen";
    app.engineVersion = VK_MAKE_VERSION(1, 0, 0);
    app.apiVersion = VK_API_VERSION_1_2;

    VkInstanceCreateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    info.pApplicationInfo = &app;
    info.enabledExtensionCount = static_cast<uint32_t>(extensions.size());
    info.ppEnabledExtensionNames = extensions.data();
#ifdef VK_USE_PLATFORM_MACOS_MVK
    info.flags |= VK_INSTANCE_CREATE_ENUMERATE_PORTABILITY_BIT_KHR;
#endif

    // Chained messenger covers vkCreateInstance/vkDestroyInstance themselves
    VkDebugUtilsMessengerCreateInfoEXT chained = validationMessengerInfo();
    if (validation) {
        info.enabledLayerCount = 1;
        info.ppEnabledLayerNames = &kKhronosValidation;
        info.pNext = &chained;
    }

    if (vkCreateInstance(&info, nullptr, &instance->instance_) != VK_SUCCESS) {
        throw std::runtime_error("Failed to create Vulkan instance");
    }

    if (validation) {
        auto createMessenger = reinterpret_cast<PFN_vkCreateDebugUtilsMessengerEXT>(
            vkGetInstanceProcAddr(instance->instance_, "vkCreateDebugUtilsMessengerEXT"));
        VkDebugUtilsMessengerCreateInfoEXT messengerInfo = validationMessengerInfo();
        if (!createMessenger ||
            createMessenger(instance->instance_, &messengerInfo, nullptr,
                            &instance->messenger_) != VK_SUCCESS) {
            throw std::runtime_error("Failed to create validation messenger");
        }
    }

    MAPGEN_INFO(LogCategory::Vulkan, "Vulkan instance created for '" + appName_ + "'" +
                (validation ? " with validation" : ""));
    return instance;
}

// ============================================================================
// Instance
// ============================================================================

Instance::Builder Instance::create() {
    return Builder();
}

Instance::~Instance() {
    if (messenger_ != VK_NULL_HANDLE) {
        auto destroyMessenger = reinterpret_cast<PFN_vkDestroyDebugUtilsMessengerEXT>(
            vkGetInstanceProcAddr(instance_, "vkDestroyDebugUtilsMessengerEXT"));
        if (destroyMessenger) {
            destroyMessenger(instance_, messenger_, nullptr);
        }
    }
    if (instance_ != VK_NULL_HANDLE) {
        vkDestroyInstance(instance_, nullptr);
        MAPGEN_DEBUG(LogCategory::Vulkan, "Vulkan instance destroyed");
    }
    if (ownsGlfw_) {
        glfwTerminate();
    }
}

} // namespace mapgen

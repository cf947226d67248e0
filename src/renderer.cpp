#include "renderer.h"

#include <GLFW/glfw3.h>

#include <algorithm>
#include <cstring>
#include <iostream>
#include <optional>
#include <set>
#include <stdexcept>
#include <vector>

#include "vk_utils.h"

namespace scribble {

using vk::throw_if_failed;

Renderer::~Renderer() {
    shutdown();
}

void Renderer::initialize(const CreateInfo& info) {
    if (instance_) {
        shutdown();
    }
    if (!info.window) {
        throw std::invalid_argument("Renderer needs a window");
    }

    window_ = info.window;
    enable_validation_ = info.enable_validation;
    app_name_ = info.app_name;

    // A throw part way through leaves the already-created objects for
    // shutdown(), which the owner's destructor runs.
    create_instance();
    setup_debug_messenger();
    create_surface();
    pick_physical_device();
    create_logical_device();
    create_upload_pool();
}

void Renderer::shutdown() {
    if (device_) {
        vkDeviceWaitIdle(device_);
        if (upload_pool_) {
            vkDestroyCommandPool(device_, upload_pool_, nullptr);
            upload_pool_ = VK_NULL_HANDLE;
        }
        vkDestroyDevice(device_, nullptr);
        device_ = VK_NULL_HANDLE;
    }
    destroy_instance_objects();

    physical_device_ = VK_NULL_HANDLE;
    queue_graphics_ = VK_NULL_HANDLE;
    queue_present_ = VK_NULL_HANDLE;
    enabled_layers_.clear();
    enabled_instance_exts_.clear();
    enabled_device_exts_.clear();
}

void Renderer::destroy_instance_objects() {
    if (instance_ && debug_messenger_) {
        auto pfn_destroy = reinterpret_cast<PFN_vkDestroyDebugUtilsMessengerEXT>(
            vkGetInstanceProcAddr(instance_, "vkDestroyDebugUtilsMessengerEXT"));
        if (pfn_destroy) {
            pfn_destroy(instance_, debug_messenger_, nullptr);
        }
        debug_messenger_ = VK_NULL_HANDLE;
    }
    if (instance_ && surface_) {
        vkDestroySurfaceKHR(instance_, surface_, nullptr);
        surface_ = VK_NULL_HANDLE;
    }
    if (instance_) {
        vkDestroyInstance(instance_, nullptr);
        instance_ = VK_NULL_HANDLE;
    }
}

void Renderer::wait_idle() const {
    if (device_) {
        throw_if_failed(vkDeviceWaitIdle(device_), "vkDeviceWaitIdle failed");
    }
}

void Renderer::create_instance() {
    uint32_t glfw_count = 0;
    const char** glfw_ext = glfwGetRequiredInstanceExtensions(&glfw_count);
    if (!glfw_ext) {
        throw std::runtime_error("GLFW reports no Vulkan surface support on this system");
    }
    enabled_instance_exts_.assign(glfw_ext, glfw_ext + glfw_count);

    if (enable_validation_) {
        enabled_layers_.push_back("VK_LAYER_KHRONOS_validation");
        if (!has_layer(enabled_layers_.back())) {
            std::cout << "[vk] VK_LAYER_KHRONOS_validation not installed, continuing without it\n";
            enabled_layers_.clear();
        }
        if (has_instance_extension("VK_EXT_debug_utils")) {
            enabled_instance_exts_.push_back("VK_EXT_debug_utils");
        }
    }

#ifdef __APPLE__
    if (has_instance_extension("VK_KHR_portability_enumeration")) {
        enabled_instance_exts_.push_back("VK_KHR_portability_enumeration");
    }
#endif

    VkApplicationInfo app{};
    app.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    app.pApplicationName = app_name_.c_str();
    app.applicationVersion = VK_MAKE_VERSION(0, 1, 0);
    app.pEngineName = "scribble";
    app.engineVersion = VK_MAKE_VERSION(0, 1, 0);
    app.apiVersion = VK_API_VERSION_1_0;

    VkInstanceCreateInfo ci{};
    ci.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    ci.pApplicationInfo = &app;
    ci.enabledExtensionCount = static_cast<uint32_t>(enabled_instance_exts_.size());
    ci.ppEnabledExtensionNames = enabled_instance_exts_.data();
    ci.enabledLayerCount = static_cast<uint32_t>(enabled_layers_.size());
    ci.ppEnabledLayerNames = enabled_layers_.data();
#ifdef __APPLE__
    if (std::find_if(enabled_instance_exts_.begin(), enabled_instance_exts_.end(), [](const char* e) {
            return std::strcmp(e, "VK_KHR_portability_enumeration") == 0;
        }) != enabled_instance_exts_.end()) {
        ci.flags |= static_cast<VkInstanceCreateFlags>(0x00000001); // VK_INSTANCE_CREATE_ENUMERATE_PORTABILITY_BIT_KHR
    }
#endif
    throw_if_failed(vkCreateInstance(&ci, nullptr, &instance_), "vkCreateInstance failed");
}

void Renderer::setup_debug_messenger() {
    if (!enable_validation_) return;
    if (!has_instance_extension("VK_EXT_debug_utils")) return;

    VkDebugUtilsMessengerCreateInfoEXT info{};
    info.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
    info.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
                           VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
    info.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
                       VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
                       VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
    info.pfnUserCallback = [](VkDebugUtilsMessageSeverityFlagBitsEXT severity,
                              VkDebugUtilsMessageTypeFlagsEXT,
                              const VkDebugUtilsMessengerCallbackDataEXT* callback_data,
                              void*) -> VkBool32 {
        const char* level = (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT) ? "error" : "warning";
        std::cerr << "[VK] " << level << ": " << callback_data->pMessage << "\n";
        return VK_FALSE;
    };
    auto pfn_create = reinterpret_cast<PFN_vkCreateDebugUtilsMessengerEXT>(
        vkGetInstanceProcAddr(instance_, "vkCreateDebugUtilsMessengerEXT"));
    if (pfn_create) {
        throw_if_failed(pfn_create(instance_, &info, nullptr, &debug_messenger_), "CreateDebugUtilsMessenger failed");
    }
}

void Renderer::create_surface() {
    throw_if_failed(glfwCreateWindowSurface(instance_, window_, nullptr, &surface_), "glfwCreateWindowSurface failed");
}

void Renderer::pick_physical_device() {
    uint32_t count = 0;
    throw_if_failed(vkEnumeratePhysicalDevices(instance_, &count, nullptr), "vkEnumeratePhysicalDevices failed");
    std::vector<VkPhysicalDevice> devices(count);
    throw_if_failed(vkEnumeratePhysicalDevices(instance_, &count, devices.data()), "vkEnumeratePhysicalDevices failed");

    auto score = [](VkPhysicalDevice device) {
        VkPhysicalDeviceProperties props{};
        vkGetPhysicalDeviceProperties(device, &props);
        int s = 0;
        if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU) s += 1000;
        if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU) s += 100;
        return s;
    };

    std::stable_sort(devices.begin(), devices.end(), [&](VkPhysicalDevice a, VkPhysicalDevice b) {
        return score(a) > score(b);
    });

    for (auto device : devices) {
        bool ok = has_device_extension(device, VK_KHR_SWAPCHAIN_EXTENSION_NAME);
#ifdef __APPLE__
        ok = ok && has_device_extension(device, "VK_KHR_portability_subset");
#endif
        if (!ok) continue;

        uint32_t qcount = 0;
        vkGetPhysicalDeviceQueueFamilyProperties(device, &qcount, nullptr);
        std::vector<VkQueueFamilyProperties> qprops(qcount);
        vkGetPhysicalDeviceQueueFamilyProperties(device, &qcount, qprops.data());

        // Prefer one family that can do both, so copies, draws and presents
        // share a single queue.
        std::optional<uint32_t> gfx;
        std::optional<uint32_t> present;
        for (uint32_t i = 0; i < qcount; ++i) {
            const bool has_gfx = (qprops[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) != 0;
            VkBool32 sup = VK_FALSE;
            vkGetPhysicalDeviceSurfaceSupportKHR(device, i, surface_, &sup);
            if (has_gfx && sup) {
                gfx = i;
                present = i;
                break;
            }
            if (has_gfx && !gfx) gfx = i;
            if (sup && !present) present = i;
        }

        if (gfx && present) {
            physical_device_ = device;
            queue_family_graphics_ = *gfx;
            queue_family_present_ = *present;
            break;
        }
    }

    if (physical_device_ == VK_NULL_HANDLE) {
        throw std::runtime_error("No suitable GPU found");
    }

    VkPhysicalDeviceProperties props{};
    vkGetPhysicalDeviceProperties(physical_device_, &props);
    std::cout << "[vk] using " << props.deviceName << " (graphics queue " << queue_family_graphics_
              << ", present queue " << queue_family_present_ << ")\n";
}

void Renderer::create_logical_device() {
    std::set<uint32_t> unique_queues = { queue_family_graphics_, queue_family_present_ };
    float priority = 1.0f;
    std::vector<VkDeviceQueueCreateInfo> queue_infos;
    queue_infos.reserve(unique_queues.size());
    for (uint32_t idx : unique_queues) {
        VkDeviceQueueCreateInfo qi{};
        qi.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        qi.queueFamilyIndex = idx;
        qi.queueCount = 1;
        qi.pQueuePriorities = &priority;
        queue_infos.push_back(qi);
    }

    enabled_device_exts_.clear();
    enabled_device_exts_.push_back(VK_KHR_SWAPCHAIN_EXTENSION_NAME);
#ifdef __APPLE__
    if (has_device_extension(physical_device_, "VK_KHR_portability_subset")) {
        enabled_device_exts_.push_back("VK_KHR_portability_subset");
    }
#endif

    VkDeviceCreateInfo dci{};
    dci.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    dci.queueCreateInfoCount = static_cast<uint32_t>(queue_infos.size());
    dci.pQueueCreateInfos = queue_infos.data();
    dci.enabledExtensionCount = static_cast<uint32_t>(enabled_device_exts_.size());
    dci.ppEnabledExtensionNames = enabled_device_exts_.data();
    dci.enabledLayerCount = static_cast<uint32_t>(enabled_layers_.size());
    dci.ppEnabledLayerNames = enabled_layers_.data();

    throw_if_failed(vkCreateDevice(physical_device_, &dci, nullptr, &device_), "vkCreateDevice failed");
    vkGetDeviceQueue(device_, queue_family_graphics_, 0, &queue_graphics_);
    vkGetDeviceQueue(device_, queue_family_present_, 0, &queue_present_);
}

void Renderer::create_upload_pool() {
    VkCommandPoolCreateInfo pci{};
    pci.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    pci.flags = VK_COMMAND_POOL_CREATE_TRANSIENT_BIT;
    pci.queueFamilyIndex = queue_family_graphics_;
    throw_if_failed(vkCreateCommandPool(device_, &pci, nullptr, &upload_pool_), "vkCreateCommandPool(upload) failed");
}

bool Renderer::has_layer(const char* name) {
    uint32_t count = 0;
    vkEnumerateInstanceLayerProperties(&count, nullptr);
    std::vector<VkLayerProperties> props(count);
    vkEnumerateInstanceLayerProperties(&count, props.data());
    for (const auto& p : props) {
        if (std::strcmp(p.layerName, name) == 0) return true;
    }
    return false;
}

bool Renderer::has_instance_extension(const char* name) {
    uint32_t count = 0;
    vkEnumerateInstanceExtensionProperties(nullptr, &count, nullptr);
    std::vector<VkExtensionProperties> props(count);
    vkEnumerateInstanceExtensionProperties(nullptr, &count, props.data());
    for (const auto& p : props) {
        if (std::strcmp(p.extensionName, name) == 0) return true;
    }
    return false;
}

bool Renderer::has_device_extension(VkPhysicalDevice dev, const char* name) {
    uint32_t count = 0;
    vkEnumerateDeviceExtensionProperties(dev, nullptr, &count, nullptr);
    std::vector<VkExtensionProperties> props(count);
    vkEnumerateDeviceExtensionProperties(dev, nullptr, &count, props.data());
    for (const auto& p : props) {
        if (std::strcmp(p.extensionName, name) == 0) return true;
    }
    return false;
}

} // namespace scribble

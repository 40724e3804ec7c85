#include "device.hh"
#include "helpers.hh"
#include <string>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace
{

bool has_all_extensions(
    const std::vector<VkExtensionProperties>& props,
    const char* const* extensions,
    size_t extension_count
){
    for(size_t i = 0; i < extension_count; ++i)
    {
        std::string required_name = extensions[i];
        bool found = false;
        for(const VkExtensionProperties& p: props)
        {
            if(required_name == p.extensionName)
            {
                found = true;
                break;
            }
        }

        if(!found)
            return false;
    }
    return true;
}

int32_t find_graphics_family(VkPhysicalDevice device, VkSurfaceKHR surface)
{
    uint32_t queue_family_count = 0;
    vkGetPhysicalDeviceQueueFamilyProperties(device, &queue_family_count, nullptr);
    std::vector<VkQueueFamilyProperties> families(queue_family_count);
    vkGetPhysicalDeviceQueueFamilyProperties(device, &queue_family_count, families.data());

    for(uint32_t i = 0; i < queue_family_count; ++i)
    {
        if(!(families[i].queueFlags & VK_QUEUE_GRAPHICS_BIT))
            continue;

        VkBool32 has_present = VK_FALSE;
        vkGetPhysicalDeviceSurfaceSupportKHR(device, i, surface, &has_present);
        if(has_present)
            return i;
    }
    return -1;
}

}

device::device(
    VkInstance vulkan,
    VkSurfaceKHR surface,
    const std::vector<const char*>& validation_layers
){
    const char* device_extensions[] = {
        VK_KHR_SYNCHRONIZATION_2_EXTENSION_NAME,
        VK_KHR_SWAPCHAIN_EXTENSION_NAME
    };

    uint32_t physical_device_count = 0;
    vkEnumeratePhysicalDevices(vulkan, &physical_device_count, nullptr);
    std::vector<VkPhysicalDevice> physical_devices(physical_device_count);
    vkEnumeratePhysicalDevices(vulkan, &physical_device_count, physical_devices.data());

    // Any device with the extensions and a presenting graphics queue will do,
    // but discrete GPUs win over the rest.
    bool found_device = false;
    bool found_discrete_device = false;
    for(VkPhysicalDevice candidate: physical_devices)
    {
        uint32_t available_count = 0;
        vkEnumerateDeviceExtensionProperties(candidate, nullptr, &available_count, nullptr);
        std::vector<VkExtensionProperties> extensions(available_count);
        vkEnumerateDeviceExtensionProperties(candidate, nullptr, &available_count, extensions.data());

        if(!has_all_extensions(extensions, device_extensions, std::size(device_extensions)))
            continue;

        int32_t graphics_family = find_graphics_family(candidate, surface);
        if(graphics_family == -1)
            continue;

        VkPhysicalDeviceProperties2 properties = {
            VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_PROPERTIES_2, nullptr
        };
        vkGetPhysicalDeviceProperties2(candidate, &properties);
        bool current_is_discrete =
            properties.properties.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU;

        if(!found_discrete_device || current_is_discrete)
        {
            physical_device = candidate;
            physical_device_props = properties;
            graphics_family_index = graphics_family;
            found_device = true;
            found_discrete_device = current_is_discrete;
        }
    }

    if(!found_device)
        throw std::runtime_error("Failed to find a device suitable for rendering");

    std::cout << "Using " << physical_device_props.properties.deviceName << std::endl;

    physical_device_features = {VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2, &vulkan12_features};
    vulkan12_features = {VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_2_FEATURES, &sync2_features};
    sync2_features = {VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_SYNCHRONIZATION_2_FEATURES_KHR, nullptr};
    vkGetPhysicalDeviceFeatures2(physical_device, &physical_device_features);

    if(!vulkan12_features.timelineSemaphore || !sync2_features.synchronization2)
        throw std::runtime_error("Device lacks timeline semaphores or synchronization2");

    // Only enable what's actually used.
    VkPhysicalDeviceSynchronization2FeaturesKHR enabled_sync2 = {
        VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_SYNCHRONIZATION_2_FEATURES_KHR, nullptr
    };
    enabled_sync2.synchronization2 = VK_TRUE;
    VkPhysicalDeviceVulkan12Features enabled12 = {
        VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_2_FEATURES, &enabled_sync2
    };
    enabled12.timelineSemaphore = VK_TRUE;
    VkPhysicalDeviceFeatures2 enabled_features = {
        VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2, &enabled12
    };

    float priority = 1.0f;
    VkDeviceQueueCreateInfo queue_info = {
        VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO, nullptr, {},
        (uint32_t)graphics_family_index, 1, &priority
    };

    VkDeviceCreateInfo device_create_info = {
        VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO,
        &enabled_features,
        {},
        1, &queue_info,
        (uint32_t)validation_layers.size(), validation_layers.data(),
        (uint32_t)std::size(device_extensions), device_extensions,
        nullptr
    };
    check_vk(
        vkCreateDevice(physical_device, &device_create_info, nullptr, &logical_device),
        "vkCreateDevice"
    );
    volkLoadDevice(logical_device);

    vkGetDeviceQueue(logical_device, graphics_family_index, 0, &graphics_queue);

    // Command buffers are one-shot and freed individually.
    VkCommandPoolCreateInfo graphics_pool_info = {
        VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO, nullptr,
        VK_COMMAND_POOL_CREATE_TRANSIENT_BIT,
        (uint32_t)graphics_family_index
    };
    check_vk(
        vkCreateCommandPool(logical_device, &graphics_pool_info, nullptr, &graphics_pool),
        "vkCreateCommandPool"
    );

    // VMA fetches the rest of the function pointers through these two.
    VmaVulkanFunctions vulkan_functions = {};
    vulkan_functions.vkGetInstanceProcAddr = vkGetInstanceProcAddr;
    vulkan_functions.vkGetDeviceProcAddr = vkGetDeviceProcAddr;

    VmaAllocatorCreateInfo allocator_info = {};
    allocator_info.physicalDevice = physical_device;
    allocator_info.device = logical_device;
    allocator_info.instance = vulkan;
    allocator_info.vulkanApiVersion = VK_API_VERSION_1_2;
    allocator_info.pVulkanFunctions = &vulkan_functions;
    check_vk(vmaCreateAllocator(&allocator_info, &allocator), "vmaCreateAllocator");
}

device::~device()
{
    vmaDestroyAllocator(allocator);
    vkDestroyCommandPool(logical_device, graphics_pool, nullptr);
    vkDestroyDevice(logical_device, nullptr);
}

void device::finish() const
{
    check_vk(vkDeviceWaitIdle(logical_device), "vkDeviceWaitIdle");
}

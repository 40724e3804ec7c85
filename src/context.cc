#include "context.hh"
#include "helpers.hh"
#include "error.hh"
#include <stdexcept>
#include <iostream>
#include <algorithm>
#include <cstring>

context::context(
    ivec2 size,
    bool fullscreen,
    bool vsync
): size(size), fullscreen(fullscreen), vsync(vsync), frame_counter(0), image_index(0)
{
    init_sdl(fullscreen);
    init_vulkan();
    check_error(
        !SDL_Vulkan_CreateSurface(win, vulkan, &surface),
        "SDL_Vulkan_CreateSurface: %s", SDL_GetError()
    );
    dev.reset(new device(vulkan, surface, validation_layers));
    init_swapchain();
}

context::~context()
{
    VkResult res = vkDeviceWaitIdle(dev->logical_device);
    if(res != VK_SUCCESS)
        std::cerr << "vkDeviceWaitIdle failed with " << res << std::endl;
    deinit_swapchain();
    reap.flush();
    dev.reset();
    vkDestroySurfaceKHR(vulkan, surface, nullptr);
    deinit_vulkan();
    deinit_sdl();
}

const device& context::get_device() const
{
    return *dev;
}

SDL_Window* context::get_window() const
{
    return win;
}

VkInstance context::get_instance() const
{
    return vulkan;
}

bool context::start_frame()
{
    frame_counter++;
    reap.start_frame();

    // Wait until the frame that last used this frame slot is done, so that
    // its semaphore & resources can be reused.
    if(frame_counter > MAX_FRAMES_IN_FLIGHT)
    {
        wait_timeline_semaphore(
            *this, frame_finish_semaphore, frame_counter - MAX_FRAMES_IN_FLIGHT
        );
        reap.finish_frame(reap.get_frame_counter() - MAX_FRAMES_IN_FLIGHT);
    }

    VkSemaphore sem = acquire_semaphores[frame_counter%MAX_FRAMES_IN_FLIGHT];
    VkResult res = vkAcquireNextImageKHR(
        dev->logical_device, swapchain, UINT64_MAX, sem, VK_NULL_HANDLE,
        &image_index
    );
    if(res == VK_ERROR_OUT_OF_DATE_KHR || res == VK_SUBOPTIMAL_KHR)
        return true;
    check_vk(res, "vkAcquireNextImageKHR");
    return false;
}

uint32_t context::get_image_index() const
{
    return image_index;
}

uint32_t context::get_image_count() const
{
    return swapchain_images.size();
}

VkImage context::get_image(uint32_t image_index) const
{
    return swapchain_images[image_index];
}

VkImageView context::get_image_view(uint32_t image_index) const
{
    return *swapchain_image_views[image_index];
}

VkFormat context::get_format() const
{
    return surface_format.format;
}

bool context::finish_frame(VkCommandBuffer cmd)
{
    VkSemaphore acquired = acquire_semaphores[frame_counter%MAX_FRAMES_IN_FLIGHT];
    VkSemaphore rendered = present_semaphores[image_index];

    VkSemaphoreSubmitInfoKHR wait_info = {
        VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO_KHR, nullptr,
        acquired, 0, VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT_KHR, 0
    };
    VkCommandBufferSubmitInfoKHR command_info = {
        VK_STRUCTURE_TYPE_COMMAND_BUFFER_SUBMIT_INFO_KHR, nullptr, cmd, 0
    };
    VkSemaphoreSubmitInfoKHR signal_infos[2] = {
        {
            VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO_KHR, nullptr,
            rendered, 0, VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT_KHR, 0
        },
        {
            VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO_KHR, nullptr,
            frame_finish_semaphore, frame_counter,
            VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT_KHR, 0
        }
    };
    VkSubmitInfo2KHR submit_info = {
        VK_STRUCTURE_TYPE_SUBMIT_INFO_2_KHR,
        nullptr, 0,
        1, &wait_info,
        1, &command_info,
        2, signal_infos
    };
    check_vk(
        vkQueueSubmit2KHR(dev->graphics_queue, 1, &submit_info, VK_NULL_HANDLE),
        "vkQueueSubmit2KHR"
    );

    VkPresentInfoKHR present_info = {
        VK_STRUCTURE_TYPE_PRESENT_INFO_KHR,
        nullptr,
        1, &rendered,
        1, &swapchain, &image_index,
        nullptr
    };

    VkResult res = vkQueuePresentKHR(dev->graphics_queue, &present_info);
    if(res == VK_ERROR_OUT_OF_DATE_KHR || res == VK_SUBOPTIMAL_KHR)
        return true;
    check_vk(res, "vkQueuePresentKHR");
    return false;
}

uint64_t context::get_frame_counter() const
{
    return frame_counter;
}

void context::reset_swapchain()
{
    dev->finish();
    deinit_swapchain();
    reap.flush();
    init_swapchain();
    std::cout << "Swapchain reset to " << size.x << "x" << size.y << std::endl;
}

ivec2 context::get_size() const
{
    return size;
}

void context::at_frame_finish(std::function<void()>&& cleanup)
{
    reap.at_finish(std::move(cleanup));
}

void context::sync_flush()
{
    dev->finish();
    reap.flush();
}

void context::set_fullscreen(bool fullscreen)
{
    if(this->fullscreen == fullscreen) return;

    SDL_SetWindowFullscreen(win, fullscreen ? SDL_WINDOW_FULLSCREEN_DESKTOP : 0);
    this->fullscreen = fullscreen;
}

bool context::is_fullscreen() const
{
    return fullscreen;
}

void context::set_vsync(bool vsync)
{
    this->vsync = vsync;
}

bool context::get_vsync() const
{
    return vsync;
}

void context::init_sdl(bool fullscreen)
{
    check_error(
        SDL_Init(SDL_INIT_VIDEO|SDL_INIT_EVENTS|SDL_INIT_TIMER) != 0,
        "SDL_Init: %s", SDL_GetError()
    );

    win = SDL_CreateWindow(
        "chipview",
        SDL_WINDOWPOS_UNDEFINED,
        SDL_WINDOWPOS_UNDEFINED,
        size.x,
        size.y,
        SDL_WINDOW_VULKAN | SDL_WINDOW_RESIZABLE | (fullscreen ? SDL_WINDOW_FULLSCREEN_DESKTOP : 0)
    );
    check_error(!win, "SDL_CreateWindow: %s", SDL_GetError());

    unsigned count = 0;
    check_error(
        !SDL_Vulkan_GetInstanceExtensions(win, &count, nullptr),
        "SDL_Vulkan_GetInstanceExtensions: %s", SDL_GetError()
    );

    extensions.resize(count);
    check_error(
        !SDL_Vulkan_GetInstanceExtensions(win, &count, extensions.data()),
        "SDL_Vulkan_GetInstanceExtensions: %s", SDL_GetError()
    );
#ifndef NDEBUG
    extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
#endif
}

void context::deinit_sdl()
{
    SDL_DestroyWindow(win);
    SDL_Quit();
}

void context::init_vulkan()
{
    if(volkInitialize() != VK_SUCCESS)
        throw std::runtime_error("Failed to load the Vulkan loader");

    VkApplicationInfo app_info {
        VK_STRUCTURE_TYPE_APPLICATION_INFO,
        nullptr,
        "chipview",
        VK_MAKE_VERSION(0,1,0),
        "chipview",
        VK_MAKE_VERSION(0,1,0),
        VK_API_VERSION_1_2
    };

#ifndef NDEBUG
    uint32_t available_layer_count = 0;
    vkEnumerateInstanceLayerProperties(&available_layer_count, nullptr);
    std::vector<VkLayerProperties> available_layers(available_layer_count);
    vkEnumerateInstanceLayerProperties(&available_layer_count, available_layers.data());

    for(auto& layer: available_layers)
    {
        if(strcmp(layer.layerName, "VK_LAYER_KHRONOS_validation") == 0)
        {
            validation_layers.push_back("VK_LAYER_KHRONOS_validation");
        }
    }
#endif

    VkInstanceCreateInfo instance_info {
        VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO,
        nullptr,
        0,
        &app_info,
        (uint32_t)validation_layers.size(), validation_layers.data(),
        (uint32_t)extensions.size(), extensions.data()
    };

    VkResult res = vkCreateInstance(&instance_info, nullptr, &vulkan);
    if(res != VK_SUCCESS)
        throw std::runtime_error("vkCreateInstance " + std::to_string(res));

    volkLoadInstance(vulkan);

#ifndef NDEBUG
    VkDebugUtilsMessengerCreateInfoEXT messenger_info = {
        VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT,
        nullptr,
        0,
        VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT|
        VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT,
        VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT|
        VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT|
        VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT,
        [](
            VkDebugUtilsMessageSeverityFlagBitsEXT,
            VkDebugUtilsMessageTypeFlagsEXT,
            const VkDebugUtilsMessengerCallbackDataEXT* data,
            void*
        ) -> VkBool32 {
            std::cerr << data->pMessage << std::endl;
            return VK_FALSE;
        },
        nullptr
    };
    check_vk(
        vkCreateDebugUtilsMessengerEXT(vulkan, &messenger_info, nullptr, &messenger),
        "vkCreateDebugUtilsMessengerEXT"
    );
#endif
}

void context::deinit_vulkan()
{
#ifndef NDEBUG
    vkDestroyDebugUtilsMessengerEXT(vulkan, messenger, nullptr);
#endif
    vkDestroyInstance(vulkan, nullptr);
}

void context::init_swapchain()
{
    uint32_t format_count = 0;
    vkGetPhysicalDeviceSurfaceFormatsKHR(dev->physical_device, surface, &format_count, nullptr);
    std::vector<VkSurfaceFormatKHR> formats(format_count);
    vkGetPhysicalDeviceSurfaceFormatsKHR(dev->physical_device, surface, &format_count, formats.data());
    if(format_count == 0)
        throw std::runtime_error("Surface has no formats");

    surface_format = formats[0];
    for(VkSurfaceFormatKHR format: formats)
    {
        if(
            (format.format == VK_FORMAT_B8G8R8A8_UNORM ||
            format.format == VK_FORMAT_R8G8B8A8_UNORM) &&
            format.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR
        ){
            surface_format = format;
            break;
        }
    }

    uint32_t mode_count = 0;
    vkGetPhysicalDeviceSurfacePresentModesKHR(dev->physical_device, surface, &mode_count, nullptr);
    std::vector<VkPresentModeKHR> modes(mode_count);
    vkGetPhysicalDeviceSurfacePresentModesKHR(dev->physical_device, surface, &mode_count, modes.data());

    // FIFO is the only mode that's guaranteed to exist.
    present_mode = VK_PRESENT_MODE_FIFO_KHR;
    std::vector<VkPresentModeKHR> preferred_modes;
    if(vsync)
    {
        preferred_modes.push_back(VK_PRESENT_MODE_MAILBOX_KHR);
        preferred_modes.push_back(VK_PRESENT_MODE_FIFO_KHR);
    }
    else preferred_modes.push_back(VK_PRESENT_MODE_IMMEDIATE_KHR);
    for(VkPresentModeKHR mode: preferred_modes)
    {
        if(std::count(modes.begin(), modes.end(), mode))
        {
            present_mode = mode;
            break;
        }
    }

    VkSurfaceCapabilitiesKHR surface_caps;
    vkGetPhysicalDeviceSurfaceCapabilitiesKHR(dev->physical_device, surface, &surface_caps);

    SDL_Vulkan_GetDrawableSize(win, &size.x, &size.y);
    size.x = clamp((uint32_t)size.x, surface_caps.minImageExtent.width, surface_caps.maxImageExtent.width);
    size.y = clamp((uint32_t)size.y, surface_caps.minImageExtent.height, surface_caps.maxImageExtent.height);

    uint32_t image_count = std::max(MAX_FRAMES_IN_FLIGHT+1, surface_caps.minImageCount);
    if(surface_caps.maxImageCount != 0)
        image_count = std::min(image_count, surface_caps.maxImageCount);

    VkSwapchainCreateInfoKHR swapchain_info = {
        VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR,
        nullptr,
        {},
        surface,
        image_count,
        surface_format.format,
        surface_format.colorSpace,
        {(uint32_t)size.x, (uint32_t)size.y},
        1,
        VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT,
        VK_SHARING_MODE_EXCLUSIVE,
        1, (const uint32_t*)&dev->graphics_family_index,
        surface_caps.currentTransform,
        VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR,
        present_mode,
        VK_TRUE,
        {}
    };
    check_vk(
        vkCreateSwapchainKHR(dev->logical_device, &swapchain_info, nullptr, &swapchain),
        "vkCreateSwapchainKHR"
    );

    vkGetSwapchainImagesKHR(dev->logical_device, swapchain, &image_count, nullptr);
    swapchain_images.resize(image_count);
    vkGetSwapchainImagesKHR(dev->logical_device, swapchain, &image_count, swapchain_images.data());

    for(VkImage img: swapchain_images)
    {
        swapchain_image_views.push_back(create_image_view(*this, img, surface_format.format, VK_IMAGE_ASPECT_COLOR_BIT));
        present_semaphores.push_back(create_binary_semaphore(*this));
    }

    for(size_t i = 0; i < MAX_FRAMES_IN_FLIGHT; ++i)
        acquire_semaphores.push_back(create_binary_semaphore(*this));
    frame_finish_semaphore = create_timeline_semaphore(*this);
    frame_counter = 0;
}

void context::deinit_swapchain()
{
    frame_finish_semaphore.reset();
    acquire_semaphores.clear();
    present_semaphores.clear();
    swapchain_image_views.clear();
    swapchain_images.clear();
    vkDestroySwapchainKHR(dev->logical_device, swapchain, nullptr);
}

#ifndef CHIPVIEW_CONTEXT_HH
#define CHIPVIEW_CONTEXT_HH

#include "device.hh"
#include "math.hh"
#include <SDL2/SDL.h>
#include <SDL2/SDL_vulkan.h>
#include <vector>
#include <functional>
#include <memory>
#include "reaper.hh"
#include "vkres.hh"

class context
{
public:
    static constexpr uint32_t MAX_FRAMES_IN_FLIGHT = 2;

    context(
        ivec2 size = ivec2(1280, 720),
        bool fullscreen = false,
        bool vsync = true
    );
    ~context();

    const device& get_device() const;
    SDL_Window* get_window() const;
    VkInstance get_instance() const;

    // Returns true when the swapchain must be reset before rendering.
    bool start_frame();
    uint32_t get_image_index() const;
    uint32_t get_image_count() const;
    VkImage get_image(uint32_t image_index) const;
    VkImageView get_image_view(uint32_t image_index) const;
    VkFormat get_format() const;

    // Submits the frame's final command buffer and presents. Returns true
    // when the swapchain must be reset.
    bool finish_frame(VkCommandBuffer cmd);

    uint64_t get_frame_counter() const;

    void reset_swapchain();
    ivec2 get_size() const;

    // The cleanup runs once the GPU is done with the frame being recorded.
    void at_frame_finish(std::function<void()>&& cleanup);
    void sync_flush();

    void set_fullscreen(bool fullscreen);
    bool is_fullscreen() const;

    void set_vsync(bool vsync);
    bool get_vsync() const;

private:
    void init_sdl(bool fullscreen);
    void deinit_sdl();

    void init_vulkan();
    void deinit_vulkan();

    void init_swapchain();
    void deinit_swapchain();

    // SDL-related members
    ivec2 size;
    bool fullscreen;
    bool vsync;
    SDL_Window* win;

    // Vulkan-related members
    VkInstance vulkan;
    VkSurfaceKHR surface;
    VkDebugUtilsMessengerEXT messenger;
    std::vector<const char*> extensions;
    std::vector<const char*> validation_layers;
    VkSurfaceFormatKHR surface_format;
    VkPresentModeKHR present_mode;
    std::unique_ptr<device> dev;

    // Swapchain resources
    VkSwapchainKHR swapchain;
    std::vector<VkImage> swapchain_images;
    std::vector<vkres<VkImageView>> swapchain_image_views;
    std::vector<vkres<VkSemaphore>> acquire_semaphores;
    std::vector<vkres<VkSemaphore>> present_semaphores;
    vkres<VkSemaphore> frame_finish_semaphore;
    uint64_t frame_counter;
    uint32_t image_index;

    // Memory handling
    reaper reap;
};

#endif

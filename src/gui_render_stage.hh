#ifndef CHIPVIEW_GUI_RENDER_STAGE_HH
#define CHIPVIEW_GUI_RENDER_STAGE_HH

#include "context.hh"
#include <vector>

// Draws the ImGui draw data straight into the swapchain image and leaves it
// ready for presentation. Owns the ImGui Vulkan backend for its lifetime.
class gui_render_stage
{
public:
    gui_render_stage(context& ctx);
    gui_render_stage(const gui_render_stage& other) = delete;
    ~gui_render_stage();

    // Must be called after the swapchain has been reset.
    void reset_framebuffers();

    // Frees a set from ImGui_ImplVulkan_AddTexture once in-flight frames
    // are done with it.
    void release_texture(VkDescriptorSet set);

    // Records the current ImGui draw data for the given swapchain image. The
    // returned command buffer is released once its frame has finished.
    vkres<VkCommandBuffer> record(uint32_t image_index, vec4 clear_color);

private:
    void init_render_pass();

    context* ctx;
    VkFormat format;
    vkres<VkDescriptorPool> descriptor_pool;
    vkres<VkRenderPass> render_pass;
    std::vector<vkres<VkFramebuffer>> framebuffers;
};

#endif

#ifndef CHIPVIEW_HELPERS_HH
#define CHIPVIEW_HELPERS_HH

#include "context.hh"
#include "vkres.hh"
#include "vk_error.hh"


vkres<VkImageView> create_image_view(
    context& ctx,
    VkImage image,
    VkFormat format,
    VkImageAspectFlags aspect = VK_IMAGE_ASPECT_COLOR_BIT
);

vkres<VkSemaphore> create_binary_semaphore(context& ctx);
vkres<VkSemaphore> create_timeline_semaphore(context& ctx, uint64_t start_value = 0);
void wait_timeline_semaphore(context& ctx, VkSemaphore sem, uint64_t wait_value);

// Host-visible buffer usable as a transfer source.
vkres<VkBuffer> create_cpu_buffer(context& ctx, size_t bytes);

vkres<VkImage> create_gpu_image(
    context& ctx,
    uvec2 size,
    VkFormat format,
    uint32_t mip_count,
    VkSampleCountFlagBits samples,
    VkImageUsageFlags usage
);

// For one-off setup work: the command buffer is submitted and waited for in
// end_command_buffer.
VkCommandBuffer begin_command_buffer(context& ctx);
void end_command_buffer(context& ctx, VkCommandBuffer buf);

void image_barrier(
    VkCommandBuffer cmd,
    VkImage image,
    VkImageLayout layout_before,
    VkImageLayout layout_after,
    VkAccessFlags2KHR happens_before = VK_ACCESS_2_MEMORY_WRITE_BIT_KHR | VK_ACCESS_2_MEMORY_READ_BIT_KHR,
    VkAccessFlags2KHR happens_after = VK_ACCESS_2_MEMORY_WRITE_BIT_KHR | VK_ACCESS_2_MEMORY_READ_BIT_KHR,
    VkPipelineStageFlags2KHR stage_before = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT_KHR,
    VkPipelineStageFlags2KHR stage_after = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT_KHR
);

#endif

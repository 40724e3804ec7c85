#include "helpers.hh"
#include <cstdint>

vkres<VkImageView> create_image_view(
    context& ctx,
    VkImage image,
    VkFormat format,
    VkImageAspectFlags aspect
){
    VkImageView view;
    VkImageViewCreateInfo view_info = {
        VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO,
        nullptr,
        {},
        image,
        VK_IMAGE_VIEW_TYPE_2D,
        format,
        {VK_COMPONENT_SWIZZLE_IDENTITY, VK_COMPONENT_SWIZZLE_IDENTITY,
         VK_COMPONENT_SWIZZLE_IDENTITY, VK_COMPONENT_SWIZZLE_IDENTITY},
        {aspect, 0, VK_REMAINING_MIP_LEVELS, 0, 1}
    };
    check_vk(
        vkCreateImageView(ctx.get_device().logical_device, &view_info, nullptr, &view),
        "vkCreateImageView"
    );
    return {ctx, view};
}

vkres<VkSemaphore> create_binary_semaphore(context& ctx)
{
    VkSemaphoreCreateInfo sem_info = {
        VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO, nullptr, 0
    };
    VkSemaphore sem;
    check_vk(
        vkCreateSemaphore(ctx.get_device().logical_device, &sem_info, nullptr, &sem),
        "vkCreateSemaphore"
    );
    return {ctx, sem};
}

vkres<VkSemaphore> create_timeline_semaphore(context& ctx, uint64_t start_value)
{
    VkSemaphoreTypeCreateInfo sem_type_info = {
      VK_STRUCTURE_TYPE_SEMAPHORE_TYPE_CREATE_INFO, nullptr,
      VK_SEMAPHORE_TYPE_TIMELINE, start_value
    };
    VkSemaphoreCreateInfo sem_info = {
        VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO, &sem_type_info, 0
    };
    VkSemaphore sem;
    check_vk(
        vkCreateSemaphore(ctx.get_device().logical_device, &sem_info, nullptr, &sem),
        "vkCreateSemaphore"
    );
    return {ctx, sem};
}

void wait_timeline_semaphore(context& ctx, VkSemaphore sem, uint64_t wait_value)
{
    VkSemaphoreWaitInfo wait_info = {
        VK_STRUCTURE_TYPE_SEMAPHORE_WAIT_INFO, nullptr, 0, 1, &sem, &wait_value
    };
    check_vk(
        vkWaitSemaphores(ctx.get_device().logical_device, &wait_info, UINT64_MAX),
        "vkWaitSemaphores"
    );
}

vkres<VkBuffer> create_cpu_buffer(context& ctx, size_t bytes)
{
    VkBufferCreateInfo info = {
        VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO,
        nullptr,
        0,
        bytes,
        VK_BUFFER_USAGE_TRANSFER_SRC_BIT,
        VK_SHARING_MODE_EXCLUSIVE,
        0,
        nullptr
    };
    VmaAllocationCreateInfo alloc_info = {};
    alloc_info.usage = VMA_MEMORY_USAGE_CPU_TO_GPU;

    VkBuffer buffer;
    VmaAllocation alloc;
    check_vk(
        vmaCreateBuffer(
            ctx.get_device().allocator, &info,
            &alloc_info, &buffer,
            &alloc, nullptr
        ),
        "vmaCreateBuffer (%zu bytes)", bytes
    );
    return vkres<VkBuffer>(ctx, buffer, alloc);
}

vkres<VkImage> create_gpu_image(
    context& ctx,
    uvec2 size,
    VkFormat format,
    uint32_t mip_count,
    VkSampleCountFlagBits samples,
    VkImageUsageFlags usage
){
    VkImageCreateInfo info = {
        VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO,
        nullptr,
        0,
        VK_IMAGE_TYPE_2D,
        format,
        {size.x, size.y, 1},
        mip_count,
        1,
        samples,
        VK_IMAGE_TILING_OPTIMAL,
        usage,
        VK_SHARING_MODE_EXCLUSIVE,
        0,
        nullptr,
        VK_IMAGE_LAYOUT_UNDEFINED
    };
    VmaAllocationCreateInfo alloc_info = {};
    alloc_info.usage = VMA_MEMORY_USAGE_GPU_ONLY;
    VkImage img;
    VmaAllocation alloc;

    check_vk(
        vmaCreateImage(
            ctx.get_device().allocator, &info,
            &alloc_info, &img,
            &alloc, nullptr
        ),
        "vmaCreateImage (%ux%u)", size.x, size.y
    );
    return vkres<VkImage>(ctx, img, alloc);
}

VkCommandBuffer begin_command_buffer(context& ctx)
{
    VkCommandBufferAllocateInfo command_buffer_alloc_info = {
        VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO,
        nullptr,
        ctx.get_device().graphics_pool,
        VK_COMMAND_BUFFER_LEVEL_PRIMARY,
        1
    };
    VkCommandBuffer buf;
    check_vk(
        vkAllocateCommandBuffers(
            ctx.get_device().logical_device,
            &command_buffer_alloc_info,
            &buf
        ),
        "vkAllocateCommandBuffers"
    );
    VkCommandBufferBeginInfo begin_info = {
        VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO,
        nullptr,
        VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT,
        nullptr
    };
    check_vk(vkBeginCommandBuffer(buf, &begin_info), "vkBeginCommandBuffer");
    return buf;
}

void end_command_buffer(context& ctx, VkCommandBuffer buf)
{
    check_vk(vkEndCommandBuffer(buf), "vkEndCommandBuffer");
    VkCommandBufferSubmitInfoKHR command_info = {
        VK_STRUCTURE_TYPE_COMMAND_BUFFER_SUBMIT_INFO_KHR, nullptr, buf, 0
    };
    VkSubmitInfo2KHR info = {
        VK_STRUCTURE_TYPE_SUBMIT_INFO_2_KHR,
        nullptr,
        0,
        0, nullptr,
        1, &command_info,
        0, nullptr
    };
    check_vk(
        vkQueueSubmit2KHR(ctx.get_device().graphics_queue, 1, &info, VK_NULL_HANDLE),
        "vkQueueSubmit2KHR"
    );
    ctx.get_device().finish();
    vkFreeCommandBuffers(
        ctx.get_device().logical_device,
        ctx.get_device().graphics_pool,
        1,
        &buf
    );
}

void image_barrier(
    VkCommandBuffer cmd,
    VkImage image,
    VkImageLayout layout_before,
    VkImageLayout layout_after,
    VkAccessFlags2KHR happens_before,
    VkAccessFlags2KHR happens_after,
    VkPipelineStageFlags2KHR stage_before,
    VkPipelineStageFlags2KHR stage_after
){
    VkImageMemoryBarrier2KHR image_barrier = {
        VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER_2_KHR,
        nullptr,
        stage_before,
        happens_before,
        stage_after,
        happens_after,
        layout_before,
        layout_after,
        VK_QUEUE_FAMILY_IGNORED,
        VK_QUEUE_FAMILY_IGNORED,
        image,
        {
            VK_IMAGE_ASPECT_COLOR_BIT,
            0, VK_REMAINING_MIP_LEVELS,
            0, VK_REMAINING_ARRAY_LAYERS
        }
    };
    VkDependencyInfoKHR dependency_info = {
        VK_STRUCTURE_TYPE_DEPENDENCY_INFO_KHR,
        nullptr,
        0,
        0, nullptr,
        0, nullptr,
        1, &image_barrier
    };
    vkCmdPipelineBarrier2KHR(cmd, &dependency_info);
}

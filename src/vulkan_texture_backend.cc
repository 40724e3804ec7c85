#include "vulkan_texture_backend.hh"
#include "helpers.hh"
#include "error.hh"
#include <algorithm>

namespace
{

VkFormat to_vk_format(texture_format format)
{
    switch(format)
    {
    case texture_format::RGBA8_UNORM:
        return VK_FORMAT_R8G8B8A8_UNORM;
    }
    return VK_FORMAT_UNDEFINED;
}

VkImageUsageFlags to_vk_usage(texture_usage_flags usage)
{
    VkImageUsageFlags flags = 0;
    if(usage & TEXTURE_USAGE_SAMPLED_BIT) flags |= VK_IMAGE_USAGE_SAMPLED_BIT;
    if(usage & TEXTURE_USAGE_COPY_DST_BIT) flags |= VK_IMAGE_USAGE_TRANSFER_DST_BIT;
    return flags;
}

}

class vulkan_texture_backend::vulkan_staging_buffer: public staging_buffer
{
public:
    vulkan_staging_buffer(context& ctx, size_t bytes)
    : ctx(&ctx), buffer(create_cpu_buffer(ctx, bytes)), size(bytes), mapped(nullptr)
    {
        check_vk(
            vmaMapMemory(ctx.get_device().allocator, buffer.get_allocation(), (void**)&mapped),
            "vmaMapMemory"
        );
    }

    ~vulkan_staging_buffer()
    {
        // The buffer itself is released once the current frame finishes.
        vmaUnmapMemory(ctx->get_device().allocator, buffer.get_allocation());
    }

    uint8_t* get_data() override { return mapped; }
    size_t get_size() const override { return size; }

    VkBuffer get_buffer() const { return *buffer; }

    void flush()
    {
        check_vk(
            vmaFlushAllocation(ctx->get_device().allocator, buffer.get_allocation(), 0, VK_WHOLE_SIZE),
            "vmaFlushAllocation"
        );
    }

private:
    context* ctx;
    vkres<VkBuffer> buffer;
    size_t size;
    uint8_t* mapped;
};

vulkan_texture_backend::vulkan_texture_backend(context& ctx)
: ctx(&ctx)
{
    // bufferRowLength is given in texels, so the pitch must also stay a
    // multiple of the texel size.
    VkDeviceSize optimal = ctx.get_device().physical_device_props.properties.limits.optimalBufferCopyRowPitchAlignment;
    row_alignment = align_up(std::max<VkDeviceSize>(optimal, 1), 4);

    const VkPhysicalDeviceLimits& device_limits =
        ctx.get_device().physical_device_props.properties.limits;
    limits.max_dimension = device_limits.maxImageDimension2D;
    limits.max_mip_count = 1;
    for(uint32_t d = device_limits.maxImageDimension2D; d > 1; d >>= 1)
        limits.max_mip_count++;
    limits.sample_counts = device_limits.sampledImageColorSampleCounts;
}

vulkan_texture_backend::~vulkan_texture_backend()
{
    textures.clear();
}

texture_handle vulkan_texture_backend::create_texture(const texture_config& config)
{
    config.validate();
    config.check_limits(limits);

    VkFormat format = to_vk_format(config.format);
    vkres<VkImage> image = create_gpu_image(
        *ctx,
        config.size,
        format,
        config.mip_count,
        (VkSampleCountFlagBits)config.sample_count,
        to_vk_usage(config.usage)
    );
    vkres<VkImageView> view = create_image_view(*ctx, image, format);

    return textures.emplace(gpu_texture{
        config, std::move(image), std::move(view)
    });
}

void vulkan_texture_backend::destroy_texture(texture_handle handle)
{
    find(handle);
    textures.erase(handle);
}

bool vulkan_texture_backend::is_valid(texture_handle handle) const
{
    return textures.contains(handle);
}

const texture_config& vulkan_texture_backend::get_config(texture_handle handle) const
{
    return find(handle).config;
}

size_t vulkan_texture_backend::get_row_alignment() const
{
    return row_alignment;
}

std::unique_ptr<staging_buffer> vulkan_texture_backend::create_staging_buffer(size_t bytes)
{
    return std::make_unique<vulkan_staging_buffer>(*ctx, bytes);
}

void vulkan_texture_backend::upload_region(
    texture_handle handle,
    staging_buffer& src,
    const copy_layout& layout
){
    gpu_texture& tex = find(handle);
    vulkan_staging_buffer& staging = static_cast<vulkan_staging_buffer&>(src);
    staging.flush();

    size_t texel = tex.config.get_texel_size();
    if(layout.bytes_per_row % texel != 0 || layout.bytes_per_row % row_alignment != 0)
        throw configuration_mismatch(format_error(
            "Row pitch %u is not aligned to %zu", layout.bytes_per_row, row_alignment
        ));

    const device& dev = ctx->get_device();
    VkCommandBufferAllocateInfo alloc_info = {
        VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO,
        nullptr,
        dev.graphics_pool,
        VK_COMMAND_BUFFER_LEVEL_PRIMARY,
        1
    };
    VkCommandBuffer buf;
    check_vk(
        vkAllocateCommandBuffers(dev.logical_device, &alloc_info, &buf),
        "vkAllocateCommandBuffers"
    );
    vkres<VkCommandBuffer> cmd(*ctx, dev.graphics_pool, buf);

    VkCommandBufferBeginInfo begin_info = {
        VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO,
        nullptr,
        VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT,
        nullptr
    };
    check_vk(vkBeginCommandBuffer(cmd, &begin_info), "vkBeginCommandBuffer");

    // Previous contents are overwritten in full, no need to preserve them.
    image_barrier(
        cmd, tex.image,
        VK_IMAGE_LAYOUT_UNDEFINED,
        VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
        VK_ACCESS_2_SHADER_READ_BIT_KHR,
        VK_ACCESS_2_TRANSFER_WRITE_BIT_KHR,
        VK_PIPELINE_STAGE_2_FRAGMENT_SHADER_BIT_KHR,
        VK_PIPELINE_STAGE_2_COPY_BIT_KHR
    );

    VkBufferImageCopy copy = {
        layout.offset,
        uint32_t(layout.bytes_per_row / texel),
        layout.rows_per_image,
        {VK_IMAGE_ASPECT_COLOR_BIT, layout.mip_level, 0, 1},
        {(int32_t)layout.origin.x, (int32_t)layout.origin.y, (int32_t)layout.origin.z},
        {layout.extent.x, layout.extent.y, layout.extent.z}
    };
    vkCmdCopyBufferToImage(
        cmd, staging.get_buffer(), tex.image,
        VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1, &copy
    );

    image_barrier(
        cmd, tex.image,
        VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
        VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL,
        VK_ACCESS_2_TRANSFER_WRITE_BIT_KHR,
        VK_ACCESS_2_SHADER_READ_BIT_KHR,
        VK_PIPELINE_STAGE_2_COPY_BIT_KHR,
        VK_PIPELINE_STAGE_2_FRAGMENT_SHADER_BIT_KHR
    );
    check_vk(vkEndCommandBuffer(cmd), "vkEndCommandBuffer");

    VkCommandBufferSubmitInfoKHR command_info = {
        VK_STRUCTURE_TYPE_COMMAND_BUFFER_SUBMIT_INFO_KHR, nullptr, *cmd, 0
    };
    VkSubmitInfo2KHR submit_info = {
        VK_STRUCTURE_TYPE_SUBMIT_INFO_2_KHR,
        nullptr, 0,
        0, nullptr,
        1, &command_info,
        0, nullptr
    };
    check_vk(
        vkQueueSubmit2KHR(dev.graphics_queue, 1, &submit_info, VK_NULL_HANDLE),
        "vkQueueSubmit2KHR"
    );
}

VkImageView vulkan_texture_backend::get_image_view(texture_handle handle) const
{
    return *find(handle).view;
}

vulkan_texture_backend::gpu_texture& vulkan_texture_backend::find(texture_handle handle)
{
    gpu_texture* tex = textures.get(handle);
    if(!tex)
        throw invalid_handle(format_error(
            "Texture %u (generation %u) does not exist",
            handle.index, handle.generation
        ));
    return *tex;
}

const vulkan_texture_backend::gpu_texture& vulkan_texture_backend::find(
    texture_handle handle
) const {
    const gpu_texture* tex = textures.get(handle);
    if(!tex)
        throw invalid_handle(format_error(
            "Texture %u (generation %u) does not exist",
            handle.index, handle.generation
        ));
    return *tex;
}

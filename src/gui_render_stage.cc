#include "gui_render_stage.hh"
#include "backends/imgui_impl_vulkan.h"
#include "helpers.hh"
#include <stdexcept>

namespace
{

void check_imgui_vk(VkResult result)
{
    check_vk(result, "ImGui Vulkan backend");
}

}

gui_render_stage::gui_render_stage(context& ctx)
: ctx(&ctx), format(ctx.get_format())
{
    const device& dev = ctx.get_device();

    // Only the panel textures and the font atlas need descriptors.
    VkDescriptorPoolSize pool_sizes[] =
    {
        { VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, 64 }
    };
    VkDescriptorPoolCreateInfo pool_create_info = {
        VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO,
        nullptr,
        VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT,
        64,
        (uint32_t)IM_ARRAYSIZE(pool_sizes),
        pool_sizes
    };
    VkDescriptorPool tmp_pool;
    check_vk(
        vkCreateDescriptorPool(
            dev.logical_device,
            &pool_create_info,
            nullptr,
            &tmp_pool
        ),
        "vkCreateDescriptorPool"
    );
    descriptor_pool = vkres(ctx, tmp_pool);

    init_render_pass();
    reset_framebuffers();

    ImGui_ImplVulkan_InitInfo init_info = {};
    init_info.Instance = ctx.get_instance();
    init_info.PhysicalDevice = dev.physical_device;
    init_info.Device = dev.logical_device;
    init_info.QueueFamily = (uint32_t)dev.graphics_family_index;
    init_info.Queue = dev.graphics_queue;
    init_info.DescriptorPool = descriptor_pool;
    init_info.MinImageCount = 2;
    // Vertex buffers are cycled per frame, one extra avoids overwriting a
    // buffer the GPU may still read.
    init_info.ImageCount = ctx.get_image_count()+1;
    init_info.MSAASamples = VK_SAMPLE_COUNT_1_BIT;
    init_info.CheckVkResultFn = check_imgui_vk;

    ImGui_ImplVulkan_Init(&init_info, render_pass);

    VkCommandBuffer buf = begin_command_buffer(ctx);
    ImGui_ImplVulkan_CreateFontsTexture(buf);
    end_command_buffer(ctx, buf);
    ImGui_ImplVulkan_DestroyFontUploadObjects();
}

gui_render_stage::~gui_render_stage()
{
    ctx->sync_flush();
    ImGui_ImplVulkan_Shutdown();
}

void gui_render_stage::init_render_pass()
{
    VkAttachmentDescription attachment = {};
    attachment.format = format;
    attachment.samples = VK_SAMPLE_COUNT_1_BIT;
    attachment.loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
    attachment.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
    attachment.stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    attachment.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    attachment.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    attachment.finalLayout = VK_IMAGE_LAYOUT_PRESENT_SRC_KHR;
    VkAttachmentReference color_attachment = {};
    color_attachment.attachment = 0;
    color_attachment.layout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
    VkSubpassDescription subpass = {};
    subpass.pipelineBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
    subpass.colorAttachmentCount = 1;
    subpass.pColorAttachments = &color_attachment;
    // The acquire semaphore is waited on at the color output stage, so the
    // layout transition has to wait for that stage too.
    VkSubpassDependency dependency = {};
    dependency.srcSubpass = VK_SUBPASS_EXTERNAL;
    dependency.dstSubpass = 0;
    dependency.srcStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    dependency.dstStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    dependency.srcAccessMask = 0;
    dependency.dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;
    VkRenderPassCreateInfo info = {};
    info.sType = VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO;
    info.attachmentCount = 1;
    info.pAttachments = &attachment;
    info.subpassCount = 1;
    info.pSubpasses = &subpass;
    info.dependencyCount = 1;
    info.pDependencies = &dependency;
    VkRenderPass tmp_render_pass;
    check_vk(
        vkCreateRenderPass(
            ctx->get_device().logical_device, &info, nullptr, &tmp_render_pass
        ),
        "vkCreateRenderPass"
    );
    render_pass = vkres(*ctx, tmp_render_pass);
}

void gui_render_stage::reset_framebuffers()
{
    if(ctx->get_format() != format)
        throw std::runtime_error("Swapchain format changed after reset");

    framebuffers.clear();
    ivec2 size = ctx->get_size();

    VkImageView attachment[1];
    VkFramebufferCreateInfo info = {};
    info.sType = VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO;
    info.renderPass = render_pass;
    info.attachmentCount = 1;
    info.pAttachments = attachment;
    info.width = size.x;
    info.height = size.y;
    info.layers = 1;
    for(uint32_t i = 0; i < ctx->get_image_count(); i++)
    {
        attachment[0] = ctx->get_image_view(i);
        VkFramebuffer framebuffer;
        check_vk(
            vkCreateFramebuffer(
                ctx->get_device().logical_device, &info, nullptr, &framebuffer
            ),
            "vkCreateFramebuffer"
        );
        framebuffers.emplace_back(*ctx, framebuffer);
    }
}

void gui_render_stage::release_texture(VkDescriptorSet set)
{
    VkDevice logical_device = ctx->get_device().logical_device;
    VkDescriptorPool pool = descriptor_pool;
    ctx->at_frame_finish([logical_device, pool, set](){
        vkFreeDescriptorSets(logical_device, pool, 1, &set);
    });
}

vkres<VkCommandBuffer> gui_render_stage::record(
    uint32_t image_index,
    vec4 clear_color
){
    const device& dev = ctx->get_device();
    VkCommandBufferAllocateInfo alloc_info = {
        VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO,
        nullptr,
        dev.graphics_pool,
        VK_COMMAND_BUFFER_LEVEL_PRIMARY,
        1
    };
    VkCommandBuffer tmp;
    check_vk(
        vkAllocateCommandBuffers(dev.logical_device, &alloc_info, &tmp),
        "vkAllocateCommandBuffers"
    );
    vkres<VkCommandBuffer> buf(*ctx, dev.graphics_pool, tmp);

    VkCommandBufferBeginInfo begin_info = {
        VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO,
        nullptr,
        VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT,
        nullptr
    };
    check_vk(vkBeginCommandBuffer(buf, &begin_info), "vkBeginCommandBuffer");

    VkClearValue clear;
    clear.color.float32[0] = clear_color.r;
    clear.color.float32[1] = clear_color.g;
    clear.color.float32[2] = clear_color.b;
    clear.color.float32[3] = clear_color.a;

    VkRenderPassBeginInfo info = {};
    info.sType = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
    info.renderPass = render_pass;
    info.framebuffer = framebuffers[image_index];
    ivec2 size = ctx->get_size();
    info.renderArea.extent.width = size.x;
    info.renderArea.extent.height = size.y;
    info.clearValueCount = 1;
    info.pClearValues = &clear;
    vkCmdBeginRenderPass(buf, &info, VK_SUBPASS_CONTENTS_INLINE);

    ImGui_ImplVulkan_RenderDrawData(ImGui::GetDrawData(), buf);

    vkCmdEndRenderPass(buf);
    check_vk(vkEndCommandBuffer(buf), "vkEndCommandBuffer");
    return buf;
}

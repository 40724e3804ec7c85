#include "sampler.hh"
#include "helpers.hh"

sampler::sampler(
    context& ctx,
    VkFilter min, VkFilter mag,
    VkSamplerAddressMode extension
){
    // Single mip level, so mipmapping is effectively off.
    VkSamplerCreateInfo info = {
        VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO, nullptr, 0,
        min, mag, VK_SAMPLER_MIPMAP_MODE_NEAREST,
        extension, extension, extension, 0.0f,
        VK_FALSE, 1.0f,
        VK_FALSE, VK_COMPARE_OP_ALWAYS,
        0.0f, 0.0f,
        VK_BORDER_COLOR_FLOAT_OPAQUE_BLACK,
        VK_FALSE
    };
    VkSampler tmp;
    check_vk(
        vkCreateSampler(ctx.get_device().logical_device, &info, nullptr, &tmp),
        "vkCreateSampler"
    );
    sampler_object = vkres<VkSampler>(ctx, tmp);
}

VkSampler sampler::get() const
{
    return *sampler_object;
}

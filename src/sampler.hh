#ifndef CHIPVIEW_SAMPLER_HH
#define CHIPVIEW_SAMPLER_HH
#include "context.hh"

class sampler
{
public:
    sampler(
        context& ctx,
        VkFilter min = VK_FILTER_NEAREST,
        VkFilter mag = VK_FILTER_NEAREST,
        VkSamplerAddressMode extension = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE
    );
    sampler(const sampler& other) = delete;
    sampler(sampler&& other) = default;

    VkSampler get() const;

private:
    vkres<VkSampler> sampler_object;
};

#endif

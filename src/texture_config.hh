#ifndef CHIPVIEW_TEXTURE_CONFIG_HH
#define CHIPVIEW_TEXTURE_CONFIG_HH
#include "math.hh"

enum class texture_format
{
    RGBA8_UNORM
};

enum texture_usage_bits: uint32_t
{
    TEXTURE_USAGE_SAMPLED_BIT = 1u<<0,
    TEXTURE_USAGE_COPY_DST_BIT = 1u<<1
};
using texture_usage_flags = uint32_t;

// What the device can create. sample_counts has bit N set when 2^N samples
// are supported, like VkSampleCountFlags.
struct texture_limits
{
    uint32_t max_dimension = UINT32_MAX;
    uint32_t max_mip_count = UINT32_MAX;
    uint32_t sample_counts = UINT32_MAX;
};

// Everything a backend needs to know to create a texture. Textures are
// immutable after creation; a different config means a new texture.
struct texture_config
{
    uvec2 size = uvec2(0);
    texture_format format = texture_format::RGBA8_UNORM;
    uint32_t mip_count = 1;
    uint32_t sample_count = 1;
    texture_usage_flags usage =
        TEXTURE_USAGE_SAMPLED_BIT | TEXTURE_USAGE_COPY_DST_BIT;

    // 2D RGBA8 texture with a single mip & sample that can be sampled from
    // shaders and written by buffer copies.
    static texture_config display_texture(uvec2 size);

    size_t get_texel_size() const;
    size_t get_byte_size() const;

    // Throws std::invalid_argument when the config describes no valid texture.
    void validate() const;

    // Throws resource_allocation_failure if the device can't create this
    // texture.
    void check_limits(const texture_limits& limits) const;

    bool operator==(const texture_config& other) const;
    bool operator!=(const texture_config& other) const;
};

#endif

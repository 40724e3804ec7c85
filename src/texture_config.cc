#include "texture_config.hh"
#include "error.hh"

texture_config texture_config::display_texture(uvec2 size)
{
    texture_config config;
    config.size = size;
    return config;
}

size_t texture_config::get_texel_size() const
{
    switch(format)
    {
    case texture_format::RGBA8_UNORM:
        return 4;
    }
    return 0;
}

size_t texture_config::get_byte_size() const
{
    return size_t(size.x) * size.y * get_texel_size();
}

void texture_config::validate() const
{
    if(size.x == 0 || size.y == 0)
        throw std::invalid_argument(format_error(
            "Texture size %ux%u is empty", size.x, size.y
        ));

    if(mip_count == 0)
        throw std::invalid_argument("Texture must have at least one mip level");

    if(sample_count == 0 || (sample_count & (sample_count-1)) != 0)
        throw std::invalid_argument(format_error(
            "Sample count %u is not a power of two", sample_count
        ));

    if(usage == 0)
        throw std::invalid_argument("Texture has no usage flags");
}

void texture_config::check_limits(const texture_limits& limits) const
{
    if(size.x > limits.max_dimension || size.y > limits.max_dimension)
        throw resource_allocation_failure(format_error(
            "Texture size %ux%u exceeds the device limit of %u",
            size.x, size.y, limits.max_dimension
        ));

    if(mip_count > limits.max_mip_count)
        throw resource_allocation_failure(format_error(
            "Texture has %u mip levels, the device allows %u",
            mip_count, limits.max_mip_count
        ));

    if(!(sample_count & limits.sample_counts))
        throw resource_allocation_failure(format_error(
            "Sample count %u is not supported by the device", sample_count
        ));
}

bool texture_config::operator==(const texture_config& other) const
{
    return size == other.size && format == other.format &&
        mip_count == other.mip_count && sample_count == other.sample_count &&
        usage == other.usage;
}

bool texture_config::operator!=(const texture_config& other) const
{
    return !operator==(other);
}

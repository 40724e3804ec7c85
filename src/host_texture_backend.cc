#include "host_texture_backend.hh"
#include "error.hh"
#include <algorithm>
#include <cstring>
#include <new>
#include <stdexcept>

class host_texture_backend::host_staging_buffer: public staging_buffer
{
public:
    host_staging_buffer(host_texture_backend& backend, size_t bytes)
    : backend(&backend), data(bytes, 0)
    {
    }

    ~host_staging_buffer()
    {
        backend->release(data.size());
    }

    uint8_t* get_data() override { return data.data(); }
    size_t get_size() const override { return data.size(); }

private:
    host_texture_backend* backend;
    std::vector<uint8_t> data;
};

host_texture_backend::host_texture_backend(
    size_t row_alignment,
    size_t memory_budget,
    const texture_limits& limits
):  row_alignment(std::max(row_alignment, size_t(1))), memory_budget(memory_budget),
    limits(limits), used_memory(0), submission_count(0)
{
}

host_texture_backend::~host_texture_backend()
{
}

texture_handle host_texture_backend::create_texture(const texture_config& config)
{
    config.validate();
    config.check_limits(limits);

    // Only the base level is stored, mips are never sampled on the host.
    size_t bytes = config.get_byte_size();
    reserve(bytes);
    try
    {
        return textures.emplace(host_texture{config, std::vector<uint8_t>(bytes, 0)});
    }
    catch(const std::bad_alloc&)
    {
        release(bytes);
        throw resource_allocation_failure(format_error(
            "Unable to allocate %zu bytes of texture memory", bytes
        ));
    }
    catch(const std::length_error&)
    {
        release(bytes);
        throw resource_allocation_failure(format_error(
            "Texture of %zu bytes is too large", bytes
        ));
    }
}

void host_texture_backend::destroy_texture(texture_handle handle)
{
    release(find(handle).texels.size());
    textures.erase(handle);
}

bool host_texture_backend::is_valid(texture_handle handle) const
{
    return textures.contains(handle);
}

const texture_config& host_texture_backend::get_config(texture_handle handle) const
{
    return find(handle).config;
}

size_t host_texture_backend::get_row_alignment() const
{
    return row_alignment;
}

std::unique_ptr<staging_buffer> host_texture_backend::create_staging_buffer(size_t bytes)
{
    reserve(bytes);
    try
    {
        return std::make_unique<host_staging_buffer>(*this, bytes);
    }
    catch(const std::bad_alloc&)
    {
        release(bytes);
        throw resource_allocation_failure(format_error(
            "Unable to allocate a %zu byte staging buffer", bytes
        ));
    }
    catch(const std::length_error&)
    {
        release(bytes);
        throw resource_allocation_failure(format_error(
            "Staging buffer of %zu bytes is too large", bytes
        ));
    }
}

void host_texture_backend::upload_region(
    texture_handle handle,
    staging_buffer& src,
    const copy_layout& layout
){
    host_texture* tex = textures.get(handle);
    if(!tex)
        throw invalid_handle(format_error(
            "Texture %u (generation %u) does not exist",
            handle.index, handle.generation
        ));

    const texture_config& config = tex->config;
    size_t texel = config.get_texel_size();
    uvec3 end = layout.origin + layout.extent;
    if(
        layout.mip_level != 0 || end.x > config.size.x ||
        end.y > config.size.y || end.z > 1
    ) throw configuration_mismatch("Copy region is outside of the texture");

    size_t row_bytes = layout.extent.x * texel;
    if(
        layout.bytes_per_row < row_bytes ||
        layout.bytes_per_row % row_alignment != 0 ||
        layout.rows_per_image < layout.extent.y
    ) throw configuration_mismatch(format_error(
        "Invalid copy layout: %u bytes per row, %u rows",
        layout.bytes_per_row, layout.rows_per_image
    ));

    if(layout.get_byte_size() > src.get_size())
        throw configuration_mismatch(format_error(
            "Staging buffer holds %zu bytes, copy reads %zu",
            src.get_size(), layout.get_byte_size()
        ));

    const uint8_t* in = src.get_data() + layout.offset;
    for(unsigned y = 0; y < layout.extent.y; ++y)
    {
        uint8_t* out = tex->texels.data() + ravel_tex_coord(
            uvec2(layout.origin.x, layout.origin.y + y), config.size
        ) * texel;
        memcpy(out, in + y * layout.bytes_per_row, row_bytes);
    }
    submission_count++;
}

std::vector<uint8_t> host_texture_backend::read_back(texture_handle handle) const
{
    return find(handle).texels;
}

uint64_t host_texture_backend::get_submission_count() const
{
    return submission_count;
}

size_t host_texture_backend::get_texture_count() const
{
    return textures.size();
}

size_t host_texture_backend::get_used_memory() const
{
    return used_memory;
}

const host_texture_backend::host_texture& host_texture_backend::find(
    texture_handle handle
) const {
    const host_texture* tex = textures.get(handle);
    if(!tex)
        throw invalid_handle(format_error(
            "Texture %u (generation %u) does not exist",
            handle.index, handle.generation
        ));
    return *tex;
}

void host_texture_backend::reserve(size_t bytes)
{
    if(memory_budget != 0 && bytes > memory_budget - used_memory)
        throw resource_allocation_failure(format_error(
            "Out of memory: %zu bytes requested, %zu of %zu in use",
            bytes, used_memory, memory_budget
        ));
    used_memory += bytes;
}

void host_texture_backend::release(size_t bytes)
{
    used_memory -= std::min(bytes, used_memory);
}

#include "upload_pipeline.hh"
#include "error.hh"
#include <cstring>

copy_layout compute_copy_layout(
    uvec2 size,
    size_t total_bytes,
    size_t row_alignment
){
    copy_layout layout;
    layout.offset = 0;
    layout.bytes_per_row = align_up(total_bytes / size.y, row_alignment);
    layout.rows_per_image = size.y;
    layout.origin = uvec3(0);
    layout.extent = uvec3(size, 1);
    layout.mip_level = 0;
    return layout;
}

void stage_rows(
    uint8_t* dst,
    const uint8_t* src,
    size_t packed_row_bytes,
    const copy_layout& layout
){
    dst += layout.offset;
    if(layout.bytes_per_row == packed_row_bytes)
    {
        memcpy(dst, src, packed_row_bytes * layout.rows_per_image);
        return;
    }

    size_t padding = layout.bytes_per_row - packed_row_bytes;
    for(uint32_t y = 0; y < layout.rows_per_image; ++y)
    {
        memcpy(dst, src, packed_row_bytes);
        memset(dst + packed_row_bytes, 0, padding);
        dst += layout.bytes_per_row;
        src += packed_row_bytes;
    }
}

upload_pipeline::upload_pipeline(texture_backend& backend)
: backend(&backend), upload_count(0)
{
}

void upload_pipeline::upload(texture_handle handle, const rgba_image& image)
{
    if(!backend->is_valid(handle))
        throw invalid_handle(format_error(
            "Cannot upload to texture %u (generation %u), it does not exist",
            handle.index, handle.generation
        ));

    const texture_config& config = backend->get_config(handle);
    if(image.size != config.size)
        throw configuration_mismatch(format_error(
            "Image is %ux%u but the texture is %ux%u",
            image.size.x, image.size.y, config.size.x, config.size.y
        ));

    size_t total_bytes = image.data.size();
    if(total_bytes != config.get_byte_size())
        throw configuration_mismatch(format_error(
            "Image has %zu bytes, texture expects %zu",
            total_bytes, config.get_byte_size()
        ));

    if(!(config.usage & TEXTURE_USAGE_COPY_DST_BIT) || config.sample_count != 1)
        throw configuration_mismatch(
            "Texture cannot be the destination of a buffer copy"
        );

    copy_layout layout = compute_copy_layout(
        image.size, total_bytes, backend->get_row_alignment()
    );

    std::unique_ptr<staging_buffer> staging =
        backend->create_staging_buffer(layout.get_byte_size());
    stage_rows(
        staging->get_data(),
        image.data.data(),
        total_bytes / image.size.y,
        layout
    );
    backend->upload_region(handle, *staging, layout);
    upload_count++;
}

uint64_t upload_pipeline::get_upload_count() const
{
    return upload_count;
}

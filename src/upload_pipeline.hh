#ifndef CHIPVIEW_UPLOAD_PIPELINE_HH
#define CHIPVIEW_UPLOAD_PIPELINE_HH
#include "texture_backend.hh"
#include "frame_converter.hh"

// Layout for copying a whole width x height image to mip 0 of a texture.
// Rows are padded to row_alignment when the packed row is not a multiple of
// it.
copy_layout compute_copy_layout(
    uvec2 size,
    size_t total_bytes,
    size_t row_alignment
);

// Copies packed rows from src into dst, leaving the padding of each row as
// zero.
void stage_rows(
    uint8_t* dst,
    const uint8_t* src,
    size_t packed_row_bytes,
    const copy_layout& layout
);

// Pushes converted frames into a backend texture, one copy per frame.
class upload_pipeline
{
public:
    upload_pipeline(texture_backend& backend);

    // Throws invalid_handle, configuration_mismatch or
    // resource_allocation_failure. Nothing is submitted if an exception is
    // thrown before the copy is recorded.
    void upload(texture_handle handle, const rgba_image& image);

    uint64_t get_upload_count() const;

private:
    texture_backend* backend;
    uint64_t upload_count;
};

#endif

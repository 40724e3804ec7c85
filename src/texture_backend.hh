#ifndef CHIPVIEW_TEXTURE_BACKEND_HH
#define CHIPVIEW_TEXTURE_BACKEND_HH
#include "handle_pool.hh"
#include "texture_config.hh"
#include <memory>

using texture_handle = resource_handle;

// Describes where the source bytes of a buffer to texture copy are and where
// they go. bytes_per_row may be larger than the packed row size if the
// backend needs aligned rows.
struct copy_layout
{
    size_t offset = 0;
    uint32_t bytes_per_row = 0;
    uint32_t rows_per_image = 0;
    uvec3 origin = uvec3(0);
    uvec3 extent = uvec3(0);
    uint32_t mip_level = 0;

    size_t get_byte_size() const;
};

// Host-writable memory that a copy can read from. Released when destroyed;
// backends defer the actual release until the GPU no longer uses it.
class staging_buffer
{
public:
    virtual ~staging_buffer() = default;

    virtual uint8_t* get_data() = 0;
    virtual size_t get_size() const = 0;
};

// What a graphics API must provide to host the emulator display.
class texture_backend
{
public:
    virtual ~texture_backend() = default;

    // Every call creates a new, independent texture. Throws
    // resource_allocation_failure if memory can't be allocated.
    virtual texture_handle create_texture(const texture_config& config) = 0;

    // Throws invalid_handle if the texture doesn't exist.
    virtual void destroy_texture(texture_handle handle) = 0;
    virtual bool is_valid(texture_handle handle) const = 0;
    virtual const texture_config& get_config(texture_handle handle) const = 0;

    // Required alignment of copy_layout::bytes_per_row, in bytes.
    virtual size_t get_row_alignment() const = 0;

    virtual std::unique_ptr<staging_buffer> create_staging_buffer(size_t bytes) = 0;

    // Records the copy and submits it without waiting for completion.
    virtual void upload_region(
        texture_handle handle,
        staging_buffer& src,
        const copy_layout& layout
    ) = 0;
};

#endif

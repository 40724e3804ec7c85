#ifndef CHIPVIEW_HOST_TEXTURE_BACKEND_HH
#define CHIPVIEW_HOST_TEXTURE_BACKEND_HH
#include "texture_backend.hh"
#include <vector>

// Keeps textures in system memory. Used for headless rendering and anywhere
// the texture contents need to be read back.
class host_texture_backend: public texture_backend
{
public:
    // A memory_budget of 0 means unlimited. The budget covers textures and
    // live staging buffers.
    host_texture_backend(
        size_t row_alignment = 1,
        size_t memory_budget = 0,
        const texture_limits& limits = texture_limits()
    );
    ~host_texture_backend();

    texture_handle create_texture(const texture_config& config) override;
    void destroy_texture(texture_handle handle) override;
    bool is_valid(texture_handle handle) const override;
    const texture_config& get_config(texture_handle handle) const override;

    size_t get_row_alignment() const override;

    std::unique_ptr<staging_buffer> create_staging_buffer(size_t bytes) override;

    void upload_region(
        texture_handle handle,
        staging_buffer& src,
        const copy_layout& layout
    ) override;

    // Tightly packed texels of mip 0.
    std::vector<uint8_t> read_back(texture_handle handle) const;

    uint64_t get_submission_count() const;
    size_t get_texture_count() const;
    size_t get_used_memory() const;

private:
    struct host_texture
    {
        texture_config config;
        std::vector<uint8_t> texels;
    };

    class host_staging_buffer;

    const host_texture& find(texture_handle handle) const;
    void reserve(size_t bytes);
    void release(size_t bytes);

    size_t row_alignment;
    size_t memory_budget;
    texture_limits limits;
    size_t used_memory;
    uint64_t submission_count;
    handle_pool<host_texture> textures;
};

#endif

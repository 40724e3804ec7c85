#ifndef CHIPVIEW_VULKAN_TEXTURE_BACKEND_HH
#define CHIPVIEW_VULKAN_TEXTURE_BACKEND_HH
#include "texture_backend.hh"
#include "context.hh"

// Textures live in device-local memory and are kept in
// SHADER_READ_ONLY_OPTIMAL between uploads. Uploads are submitted to the
// graphics queue, so later draws on that queue see the new contents.
class vulkan_texture_backend: public texture_backend
{
public:
    vulkan_texture_backend(context& ctx);
    ~vulkan_texture_backend();

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

    VkImageView get_image_view(texture_handle handle) const;

private:
    struct gpu_texture
    {
        texture_config config;
        vkres<VkImage> image;
        vkres<VkImageView> view;
    };

    class vulkan_staging_buffer;

    gpu_texture& find(texture_handle handle);
    const gpu_texture& find(texture_handle handle) const;

    context* ctx;
    size_t row_alignment;
    texture_limits limits;
    handle_pool<gpu_texture> textures;
};

#endif

#include <gtest/gtest.h>
#include "host_texture_backend.hh"
#include "upload_pipeline.hh"
#include "mono_framebuffer.hh"
#include "error.hh"
#include <cstdint>

namespace unittest {

class HostTextureBackendTest : public testing::Test
{
protected:
    host_texture_backend backend;
    mono_framebuffer screen;
    frame_converter converter{uvec2(64, 32)};

    texture_handle create_display_texture()
    {
        return backend.create_texture(texture_config::display_texture(uvec2(64, 32)));
    }

    std::vector<uint8_t> upload_and_read(texture_handle tex)
    {
        upload_pipeline pipeline(backend);
        pipeline.upload(tex, converter.convert(screen));
        return backend.read_back(tex);
    }

    static void expect_all(const std::vector<uint8_t>& texels, uint8_t v)
    {
        ASSERT_EQ(texels.size(), 64u * 32u * 4u);
        for(size_t i = 0; i < texels.size(); i += 4)
        {
            ASSERT_EQ(texels[i + 0], v) << "texel " << i / 4;
            ASSERT_EQ(texels[i + 1], v) << "texel " << i / 4;
            ASSERT_EQ(texels[i + 2], v) << "texel " << i / 4;
            ASSERT_EQ(texels[i + 3], 255) << "texel " << i / 4;
        }
    }
};

TEST_F(HostTextureBackendTest, round_trip_all_clear)
{
    texture_handle tex = create_display_texture();
    expect_all(upload_and_read(tex), 0);
}

TEST_F(HostTextureBackendTest, round_trip_all_set)
{
    for(unsigned y = 0; y < 32; ++y)
        for(unsigned x = 0; x < 64; ++x)
            screen.set_pixel(x, y, true);

    texture_handle tex = create_display_texture();
    expect_all(upload_and_read(tex), 255);
}

TEST_F(HostTextureBackendTest, repeated_upload_is_idempotent)
{
    screen.draw_sprite(17, 5, {0xAA, 0x55, 0xFF});
    texture_handle tex = create_display_texture();

    std::vector<uint8_t> first = upload_and_read(tex);
    std::vector<uint8_t> second = upload_and_read(tex);
    ASSERT_EQ(first, second);
    ASSERT_EQ(backend.get_submission_count(), 2u);
}

TEST_F(HostTextureBackendTest, round_trip_with_padded_rows)
{
    host_texture_backend padded(256);
    mono_framebuffer small(uvec2(5, 3));
    small.set_pixel(4, 2, true);
    frame_converter small_converter(uvec2(5, 3));

    texture_handle tex = padded.create_texture(texture_config::display_texture(uvec2(5, 3)));
    upload_pipeline pipeline(padded);
    const rgba_image& image = small_converter.convert(small);
    pipeline.upload(tex, image);

    ASSERT_EQ(padded.read_back(tex), image.data);
}

TEST_F(HostTextureBackendTest, each_creation_is_independent)
{
    texture_handle a = create_display_texture();
    texture_handle b = create_display_texture();
    ASSERT_NE(a, b);
    ASSERT_EQ(backend.get_texture_count(), 2u);

    screen.set_pixel(0, 0, true);
    upload_and_read(a);

    ASSERT_EQ(backend.read_back(a)[0], 255);
    ASSERT_EQ(backend.read_back(b)[0], 0);

    backend.destroy_texture(a);
    ASSERT_FALSE(backend.is_valid(a));
    ASSERT_TRUE(backend.is_valid(b));
}

TEST_F(HostTextureBackendTest, destroyed_texture_is_invalid)
{
    texture_handle tex = create_display_texture();
    backend.destroy_texture(tex);

    ASSERT_FALSE(backend.is_valid(tex));
    ASSERT_THROW(backend.read_back(tex), invalid_handle);
    ASSERT_THROW(backend.get_config(tex), invalid_handle);
    ASSERT_THROW(backend.destroy_texture(tex), invalid_handle);
    ASSERT_EQ(backend.get_used_memory(), 0u);
}

TEST_F(HostTextureBackendTest, stale_handle_after_slot_reuse)
{
    texture_handle old_tex = create_display_texture();
    backend.destroy_texture(old_tex);
    texture_handle new_tex = create_display_texture();

    ASSERT_EQ(old_tex.index, new_tex.index);
    ASSERT_FALSE(backend.is_valid(old_tex));

    upload_pipeline pipeline(backend);
    ASSERT_THROW(pipeline.upload(old_tex, converter.convert(screen)), invalid_handle);
    ASSERT_EQ(backend.get_submission_count(), 0u);
}

TEST_F(HostTextureBackendTest, budget_exceeded)
{
    host_texture_backend limited(1, 64 * 32 * 4);
    ASSERT_NO_THROW(limited.create_texture(texture_config::display_texture(uvec2(64, 32))));
    try
    {
        limited.create_texture(texture_config::display_texture(uvec2(64, 32)));
        FAIL() << "Second texture should not fit";
    }
    catch(const resource_allocation_failure& e)
    {
        ASSERT_EQ(e.get_result(), 0);
    }
    ASSERT_EQ(limited.get_texture_count(), 1u);
}

TEST_F(HostTextureBackendTest, staging_memory_released)
{
    texture_handle tex = create_display_texture();
    size_t texture_bytes = backend.get_used_memory();
    {
        std::unique_ptr<staging_buffer> staging = backend.create_staging_buffer(1024);
        ASSERT_EQ(staging->get_size(), 1024u);
        ASSERT_EQ(backend.get_used_memory(), texture_bytes + 1024);
    }
    ASSERT_EQ(backend.get_used_memory(), texture_bytes);
    backend.destroy_texture(tex);
}

TEST_F(HostTextureBackendTest, rejects_bad_layouts)
{
    host_texture_backend aligned(8);
    texture_handle tex = aligned.create_texture(texture_config::display_texture(uvec2(4, 4)));
    std::unique_ptr<staging_buffer> staging = aligned.create_staging_buffer(64);

    copy_layout layout = compute_copy_layout(uvec2(4, 4), 64, 8);
    layout.bytes_per_row = 12;
    ASSERT_THROW(aligned.upload_region(tex, *staging, layout), configuration_mismatch);

    layout = compute_copy_layout(uvec2(4, 4), 64, 8);
    layout.extent = uvec3(5, 4, 1);
    ASSERT_THROW(aligned.upload_region(tex, *staging, layout), configuration_mismatch);

    std::unique_ptr<staging_buffer> small = aligned.create_staging_buffer(32);
    layout = compute_copy_layout(uvec2(4, 4), 64, 8);
    ASSERT_THROW(aligned.upload_region(tex, *small, layout), configuration_mismatch);

    ASSERT_EQ(aligned.get_submission_count(), 0u);
}

TEST_F(HostTextureBackendTest, invalid_config_rejected)
{
    ASSERT_THROW(
        backend.create_texture(texture_config::display_texture(uvec2(0, 0))),
        std::invalid_argument
    );
    ASSERT_EQ(backend.get_texture_count(), 0u);
}

TEST_F(HostTextureBackendTest, device_limits_checked_on_creation)
{
    texture_limits limits;
    limits.max_dimension = 256;
    host_texture_backend limited(1, 0, limits);

    ASSERT_THROW(
        limited.create_texture(texture_config::display_texture(uvec2(20000, 32))),
        resource_allocation_failure
    );
    ASSERT_EQ(limited.get_texture_count(), 0u);
    ASSERT_EQ(limited.get_used_memory(), 0u);

    ASSERT_NO_THROW(limited.create_texture(texture_config::display_texture(uvec2(256, 256))));
}

TEST_F(HostTextureBackendTest, failed_allocation_keeps_memory_accounting)
{
    // 2^63 bytes, more than any vector can hold.
    ASSERT_THROW(
        backend.create_texture(texture_config::display_texture(uvec2(1u << 31, 1u << 30))),
        resource_allocation_failure
    );
    ASSERT_EQ(backend.get_used_memory(), 0u);
    ASSERT_EQ(backend.get_texture_count(), 0u);

    texture_handle tex = create_display_texture();
    ASSERT_EQ(backend.get_used_memory(), 64u * 32u * 4u);
    backend.destroy_texture(tex);
    ASSERT_EQ(backend.get_used_memory(), 0u);
}

TEST_F(HostTextureBackendTest, failed_staging_allocation_keeps_memory_accounting)
{
    texture_handle tex = create_display_texture();
    size_t texture_bytes = backend.get_used_memory();

    ASSERT_THROW(
        backend.create_staging_buffer(size_t(1) << 63),
        resource_allocation_failure
    );
    ASSERT_EQ(backend.get_used_memory(), texture_bytes);

    host_texture_backend limited(1, 4096);
    ASSERT_THROW(limited.create_staging_buffer(SIZE_MAX), resource_allocation_failure);
    ASSERT_EQ(limited.get_used_memory(), 0u);
}

}

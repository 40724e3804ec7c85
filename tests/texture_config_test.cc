#include <gtest/gtest.h>
#include "texture_config.hh"
#include "error.hh"

namespace unittest {

TEST(TextureConfigTest, display_texture_defaults)
{
    texture_config config = texture_config::display_texture(uvec2(64, 32));
    ASSERT_EQ(config.size, uvec2(64, 32));
    ASSERT_EQ(config.format, texture_format::RGBA8_UNORM);
    ASSERT_EQ(config.mip_count, 1u);
    ASSERT_EQ(config.sample_count, 1u);
    ASSERT_TRUE(config.usage & TEXTURE_USAGE_SAMPLED_BIT);
    ASSERT_TRUE(config.usage & TEXTURE_USAGE_COPY_DST_BIT);
    ASSERT_EQ(config.get_texel_size(), 4u);
    ASSERT_EQ(config.get_byte_size(), 64u * 32u * 4u);
    ASSERT_NO_THROW(config.validate());
}

TEST(TextureConfigTest, invalid_configs)
{
    texture_config config = texture_config::display_texture(uvec2(0, 32));
    ASSERT_THROW(config.validate(), std::invalid_argument);

    config = texture_config::display_texture(uvec2(8, 8));
    config.mip_count = 0;
    ASSERT_THROW(config.validate(), std::invalid_argument);

    config = texture_config::display_texture(uvec2(8, 8));
    config.sample_count = 3;
    ASSERT_THROW(config.validate(), std::invalid_argument);

    config = texture_config::display_texture(uvec2(8, 8));
    config.usage = 0;
    ASSERT_THROW(config.validate(), std::invalid_argument);
}

TEST(TextureConfigTest, equality)
{
    texture_config a = texture_config::display_texture(uvec2(8, 8));
    texture_config b = texture_config::display_texture(uvec2(8, 8));
    ASSERT_EQ(a, b);

    b.usage = TEXTURE_USAGE_SAMPLED_BIT;
    ASSERT_NE(a, b);
}

TEST(MathTest, align_up)
{
    ASSERT_EQ(align_up(4, 1), 4u);
    ASSERT_EQ(align_up(4, 0), 4u);
    ASSERT_EQ(align_up(256, 256), 256u);
    ASSERT_EQ(align_up(257, 256), 512u);
    ASSERT_EQ(align_up(12, 8), 16u);
}

TEST(MathTest, normalize_color)
{
    vec4 c = normalize_color(ivec4(255, 0, 51, 255));
    ASSERT_FLOAT_EQ(c.r, 1.0f);
    ASSERT_FLOAT_EQ(c.g, 0.0f);
    ASSERT_FLOAT_EQ(c.b, 0.2f);
    ASSERT_FLOAT_EQ(c.a, 1.0f);
}

TEST(TextureConfigTest, within_device_limits)
{
    texture_limits limits;
    limits.max_dimension = 4096;
    limits.max_mip_count = 13;
    limits.sample_counts = 1 | 2 | 4;

    texture_config config = texture_config::display_texture(uvec2(4096, 1));
    ASSERT_NO_THROW(config.check_limits(limits));
    ASSERT_NO_THROW(config.check_limits(texture_limits()));
}

TEST(TextureConfigTest, beyond_device_limits)
{
    texture_limits limits;
    limits.max_dimension = 4096;
    limits.max_mip_count = 13;
    limits.sample_counts = 1 | 2;

    texture_config config = texture_config::display_texture(uvec2(20000, 32));
    ASSERT_THROW(config.check_limits(limits), resource_allocation_failure);

    config = texture_config::display_texture(uvec2(64, 4097));
    ASSERT_THROW(config.check_limits(limits), resource_allocation_failure);

    config = texture_config::display_texture(uvec2(64, 32));
    config.mip_count = 14;
    ASSERT_THROW(config.check_limits(limits), resource_allocation_failure);

    config = texture_config::display_texture(uvec2(64, 32));
    config.sample_count = 4;
    ASSERT_THROW(config.check_limits(limits), resource_allocation_failure);
}

}

#include <gtest/gtest.h>
#include "options.hh"

namespace unittest {

TEST(OptionsTest, defaults)
{
    options opts;
    ASSERT_EQ(opts.window_size, ivec2(1280, 720));
    ASSERT_FALSE(opts.fullscreen);
    ASSERT_TRUE(opts.vsync);
    ASSERT_EQ(opts.screen_size, uvec2(64, 32));
    ASSERT_FLOAT_EQ(opts.display_scale, 9.0f);
    ASSERT_EQ(opts.tint, vec4(0.19f, 0.66f, 0.38f, 1.0f));
}

TEST(OptionsTest, serialize_and_restore)
{
    options opts;
    opts.window_size = ivec2(800, 600);
    opts.fullscreen = true;
    opts.vsync = false;
    opts.screen_size = uvec2(128, 64);
    opts.display_scale = 4.0f;
    opts.tint = vec4(1.0f, 0.5f, 0.25f, 1.0f);

    json j = opts.serialize();
    ASSERT_EQ(j["screen_width"], 128);
    ASSERT_EQ(j["tint"].size(), 4u);

    options restored;
    ASSERT_TRUE(restored.deserialize(j));
    ASSERT_EQ(restored.window_size, opts.window_size);
    ASSERT_EQ(restored.fullscreen, opts.fullscreen);
    ASSERT_EQ(restored.vsync, opts.vsync);
    ASSERT_EQ(restored.screen_size, opts.screen_size);
    ASSERT_FLOAT_EQ(restored.display_scale, opts.display_scale);
    ASSERT_EQ(restored.tint, opts.tint);
}

TEST(OptionsTest, missing_keys_use_defaults)
{
    options opts;
    ASSERT_TRUE(opts.deserialize(json::parse(R"({"vsync": false})")));
    ASSERT_FALSE(opts.vsync);
    ASSERT_EQ(opts.screen_size, uvec2(64, 32));
    ASSERT_FLOAT_EQ(opts.display_scale, 9.0f);
}

TEST(OptionsTest, wrong_types_reset_everything)
{
    options opts;
    opts.fullscreen = true;
    ASSERT_FALSE(opts.deserialize(json::parse(R"({"vsync": false, "display_scale": "big"})")));
    ASSERT_TRUE(opts.vsync);
    ASSERT_FALSE(opts.fullscreen);

    ASSERT_FALSE(opts.deserialize(json::parse(R"({"tint": [1, 2]})")));
    ASSERT_EQ(opts.tint, options().tint);
}

TEST(OptionsTest, insane_values_fall_back)
{
    options opts;
    ASSERT_TRUE(opts.deserialize(json::parse(
        R"({"screen_width": 0, "display_scale": -2.0, "window_width": -5, "vsync": false})"
    )));
    ASSERT_EQ(opts.screen_size, uvec2(64, 32));
    ASSERT_FLOAT_EQ(opts.display_scale, 9.0f);
    ASSERT_EQ(opts.window_size, ivec2(1280, 720));
    ASSERT_FALSE(opts.vsync);
}

TEST(OptionsTest, negative_screen_size_falls_back)
{
    options opts;
    ASSERT_TRUE(opts.deserialize(json::parse(R"({"screen_height": -1})")));
    ASSERT_EQ(opts.screen_size, uvec2(64, 32));

    ASSERT_TRUE(opts.deserialize(json::parse(R"({"screen_width": -64, "screen_height": 16})")));
    ASSERT_EQ(opts.screen_size, uvec2(64, 32));
}

TEST(OptionsTest, oversized_screen_falls_back)
{
    options opts;
    ASSERT_TRUE(opts.deserialize(json::parse(R"({"screen_width": 5000000000})")));
    ASSERT_EQ(opts.screen_size, uvec2(64, 32));

    ASSERT_TRUE(opts.deserialize(json::parse(R"({"screen_width": 4097, "screen_height": 32})")));
    ASSERT_EQ(opts.screen_size, uvec2(64, 32));
}

TEST(OptionsTest, largest_screen_accepted)
{
    options opts;
    ASSERT_TRUE(opts.deserialize(json::parse(R"({"screen_width": 4096, "screen_height": 1})")));
    ASSERT_EQ(opts.screen_size, uvec2(options::MAX_SCREEN_DIMENSION, 1));
}

}

#include <gtest/gtest.h>
#include "mono_framebuffer.hh"

namespace unittest {

class MonoFramebufferTest : public testing::Test
{
protected:
    mono_framebuffer fb;

    unsigned count_lit() const
    {
        unsigned lit = 0;
        uvec2 size = fb.get_screen_size();
        for(unsigned y = 0; y < size.y; ++y)
            for(unsigned x = 0; x < size.x; ++x)
                lit += fb.get_pixel(x, y);
        return lit;
    }
};

TEST_F(MonoFramebufferTest, default_size_is_blank)
{
    ASSERT_EQ(fb.get_screen_size(), uvec2(64, 32));
    ASSERT_EQ(count_lit(), 0u);
}

TEST_F(MonoFramebufferTest, set_and_clear)
{
    fb.set_pixel(10, 20, true);
    ASSERT_TRUE(fb.get_pixel(10, 20));
    ASSERT_FALSE(fb.get_pixel(20, 10));

    fb.set_pixel(10, 20, false);
    ASSERT_FALSE(fb.get_pixel(10, 20));

    fb.set_pixel(0, 0, true);
    fb.set_pixel(63, 31, true);
    fb.clear();
    ASSERT_EQ(count_lit(), 0u);
}

TEST_F(MonoFramebufferTest, out_of_range)
{
    ASSERT_THROW(fb.get_pixel(64, 0), std::out_of_range);
    ASSERT_THROW(fb.get_pixel(0, 32), std::out_of_range);
    ASSERT_THROW(fb.set_pixel(64, 32, true), std::out_of_range);
}

TEST_F(MonoFramebufferTest, empty_size_rejected)
{
    ASSERT_THROW(mono_framebuffer(uvec2(0, 32)), std::invalid_argument);
    ASSERT_THROW(mono_framebuffer(uvec2(64, 0)), std::invalid_argument);
}

TEST_F(MonoFramebufferTest, sprite_rows_are_msb_first)
{
    ASSERT_FALSE(fb.draw_sprite(4, 2, {0x81, 0x40}));

    EXPECT_TRUE(fb.get_pixel(4, 2));
    EXPECT_TRUE(fb.get_pixel(11, 2));
    EXPECT_TRUE(fb.get_pixel(5, 3));
    EXPECT_EQ(count_lit(), 3u);
}

TEST_F(MonoFramebufferTest, sprite_xor_and_collision)
{
    fb.draw_sprite(0, 0, {0xF0});
    ASSERT_EQ(count_lit(), 4u);

    // Overlaps two of the lit pixels.
    ASSERT_TRUE(fb.draw_sprite(2, 0, {0xF0}));
    EXPECT_TRUE(fb.get_pixel(0, 0));
    EXPECT_TRUE(fb.get_pixel(1, 0));
    EXPECT_FALSE(fb.get_pixel(2, 0));
    EXPECT_FALSE(fb.get_pixel(3, 0));
    EXPECT_TRUE(fb.get_pixel(4, 0));
    EXPECT_TRUE(fb.get_pixel(5, 0));
}

TEST_F(MonoFramebufferTest, drawing_twice_erases)
{
    std::vector<uint8_t> sprite = {0x3C, 0x42, 0x81};
    ASSERT_FALSE(fb.draw_sprite(30, 10, sprite));
    ASSERT_TRUE(fb.draw_sprite(30, 10, sprite));
    ASSERT_EQ(count_lit(), 0u);
}

TEST_F(MonoFramebufferTest, sprite_wraps_around_edges)
{
    fb.draw_sprite(60, 31, {0xFF, 0x80});

    for(unsigned x: {60u, 61u, 62u, 63u, 0u, 1u, 2u, 3u})
        EXPECT_TRUE(fb.get_pixel(x, 31)) << "x " << x;
    EXPECT_TRUE(fb.get_pixel(60, 0));
    EXPECT_EQ(count_lit(), 9u);
}

}

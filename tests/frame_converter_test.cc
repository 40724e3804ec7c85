#include <gtest/gtest.h>
#include "frame_converter.hh"
#include "mono_framebuffer.hh"
#include "error.hh"

namespace unittest {

class FrameConverterTest : public testing::Test
{
protected:
    static void expect_pixel(
        const rgba_image& image, unsigned x, unsigned y, uint8_t v
    ){
        size_t offset = (y * 4 * image.size.x) + (x * 4);
        ASSERT_LT(offset + 3, image.data.size());
        EXPECT_EQ(image.data[offset + 0], v) << "at " << x << ", " << y;
        EXPECT_EQ(image.data[offset + 1], v) << "at " << x << ", " << y;
        EXPECT_EQ(image.data[offset + 2], v) << "at " << x << ", " << y;
        EXPECT_EQ(image.data[offset + 3], 255) << "at " << x << ", " << y;
    }
};

TEST_F(FrameConverterTest, set_and_unset_pixels)
{
    mono_framebuffer fb(uvec2(2, 1));
    fb.set_pixel(1, 0, true);

    frame_converter converter(uvec2(2, 1));
    const rgba_image& image = converter.convert(fb);

    std::vector<uint8_t> expected = {0, 0, 0, 255, 255, 255, 255, 255};
    ASSERT_EQ(image.data, expected);
}

TEST_F(FrameConverterTest, output_length)
{
    mono_framebuffer fb;
    frame_converter converter(uvec2(64, 32));
    ASSERT_EQ(converter.convert(fb).data.size(), 64u * 32u * 4u);
    ASSERT_EQ(converter.get_size(), uvec2(64, 32));
}

TEST_F(FrameConverterTest, single_pixel)
{
    mono_framebuffer fb(uvec2(1, 1));
    fb.set_pixel(0, 0, true);

    frame_converter converter(uvec2(1, 1));
    const rgba_image& image = converter.convert(fb);
    ASSERT_EQ(image.data.size(), 4u);
    expect_pixel(image, 0, 0, 255);
}

TEST_F(FrameConverterTest, corner_pixels_64x32)
{
    mono_framebuffer fb;
    fb.set_pixel(0, 0, true);
    fb.set_pixel(63, 31, true);

    frame_converter converter(uvec2(64, 32));
    const rgba_image& image = converter.convert(fb);

    size_t last = (31 * 4 * 64) + (63 * 4);
    for(size_t offset = 0; offset < image.data.size(); offset += 4)
    {
        uint8_t v = (offset == 0 || offset == last) ? 255 : 0;
        ASSERT_EQ(image.data[offset + 0], v) << "offset " << offset;
        ASSERT_EQ(image.data[offset + 1], v) << "offset " << offset;
        ASSERT_EQ(image.data[offset + 2], v) << "offset " << offset;
        ASSERT_EQ(image.data[offset + 3], 255) << "offset " << offset;
    }
}

TEST_F(FrameConverterTest, reused_buffer_reflects_latest_frame)
{
    mono_framebuffer fb(uvec2(4, 4));
    frame_converter converter(uvec2(4, 4));

    fb.set_pixel(2, 3, true);
    converter.convert(fb);
    expect_pixel(converter.get_image(), 2, 3, 255);

    fb.clear();
    fb.set_pixel(0, 1, true);
    const rgba_image& image = converter.convert(fb);
    expect_pixel(image, 2, 3, 0);
    expect_pixel(image, 0, 1, 255);
}

TEST_F(FrameConverterTest, size_mismatch)
{
    mono_framebuffer fb(uvec2(32, 32));
    frame_converter converter(uvec2(64, 32));
    ASSERT_THROW(converter.convert(fb), configuration_mismatch);
}

TEST_F(FrameConverterTest, alpha_is_opaque_before_first_frame)
{
    frame_converter converter(uvec2(3, 2));
    const rgba_image& image = converter.get_image();
    for(unsigned y = 0; y < 2; ++y)
        for(unsigned x = 0; x < 3; ++x)
            expect_pixel(image, x, y, 0);
}

}

#include "frame_converter.hh"
#include "error.hh"

frame_converter::frame_converter(uvec2 size)
{
    image.size = size;
    image.data.resize(size_t(size.x) * size.y * 4, 0);
    for(size_t i = 3; i < image.data.size(); i += 4)
        image.data[i] = 255;
}

const rgba_image& frame_converter::convert(const pixel_source& src)
{
    uvec2 src_size = src.get_screen_size();
    if(src_size != image.size)
        throw configuration_mismatch(format_error(
            "Screen is %ux%u but the converter expects %ux%u",
            src_size.x, src_size.y, image.size.x, image.size.y
        ));

    size_t row_bytes = size_t(image.size.x) * 4;
    for(unsigned y = 0; y < image.size.y; ++y)
    {
        uint8_t* row = image.data.data() + y * row_bytes;
        for(unsigned x = 0; x < image.size.x; ++x)
        {
            uint8_t v = src.get_pixel(x, y) ? 255 : 0;
            uint8_t* px = row + x * 4;
            px[0] = v;
            px[1] = v;
            px[2] = v;
            px[3] = 255;
        }
    }
    return image;
}

const rgba_image& frame_converter::get_image() const
{
    return image;
}

uvec2 frame_converter::get_size() const
{
    return image.size;
}
